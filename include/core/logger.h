#pragma once

#include "core/env_config.h"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <iostream>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>
#include <string>

/**
 * @brief Logger utility using Plog
 *
 * Initializes Plog with a size-rolling file appender and an optional
 * console appender.
 *
 * Usage:
 *   Logger::init(".continuum/logs");
 *   PLOG_INFO << "[Component] Your log message";
 */

namespace Logger {

/**
 * @brief Parse a severity name (NONE, FATAL, ERROR, WARNING/WARN, INFO,
 * DEBUG, VERBOSE), case-insensitive
 * @return Parsed severity, or fallback if the name is unknown
 */
inline plog::Severity parseSeverity(const std::string &name,
                                    plog::Severity fallback) {
  std::string upper = name;
  std::transform(upper.begin(), upper.end(), upper.begin(),
                 [](unsigned char c) {
                   return static_cast<char>(std::toupper(c));
                 });

  if (upper == "NONE")
    return plog::none;
  if (upper == "FATAL")
    return plog::fatal;
  if (upper == "ERROR")
    return plog::error;
  if (upper == "WARNING" || upper == "WARN")
    return plog::warning;
  if (upper == "INFO")
    return plog::info;
  if (upper == "DEBUG")
    return plog::debug;
  if (upper == "VERBOSE")
    return plog::verbose;
  return fallback;
}

/**
 * @brief Initialize Plog logger
 *
 * Creates the log directory if it doesn't exist. LOG_LEVEL in the
 * environment overrides log_level.
 *
 * @param log_dir Directory to store log files
 * @param log_level Log level (default: INFO)
 * @param max_files Number of rolled files to keep
 * @param enable_console Whether to also log to console (default: true)
 */
inline void init(const std::string &log_dir,
                 plog::Severity log_level = plog::info, int max_files = 5,
                 bool enable_console = true) {
  std::string log_directory = log_dir;

  try {
    std::filesystem::create_directories(log_directory);
  } catch (const std::exception &e) {
    std::cerr << "Warning: Failed to create log directory '" << log_directory
              << "': " << e.what() << std::endl;
    std::cerr << "Logs will be written to current directory." << std::endl;
    log_directory = ".";
  }

  std::string log_level_str = EnvConfig::getString("LOG_LEVEL", "");
  if (!log_level_str.empty()) {
    log_level = parseSeverity(log_level_str, log_level);
  }

  std::string log_file_path =
      (std::filesystem::path(log_directory) / "supervisor.log").string();

  // Format: supervisor.log, supervisor.1.log, ...
  size_t max_file_size = 10 * 1024 * 1024;
  static plog::RollingFileAppender<plog::TxtFormatter> rollingFileAppender(
      log_file_path.c_str(), max_file_size, max_files);

  if (enable_console) {
    static plog::ConsoleAppender<plog::TxtFormatter> consoleAppender;
    plog::init(log_level, &consoleAppender).addAppender(&rollingFileAppender);
  } else {
    plog::init(log_level, &rollingFileAppender);
  }

  PLOG_INFO << "========================================";
  PLOG_INFO << "Logger initialized";
  PLOG_INFO << "Log file: " << log_file_path;
  PLOG_INFO << "Log level: " << plog::severityToString(log_level);
  PLOG_INFO << "Max files to keep: " << max_files;
  PLOG_INFO << "========================================";
}

} // namespace Logger
