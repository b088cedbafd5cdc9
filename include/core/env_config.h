#pragma once

#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

/**
 * @brief Helper functions to parse environment variables
 *
 * Provides utilities to read and parse environment variables
 * with default values and validation.
 */
namespace EnvConfig {

/// Service port override (beats config.json, loses to --port).
constexpr const char *kPortVariable = "CONTINUUM_PORT";
/// Directory holding config.json, the lock file and logs.
constexpr const char *kConfigDirVariable = "CONTINUUM_CONFIG_DIR";
/// Browser executable used for debug sessions.
constexpr const char *kBrowserVariable = "CONTINUUM_BROWSER";

/**
 * @brief Get string environment variable
 * @param name Variable name
 * @param default_value Default value if not set
 * @return String value or default
 */
inline std::string getString(const char *name,
                             const std::string &default_value = "") {
  const char *value = std::getenv(name);
  return value ? std::string(value) : default_value;
}

/**
 * @brief Service port from CONTINUUM_PORT, if set and valid
 */
inline std::optional<int> getPortOverride() {
  const char *value = std::getenv(kPortVariable);
  if (!value || strlen(value) == 0) {
    return std::nullopt;
  }
  char *end = nullptr;
  long port = std::strtol(value, &end, 10);
  if (*end != '\0' || port < 1 || port > 65535) {
    std::cerr << "Warning: Invalid " << kPortVariable << "='" << value
              << "'. Ignoring override." << std::endl;
    return std::nullopt;
  }
  return static_cast<int>(port);
}

/**
 * @brief Resolve the supervisor's config directory
 *
 * Priority:
 *   1. CONTINUUM_CONFIG_DIR
 *   2. ./.continuum (relative to the working directory, so that each working
 *      directory supervises its own instance)
 *
 * The directory is created if missing. Creation failure is reported by
 * throwing std::filesystem::filesystem_error: without this directory the
 * supervisor cannot hold its lock.
 *
 * @return Resolved directory path
 */
inline std::string resolveConfigDir() {
  std::string dir = getString(kConfigDirVariable, "");
  if (dir.empty()) {
    dir = "./.continuum";
  } else {
    std::cerr << "[EnvConfig] Using config directory from "
              << kConfigDirVariable << ": " << dir << std::endl;
  }

  std::filesystem::create_directories(dir);
  return dir;
}

/**
 * @brief Join a path below the config directory unless it is absolute
 */
inline std::string resolveInConfigDir(const std::string &config_dir,
                                      const std::string &path) {
  std::filesystem::path p(path);
  if (p.is_absolute()) {
    return path;
  }
  return (std::filesystem::path(config_dir) / p).string();
}

} // namespace EnvConfig
