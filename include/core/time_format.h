#pragma once

#include <cctype>
#include <chrono>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>
#include <string>

namespace TimeFormat {

/**
 * @brief Format a time point as ISO 8601 UTC with milliseconds
 *        (e.g. 2026-10-18T09:15:02.123Z)
 */
inline std::string toIso8601(std::chrono::system_clock::time_point tp) {
  auto time_t = std::chrono::system_clock::to_time_t(tp);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                tp.time_since_epoch()) %
            1000;

  std::tm tm_utc{};
  gmtime_r(&time_t, &tm_utc);

  std::stringstream ss;
  ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
  ss << '.' << std::setfill('0') << std::setw(3) << ms.count();
  ss << "Z";
  return ss.str();
}

/**
 * @brief Parse the format produced by toIso8601 (fraction optional)
 */
inline std::optional<std::chrono::system_clock::time_point>
fromIso8601(const std::string &text) {
  std::tm tm_utc{};
  std::istringstream ss(text);
  ss >> std::get_time(&tm_utc, "%Y-%m-%dT%H:%M:%S");
  if (ss.fail()) {
    return std::nullopt;
  }

  int millis = 0;
  if (ss.peek() == '.') {
    ss.get();
    std::string digits;
    while (std::isdigit(ss.peek())) {
      digits.push_back(static_cast<char>(ss.get()));
    }
    if (!digits.empty()) {
      digits.resize(3, '0');
      millis = std::stoi(digits);
    }
  }

  auto tp = std::chrono::system_clock::from_time_t(timegm(&tm_utc));
  return tp + std::chrono::milliseconds(millis);
}

/**
 * @brief Milliseconds since the Unix epoch
 */
inline int64_t epochMillis(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             tp.time_since_epoch())
      .count();
}

} // namespace TimeFormat
