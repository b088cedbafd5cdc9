#pragma once

#include <chrono>
#include <json/json.h>
#include <optional>
#include <string>
#include <sys/types.h>

namespace supervisor {

/**
 * @brief Persisted record of the instance that owns a working directory
 *
 * File format:
 *   { "pid": 1234, "startTime": "2026-10-18T09:15:02.123Z",
 *     "version": "1.0.0", "port": 9000 }
 *
 * "port" is written once the service port has been secured and is absent
 * before that.
 */
struct InstanceLock {
  pid_t pid = -1;
  std::chrono::system_clock::time_point start_time;
  std::string version;
  std::optional<int> port;

  Json::Value toJson() const;

  /**
   * @brief Parse a lock record
   * @return nullopt if required fields are missing or mistyped
   */
  static std::optional<InstanceLock> fromJson(const Json::Value &json);
};

} // namespace supervisor
