#pragma once

#include <chrono>
#include <json/json.h>
#include <string>
#include <sys/types.h>

namespace sessions {

enum class SessionStatus { Pending, Active, Closed };

const char *toString(SessionStatus status);

/**
 * @brief A browser with its remote-debugging port, scoped to one
 * (purpose, persona) key
 */
struct DebugSession {
  std::string session_id;
  std::string purpose;
  std::string persona;
  int port = 0;
  SessionStatus status = SessionStatus::Pending;
  std::chrono::system_clock::time_point created_at;
  std::chrono::system_clock::time_point last_activity_at;

  // Browser handle
  pid_t browser_pid = -1;
  std::string user_data_dir;

  Json::Value toJson() const;
};

} // namespace sessions
