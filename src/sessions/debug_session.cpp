#include "sessions/debug_session.h"
#include "core/time_format.h"

namespace sessions {

const char *toString(SessionStatus status) {
  switch (status) {
  case SessionStatus::Pending:
    return "pending";
  case SessionStatus::Active:
    return "active";
  case SessionStatus::Closed:
    return "closed";
  }
  return "unknown";
}

Json::Value DebugSession::toJson() const {
  Json::Value json;
  json["sessionId"] = session_id;
  json["purpose"] = purpose;
  json["persona"] = persona;
  json["port"] = port;
  json["status"] = toString(status);
  json["createdAt"] = TimeFormat::toIso8601(created_at);
  json["lastActivityAt"] = TimeFormat::toIso8601(last_activity_at);
  json["browserPid"] = static_cast<Json::Int>(browser_pid);
  json["userDataDir"] = user_data_dir;
  return json;
}

} // namespace sessions
