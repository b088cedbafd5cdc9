#include "supervisor/instance_lock.h"
#include "core/time_format.h"

namespace supervisor {

Json::Value InstanceLock::toJson() const {
  Json::Value json;
  json["pid"] = static_cast<Json::Int>(pid);
  json["startTime"] = TimeFormat::toIso8601(start_time);
  json["version"] = version;
  if (port) {
    json["port"] = *port;
  }
  return json;
}

std::optional<InstanceLock> InstanceLock::fromJson(const Json::Value &json) {
  if (!json.isObject() || !json.isMember("pid") || !json["pid"].isInt()) {
    return std::nullopt;
  }

  InstanceLock lock;
  lock.pid = static_cast<pid_t>(json["pid"].asInt());
  if (lock.pid <= 0) {
    return std::nullopt;
  }

  if (json.isMember("startTime") && json["startTime"].isString()) {
    auto parsed = TimeFormat::fromIso8601(json["startTime"].asString());
    if (parsed) {
      lock.start_time = *parsed;
    }
  }
  lock.version = json.get("version", "").asString();
  if (json.isMember("port") && json["port"].isInt()) {
    lock.port = json["port"].asInt();
  }
  return lock;
}

} // namespace supervisor
