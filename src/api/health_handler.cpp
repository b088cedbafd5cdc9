#include "api/health_handler.h"
#include "core/health_monitor.h"
#include "core/time_format.h"
#include <chrono>
#include <drogon/HttpResponse.h>

// Static start time for uptime calculation
static std::chrono::steady_clock::time_point g_start_time =
    std::chrono::steady_clock::now();

HealthMonitor *HealthHandler::monitor_ = nullptr;

void HealthHandler::setHealthMonitor(HealthMonitor *monitor) {
  monitor_ = monitor;
}

void HealthHandler::getHealth(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  try {
    Json::Value response;

    std::string status = "healthy";
    if (monitor_) {
      auto snapshot = monitor_->latestSnapshot();
      if (snapshot && !snapshot->socket_layer_ok) {
        status = "degraded";
      }
      response["monitor"] = monitor_->toJson();
    } else {
      status = "unknown";
    }

    response["status"] = status;
    response["timestamp"] =
        TimeFormat::toIso8601(std::chrono::system_clock::now());
    response["uptime"] = static_cast<Json::Int64>(getUptime());
    response["service"] = "continuum-supervisor";

    auto resp = HttpResponse::newHttpJsonResponse(response);
    resp->setStatusCode(k200OK);
    callback(resp);
  } catch (const std::exception &e) {
    Json::Value errorResponse;
    errorResponse["error"] = "Internal server error";
    errorResponse["message"] = e.what();

    auto resp = HttpResponse::newHttpJsonResponse(errorResponse);
    resp->setStatusCode(k500InternalServerError);
    callback(resp);
  }
}

int64_t HealthHandler::getUptime() const {
  auto now = std::chrono::steady_clock::now();
  auto duration =
      std::chrono::duration_cast<std::chrono::seconds>(now - g_start_time);
  return duration.count();
}
