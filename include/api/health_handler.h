#pragma once

#include <drogon/HttpController.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>

using namespace drogon;

class HealthMonitor;

/**
 * @brief Health check endpoint handler
 *
 * Endpoint: GET /v1/supervisor/health
 * Returns: JSON with status, timestamp, uptime, the latest health snapshot
 * and the monitor's counters. "degraded" (still 200) when the socket layer
 * was unhealthy in the last cycle.
 */
class HealthHandler : public drogon::HttpController<HealthHandler>
{
public:
    METHOD_LIST_BEGIN
        ADD_METHOD_TO(HealthHandler::getHealth, "/v1/supervisor/health", Get);
    METHOD_LIST_END

    /**
     * @brief Handle GET /v1/supervisor/health
     *
     * @param req HTTP request
     * @param callback Response callback
     */
    void getHealth(const HttpRequestPtr &req,
                   std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Set health monitor (dependency injection)
     */
    static void setHealthMonitor(HealthMonitor *monitor);

private:
    /**
     * @brief Seconds since this process started serving
     */
    int64_t getUptime() const;

    static HealthMonitor *monitor_;
};
