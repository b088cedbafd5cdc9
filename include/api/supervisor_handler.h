#pragma once

#include <drogon/HttpController.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>

using namespace drogon;

namespace supervisor {
class LockManager;
class ShutdownCoordinator;
}

/**
 * @brief Supervisor command surface
 *
 * Endpoints:
 * - GET /v1/supervisor/status - pid, port, version, start time, uptime and
 *   shutdown state of this instance
 * - POST /v1/supervisor/stop - request a graceful shutdown (202 Accepted)
 */
class SupervisorHandler : public drogon::HttpController<SupervisorHandler> {
public:
    METHOD_LIST_BEGIN
        ADD_METHOD_TO(SupervisorHandler::getStatus, "/v1/supervisor/status", Get);
        ADD_METHOD_TO(SupervisorHandler::stop, "/v1/supervisor/stop", Post);
    METHOD_LIST_END

    void getStatus(const HttpRequestPtr &req,
                   std::function<void(const HttpResponsePtr &)> &&callback);

    void stop(const HttpRequestPtr &req,
              std::function<void(const HttpResponsePtr &)> &&callback);

    static void setLockManager(supervisor::LockManager *lock);
    static void setShutdownCoordinator(supervisor::ShutdownCoordinator *coordinator);

private:
    static supervisor::LockManager *lock_;
    static supervisor::ShutdownCoordinator *shutdown_;
};
