#pragma once

#include <drogon/HttpController.h>
#include <drogon/HttpRequest.h>
#include <drogon/HttpResponse.h>
#include <json/json.h>
#include <string>

using namespace drogon;

namespace sessions {
class SessionCoordinator;
}

/**
 * @brief Debug session endpoints
 *
 * Endpoints:
 * - POST /v1/supervisor/sessions - Request (or reuse) a session
 *   Body: {"purpose": "...", "persona": "..."}; persona defaults to "system"
 * - GET /v1/supervisor/sessions - Session summary
 * - GET /v1/supervisor/sessions/{sessionId} - One session
 * - DELETE /v1/supervisor/sessions/{sessionId} - Tear a session down
 * - POST /v1/supervisor/sessions/{sessionId}/activate - Bring its page to the
 *   foreground
 */
class SessionHandler : public drogon::HttpController<SessionHandler> {
public:
    METHOD_LIST_BEGIN
        ADD_METHOD_TO(SessionHandler::requestSession, "/v1/supervisor/sessions", Post);
        ADD_METHOD_TO(SessionHandler::listSessions, "/v1/supervisor/sessions", Get);
        ADD_METHOD_TO(SessionHandler::getSession, "/v1/supervisor/sessions/{sessionId}", Get);
        ADD_METHOD_TO(SessionHandler::deleteSession, "/v1/supervisor/sessions/{sessionId}", Delete);
        ADD_METHOD_TO(SessionHandler::activateSession, "/v1/supervisor/sessions/{sessionId}/activate", Post);
    METHOD_LIST_END

    void requestSession(const HttpRequestPtr &req,
                        std::function<void(const HttpResponsePtr &)> &&callback);

    void listSessions(const HttpRequestPtr &req,
                      std::function<void(const HttpResponsePtr &)> &&callback);

    void getSession(const HttpRequestPtr &req,
                    std::function<void(const HttpResponsePtr &)> &&callback);

    void deleteSession(const HttpRequestPtr &req,
                       std::function<void(const HttpResponsePtr &)> &&callback);

    void activateSession(const HttpRequestPtr &req,
                         std::function<void(const HttpResponsePtr &)> &&callback);

    /**
     * @brief Set session coordinator (dependency injection)
     */
    static void setSessionCoordinator(sessions::SessionCoordinator *coordinator);

private:
    std::string extractSessionId(const HttpRequestPtr &req) const;

    HttpResponsePtr createErrorResponse(int statusCode,
                                        const std::string &error,
                                        const std::string &message = "") const;

    HttpResponsePtr createSuccessResponse(const Json::Value &data,
                                          int statusCode = 200) const;

    static sessions::SessionCoordinator *coordinator_;
};
