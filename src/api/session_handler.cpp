#include "api/session_handler.h"
#include "sessions/session_coordinator.h"
#include "supervisor/supervisor_error.h"
#include <plog/Log.h>
#include <memory>
#include <regex>
#include <stdexcept>
#include <thread>

sessions::SessionCoordinator *SessionHandler::coordinator_ = nullptr;

namespace {

bool isValidName(const std::string &value) {
  static const std::regex pattern("^[A-Za-z0-9_.-]{1,64}$");
  return std::regex_match(value, pattern);
}

} // namespace

void SessionHandler::setSessionCoordinator(
    sessions::SessionCoordinator *coordinator) {
  coordinator_ = coordinator;
}

std::string SessionHandler::extractSessionId(const HttpRequestPtr &req) const {
  std::string sessionId = req->getParameter("sessionId");

  if (sessionId.empty()) {
    std::string path = req->getPath();
    size_t pos = path.find("/sessions/");
    if (pos != std::string::npos) {
      size_t start = pos + 10; // length of "/sessions/"
      size_t end = path.find("/", start);
      if (end == std::string::npos) {
        end = path.length();
      }
      sessionId = path.substr(start, end - start);
    }
  }

  return sessionId;
}

void SessionHandler::requestSession(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  if (!coordinator_) {
    callback(createErrorResponse(500, "Internal server error",
                                 "Session coordinator not initialized"));
    return;
  }

  auto json = req->getJsonObject();
  if (!json || !json->isObject()) {
    callback(createErrorResponse(400, "Bad request",
                                 "Request body must be a JSON object"));
    return;
  }

  if (!(*json)["purpose"].isString()) {
    callback(createErrorResponse(400, "Bad request",
                                 "Field 'purpose' is required"));
    return;
  }
  std::string purpose = (*json)["purpose"].asString();
  std::string persona = json->get("persona", "system").asString();

  if (!isValidName(purpose) || !isValidName(persona)) {
    callback(createErrorResponse(
        400, "Bad request",
        "purpose and persona must be 1-64 characters of [A-Za-z0-9_.-]"));
    return;
  }

  // Launching a browser blocks for up to the launch timeout; keep it off the
  // event loop.
  auto shared_callback =
      std::make_shared<std::function<void(const HttpResponsePtr &)>>(
          std::move(callback));
  auto *self = this;
  std::thread([self, shared_callback, purpose, persona]() {
    try {
      auto session = coordinator_->requestSession(purpose, persona);
      (*shared_callback)(self->createSuccessResponse(session.toJson()));
    } catch (const supervisor::SupervisorError &e) {
      (*shared_callback)(self->createErrorResponse(
          502, supervisor::toString(e.code()), e.what()));
    } catch (const std::invalid_argument &e) {
      (*shared_callback)(self->createErrorResponse(400, "Bad request",
                                                   e.what()));
    } catch (const std::exception &e) {
      PLOG_ERROR << "[SessionHandler] requestSession failed: " << e.what();
      (*shared_callback)(self->createErrorResponse(
          500, "Internal server error", e.what()));
    }
  }).detach();
}

void SessionHandler::listSessions(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  if (!coordinator_) {
    callback(createErrorResponse(500, "Internal server error",
                                 "Session coordinator not initialized"));
    return;
  }
  callback(createSuccessResponse(coordinator_->getSessionSummary()));
}

void SessionHandler::getSession(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  if (!coordinator_) {
    callback(createErrorResponse(500, "Internal server error",
                                 "Session coordinator not initialized"));
    return;
  }

  std::string sessionId = extractSessionId(req);
  auto session = coordinator_->findSession(sessionId);
  if (!session) {
    callback(createErrorResponse(404, "Not found",
                                 "Session not found: " + sessionId));
    return;
  }
  callback(createSuccessResponse(session->toJson()));
}

void SessionHandler::deleteSession(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  if (!coordinator_) {
    callback(createErrorResponse(500, "Internal server error",
                                 "Session coordinator not initialized"));
    return;
  }

  std::string sessionId = extractSessionId(req);
  auto shared_callback =
      std::make_shared<std::function<void(const HttpResponsePtr &)>>(
          std::move(callback));
  auto *self = this;
  std::thread([self, shared_callback, sessionId]() {
    Json::Value response;
    response["sessionId"] = sessionId;
    try {
      response["closed"] = coordinator_->teardown(sessionId);
      (*shared_callback)(self->createSuccessResponse(response));
    } catch (const std::exception &e) {
      PLOG_WARNING << "[SessionHandler] Teardown of " << sessionId
                   << " reported: " << e.what();
      response["closed"] = true;
      response["warning"] = e.what();
      (*shared_callback)(self->createSuccessResponse(response));
    }
  }).detach();
}

void SessionHandler::activateSession(
    const HttpRequestPtr &req,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  if (!coordinator_) {
    callback(createErrorResponse(500, "Internal server error",
                                 "Session coordinator not initialized"));
    return;
  }

  std::string sessionId = extractSessionId(req);
  auto shared_callback =
      std::make_shared<std::function<void(const HttpResponsePtr &)>>(
          std::move(callback));
  auto *self = this;
  std::thread([self, shared_callback, sessionId]() {
    try {
      bool activated = coordinator_->activateSession(sessionId);
      if (!activated) {
        (*shared_callback)(self->createErrorResponse(
            502, "Bad gateway", "Browser did not activate a page target"));
        return;
      }
      Json::Value response;
      response["sessionId"] = sessionId;
      response["activated"] = true;
      (*shared_callback)(self->createSuccessResponse(response));
    } catch (const supervisor::SupervisorError &e) {
      int status =
          e.code() == supervisor::SupervisorErrorCode::SessionNotFound ? 404
                                                                       : 502;
      (*shared_callback)(self->createErrorResponse(
          status, supervisor::toString(e.code()), e.what()));
    } catch (const std::exception &e) {
      (*shared_callback)(self->createErrorResponse(
          500, "Internal server error", e.what()));
    }
  }).detach();
}

HttpResponsePtr
SessionHandler::createErrorResponse(int statusCode, const std::string &error,
                                    const std::string &message) const {
  Json::Value response(Json::objectValue);
  response["error"] = error;
  if (!message.empty()) {
    response["message"] = message;
  }

  auto resp = HttpResponse::newHttpJsonResponse(response);
  resp->setStatusCode(static_cast<HttpStatusCode>(statusCode));
  return resp;
}

HttpResponsePtr SessionHandler::createSuccessResponse(const Json::Value &data,
                                                      int statusCode) const {
  auto resp = HttpResponse::newHttpJsonResponse(data);
  resp->setStatusCode(static_cast<HttpStatusCode>(statusCode));
  return resp;
}
