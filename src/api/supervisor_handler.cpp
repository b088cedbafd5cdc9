#include "api/supervisor_handler.h"
#include "core/time_format.h"
#include "supervisor/lock_manager.h"
#include "supervisor/shutdown_coordinator.h"
#include <plog/Log.h>
#include <thread>
#include <unistd.h>

#ifndef PROJECT_VERSION
#define PROJECT_VERSION "1.0.0"
#endif

supervisor::LockManager *SupervisorHandler::lock_ = nullptr;
supervisor::ShutdownCoordinator *SupervisorHandler::shutdown_ = nullptr;

void SupervisorHandler::setLockManager(supervisor::LockManager *lock) {
  lock_ = lock;
}

void SupervisorHandler::setShutdownCoordinator(
    supervisor::ShutdownCoordinator *coordinator) {
  shutdown_ = coordinator;
}

void SupervisorHandler::getStatus(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  Json::Value response;
  response["pid"] = static_cast<Json::Int>(getpid());
  response["version"] = PROJECT_VERSION;
  response["state"] =
      shutdown_ ? supervisor::toString(shutdown_->state()) : "running";

  if (lock_) {
    response["lockFile"] = lock_->lockPath();
    auto lock = lock_->readLock();
    if (lock && lock->pid == getpid()) {
      response["startTime"] = TimeFormat::toIso8601(lock->start_time);
      response["uptime"] = static_cast<Json::Int64>(
          std::chrono::duration_cast<std::chrono::seconds>(
              std::chrono::system_clock::now() - lock->start_time)
              .count());
      if (lock->port) {
        response["port"] = *lock->port;
      }
    }
  }

  callback(HttpResponse::newHttpJsonResponse(response));
}

void SupervisorHandler::stop(
    const HttpRequestPtr & /*req*/,
    std::function<void(const HttpResponsePtr &)> &&callback) {
  if (!shutdown_) {
    Json::Value error;
    error["error"] = "Internal server error";
    error["message"] = "Shutdown coordinator not initialized";
    auto resp = HttpResponse::newHttpJsonResponse(error);
    resp->setStatusCode(k500InternalServerError);
    callback(resp);
    return;
  }

  Json::Value response;
  response["accepted"] = !shutdown_->isShuttingDown();
  response["state"] = supervisor::toString(shutdown_->state());
  auto resp = HttpResponse::newHttpJsonResponse(response);
  resp->setStatusCode(k202Accepted);
  callback(resp);

  if (shutdown_->isShuttingDown()) {
    return;
  }

  PLOG_INFO << "[Supervisor] Stop requested over HTTP";
  // Shutdown closes this very connection; run it after the response is out.
  supervisor::ShutdownCoordinator *coordinator = shutdown_;
  std::thread([coordinator]() {
    supervisor::ShutdownEvent event;
    event.trigger = supervisor::ShutdownTrigger::StopCommand;
    event.detail = "POST /v1/supervisor/stop";
    coordinator->dispatch(event);
  }).detach();
}
