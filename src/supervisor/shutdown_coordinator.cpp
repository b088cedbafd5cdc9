#include "supervisor/shutdown_coordinator.h"
#include "core/health_monitor.h"
#include "supervisor/supervisor_error.h"
#include <cstdlib>
#include <plog/Log.h>

namespace supervisor {

const char *toString(ShutdownState state) {
  switch (state) {
  case ShutdownState::Running:
    return "running";
  case ShutdownState::ShuttingDown:
    return "shutting_down";
  case ShutdownState::Stopped:
    return "stopped";
  }
  return "unknown";
}

const char *toString(ShutdownTrigger trigger) {
  switch (trigger) {
  case ShutdownTrigger::Interrupt:
    return "SIGINT";
  case ShutdownTrigger::Terminate:
    return "SIGTERM";
  case ShutdownTrigger::HangUp:
    return "SIGHUP";
  case ShutdownTrigger::StopCommand:
    return "stop command";
  case ShutdownTrigger::UncaughtException:
    return "uncaught exception";
  case ShutdownTrigger::FatalError:
    return "fatal error";
  }
  return "unknown";
}

int exitCodeFor(ShutdownTrigger trigger) {
  switch (trigger) {
  case ShutdownTrigger::UncaughtException:
  case ShutdownTrigger::FatalError:
    return 1;
  default:
    return 0;
  }
}

ShutdownCoordinator::ShutdownCoordinator(server::ISocketLayer &socket_layer,
                                         sessions::SessionCoordinator &sessions,
                                         LockManager &lock, Options options,
                                         ExitFunction exit_function)
    : socket_layer_(socket_layer), sessions_(sessions), lock_(lock),
      options_(options), exit_function_(std::move(exit_function)) {
  if (!exit_function_) {
    exit_function_ = [](int code) { std::exit(code); };
  }
}

std::optional<ShutdownEvent> ShutdownCoordinator::trigger() const {
  std::lock_guard<std::mutex> lock(trigger_mutex_);
  return trigger_;
}

bool ShutdownCoordinator::dispatch(const ShutdownEvent &event) {
  ShutdownState expected = ShutdownState::Running;
  if (!state_.compare_exchange_strong(expected,
                                      ShutdownState::ShuttingDown)) {
    PLOG_INFO << "[Shutdown] " << toString(event.trigger)
              << " ignored, shutdown already " << toString(expected);
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(trigger_mutex_);
    trigger_ = event;
  }

  PLOG_INFO << "[Shutdown] Shutdown started by " << toString(event.trigger)
            << (event.detail.empty() ? "" : ": " + event.detail);

  if (health_monitor_) {
    health_monitor_->stop();
  }

  PLOG_INFO << "[Shutdown] Step 1/4: stop accepting connections";
  socket_layer_.stopAccepting();

  PLOG_INFO << "[Shutdown] Step 2/4: closing "
            << socket_layer_.activeConnectionCount() << " connection(s)";
  if (!socket_layer_.closeAllConnections(options_.connection_close_timeout)) {
    close_timed_out_.store(true);
    PLOG_WARNING << "[Shutdown] " << toString(SupervisorErrorCode::ShutdownTimeout)
                 << ": connections not closed within "
                 << options_.connection_close_timeout.count()
                 << "ms, continuing";
  }

  PLOG_INFO << "[Shutdown] Step 3/4: tearing down debug sessions";
  sessions_.close();
  try {
    size_t failures = sessions_.emergencyShutdownAll();
    if (failures > 0) {
      PLOG_WARNING << "[Shutdown] " << failures
                   << " session(s) could not be stopped cleanly";
    }
  } catch (const std::exception &e) {
    PLOG_ERROR << "[Shutdown] Session teardown failed: " << e.what();
  }

  PLOG_INFO << "[Shutdown] Step 4/4: releasing instance lock";
  lock_.release();

  state_.store(ShutdownState::Stopped);
  int code = exitCodeFor(event.trigger);
  PLOG_INFO << "[Shutdown] Stopped, exit status " << code;
  exit_function_(code);
  return true;
}

} // namespace supervisor
