#pragma once

#include "server/socket_layer.h"
#include "sessions/session_coordinator.h"
#include "supervisor/lock_manager.h"
#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

class HealthMonitor;

namespace supervisor {

enum class ShutdownState { Running, ShuttingDown, Stopped };

/**
 * @brief Where a shutdown request came from
 */
enum class ShutdownTrigger {
  Interrupt,         // SIGINT
  Terminate,         // SIGTERM
  HangUp,            // SIGHUP
  StopCommand,       // POST /v1/supervisor/stop
  UncaughtException, // std::terminate
  FatalError         // unrecoverable error after startup
};

struct ShutdownEvent {
  ShutdownTrigger trigger = ShutdownTrigger::Terminate;
  std::string detail;
};

const char *toString(ShutdownState state);
const char *toString(ShutdownTrigger trigger);

/**
 * @brief Exit status for a trigger: 0 for signals and stop requests, 1 for
 * exceptions and fatal errors
 */
int exitCodeFor(ShutdownTrigger trigger);

/**
 * @brief Running -> ShuttingDown -> Stopped
 *
 * Every shutdown path (signals, the stop endpoint, the terminate handler)
 * dispatches an event here. The first event performs, in this order:
 *   0. cancel the health-check interval
 *   1. stop accepting new connections
 *   2. close open connections, giving up after the close timeout
 *   3. refuse new sessions and tear down all debug sessions, including
 *      launches in progress (failures are logged only)
 *   4. release the instance lock
 *   5. call the exit function with the trigger's exit status
 * Later events are ignored.
 */
class ShutdownCoordinator {
public:
  using ExitFunction = std::function<void(int)>;

  struct Options {
    std::chrono::milliseconds connection_close_timeout{3000};
  };

  /**
   * @param exit_function Called once at the end of shutdown; std::exit when
   * empty
   */
  ShutdownCoordinator(server::ISocketLayer &socket_layer,
                      sessions::SessionCoordinator &sessions,
                      LockManager &lock, Options options,
                      ExitFunction exit_function = nullptr);

  /**
   * @brief Health monitor whose timer is cancelled first (optional)
   */
  void setHealthMonitor(HealthMonitor *monitor) { health_monitor_ = monitor; }

  /**
   * @brief Deliver a shutdown event
   * @return true if this event performed the shutdown, false if one was
   * already in progress or done
   */
  bool dispatch(const ShutdownEvent &event);

  ShutdownState state() const { return state_.load(); }
  bool isShuttingDown() const { return state() != ShutdownState::Running; }

  /**
   * @brief The event that started the shutdown
   */
  std::optional<ShutdownEvent> trigger() const;

  /**
   * @brief True if open connections did not close within the timeout
   */
  bool closeTimedOut() const { return close_timed_out_.load(); }

private:
  server::ISocketLayer &socket_layer_;
  sessions::SessionCoordinator &sessions_;
  LockManager &lock_;
  HealthMonitor *health_monitor_ = nullptr;
  Options options_;
  ExitFunction exit_function_;

  std::atomic<ShutdownState> state_{ShutdownState::Running};
  std::atomic<bool> close_timed_out_{false};

  mutable std::mutex trigger_mutex_;
  std::optional<ShutdownEvent> trigger_;
};

} // namespace supervisor
