#pragma once

#include "supervisor/shutdown_coordinator.h"
#include <atomic>
#include <memory>
#include <thread>

namespace supervisor {

/**
 * @brief Turns SIGINT, SIGTERM and SIGHUP into ShutdownEvents
 *
 * The signal handler only writes the signal number into a self-pipe. A
 * watcher thread reads it and dispatches to the ShutdownCoordinator, so the
 * whole teardown runs outside signal context.
 *
 * One dispatcher per process.
 */
class SignalDispatcher {
public:
  explicit SignalDispatcher(ShutdownCoordinator &coordinator);
  ~SignalDispatcher();

  SignalDispatcher(const SignalDispatcher &) = delete;
  SignalDispatcher &operator=(const SignalDispatcher &) = delete;

  /**
   * @brief Create the pipe, start the watcher and install the handlers
   *
   * May be called again to re-install the handlers after a library replaced
   * them.
   *
   * @throws std::runtime_error if the pipe cannot be created
   */
  void install();

  /**
   * @brief Restore default handlers and stop the watcher
   */
  void uninstall();

  /**
   * @brief Map a signal number to its trigger (SIGTERM for unknown ones)
   */
  static ShutdownTrigger triggerFor(int signo);

private:
  static void handleSignal(int signo);
  void watchLoop();

  ShutdownCoordinator &coordinator_;
  std::unique_ptr<std::thread> watcher_;
  std::atomic<bool> running_{false};
  int read_fd_ = -1;
};

} // namespace supervisor
