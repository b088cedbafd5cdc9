#pragma once

#include "supervisor/lock_manager.h"
#include "supervisor/port_negotiator.h"
#include <string>

namespace supervisor {

struct ClaimResult {
  /// false: do not start the service, exit with exit_code
  bool proceed = false;
  int exit_code = 0;
  int port = 0;
  /// PID of a previous instance that was terminated, or -1
  pid_t replaced_pid = -1;
};

/**
 * @brief Establish the singleton guarantee and a port, in that order
 *
 * Acquires the lock (replacing a live holder unless stay_alive is set),
 * secures the port and records it in the lock. Fatal problems are thrown as
 * SupervisorError; a stay-alive conflict with a running instance is
 * returned as proceed=false with exit code 0.
 */
ClaimResult claimInstance(LockManager &lock, PortNegotiator &ports,
                          int preferred_port, const std::string &host,
                          bool stay_alive);

/**
 * @brief Releases the claimed lock when the serving scope is left
 *
 * The normal shutdown path releases the lock itself, which makes this a
 * no-op; it matters when startup throws between the claim and the event
 * loop.
 */
class ClaimGuard {
public:
  explicit ClaimGuard(LockManager &lock) : lock_(lock) {}
  ~ClaimGuard();

  ClaimGuard(const ClaimGuard &) = delete;
  ClaimGuard &operator=(const ClaimGuard &) = delete;

private:
  LockManager &lock_;
};

} // namespace supervisor
