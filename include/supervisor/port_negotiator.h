#pragma once

#include "supervisor/instance_lock.h"
#include <chrono>
#include <optional>
#include <set>
#include <string>

namespace supervisor {

/**
 * @brief Result of a transient bind probe
 */
struct PortProbeResult {
  int port = 0;
  bool free = false;
};

/**
 * @brief Parameters of one securePort() call
 */
struct PortRequest {
  std::string host = "0.0.0.0";
  /// Never disturb an existing owner; fail fast instead
  bool stay_alive = false;
  /// Live instance recorded in the lock file, if any
  std::optional<InstanceLock> prior_instance;
};

/**
 * @brief Port discovery and replacement of a previous instance
 *
 * securePort() algorithm:
 *  1. Probe the preferred port. Free -> done.
 *  2. Occupied by the recorded prior instance -> SIGTERM, wait up to the
 *     replacement grace for the port to free, SIGKILL, re-probe.
 *     With stay_alive this step is replaced by a PortConflictStayAlive error.
 *  3. Occupied by something else -> try preferred+1, preferred+2, ... up to
 *     max_attempts ports in total.
 *  4. Nothing free -> PortExhausted.
 */
class PortNegotiator {
public:
  struct Options {
    int max_attempts = 100;
    std::chrono::milliseconds replacement_grace{5000};
  };

  PortNegotiator();
  explicit PortNegotiator(Options options);

  /**
   * @brief Secure a port for the service
   * @throws SupervisorError PortExhausted or PortConflictStayAlive
   */
  int securePort(int preferred, const PortRequest &request);

  /**
   * @brief Transient bind probe; the socket is closed before returning
   */
  static PortProbeResult probe(const std::string &host, int port);

  /**
   * @brief Sequential discovery starting at first
   * @param excluded Ports that must not be returned even if free
   * @return First free port, or nullopt within attempts
   */
  static std::optional<int> findFreePort(const std::string &host, int first,
                                         int attempts,
                                         const std::set<int> &excluded = {});

  /**
   * @brief Graceful-then-forceful termination of a previous instance
   * @return true if the process is gone afterwards
   */
  bool replaceInstance(const InstanceLock &prior);

  const Options &options() const { return options_; }

private:
  bool waitForPortFree(const std::string &host, int port) const;

  Options options_;
};

} // namespace supervisor
