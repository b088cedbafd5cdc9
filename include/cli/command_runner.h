#pragma once

#include "cli/command.h"
#include "supervisor/lock_manager.h"
#include <chrono>
#include <json/json.h>
#include <optional>
#include <ostream>

namespace cli {

/**
 * @brief What `status` reports
 */
struct InstanceStatus {
  bool running = false;
  /// Lock file exists but its process is gone
  bool stale_lock = false;
  std::optional<supervisor::InstanceLock> lock;

  Json::Value toJson() const;
};

/**
 * @brief Liveness of the lock holder, never file presence alone
 */
InstanceStatus queryStatus(const supervisor::LockManager &lock);

/**
 * @brief Print the status
 * @return Exit status (always 0)
 */
int runStatus(const supervisor::LockManager &lock, const StatusCommand &cmd,
              std::ostream &out);

/**
 * @brief Stop the running instance: SIGTERM, grace, SIGKILL
 *
 * A lock left behind by a dead holder is removed.
 *
 * @return 0 if nothing is running afterwards, 1 if the holder survived
 */
int runStop(supervisor::LockManager &lock, std::ostream &out,
            std::chrono::milliseconds grace = std::chrono::seconds(5));

} // namespace cli
