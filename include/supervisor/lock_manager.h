#pragma once

#include "supervisor/instance_lock.h"
#include <mutex>
#include <optional>
#include <string>

namespace supervisor {

enum class LockStatus {
  Owned,   // this process now holds the lock
  Conflict // a live process holds it
};

/**
 * @brief Outcome of LockManager::acquire()
 *
 * For Owned, lock is our own record. For Conflict, lock is the live
 * holder's record.
 */
struct LockAcquisition {
  LockStatus status = LockStatus::Conflict;
  InstanceLock lock;
  bool discarded_stale = false;
};

/**
 * @brief Exclusive "this service is running here" marker on disk
 *
 * A lock is valid iff its pid refers to a live process. Creation is atomic:
 * the record is written to a private temp file and hard-linked into place,
 * which fails if any lock already exists, so two concurrent starters can
 * never both own it. Claims, stale discards and releases additionally run
 * under an flock on "<lock_path>.guard" so that discarding a stale record
 * cannot remove a lock another process has just created.
 *
 * Filesystem failures are thrown as SupervisorError(LockIoFailure); callers
 * must treat them as fatal at startup.
 */
class LockManager {
public:
  /**
   * @param lock_path Path of the lock file
   * @param version Version string recorded in the lock
   */
  explicit LockManager(std::string lock_path, std::string version);
  ~LockManager() = default;

  LockManager(const LockManager &) = delete;
  LockManager &operator=(const LockManager &) = delete;

  /**
   * @brief Claim the lock for the current process
   *
   * A stale lock (dead pid, or a record that cannot be parsed) is deleted
   * and the claim retried once.
   */
  LockAcquisition acquire();

  /**
   * @brief Delete the lock file if it still names the current process
   *
   * A lagging shutdown can never delete a newer owner's lock. Calling it
   * again after a successful release is a no-op.
   *
   * @return true if a lock file was removed by this call
   */
  bool release();

  /**
   * @brief Rewrite our lock with the service port once it is secured
   * @return false if we do not own the lock
   */
  bool recordPort(int port);

  /**
   * @brief Read the lock file
   * @return nullopt if absent or unparseable
   */
  std::optional<InstanceLock> readLock() const;

  /**
   * @brief The lock record, only if its process is alive
   */
  std::optional<InstanceLock> liveInstance() const;

  /**
   * @brief Remove a lock file whose holder is dead
   * @return true if a stale file was removed
   */
  bool discardIfStale();

  bool isOwned() const;
  const std::string &lockPath() const { return lock_path_; }
  std::string guardPath() const { return lock_path_ + ".guard"; }

private:
  enum class ClaimResult { Created, Exists };

  ClaimResult tryCreate(const InstanceLock &lock);
  void writeFile(const std::string &path, const InstanceLock &lock) const;
  void removeLockFile();

  std::string lock_path_;
  std::string version_;

  mutable std::mutex mutex_;
  std::optional<InstanceLock> owned_;
};

} // namespace supervisor
