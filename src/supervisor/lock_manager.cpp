#include "supervisor/lock_manager.h"
#include "supervisor/process_utils.h"
#include "supervisor/supervisor_error.h"
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <plog/Log.h>
#include <sys/file.h>
#include <unistd.h>

namespace supervisor {

namespace {

/**
 * Exclusive flock on "<lock>.guard" for the scope of one claim, discard or
 * release. Removing a stale lock and linking a new one happen under it, so a
 * racer that read the stale record earlier cannot delete the winner's lock.
 * The guard file itself is never removed.
 */
class TakeoverGuard {
public:
  explicit TakeoverGuard(const std::string &path) {
    fd_ = ::open(path.c_str(), O_CREAT | O_RDWR | O_CLOEXEC, 0644);
    if (fd_ < 0) {
      throw SupervisorError(SupervisorErrorCode::LockIoFailure,
                            "Cannot open " + path + ": " + strerror(errno));
    }
    while (::flock(fd_, LOCK_EX) != 0) {
      if (errno == EINTR) {
        continue;
      }
      int err = errno;
      ::close(fd_);
      throw SupervisorError(SupervisorErrorCode::LockIoFailure,
                            "Cannot lock " + path + ": " + strerror(err));
    }
  }

  ~TakeoverGuard() {
    ::flock(fd_, LOCK_UN);
    ::close(fd_);
  }

  TakeoverGuard(const TakeoverGuard &) = delete;
  TakeoverGuard &operator=(const TakeoverGuard &) = delete;

private:
  int fd_ = -1;
};

} // namespace

LockManager::LockManager(std::string lock_path, std::string version)
    : lock_path_(std::move(lock_path)), version_(std::move(version)) {}

LockAcquisition LockManager::acquire() {
  std::lock_guard<std::mutex> lock(mutex_);

  try {
    std::filesystem::path path(lock_path_);
    if (path.has_parent_path()) {
      std::filesystem::create_directories(path.parent_path());
    }
  } catch (const std::filesystem::filesystem_error &e) {
    throw SupervisorError(SupervisorErrorCode::LockIoFailure,
                          "Cannot create lock directory for " + lock_path_ +
                              ": " + e.what());
  }

  TakeoverGuard guard(guardPath());

  InstanceLock mine;
  mine.pid = getpid();
  mine.start_time = std::chrono::system_clock::now();
  mine.version = version_;

  LockAcquisition result;

  // One retry after discarding a stale lock.
  for (int attempt = 0; attempt < 2; ++attempt) {
    if (tryCreate(mine) == ClaimResult::Created) {
      owned_ = mine;
      result.status = LockStatus::Owned;
      result.lock = mine;
      PLOG_INFO << "[LockManager] Acquired " << lock_path_ << " (PID "
                << mine.pid << ")";
      return result;
    }

    auto holder = readLock();
    if (holder && holder->pid == mine.pid) {
      // Already ours (e.g. acquire() called twice)
      owned_ = *holder;
      result.status = LockStatus::Owned;
      result.lock = *holder;
      return result;
    }

    if (holder && isProcessAlive(holder->pid)) {
      PLOG_INFO << "[LockManager] Lock held by live PID " << holder->pid;
      result.status = LockStatus::Conflict;
      result.lock = *holder;
      return result;
    }

    if (attempt == 1) {
      break;
    }

    if (holder) {
      PLOG_WARNING << "[LockManager] Stale lock: PID " << holder->pid
                   << " is not running, discarding " << lock_path_;
    } else {
      PLOG_WARNING << "[LockManager] Stale lock: unreadable record, "
                      "discarding "
                   << lock_path_;
    }
    removeLockFile();
    result.discarded_stale = true;
  }

  throw SupervisorError(SupervisorErrorCode::StaleLock,
                        "Could not clear stale lock " + lock_path_);
}

bool LockManager::release() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!owned_) {
    return false;
  }
  owned_.reset();

  try {
    TakeoverGuard guard(guardPath());
    auto current = readLock();
    if (!current) {
      return false;
    }
    if (current->pid != getpid()) {
      PLOG_WARNING << "[LockManager] Lock now belongs to PID " << current->pid
                   << ", leaving it in place";
      return false;
    }
    removeLockFile();
  } catch (const SupervisorError &e) {
    PLOG_ERROR << "[LockManager] " << e.what();
    return false;
  }
  PLOG_INFO << "[LockManager] Released " << lock_path_;
  return true;
}

bool LockManager::recordPort(int port) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!owned_) {
    return false;
  }

  InstanceLock updated = *owned_;
  updated.port = port;

  // Write beside the lock and rename over it; readers never see a
  // partially written record.
  std::string tmp_path = lock_path_ + "." + std::to_string(getpid()) + ".port";
  writeFile(tmp_path, updated);
  if (std::rename(tmp_path.c_str(), lock_path_.c_str()) != 0) {
    int err = errno;
    std::remove(tmp_path.c_str());
    throw SupervisorError(SupervisorErrorCode::LockIoFailure,
                          "Cannot update lock " + lock_path_ + ": " +
                              strerror(err));
  }

  owned_ = updated;
  return true;
}

std::optional<InstanceLock> LockManager::readLock() const {
  std::ifstream file(lock_path_);
  if (!file.is_open()) {
    return std::nullopt;
  }

  Json::CharReaderBuilder builder;
  Json::Value json;
  std::string errors;
  if (!Json::parseFromStream(builder, file, &json, &errors)) {
    PLOG_DEBUG << "[LockManager] Cannot parse " << lock_path_ << ": "
               << errors;
    return std::nullopt;
  }
  return InstanceLock::fromJson(json);
}

std::optional<InstanceLock> LockManager::liveInstance() const {
  auto lock = readLock();
  if (lock && isProcessAlive(lock->pid)) {
    return lock;
  }
  return std::nullopt;
}

bool LockManager::discardIfStale() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (!std::filesystem::exists(lock_path_)) {
    return false;
  }
  TakeoverGuard guard(guardPath());
  auto holder = readLock();
  if (holder && isProcessAlive(holder->pid)) {
    return false;
  }
  PLOG_INFO << "[LockManager] Removing stale lock " << lock_path_;
  removeLockFile();
  return true;
}

bool LockManager::isOwned() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return owned_.has_value();
}

LockManager::ClaimResult LockManager::tryCreate(const InstanceLock &lock) {
  std::string tmp_path = lock_path_ + "." + std::to_string(lock.pid) + ".tmp";
  writeFile(tmp_path, lock);

  int rc = link(tmp_path.c_str(), lock_path_.c_str());
  int err = errno;
  std::remove(tmp_path.c_str());

  if (rc == 0) {
    return ClaimResult::Created;
  }
  if (err == EEXIST) {
    return ClaimResult::Exists;
  }
  throw SupervisorError(SupervisorErrorCode::LockIoFailure,
                        "Cannot create lock " + lock_path_ + ": " +
                            strerror(err));
}

void LockManager::writeFile(const std::string &path,
                            const InstanceLock &lock) const {
  std::ofstream file(path, std::ios::trunc);
  if (!file.is_open()) {
    throw SupervisorError(SupervisorErrorCode::LockIoFailure,
                          "Cannot open " + path + " for writing: " +
                              strerror(errno));
  }

  Json::StreamWriterBuilder builder;
  builder["indentation"] = "  ";
  file << Json::writeString(builder, lock.toJson()) << "\n";
  file.flush();
  if (!file.good()) {
    file.close();
    std::remove(path.c_str());
    throw SupervisorError(SupervisorErrorCode::LockIoFailure,
                          "Failed writing " + path);
  }
}

void LockManager::removeLockFile() {
  if (std::remove(lock_path_.c_str()) != 0 && errno != ENOENT) {
    throw SupervisorError(SupervisorErrorCode::LockIoFailure,
                          "Cannot remove " + lock_path_ + ": " +
                              strerror(errno));
  }
}

} // namespace supervisor
