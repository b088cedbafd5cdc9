#include "cli/command_runner.h"
#include "core/bounded_retry.h"
#include "core/time_format.h"
#include "supervisor/process_utils.h"
#include "supervisor/supervisor_error.h"
#include <filesystem>
#include <plog/Log.h>

namespace cli {

Json::Value InstanceStatus::toJson() const {
  Json::Value json;
  json["running"] = running;
  json["staleLock"] = stale_lock;
  if (lock) {
    json["pid"] = static_cast<Json::Int>(lock->pid);
    json["version"] = lock->version;
    json["startTime"] = TimeFormat::toIso8601(lock->start_time);
    if (lock->port) {
      json["port"] = *lock->port;
    }
  }
  return json;
}

InstanceStatus queryStatus(const supervisor::LockManager &lock) {
  InstanceStatus status;
  status.lock = lock.readLock();
  if (status.lock && supervisor::isProcessAlive(status.lock->pid)) {
    status.running = true;
  } else {
    status.stale_lock =
        status.lock.has_value() || std::filesystem::exists(lock.lockPath());
  }
  return status;
}

int runStatus(const supervisor::LockManager &lock, const StatusCommand &cmd,
              std::ostream &out) {
  InstanceStatus status = queryStatus(lock);

  if (cmd.json) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    out << Json::writeString(builder, status.toJson()) << std::endl;
    return 0;
  }

  if (status.running) {
    out << "Running: PID " << status.lock->pid;
    if (status.lock->port) {
      out << ", port " << *status.lock->port;
    }
    out << ", version " << status.lock->version << ", started "
        << TimeFormat::toIso8601(status.lock->start_time) << std::endl;
  } else if (status.stale_lock) {
    out << "Not running (stale lock at " << lock.lockPath() << ")"
        << std::endl;
  } else {
    out << "Not running" << std::endl;
  }
  return 0;
}

int runStop(supervisor::LockManager &lock, std::ostream &out,
            std::chrono::milliseconds grace) {
  auto live = lock.liveInstance();
  if (!live) {
    if (lock.discardIfStale()) {
      out << "Not running (removed stale lock)" << std::endl;
    } else {
      out << "Not running" << std::endl;
    }
    return 0;
  }

  PLOG_INFO << "[CLI] Stopping instance PID " << live->pid;
  out << "Stopping PID " << live->pid << "..." << std::endl;

  auto outcome = supervisor::terminateProcess(live->pid, grace);
  if (outcome == supervisor::TerminationOutcome::Failed) {
    out << "PID " << live->pid << " did not exit" << std::endl;
    return 1;
  }

  // A gracefully stopped instance removes its own lock; give it a moment
  // before treating the file as left behind.
  BoundedRetry retry;
  retry.timeout = std::chrono::milliseconds(1000);
  bool removed_by_owner = retry.waitUntil(
      [&lock]() { return !std::filesystem::exists(lock.lockPath()); });
  if (!removed_by_owner && lock.discardIfStale()) {
    PLOG_INFO << "[CLI] Removed lock left by PID " << live->pid;
  }

  out << "Stopped (" << supervisor::toString(outcome) << ")" << std::endl;
  return 0;
}

} // namespace cli
