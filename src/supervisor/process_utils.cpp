#include "supervisor/process_utils.h"
#include "core/bounded_retry.h"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fstream>
#include <plog/Log.h>
#include <string>
#include <sys/wait.h>
#include <unistd.h>

namespace supervisor {

namespace {

bool isZombie(pid_t pid) {
  std::ifstream stat_file("/proc/" + std::to_string(pid) + "/stat");
  if (!stat_file.is_open()) {
    return false;
  }
  std::string line;
  std::getline(stat_file, line);

  // Format: pid (comm) state ...; comm may contain spaces and parentheses
  auto close_paren = line.rfind(')');
  if (close_paren == std::string::npos || close_paren + 2 >= line.size()) {
    return false;
  }
  return line[close_paren + 2] == 'Z';
}

void reapIfChild(pid_t pid) {
  int status = 0;
  // ECHILD for processes we did not spawn; nothing to reap then.
  waitpid(pid, &status, WNOHANG);
}

} // namespace

bool isProcessAlive(pid_t pid) {
  if (pid <= 0) {
    return false;
  }
  if (kill(pid, 0) != 0 && errno != EPERM) {
    return false;
  }
  return !isZombie(pid);
}

TerminationOutcome terminateProcess(pid_t pid,
                                    std::chrono::milliseconds grace) {
  if (!isProcessAlive(pid)) {
    reapIfChild(pid);
    return TerminationOutcome::AlreadyGone;
  }

  auto gone = [pid]() {
    reapIfChild(pid);
    return !isProcessAlive(pid);
  };

  PLOG_INFO << "[Process] Sending SIGTERM to PID " << pid;
  if (kill(pid, SIGTERM) != 0) {
    if (errno == ESRCH) {
      return TerminationOutcome::AlreadyGone;
    }
    PLOG_WARNING << "[Process] SIGTERM to PID " << pid
                 << " failed: " << strerror(errno);
  }

  BoundedRetry graceful_wait;
  graceful_wait.timeout = grace;
  if (graceful_wait.waitUntil(gone)) {
    return TerminationOutcome::Graceful;
  }

  PLOG_WARNING << "[Process] PID " << pid << " still alive after "
               << grace.count() << "ms, sending SIGKILL";
  if (kill(pid, SIGKILL) != 0 && errno != ESRCH) {
    PLOG_ERROR << "[Process] SIGKILL to PID " << pid
               << " failed: " << strerror(errno);
    return TerminationOutcome::Failed;
  }

  BoundedRetry forced_wait;
  forced_wait.timeout = std::chrono::milliseconds(1000);
  forced_wait.initial_backoff = std::chrono::milliseconds(10);
  if (forced_wait.waitUntil(gone)) {
    return TerminationOutcome::Forced;
  }
  return TerminationOutcome::Failed;
}

const char *toString(TerminationOutcome outcome) {
  switch (outcome) {
  case TerminationOutcome::AlreadyGone:
    return "already gone";
  case TerminationOutcome::Graceful:
    return "graceful";
  case TerminationOutcome::Forced:
    return "forced";
  case TerminationOutcome::Failed:
    return "failed";
  }
  return "unknown";
}

} // namespace supervisor
