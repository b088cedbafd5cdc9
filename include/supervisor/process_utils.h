#pragma once

#include <chrono>
#include <sys/types.h>

namespace supervisor {

/**
 * @brief Liveness probe used by every "is that instance still there" check
 *
 * kill(pid, 0) succeeds (or fails with EPERM) for an existing process.
 * Zombies are reported dead: they hold no sockets and will never release a
 * lock themselves.
 */
bool isProcessAlive(pid_t pid);

/**
 * @brief Result of terminateProcess()
 */
enum class TerminationOutcome {
  AlreadyGone, // process did not exist
  Graceful,    // exited after SIGTERM within the grace window
  Forced,      // needed SIGKILL
  Failed       // still alive after SIGKILL (or signalling was denied)
};

/**
 * @brief Graceful-then-forceful termination
 *
 * Sends SIGTERM, polls (with backoff) until the process is gone or the
 * grace window expires, then sends SIGKILL and waits briefly. Child
 * processes of the caller are reaped so they do not linger as zombies.
 *
 * @param pid Process to terminate
 * @param grace Time allowed for a cooperative exit
 */
TerminationOutcome
terminateProcess(pid_t pid,
                 std::chrono::milliseconds grace = std::chrono::seconds(5));

const char *toString(TerminationOutcome outcome);

} // namespace supervisor
