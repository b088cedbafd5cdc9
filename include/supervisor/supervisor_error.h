#pragma once

#include <stdexcept>
#include <string>

namespace supervisor {

/**
 * @brief Failure classes of the supervisor
 *
 * Recoverable codes (StaleLock, PortConflictForeign,
 * PortConflictOwnReplaceable, ShutdownTimeout, HealthCheckError) are handled
 * where they occur and only appear in logs. The others are thrown as
 * SupervisorError.
 */
enum class SupervisorErrorCode {
  StaleLock,
  PortConflictForeign,
  PortConflictOwnReplaceable,
  PortConflictStayAlive,
  PortExhausted,
  LockIoFailure,
  ShutdownTimeout,
  SessionLaunchFailure,
  SessionNotFound,
  HealthCheckError,
  InvalidCommand
};

/**
 * @brief Name of an error code, as used in logs and JSON error bodies
 */
const char *toString(SupervisorErrorCode code);

/**
 * @brief Process exit status for a fatal error of the given code
 *
 * A stay-alive conflict is a clean exit (0); every other fatal error is 1.
 */
int exitCodeFor(SupervisorErrorCode code);

class SupervisorError : public std::runtime_error {
public:
  SupervisorError(SupervisorErrorCode code, const std::string &message)
      : std::runtime_error(message), code_(code) {}

  SupervisorErrorCode code() const { return code_; }

private:
  SupervisorErrorCode code_;
};

} // namespace supervisor
