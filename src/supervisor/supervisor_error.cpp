#include "supervisor/supervisor_error.h"

namespace supervisor {

const char *toString(SupervisorErrorCode code) {
  switch (code) {
  case SupervisorErrorCode::StaleLock:
    return "StaleLock";
  case SupervisorErrorCode::PortConflictForeign:
    return "PortConflictForeign";
  case SupervisorErrorCode::PortConflictOwnReplaceable:
    return "PortConflictOwnReplaceable";
  case SupervisorErrorCode::PortConflictStayAlive:
    return "PortConflictStayAlive";
  case SupervisorErrorCode::PortExhausted:
    return "PortExhausted";
  case SupervisorErrorCode::LockIoFailure:
    return "LockIoFailure";
  case SupervisorErrorCode::ShutdownTimeout:
    return "ShutdownTimeout";
  case SupervisorErrorCode::SessionLaunchFailure:
    return "SessionLaunchFailure";
  case SupervisorErrorCode::SessionNotFound:
    return "SessionNotFound";
  case SupervisorErrorCode::HealthCheckError:
    return "HealthCheckError";
  case SupervisorErrorCode::InvalidCommand:
    return "InvalidCommand";
  }
  return "Unknown";
}

int exitCodeFor(SupervisorErrorCode code) {
  if (code == SupervisorErrorCode::PortConflictStayAlive) {
    return 0;
  }
  return 1;
}

} // namespace supervisor
