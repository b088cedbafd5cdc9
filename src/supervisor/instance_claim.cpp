#include "supervisor/instance_claim.h"
#include "supervisor/process_utils.h"
#include "supervisor/supervisor_error.h"
#include <plog/Log.h>

namespace supervisor {

ClaimResult claimInstance(LockManager &lock, PortNegotiator &ports,
                          int preferred_port, const std::string &host,
                          bool stay_alive) {
  ClaimResult result;

  LockAcquisition acquisition = lock.acquire();
  std::optional<InstanceLock> prior;

  if (acquisition.status == LockStatus::Conflict) {
    const InstanceLock &holder = acquisition.lock;

    if (stay_alive) {
      PLOG_INFO << "[LockManager] Instance already running (PID " << holder.pid
                << (holder.port ? ", port " + std::to_string(*holder.port)
                                : std::string())
                << "), --stay-alive set: leaving it alone";
      result.proceed = false;
      result.exit_code =
          exitCodeFor(SupervisorErrorCode::PortConflictStayAlive);
      return result;
    }

    prior = holder;
    if (!holder.port || *holder.port != preferred_port) {
      // It will not free the preferred port by itself; replace it now so the
      // lock can be taken over.
      if (!ports.replaceInstance(holder)) {
        throw SupervisorError(SupervisorErrorCode::LockIoFailure,
                              "Previous instance PID " +
                                  std::to_string(holder.pid) +
                                  " survived SIGKILL");
      }
      result.replaced_pid = holder.pid;
      prior.reset();
    }
  }

  PortRequest request;
  request.host = host;
  request.stay_alive = stay_alive;
  request.prior_instance = prior;
  result.port = ports.securePort(preferred_port, request);

  if (prior && !isProcessAlive(prior->pid)) {
    result.replaced_pid = prior->pid;
  }

  if (acquisition.status == LockStatus::Conflict) {
    if (prior && isProcessAlive(prior->pid)) {
      // Held the lock but not our port; it has to go before we can own the
      // lock.
      if (!ports.replaceInstance(*prior)) {
        throw SupervisorError(SupervisorErrorCode::LockIoFailure,
                              "Previous instance PID " +
                                  std::to_string(prior->pid) +
                                  " survived SIGKILL");
      }
      result.replaced_pid = prior->pid;
    }

    // The replaced instance removes its lock while shutting down; a killed
    // one leaves a stale lock that acquire() discards.
    LockAcquisition second = lock.acquire();
    if (second.status != LockStatus::Owned) {
      throw SupervisorError(SupervisorErrorCode::LockIoFailure,
                            "Another instance (PID " +
                                std::to_string(second.lock.pid) +
                                ") claimed the lock during replacement");
    }
  }

  lock.recordPort(result.port);
  result.proceed = true;
  result.exit_code = 0;

  PLOG_INFO << "[LockManager] Instance claimed, service port " << result.port;
  return result;
}

ClaimGuard::~ClaimGuard() {
  if (lock_.isOwned()) {
    PLOG_WARNING << "[LockManager] Leaving without shutdown, releasing "
                 << lock_.lockPath();
    lock_.release();
  }
}

} // namespace supervisor
