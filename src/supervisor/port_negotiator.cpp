#include "supervisor/port_negotiator.h"
#include "core/bounded_retry.h"
#include "supervisor/process_utils.h"
#include "supervisor/supervisor_error.h"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <plog/Log.h>
#include <sys/socket.h>
#include <unistd.h>

namespace supervisor {

PortNegotiator::PortNegotiator() : PortNegotiator(Options{}) {}

PortNegotiator::PortNegotiator(Options options) : options_(options) {
  if (options_.max_attempts < 1) {
    options_.max_attempts = 1;
  }
}

PortProbeResult PortNegotiator::probe(const std::string &host, int port) {
  PortProbeResult result;
  result.port = port;

  if (port < 1 || port > 65535) {
    return result;
  }

  int sock = socket(AF_INET, SOCK_STREAM, 0);
  if (sock < 0) {
    PLOG_WARNING << "[PortNegotiator] socket() failed while probing " << port;
    return result;
  }

  // Same option Drogon sets on its listener, so TIME_WAIT remnants of a
  // previous instance do not count as occupied.
  int opt = 1;
  setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  struct sockaddr_in addr {};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port));
  if (host.empty() || host == "0.0.0.0") {
    addr.sin_addr.s_addr = INADDR_ANY;
  } else if (inet_pton(AF_INET, host.c_str(), &addr.sin_addr) <= 0) {
    addr.sin_addr.s_addr = INADDR_ANY;
  }

  result.free =
      (bind(sock, reinterpret_cast<struct sockaddr *>(&addr), sizeof(addr)) ==
       0);
  close(sock);
  return result;
}

std::optional<int> PortNegotiator::findFreePort(const std::string &host,
                                                int first, int attempts,
                                                const std::set<int> &excluded) {
  for (int i = 0; i < attempts; ++i) {
    int candidate = first + i;
    if (candidate > 65535) {
      break;
    }
    if (excluded.count(candidate) > 0) {
      continue;
    }
    if (probe(host, candidate).free) {
      return candidate;
    }
  }
  return std::nullopt;
}

int PortNegotiator::securePort(int preferred, const PortRequest &request) {
  if (probe(request.host, preferred).free) {
    PLOG_INFO << "[PortNegotiator] Port " << preferred << " is free";
    return preferred;
  }

  bool own_instance = request.prior_instance &&
                      isProcessAlive(request.prior_instance->pid) &&
                      (!request.prior_instance->port ||
                       *request.prior_instance->port == preferred);

  if (own_instance) {
    if (request.stay_alive) {
      throw SupervisorError(
          SupervisorErrorCode::PortConflictStayAlive,
          "Port " + std::to_string(preferred) +
              " is held by running instance PID " +
              std::to_string(request.prior_instance->pid) +
              " and --stay-alive was requested");
    }

    PLOG_INFO << "[PortNegotiator] "
              << toString(SupervisorErrorCode::PortConflictOwnReplaceable)
              << ": port " << preferred << " held by previous instance PID "
              << request.prior_instance->pid << ", replacing it";
    replaceInstance(*request.prior_instance);

    if (waitForPortFree(request.host, preferred)) {
      PLOG_INFO << "[PortNegotiator] Port " << preferred
                << " reclaimed from previous instance";
      return preferred;
    }
    PLOG_WARNING << "[PortNegotiator] Port " << preferred
                 << " still busy after replacement, searching onwards";
  } else if (request.stay_alive) {
    // Foreign occupant: stay-alive does not forbid moving to another port.
    PLOG_INFO << "[PortNegotiator] Port " << preferred
              << " busy (not ours), searching onwards";
  } else {
    PLOG_INFO << "[PortNegotiator] "
              << toString(SupervisorErrorCode::PortConflictForeign)
              << ": port " << preferred << " busy, searching onwards";
  }

  auto found = findFreePort(request.host, preferred + 1,
                            options_.max_attempts - 1, {preferred});
  if (found) {
    PLOG_INFO << "[PortNegotiator] Using port " << *found << " (preferred "
              << preferred << " was busy)";
    return *found;
  }

  throw SupervisorError(SupervisorErrorCode::PortExhausted,
                        "No free port in [" + std::to_string(preferred) +
                            ", " +
                            std::to_string(preferred + options_.max_attempts -
                                           1) +
                            "]");
}

bool PortNegotiator::replaceInstance(const InstanceLock &prior) {
  PLOG_INFO << "[PortNegotiator] Sending SIGTERM to previous instance PID "
            << prior.pid << " (grace " << options_.replacement_grace.count()
            << "ms)";
  TerminationOutcome outcome =
      terminateProcess(prior.pid, options_.replacement_grace);
  PLOG_INFO << "[PortNegotiator] Previous instance PID " << prior.pid << ": "
            << toString(outcome);
  return outcome != TerminationOutcome::Failed;
}

bool PortNegotiator::waitForPortFree(const std::string &host, int port) const {
  BoundedRetry retry;
  retry.timeout = std::chrono::milliseconds(1000);
  return retry.waitUntil([&]() { return probe(host, port).free; });
}

} // namespace supervisor
