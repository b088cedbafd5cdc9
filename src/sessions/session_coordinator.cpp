#include "sessions/session_coordinator.h"
#include "core/time_format.h"
#include "supervisor/port_negotiator.h"
#include "supervisor/supervisor_error.h"
#include <plog/Log.h>
#include <stdexcept>

namespace sessions {

using supervisor::SupervisorError;
using supervisor::SupervisorErrorCode;

SessionCoordinator::SessionCoordinator(IBrowserLauncher &launcher,
                                       IDevToolsClient &devtools,
                                       Options options)
    : launcher_(launcher), devtools_(devtools), options_(std::move(options)) {}

SessionCoordinator::~SessionCoordinator() {
  std::unique_lock<std::mutex> lock(mutex_);
  if (in_flight_ > 0) {
    PLOG_INFO << "[SessionCoordinator] Waiting for " << in_flight_
              << " running request(s)";
  }
  idle_cv_.wait(lock, [this]() { return in_flight_ == 0; });
}

SessionCoordinator::InFlightGuard::InFlightGuard(SessionCoordinator &owner)
    : owner_(owner) {
  std::lock_guard<std::mutex> lock(owner_.mutex_);
  ++owner_.in_flight_;
}

SessionCoordinator::InFlightGuard::~InFlightGuard() {
  std::lock_guard<std::mutex> lock(owner_.mutex_);
  if (--owner_.in_flight_ == 0) {
    owner_.idle_cv_.notify_all();
  }
}

std::string SessionCoordinator::makeSessionId(const std::string &purpose,
                                              const std::string &persona) {
  return purpose + "_" + persona + "_" +
         std::to_string(
             TimeFormat::epochMillis(std::chrono::system_clock::now())) +
         "_" + std::to_string(++sequence_);
}

DebugSession SessionCoordinator::requestSession(const std::string &purpose,
                                                const std::string &persona) {
  if (purpose.empty() || persona.empty()) {
    throw std::invalid_argument("purpose and persona must not be empty");
  }

  InFlightGuard in_flight(*this);
  const SessionKey key(purpose, persona);

  while (true) {
    std::shared_ptr<Entry> entry;
    std::promise<void> launched;

    {
      std::unique_lock<std::mutex> lock(mutex_);
      if (closed_) {
        throw SupervisorError(SupervisorErrorCode::SessionLaunchFailure,
                              "Supervisor is shutting down");
      }
      auto it = registry_.find(key);
      if (it != registry_.end()) {
        std::shared_ptr<Entry> existing = it->second;
        if (existing->session.status == SessionStatus::Active) {
          existing->session.last_activity_at =
              std::chrono::system_clock::now();
          PLOG_INFO << "[SessionCoordinator] Reusing session "
                    << existing->session.session_id << " (port "
                    << existing->session.port << ") for " << purpose << "/"
                    << persona;
          return existing->session;
        }

        // Another request is launching this key; wait for it, then look
        // again.
        std::shared_future<void> ready = existing->ready;
        lock.unlock();
        PLOG_DEBUG << "[SessionCoordinator] Waiting for pending session "
                   << existing->session.session_id;
        ready.wait();
        continue;
      }

      int port = allocatePortLocked();

      entry = std::make_shared<Entry>();
      entry->key = key;
      entry->session.session_id = makeSessionId(purpose, persona);
      entry->session.purpose = purpose;
      entry->session.persona = persona;
      entry->session.port = port;
      entry->session.status = SessionStatus::Pending;
      entry->session.created_at = std::chrono::system_clock::now();
      entry->session.last_activity_at = entry->session.created_at;
      entry->ready = launched.get_future().share();

      registry_[key] = entry;
      ports_in_use_.insert(port);
    }

    PLOG_INFO << "[SessionCoordinator] Creating session "
              << entry->session.session_id << " on port "
              << entry->session.port;

    try {
      DebugSession session = launchEntry(entry);
      launched.set_value();
      return session;
    } catch (const std::exception &) {
      // Waiters must wake up and retry; the error goes to this caller.
      launched.set_value();
      throw;
    }
  }
}

DebugSession SessionCoordinator::launchEntry(const std::shared_ptr<Entry> &entry) {
  BrowserLaunchRequest request;
  request.session_id = entry->session.session_id;
  request.purpose = entry->session.purpose;
  request.persona = entry->session.persona;
  request.debug_port = entry->session.port;

  auto abandon = [this, &entry]() {
    std::lock_guard<std::mutex> lock(mutex_);
    removeLocked(entry);
  };

  BrowserHandle handle;
  try {
    handle = launcher_.launch(request);
  } catch (const SupervisorError &e) {
    PLOG_ERROR << "[SessionCoordinator] Launch failed for "
               << request.session_id << ": " << e.what();
    abandon();
    throw;
  } catch (const std::exception &e) {
    PLOG_ERROR << "[SessionCoordinator] Launch failed for "
               << request.session_id << ": " << e.what();
    abandon();
    throw SupervisorError(SupervisorErrorCode::SessionLaunchFailure, e.what());
  }

  auto discardBrowser = [this, &handle]() {
    try {
      launcher_.terminate(handle);
    } catch (const std::exception &e) {
      PLOG_WARNING << "[SessionCoordinator] Could not stop browser PID "
                   << handle.pid << ": " << e.what();
    }
  };

  auto isCancelled = [this, &entry]() {
    std::lock_guard<std::mutex> lock(mutex_);
    return entry->cancelled;
  };

  if (!isCancelled() &&
      !devtools_.waitUntilReady(request.debug_port, options_.launch_timeout)) {
    PLOG_ERROR << "[SessionCoordinator] "
               << toString(SupervisorErrorCode::SessionLaunchFailure)
               << ": debug port " << request.debug_port
               << " did not answer within " << options_.launch_timeout.count()
               << "ms";
    discardBrowser();
    abandon();
    throw SupervisorError(SupervisorErrorCode::SessionLaunchFailure,
                          "Browser for session " + request.session_id +
                              " did not become ready on port " +
                              std::to_string(request.debug_port));
  }

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!entry->cancelled) {
      entry->handle = handle;
      entry->session.browser_pid = handle.pid;
      entry->session.user_data_dir = handle.user_data_dir;
      entry->session.status = SessionStatus::Active;
      entry->session.last_activity_at = std::chrono::system_clock::now();
      PLOG_INFO << "[SessionCoordinator] Session "
                << entry->session.session_id << " active (browser PID "
                << handle.pid << ", port " << entry->session.port << ")";
      return entry->session;
    }
  }

  PLOG_INFO << "[SessionCoordinator] Session " << request.session_id
            << " was torn down during launch";
  discardBrowser();
  abandon();
  throw SupervisorError(SupervisorErrorCode::SessionLaunchFailure,
                        "Session " + request.session_id +
                            " was torn down during launch");
}

bool SessionCoordinator::teardown(const std::string &session_id) {
  InFlightGuard in_flight(*this);
  std::shared_ptr<Entry> entry;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    entry = findByIdLocked(session_id);
    if (!entry) {
      PLOG_DEBUG << "[SessionCoordinator] Teardown of unknown session "
                 << session_id << " ignored";
      return false;
    }

    if (entry->session.status == SessionStatus::Pending) {
      // The launching request owns the browser and the port until it
      // notices the cancellation.
      entry->cancelled = true;
      registry_.erase(entry->key);
      return true;
    }

    removeLocked(entry);
    entry->session.status = SessionStatus::Closed;
  }

  bool stopped = launcher_.terminate(entry->handle);
  if (stopped) {
    PLOG_INFO << "[SessionCoordinator] Session " << session_id
              << " torn down (port " << entry->session.port << " released)";
  } else {
    PLOG_WARNING << "[SessionCoordinator] Session " << session_id
                 << " closed but browser PID " << entry->handle.pid
                 << " did not exit";
  }
  return true;
}

size_t SessionCoordinator::emergencyShutdownAll() {
  std::vector<std::shared_ptr<Entry>> active;
  std::vector<std::shared_ptr<Entry>> pending;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &[key, entry] : registry_) {
      if (entry->session.status == SessionStatus::Pending) {
        // The launching request stops the browser and frees the port
        entry->cancelled = true;
        pending.push_back(entry);
        continue;
      }
      entry->session.status = SessionStatus::Closed;
      ports_in_use_.erase(entry->session.port);
      active.push_back(entry);
    }
    registry_.clear();
  }

  if (active.empty() && pending.empty()) {
    return 0;
  }

  PLOG_INFO << "[SessionCoordinator] Emergency shutdown of " << active.size()
            << " session(s), " << pending.size() << " launch(es) in progress";

  size_t failures = 0;
  for (const auto &entry : active) {
    try {
      if (!launcher_.terminate(entry->handle)) {
        ++failures;
      }
    } catch (const std::exception &e) {
      PLOG_ERROR << "[SessionCoordinator] Failed to stop session "
                 << entry->session.session_id << ": " << e.what();
      ++failures;
    }
  }

  const auto pending_wait =
      options_.launch_timeout + options_.pending_stop_grace;
  for (const auto &entry : pending) {
    if (entry->ready.wait_for(pending_wait) != std::future_status::ready) {
      PLOG_ERROR << "[SessionCoordinator] Launch of "
                 << entry->session.session_id << " did not stop within "
                 << pending_wait.count() << "ms";
      ++failures;
    }
  }
  return failures;
}

void SessionCoordinator::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!closed_) {
    closed_ = true;
    PLOG_INFO << "[SessionCoordinator] No longer accepting session requests";
  }
}

bool SessionCoordinator::isClosed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::optional<DebugSession>
SessionCoordinator::findSession(const std::string &session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto entry = findByIdLocked(session_id);
  if (!entry) {
    return std::nullopt;
  }
  return entry->session;
}

std::vector<DebugSession> SessionCoordinator::listSessions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DebugSession> result;
  result.reserve(registry_.size());
  for (const auto &[key, entry] : registry_) {
    result.push_back(entry->session);
  }
  return result;
}

size_t SessionCoordinator::sessionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return registry_.size();
}

Json::Value SessionCoordinator::getSessionSummary() const {
  std::lock_guard<std::mutex> lock(mutex_);

  Json::Value summary;
  summary["totalSessions"] = static_cast<Json::UInt64>(registry_.size());
  summary["byPurpose"] = Json::Value(Json::objectValue);
  summary["byPersona"] = Json::Value(Json::objectValue);
  summary["activePorts"] = Json::Value(Json::arrayValue);
  summary["sessions"] = Json::Value(Json::arrayValue);

  for (const auto &[key, entry] : registry_) {
    const DebugSession &session = entry->session;
    summary["byPurpose"][session.purpose] =
        summary["byPurpose"].get(session.purpose, 0).asInt() + 1;
    summary["byPersona"][session.persona] =
        summary["byPersona"].get(session.persona, 0).asInt() + 1;
    summary["sessions"].append(session.toJson());
  }
  for (int port : ports_in_use_) {
    summary["activePorts"].append(port);
  }
  return summary;
}

bool SessionCoordinator::activateSession(const std::string &session_id) {
  InFlightGuard in_flight(*this);
  int port = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entry = findByIdLocked(session_id);
    if (!entry || entry->session.status != SessionStatus::Active) {
      throw SupervisorError(SupervisorErrorCode::SessionNotFound,
                            "No active session " + session_id);
    }
    entry->session.last_activity_at = std::chrono::system_clock::now();
    port = entry->session.port;
  }

  auto targets = devtools_.listTargets(port);
  if (!targets) {
    PLOG_WARNING << "[SessionCoordinator] Session " << session_id
                 << " does not answer on port " << port;
    return false;
  }

  for (const auto &target : *targets) {
    if (target.type == "page") {
      PLOG_INFO << "[SessionCoordinator] Activating target " << target.id
                << " of session " << session_id;
      return devtools_.activateTarget(port, target.id);
    }
  }
  PLOG_WARNING << "[SessionCoordinator] Session " << session_id
               << " has no page target";
  return false;
}

bool SessionCoordinator::anyBrowserReachable() {
  std::vector<int> ports;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[key, entry] : registry_) {
      if (entry->session.status == SessionStatus::Active) {
        ports.push_back(entry->session.port);
      }
    }
  }

  for (int port : ports) {
    if (devtools_.listTargets(port)) {
      return true;
    }
  }
  return false;
}

size_t SessionCoordinator::pruneUnreachable(std::chrono::milliseconds min_age) {
  std::vector<DebugSession> candidates;
  auto now = std::chrono::system_clock::now();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto &[key, entry] : registry_) {
      if (entry->session.status == SessionStatus::Active &&
          now - entry->session.created_at >= min_age) {
        candidates.push_back(entry->session);
      }
    }
  }

  size_t pruned = 0;
  for (const auto &session : candidates) {
    if (devtools_.listTargets(session.port)) {
      continue;
    }
    PLOG_INFO << "[SessionCoordinator] Session " << session.session_id
              << " unreachable on port " << session.port << ", removing";
    try {
      if (teardown(session.session_id)) {
        ++pruned;
      }
    } catch (const std::exception &e) {
      PLOG_WARNING << "[SessionCoordinator] Prune of " << session.session_id
                   << " failed: " << e.what();
      ++pruned;
    }
  }
  return pruned;
}

int SessionCoordinator::allocatePortLocked() {
  for (int port = options_.port_range_start; port <= options_.port_range_end;
       ++port) {
    if (ports_in_use_.count(port) > 0) {
      continue;
    }
    if (supervisor::PortNegotiator::probe(options_.host, port).free) {
      return port;
    }
  }
  throw SupervisorError(SupervisorErrorCode::SessionLaunchFailure,
                        "No free debug port in [" +
                            std::to_string(options_.port_range_start) + ", " +
                            std::to_string(options_.port_range_end) + "]");
}

std::shared_ptr<SessionCoordinator::Entry>
SessionCoordinator::findByIdLocked(const std::string &session_id) const {
  for (const auto &[key, entry] : registry_) {
    if (entry->session.session_id == session_id) {
      return entry;
    }
  }
  return nullptr;
}

void SessionCoordinator::removeLocked(const std::shared_ptr<Entry> &entry) {
  auto it = registry_.find(entry->key);
  if (it != registry_.end() && it->second == entry) {
    registry_.erase(it);
  }
  ports_in_use_.erase(entry->session.port);
}

} // namespace sessions
