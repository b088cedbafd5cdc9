#pragma once

#include "sessions/browser_launcher.h"
#include "sessions/debug_session.h"
#include "sessions/devtools_client.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <future>
#include <json/json.h>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace sessions {

/**
 * @brief Registry of debug sessions keyed by (purpose, persona)
 *
 * Identical keys share one browser; distinct keys get their own browser on
 * their own port. The first request for a key inserts a pending entry under
 * the registry mutex before anything is launched, so concurrent first
 * requests cannot both launch: the later ones wait for the pending entry and
 * reuse it (or retry if its launch failed).
 *
 * Launch failures are thrown as SupervisorError(SessionLaunchFailure) to the
 * requester only; other sessions are unaffected.
 */
class SessionCoordinator {
public:
  /// (purpose, persona); compared field by field so no two pairs collide
  using SessionKey = std::pair<std::string, std::string>;

  struct Options {
    int port_range_start = 9222;
    int port_range_end = 9232;
    /// Interface the debug ports are probed on
    std::string host = "127.0.0.1";
    std::chrono::milliseconds launch_timeout{10000};
    /// Extra time a pending launch gets to stop its browser at shutdown
    std::chrono::milliseconds pending_stop_grace{5000};
  };

  SessionCoordinator(IBrowserLauncher &launcher, IDevToolsClient &devtools,
                     Options options);
  /// Blocks until requests still running on other threads have returned
  ~SessionCoordinator();

  SessionCoordinator(const SessionCoordinator &) = delete;
  SessionCoordinator &operator=(const SessionCoordinator &) = delete;

  /**
   * @brief Get the session for (purpose, persona), launching one if needed
   *
   * Reuse refreshes last_activity_at and returns the same session id and
   * port.
   *
   * @throws std::invalid_argument if purpose or persona is empty
   * @throws SupervisorError SessionLaunchFailure, also after close()
   */
  DebugSession requestSession(const std::string &purpose,
                              const std::string &persona);

  /**
   * @brief Close one session and remove it from the registry
   *
   * Unknown or already closed ids are a no-op. If stopping the browser
   * throws, the registry is already cleaned up and the exception is
   * propagated.
   *
   * @return true if a session was torn down
   */
  bool teardown(const std::string &session_id);

  /**
   * @brief Tear down every session, best effort
   *
   * Pending launches are cancelled and waited for (launch timeout plus
   * pending_stop_grace) so that their browsers are stopped before this
   * returns.
   *
   * @return Number of sessions whose browser could not be stopped
   */
  size_t emergencyShutdownAll();

  /**
   * @brief Refuse new sessions from now on
   *
   * Called before the final emergencyShutdownAll() at process shutdown, so
   * that requests waiting on a cancelled launch do not start another browser.
   */
  void close();
  bool isClosed() const;

  std::optional<DebugSession> findSession(const std::string &session_id) const;
  std::vector<DebugSession> listSessions() const;
  size_t sessionCount() const;

  /**
   * @brief Totals, per-purpose and per-persona counts, allocated ports and
   * the session list
   */
  Json::Value getSessionSummary() const;

  /**
   * @brief Bring the session's first page target to the foreground
   * @throws SupervisorError SessionNotFound
   */
  bool activateSession(const std::string &session_id);

  /**
   * @brief True if the listing endpoint of any active session answers
   */
  bool anyBrowserReachable();

  /**
   * @brief Tear down sessions older than min_age whose browser no longer
   * answers
   * @return Number of sessions removed
   */
  size_t pruneUnreachable(
      std::chrono::milliseconds min_age = std::chrono::seconds(30));

private:
  struct Entry {
    SessionKey key;
    DebugSession session;
    BrowserHandle handle;
    std::shared_future<void> ready;
    bool cancelled = false;
  };

  /// Counts a call made from a request thread while it runs
  class InFlightGuard {
  public:
    explicit InFlightGuard(SessionCoordinator &owner);
    ~InFlightGuard();

  private:
    SessionCoordinator &owner_;
  };

  int allocatePortLocked();
  std::string makeSessionId(const std::string &purpose,
                            const std::string &persona);
  std::shared_ptr<Entry> findByIdLocked(const std::string &session_id) const;
  void removeLocked(const std::shared_ptr<Entry> &entry);
  DebugSession launchEntry(const std::shared_ptr<Entry> &entry);

  IBrowserLauncher &launcher_;
  IDevToolsClient &devtools_;
  Options options_;

  mutable std::mutex mutex_;
  std::map<SessionKey, std::shared_ptr<Entry>> registry_;
  std::set<int> ports_in_use_;
  bool closed_ = false;
  size_t in_flight_ = 0;
  std::condition_variable idle_cv_;
  std::atomic<uint64_t> sequence_{0};
};

} // namespace sessions
