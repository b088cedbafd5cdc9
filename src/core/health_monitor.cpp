#include "core/health_monitor.h"
#include "core/time_format.h"
#include "supervisor/supervisor_error.h"
#include <plog/Log.h>

const char *toString(BrowserAutoLaunchPolicy policy) {
  switch (policy) {
  case BrowserAutoLaunchPolicy::Disabled:
    return "disabled";
  case BrowserAutoLaunchPolicy::WhenIdle:
    return "when_idle";
  }
  return "unknown";
}

Json::Value HealthSnapshot::toJson() const {
  Json::Value json;
  json["timestamp"] = TimeFormat::toIso8601(timestamp);
  json["socketLayerOk"] = socket_layer_ok;
  json["browserReachable"] = browser_reachable;
  json["activeConnectionCount"] =
      static_cast<Json::UInt64>(active_connection_count);
  return json;
}

HealthMonitor::HealthMonitor(server::ISocketLayer &socket_layer,
                             sessions::SessionCoordinator &sessions,
                             Options options)
    : socket_layer_(socket_layer), sessions_(sessions), options_(options),
      running_(false), cycle_in_progress_(false), cycles_run_(0),
      cycles_skipped_(0), self_heal_restarts_(0), cycle_errors_(0) {}

HealthMonitor::~HealthMonitor() { stop(); }

void HealthMonitor::start() {
  if (running_.load()) {
    PLOG_WARNING << "[HealthMonitor] Already running";
    return;
  }

  running_.store(true);
  monitor_thread_ =
      std::make_unique<std::thread>(&HealthMonitor::monitorLoop, this);

  PLOG_INFO << "[HealthMonitor] Started (interval="
            << options_.interval.count() << "ms, browser auto-launch "
            << toString(options_.auto_launch) << ")";
}

void HealthMonitor::stop() {
  if (!running_.exchange(false)) {
    return;
  }

  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
  }
  wake_.notify_all();

  if (monitor_thread_ && monitor_thread_->joinable()) {
    if (monitor_thread_->get_id() == std::this_thread::get_id()) {
      monitor_thread_->detach();
    } else {
      monitor_thread_->join();
    }
  }

  PLOG_INFO << "[HealthMonitor] Stopped";
}

void HealthMonitor::monitorLoop() {
  PLOG_DEBUG << "[HealthMonitor] Monitoring thread started";

  while (running_.load()) {
    {
      std::unique_lock<std::mutex> lock(wait_mutex_);
      wake_.wait_for(lock, options_.interval,
                     [this]() { return !running_.load(); });
    }
    if (!running_.load()) {
      break;
    }
    runCycle();
  }

  PLOG_DEBUG << "[HealthMonitor] Monitoring thread stopped";
}

bool HealthMonitor::runCycle() {
  bool expected = false;
  if (!cycle_in_progress_.compare_exchange_strong(expected, true)) {
    cycles_skipped_++;
    PLOG_DEBUG << "[HealthMonitor] Previous cycle still running, skipping";
    return false;
  }

  try {
    HealthSnapshot snapshot;
    snapshot.timestamp = std::chrono::system_clock::now();

    snapshot.socket_layer_ok = socket_layer_.isHealthy();
    if (!snapshot.socket_layer_ok) {
      PLOG_WARNING << "[HealthMonitor] Socket layer unhealthy, self-healing "
                      "with in-place restart";
      socket_layer_.restart();
      self_heal_restarts_++;
      snapshot.socket_layer_ok = socket_layer_.isHealthy();
      PLOG_INFO << "[HealthMonitor] Self-healing restart "
                << (snapshot.socket_layer_ok ? "succeeded"
                                             : "did not restore health");
    }

    snapshot.active_connection_count = socket_layer_.activeConnectionCount();
    snapshot.browser_reachable = sessions_.anyBrowserReachable();

    applyIdlePolicy(snapshot.active_connection_count);

    if (options_.prune_unreachable_sessions) {
      size_t pruned = sessions_.pruneUnreachable(options_.prune_min_age);
      if (pruned > 0) {
        PLOG_INFO << "[HealthMonitor] Pruned " << pruned
                  << " unreachable session(s)";
      }
    }

    {
      std::lock_guard<std::mutex> lock(snapshot_mutex_);
      snapshot_ = snapshot;
    }
    cycles_run_++;
  } catch (const std::exception &e) {
    cycle_errors_++;
    PLOG_ERROR << "[HealthMonitor] "
               << supervisor::toString(
                      supervisor::SupervisorErrorCode::HealthCheckError)
               << ": " << e.what() << " (cycle skipped)";
  }

  cycle_in_progress_.store(false);
  return true;
}

void HealthMonitor::applyIdlePolicy(size_t connection_count) {
  bool idle = (connection_count == 0);
  bool became_idle = idle && !was_idle_;
  was_idle_ = idle;

  if (!idle) {
    return;
  }

  if (options_.auto_launch == BrowserAutoLaunchPolicy::Disabled) {
    if (became_idle) {
      PLOG_INFO << "[HealthMonitor] No clients connected; browser "
                   "auto-launch is disabled, not launching";
    }
    return;
  }

  try {
    auto session = sessions_.requestSession("auto_launch", "system");
    PLOG_INFO << "[HealthMonitor] No clients connected; auto-launch session "
              << session.session_id << " on port " << session.port;
  } catch (const supervisor::SupervisorError &e) {
    PLOG_WARNING << "[HealthMonitor] Auto-launch failed: " << e.what();
  }
}

std::optional<HealthSnapshot> HealthMonitor::latestSnapshot() const {
  std::lock_guard<std::mutex> lock(snapshot_mutex_);
  return snapshot_;
}

HealthMonitor::Counters HealthMonitor::counters() const {
  Counters counters;
  counters.cycles_run = cycles_run_.load();
  counters.cycles_skipped = cycles_skipped_.load();
  counters.self_heal_restarts = self_heal_restarts_.load();
  counters.cycle_errors = cycle_errors_.load();
  return counters;
}

Json::Value HealthMonitor::toJson() const {
  Json::Value json;
  auto snapshot = latestSnapshot();
  json["snapshot"] = snapshot ? snapshot->toJson() : Json::Value();
  Counters c = counters();
  json["cyclesRun"] = static_cast<Json::UInt64>(c.cycles_run);
  json["cyclesSkipped"] = static_cast<Json::UInt64>(c.cycles_skipped);
  json["selfHealRestarts"] = static_cast<Json::UInt64>(c.self_heal_restarts);
  json["cycleErrors"] = static_cast<Json::UInt64>(c.cycle_errors);
  json["intervalMs"] = static_cast<Json::Int64>(options_.interval.count());
  json["browserAutoLaunch"] = toString(options_.auto_launch);
  json["running"] = running_.load();
  return json;
}
