#pragma once

#include "server/socket_layer.h"
#include "sessions/session_coordinator.h"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <json/json.h>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

/**
 * @brief Whether the monitor may start a browser when nobody is connected
 */
enum class BrowserAutoLaunchPolicy {
  Disabled, // idle state is only reported
  WhenIdle  // request the ("auto_launch", "system") session when idle
};

const char *toString(BrowserAutoLaunchPolicy policy);

/**
 * @brief Result of one monitoring cycle; only the latest one is kept
 */
struct HealthSnapshot {
  std::chrono::system_clock::time_point timestamp;
  bool socket_layer_ok = false;
  bool browser_reachable = false;
  size_t active_connection_count = 0;

  Json::Value toJson() const;
};

/**
 * @brief Health Monitor that runs on separate thread
 *
 * Every interval it checks the socket layer (restarting it in place when
 * unhealthy), counts connected clients, applies the auto-launch policy and
 * optionally prunes sessions whose browser went away.
 *
 * Errors inside a cycle are logged and counted, never propagated. Cycles
 * never overlap: a runCycle() call made while another is in progress is
 * skipped.
 */
class HealthMonitor {
public:
  struct Options {
    std::chrono::milliseconds interval{30000};
    BrowserAutoLaunchPolicy auto_launch = BrowserAutoLaunchPolicy::Disabled;
    bool prune_unreachable_sessions = false;
    std::chrono::milliseconds prune_min_age{30000};
  };

  struct Counters {
    uint64_t cycles_run = 0;
    uint64_t cycles_skipped = 0;
    uint64_t self_heal_restarts = 0;
    uint64_t cycle_errors = 0;
  };

  HealthMonitor(server::ISocketLayer &socket_layer,
                sessions::SessionCoordinator &sessions, Options options);

  ~HealthMonitor();

  /**
   * @brief Start the health monitoring thread
   */
  void start();

  /**
   * @brief Stop the thread; cancels a pending interval immediately
   */
  void stop();

  bool isRunning() const { return running_.load(); }

  /**
   * @brief Run one monitoring cycle on the calling thread
   * @return false if skipped because another cycle was in progress
   */
  bool runCycle();

  std::optional<HealthSnapshot> latestSnapshot() const;
  Counters counters() const;
  const Options &options() const { return options_; }

  /**
   * @brief Latest snapshot, counters and policy for the health endpoint
   */
  Json::Value toJson() const;

private:
  void monitorLoop();
  void applyIdlePolicy(size_t connection_count);

  server::ISocketLayer &socket_layer_;
  sessions::SessionCoordinator &sessions_;
  Options options_;

  // Thread management
  std::atomic<bool> running_;
  std::unique_ptr<std::thread> monitor_thread_;
  std::mutex wait_mutex_;
  std::condition_variable wake_;

  std::atomic<bool> cycle_in_progress_;
  bool was_idle_ = false;

  mutable std::mutex snapshot_mutex_;
  std::optional<HealthSnapshot> snapshot_;

  // Statistics
  std::atomic<uint64_t> cycles_run_;
  std::atomic<uint64_t> cycles_skipped_;
  std::atomic<uint64_t> self_heal_restarts_;
  std::atomic<uint64_t> cycle_errors_;
};
