#include "core/health_monitor.h"
#include "test_fakes.h"
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>

using namespace std::chrono_literals;

namespace {

// isHealthy() blocks until released, to hold a cycle open
class BlockingSocketLayer : public FakeSocketLayer {
public:
  bool isHealthy() override {
    entered = true;
    while (!released.load()) {
      std::this_thread::sleep_for(5ms);
    }
    return true;
  }

  std::atomic<bool> entered{false};
  std::atomic<bool> released{false};
};

class ThrowingSocketLayer : public FakeSocketLayer {
public:
  bool isHealthy() override { throw std::runtime_error("probe exploded"); }
};

} // namespace

class HealthMonitorTest : public ::testing::Test {
protected:
  void SetUp() override {
    sessions::SessionCoordinator::Options options;
    options.port_range_start = 39300;
    options.port_range_end = 39340;
    sessions_ = std::make_unique<sessions::SessionCoordinator>(
        launcher_, devtools_, options);
  }

  HealthMonitor::Options monitorOptions(
      BrowserAutoLaunchPolicy policy = BrowserAutoLaunchPolicy::Disabled) {
    HealthMonitor::Options options;
    options.interval = 30000ms;
    options.auto_launch = policy;
    return options;
  }

  FakeBrowserLauncher launcher_;
  FakeDevToolsClient devtools_;
  FakeSocketLayer socket_;
  std::unique_ptr<sessions::SessionCoordinator> sessions_;
};

TEST_F(HealthMonitorTest, HealthyCycleRecordsSnapshot) {
  socket_.connections = 2;
  HealthMonitor monitor(socket_, *sessions_, monitorOptions());

  EXPECT_FALSE(monitor.latestSnapshot().has_value());
  EXPECT_TRUE(monitor.runCycle());

  auto snapshot = monitor.latestSnapshot();
  ASSERT_TRUE(snapshot.has_value());
  EXPECT_TRUE(snapshot->socket_layer_ok);
  EXPECT_FALSE(snapshot->browser_reachable);
  EXPECT_EQ(snapshot->active_connection_count, 2u);
  EXPECT_EQ(socket_.restarts.load(), 0);
  EXPECT_EQ(monitor.counters().cycles_run, 1u);
}

// Unhealthy socket layer triggers an in-place restart
TEST_F(HealthMonitorTest, UnhealthySocketLayerIsRestarted) {
  socket_.healthy = false;
  HealthMonitor monitor(socket_, *sessions_, monitorOptions());

  monitor.runCycle();

  EXPECT_EQ(socket_.restarts.load(), 1);
  EXPECT_EQ(monitor.counters().self_heal_restarts, 1u);
  ASSERT_TRUE(monitor.latestSnapshot().has_value());
  EXPECT_TRUE(monitor.latestSnapshot()->socket_layer_ok);
}

TEST_F(HealthMonitorTest, FailedRestartIsReportedInSnapshot) {
  socket_.healthy = false;
  socket_.restart_heals = false;
  HealthMonitor monitor(socket_, *sessions_, monitorOptions());

  monitor.runCycle();

  ASSERT_TRUE(monitor.latestSnapshot().has_value());
  EXPECT_FALSE(monitor.latestSnapshot()->socket_layer_ok);
}

TEST_F(HealthMonitorTest, IdleWithAutoLaunchDisabledLaunchesNothing) {
  socket_.connections = 0;
  HealthMonitor monitor(socket_, *sessions_, monitorOptions());

  monitor.runCycle();
  monitor.runCycle();

  EXPECT_EQ(launcher_.launches.load(), 0);
  EXPECT_EQ(sessions_->sessionCount(), 0u);
}

TEST_F(HealthMonitorTest, IdleWithAutoLaunchRequestsSystemSession) {
  socket_.connections = 0;
  HealthMonitor monitor(socket_, *sessions_,
                        monitorOptions(BrowserAutoLaunchPolicy::WhenIdle));

  monitor.runCycle();
  monitor.runCycle();

  // Second cycle reuses the session
  EXPECT_EQ(launcher_.launches.load(), 1);
  auto list = sessions_->listSessions();
  ASSERT_EQ(list.size(), 1u);
  EXPECT_EQ(list[0].purpose, "auto_launch");
  EXPECT_EQ(list[0].persona, "system");
}

TEST_F(HealthMonitorTest, ConnectedClientsSuppressAutoLaunch) {
  socket_.connections = 1;
  HealthMonitor monitor(socket_, *sessions_,
                        monitorOptions(BrowserAutoLaunchPolicy::WhenIdle));

  monitor.runCycle();

  EXPECT_EQ(launcher_.launches.load(), 0);
}

TEST_F(HealthMonitorTest, AutoLaunchFailureDoesNotFailCycle) {
  launcher_.fail_launch = true;
  HealthMonitor monitor(socket_, *sessions_,
                        monitorOptions(BrowserAutoLaunchPolicy::WhenIdle));

  EXPECT_TRUE(monitor.runCycle());
  EXPECT_EQ(monitor.counters().cycle_errors, 0u);
  EXPECT_TRUE(monitor.latestSnapshot().has_value());
}

// Errors inside a cycle are contained and counted
TEST_F(HealthMonitorTest, CycleErrorIsCountedNotThrown) {
  ThrowingSocketLayer socket;
  HealthMonitor monitor(socket, *sessions_, monitorOptions());

  EXPECT_NO_THROW(monitor.runCycle());
  EXPECT_EQ(monitor.counters().cycle_errors, 1u);
  EXPECT_EQ(monitor.counters().cycles_run, 0u);

  // The monitor keeps working afterwards
  EXPECT_TRUE(monitor.runCycle());
  EXPECT_EQ(monitor.counters().cycle_errors, 2u);
}

// Cycles never overlap
TEST_F(HealthMonitorTest, OverlappingCycleIsSkipped) {
  BlockingSocketLayer socket;
  HealthMonitor monitor(socket, *sessions_, monitorOptions());

  std::thread first([&monitor]() { monitor.runCycle(); });
  while (!socket.entered.load()) {
    std::this_thread::sleep_for(1ms);
  }

  EXPECT_FALSE(monitor.runCycle());
  EXPECT_EQ(monitor.counters().cycles_skipped, 1u);

  socket.released = true;
  first.join();
  EXPECT_EQ(monitor.counters().cycles_run, 1u);
}

TEST_F(HealthMonitorTest, PruneUnreachableSessionsWhenEnabled) {
  auto session = sessions_->requestSession("review", "alice");
  devtools_.setReachable(session.port, false);
  socket_.connections = 1;

  auto options = monitorOptions();
  options.prune_unreachable_sessions = true;
  options.prune_min_age = 0ms;
  HealthMonitor monitor(socket_, *sessions_, options);

  monitor.runCycle();

  EXPECT_EQ(sessions_->sessionCount(), 0u);
}

TEST_F(HealthMonitorTest, ThreadRunsCyclesAtInterval) {
  auto options = monitorOptions();
  options.interval = 20ms;
  HealthMonitor monitor(socket_, *sessions_, options);

  monitor.start();
  EXPECT_TRUE(monitor.isRunning());
  std::this_thread::sleep_for(200ms);
  monitor.stop();

  EXPECT_FALSE(monitor.isRunning());
  EXPECT_GE(monitor.counters().cycles_run, 2u);
}

// Stop cancels a pending interval instead of waiting it out
TEST_F(HealthMonitorTest, StopDoesNotWaitForInterval) {
  HealthMonitor monitor(socket_, *sessions_, monitorOptions());
  monitor.start();

  auto begin = std::chrono::steady_clock::now();
  monitor.stop();
  auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_LT(elapsed, 2s);
  EXPECT_EQ(monitor.counters().cycles_run, 0u);
}

TEST_F(HealthMonitorTest, JsonContainsCountersAndPolicy) {
  HealthMonitor monitor(socket_, *sessions_,
                        monitorOptions(BrowserAutoLaunchPolicy::WhenIdle));
  socket_.connections = 1;
  monitor.runCycle();

  Json::Value json = monitor.toJson();

  EXPECT_EQ(json["cyclesRun"].asUInt64(), 1u);
  EXPECT_EQ(json["browserAutoLaunch"].asString(), "when_idle");
  EXPECT_TRUE(json["snapshot"]["socketLayerOk"].asBool());
  EXPECT_EQ(json["snapshot"]["activeConnectionCount"].asUInt64(), 1u);
  EXPECT_FALSE(json["running"].asBool());
}
