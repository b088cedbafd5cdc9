#include "sessions/session_coordinator.h"
#include "supervisor/supervisor_error.h"
#include "test_fakes.h"
#include <atomic>
#include <gtest/gtest.h>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace sessions;
using supervisor::SupervisorError;
using supervisor::SupervisorErrorCode;

class SessionCoordinatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    SessionCoordinator::Options options;
    options.port_range_start = 39222;
    options.port_range_end = 39262;
    options.launch_timeout = std::chrono::milliseconds(200);
    coordinator_ =
        std::make_unique<SessionCoordinator>(launcher_, devtools_, options);
  }

  void TearDown() override { coordinator_.reset(); }

  FakeBrowserLauncher launcher_;
  FakeDevToolsClient devtools_;
  std::unique_ptr<SessionCoordinator> coordinator_;
};

TEST_F(SessionCoordinatorTest, FirstRequestLaunchesActiveSession) {
  auto session = coordinator_->requestSession("review", "alice");

  EXPECT_EQ(session.status, SessionStatus::Active);
  EXPECT_EQ(session.purpose, "review");
  EXPECT_EQ(session.persona, "alice");
  EXPECT_GE(session.port, 39222);
  EXPECT_LE(session.port, 39262);
  EXPECT_EQ(session.session_id.rfind("review_alice_", 0), 0u);
  EXPECT_GT(session.browser_pid, 0);
  EXPECT_EQ(launcher_.launches.load(), 1);

  ASSERT_EQ(launcher_.requests.size(), 1u);
  EXPECT_EQ(launcher_.requests[0].debug_port, session.port);
  EXPECT_EQ(launcher_.requests[0].session_id, session.session_id);
}

// Identical keys share one browser
TEST_F(SessionCoordinatorTest, SameKeyReusesSession) {
  auto first = coordinator_->requestSession("review", "alice");
  std::this_thread::sleep_for(std::chrono::milliseconds(5));
  auto second = coordinator_->requestSession("review", "alice");

  EXPECT_EQ(first.session_id, second.session_id);
  EXPECT_EQ(first.port, second.port);
  EXPECT_GE(second.last_activity_at, first.last_activity_at);
  EXPECT_EQ(launcher_.launches.load(), 1);
  EXPECT_EQ(coordinator_->sessionCount(), 1u);
}

// Distinct keys get distinct browsers on distinct ports
TEST_F(SessionCoordinatorTest, DistinctKeysGetDistinctPorts) {
  auto a = coordinator_->requestSession("review", "alice");
  auto b = coordinator_->requestSession("review", "bob");
  auto c = coordinator_->requestSession("debug", "alice");

  std::set<int> ports{a.port, b.port, c.port};
  EXPECT_EQ(ports.size(), 3u);
  EXPECT_EQ(launcher_.launches.load(), 3);
  EXPECT_EQ(coordinator_->sessionCount(), 3u);
}

// Concurrent first requests for one key launch exactly once
TEST_F(SessionCoordinatorTest, ConcurrentFirstRequestsLaunchOnce) {
  launcher_.launch_delay = std::chrono::milliseconds(100);

  std::vector<std::thread> threads;
  std::vector<std::string> ids(8);
  for (size_t i = 0; i < ids.size(); ++i) {
    threads.emplace_back([this, &ids, i]() {
      ids[i] = coordinator_->requestSession("review", "alice").session_id;
    });
  }
  for (auto &t : threads) {
    t.join();
  }

  EXPECT_EQ(launcher_.launches.load(), 1);
  for (const auto &id : ids) {
    EXPECT_EQ(id, ids[0]);
  }
}

TEST_F(SessionCoordinatorTest, EmptyPurposeOrPersonaIsRejected) {
  EXPECT_THROW(coordinator_->requestSession("", "alice"),
               std::invalid_argument);
  EXPECT_THROW(coordinator_->requestSession("review", ""),
               std::invalid_argument);
  EXPECT_EQ(launcher_.launches.load(), 0);
}

// A failed launch reaches the requester only and leaves no entry behind
TEST_F(SessionCoordinatorTest, LaunchFailureIsReportedAndNotRegistered) {
  auto healthy = coordinator_->requestSession("review", "bob");
  launcher_.fail_launch = true;

  try {
    coordinator_->requestSession("review", "alice");
    FAIL() << "expected SessionLaunchFailure";
  } catch (const SupervisorError &e) {
    EXPECT_EQ(e.code(), SupervisorErrorCode::SessionLaunchFailure);
  }

  EXPECT_EQ(coordinator_->sessionCount(), 1u);
  EXPECT_TRUE(coordinator_->findSession(healthy.session_id).has_value());

  // The key can be retried once the browser is available again
  launcher_.fail_launch = false;
  auto retried = coordinator_->requestSession("review", "alice");
  EXPECT_EQ(retried.status, SessionStatus::Active);
}

TEST_F(SessionCoordinatorTest, UnreadyBrowserIsTerminated) {
  devtools_.ready = false;

  EXPECT_THROW(coordinator_->requestSession("review", "alice"),
               SupervisorError);

  EXPECT_EQ(launcher_.terminations.load(), 1);
  EXPECT_EQ(coordinator_->sessionCount(), 0u);
  EXPECT_EQ(coordinator_->getSessionSummary()["activePorts"].size(), 0u);
}

TEST_F(SessionCoordinatorTest, TeardownStopsBrowserAndFreesPort) {
  auto session = coordinator_->requestSession("review", "alice");

  EXPECT_TRUE(coordinator_->teardown(session.session_id));

  EXPECT_EQ(launcher_.terminated_pids.count(session.browser_pid), 1u);
  EXPECT_FALSE(coordinator_->findSession(session.session_id).has_value());
  EXPECT_EQ(coordinator_->getSessionSummary()["activePorts"].size(), 0u);

  // A new request for the key launches a fresh session
  auto again = coordinator_->requestSession("review", "alice");
  EXPECT_NE(again.session_id, session.session_id);
  EXPECT_EQ(launcher_.launches.load(), 2);
}

TEST_F(SessionCoordinatorTest, TeardownOfUnknownSessionIsNoOp) {
  EXPECT_FALSE(coordinator_->teardown("nope"));

  auto session = coordinator_->requestSession("review", "alice");
  EXPECT_TRUE(coordinator_->teardown(session.session_id));
  EXPECT_FALSE(coordinator_->teardown(session.session_id));
  EXPECT_EQ(launcher_.terminations.load(), 1);
}

// Registry is cleaned before the browser stop error propagates
TEST_F(SessionCoordinatorTest, TeardownErrorPropagatesAfterCleanup) {
  auto session = coordinator_->requestSession("review", "alice");
  launcher_.throw_on_terminate = true;

  EXPECT_THROW(coordinator_->teardown(session.session_id),
               std::runtime_error);
  EXPECT_EQ(coordinator_->sessionCount(), 0u);
}

TEST_F(SessionCoordinatorTest, EmergencyShutdownAllCountsFailures) {
  coordinator_->requestSession("review", "alice");
  coordinator_->requestSession("review", "bob");

  EXPECT_EQ(coordinator_->emergencyShutdownAll(), 0u);
  EXPECT_EQ(coordinator_->sessionCount(), 0u);
  EXPECT_EQ(launcher_.terminations.load(), 2);

  coordinator_->requestSession("review", "carol");
  launcher_.throw_on_terminate = true;
  EXPECT_EQ(coordinator_->emergencyShutdownAll(), 1u);
  EXPECT_EQ(coordinator_->sessionCount(), 0u);
}

TEST_F(SessionCoordinatorTest, SummaryCountsByPurposeAndPersona) {
  coordinator_->requestSession("review", "alice");
  coordinator_->requestSession("review", "bob");
  coordinator_->requestSession("debug", "alice");

  Json::Value summary = coordinator_->getSessionSummary();

  EXPECT_EQ(summary["totalSessions"].asUInt(), 3u);
  EXPECT_EQ(summary["byPurpose"]["review"].asInt(), 2);
  EXPECT_EQ(summary["byPurpose"]["debug"].asInt(), 1);
  EXPECT_EQ(summary["byPersona"]["alice"].asInt(), 2);
  EXPECT_EQ(summary["byPersona"]["bob"].asInt(), 1);
  EXPECT_EQ(summary["activePorts"].size(), 3u);
  ASSERT_EQ(summary["sessions"].size(), 3u);
  EXPECT_EQ(summary["sessions"][0]["status"].asString(), "active");
}

TEST_F(SessionCoordinatorTest, ActivateSessionActivatesPageTarget) {
  auto session = coordinator_->requestSession("review", "alice");

  EXPECT_TRUE(coordinator_->activateSession(session.session_id));
  ASSERT_EQ(devtools_.activated.size(), 1u);
  EXPECT_EQ(devtools_.activated[0], "page-" + std::to_string(session.port));
}

TEST_F(SessionCoordinatorTest, ActivateUnknownSessionThrowsNotFound) {
  try {
    coordinator_->activateSession("missing");
    FAIL() << "expected SessionNotFound";
  } catch (const SupervisorError &e) {
    EXPECT_EQ(e.code(), SupervisorErrorCode::SessionNotFound);
  }
}

TEST_F(SessionCoordinatorTest, BrowserReachability) {
  EXPECT_FALSE(coordinator_->anyBrowserReachable());

  auto session = coordinator_->requestSession("review", "alice");
  EXPECT_TRUE(coordinator_->anyBrowserReachable());

  devtools_.setReachable(session.port, false);
  EXPECT_FALSE(coordinator_->anyBrowserReachable());
}

TEST_F(SessionCoordinatorTest, PruneRemovesOnlyUnreachableSessions) {
  auto gone = coordinator_->requestSession("review", "alice");
  auto alive = coordinator_->requestSession("review", "bob");
  devtools_.setReachable(gone.port, false);

  // Too young to prune
  EXPECT_EQ(coordinator_->pruneUnreachable(std::chrono::hours(1)), 0u);

  EXPECT_EQ(coordinator_->pruneUnreachable(std::chrono::milliseconds(0)), 1u);
  EXPECT_FALSE(coordinator_->findSession(gone.session_id).has_value());
  EXPECT_TRUE(coordinator_->findSession(alive.session_id).has_value());
}

// Underscores inside purpose or persona must not merge distinct keys
TEST_F(SessionCoordinatorTest, UnderscoredKeysStayIsolated) {
  auto first = coordinator_->requestSession("a_b", "c");
  auto second = coordinator_->requestSession("a", "b_c");

  EXPECT_NE(first.session_id, second.session_id);
  EXPECT_NE(first.port, second.port);
  EXPECT_EQ(second.purpose, "a");
  EXPECT_EQ(second.persona, "b_c");
  EXPECT_EQ(launcher_.launches.load(), 2);
  EXPECT_EQ(coordinator_->sessionCount(), 2u);

  // Each key still reuses its own session
  EXPECT_EQ(coordinator_->requestSession("a_b", "c").session_id,
            first.session_id);
  EXPECT_EQ(coordinator_->requestSession("a", "b_c").session_id,
            second.session_id);
}

// A launch still in progress is stopped before emergencyShutdownAll returns
TEST_F(SessionCoordinatorTest, EmergencyShutdownWaitsForPendingLaunch) {
  launcher_.launch_delay = std::chrono::milliseconds(300);

  std::atomic<bool> failed{false};
  std::thread requester([this, &failed]() {
    try {
      coordinator_->requestSession("review", "alice");
    } catch (const SupervisorError &e) {
      failed = e.code() == SupervisorErrorCode::SessionLaunchFailure;
    }
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  EXPECT_EQ(coordinator_->emergencyShutdownAll(), 0u);

  EXPECT_EQ(launcher_.launches.load(), 1);
  EXPECT_EQ(launcher_.terminations.load(), 1);
  EXPECT_EQ(coordinator_->getSessionSummary()["activePorts"].size(), 0u);

  requester.join();
  EXPECT_TRUE(failed.load());
  EXPECT_EQ(coordinator_->sessionCount(), 0u);
}

TEST_F(SessionCoordinatorTest, ClosedCoordinatorRefusesNewSessions) {
  coordinator_->requestSession("review", "alice");
  coordinator_->close();
  EXPECT_TRUE(coordinator_->isClosed());
  EXPECT_EQ(coordinator_->emergencyShutdownAll(), 0u);

  try {
    coordinator_->requestSession("review", "bob");
    FAIL() << "expected SessionLaunchFailure";
  } catch (const SupervisorError &e) {
    EXPECT_EQ(e.code(), SupervisorErrorCode::SessionLaunchFailure);
  }
  EXPECT_EQ(launcher_.launches.load(), 1);
}

// Waiters on a cancelled launch do not start another browser after close()
TEST_F(SessionCoordinatorTest, WaitersDoNotRelaunchAfterClose) {
  launcher_.launch_delay = std::chrono::milliseconds(200);

  std::vector<std::thread> requesters;
  std::atomic<int> refused{0};
  for (int i = 0; i < 3; ++i) {
    requesters.emplace_back([this, &refused]() {
      try {
        coordinator_->requestSession("review", "alice");
      } catch (const SupervisorError &) {
        refused++;
      }
    });
  }
  std::this_thread::sleep_for(std::chrono::milliseconds(50));

  coordinator_->close();
  coordinator_->emergencyShutdownAll();
  for (auto &t : requesters) {
    t.join();
  }

  EXPECT_EQ(refused.load(), 3);
  EXPECT_EQ(launcher_.launches.load(), 1);
  EXPECT_EQ(launcher_.terminations.load(), 1);
}

TEST_F(SessionCoordinatorTest, SessionJsonUsesCamelCaseKeys) {
  auto session = coordinator_->requestSession("review", "alice");
  Json::Value json = session.toJson();

  EXPECT_EQ(json["sessionId"].asString(), session.session_id);
  EXPECT_EQ(json["port"].asInt(), session.port);
  EXPECT_EQ(json["status"].asString(), "active");
  EXPECT_TRUE(json.isMember("createdAt"));
  EXPECT_TRUE(json.isMember("lastActivityAt"));
}
