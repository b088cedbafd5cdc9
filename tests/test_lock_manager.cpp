#include "supervisor/lock_manager.h"
#include "supervisor/supervisor_error.h"
#include "test_fakes.h"
#include <csignal>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <json/json.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

using namespace supervisor;

namespace {

pid_t spawnSleeper() {
  pid_t pid = fork();
  if (pid == 0) {
    pause();
    _exit(0);
  }
  return pid;
}

pid_t deadPid() {
  pid_t pid = fork();
  if (pid == 0) {
    _exit(0);
  }
  waitpid(pid, nullptr, 0);
  return pid;
}

void writeLock(const std::string &path, const InstanceLock &lock) {
  Json::StreamWriterBuilder builder;
  std::ofstream out(path);
  out << Json::writeString(builder, lock.toJson());
}

InstanceLock lockFor(pid_t pid, std::optional<int> port = std::nullopt) {
  InstanceLock lock;
  lock.pid = pid;
  lock.start_time = std::chrono::system_clock::now();
  lock.version = "0.9.0";
  lock.port = port;
  return lock;
}

} // namespace

class LockManagerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = std::make_unique<TempDir>("lock_manager_test");
    lock_path_ = dir_->file("supervisor.lock");
  }

  void TearDown() override {
    if (sleeper_ > 0) {
      kill(sleeper_, SIGKILL);
      waitpid(sleeper_, nullptr, 0);
    }
    dir_.reset();
  }

  std::unique_ptr<TempDir> dir_;
  std::string lock_path_;
  pid_t sleeper_ = -1;
};

// Fresh directory: the lock is created and records our pid
TEST_F(LockManagerTest, AcquireCreatesLockForCurrentProcess) {
  LockManager manager(lock_path_, "1.2.3");

  auto result = manager.acquire();

  EXPECT_EQ(result.status, LockStatus::Owned);
  EXPECT_FALSE(result.discarded_stale);
  EXPECT_TRUE(manager.isOwned());
  ASSERT_TRUE(std::filesystem::exists(lock_path_));

  auto on_disk = manager.readLock();
  ASSERT_TRUE(on_disk.has_value());
  EXPECT_EQ(on_disk->pid, getpid());
  EXPECT_EQ(on_disk->version, "1.2.3");
  EXPECT_FALSE(on_disk->port.has_value());
}

TEST_F(LockManagerTest, AcquireCreatesMissingParentDirectory) {
  std::string nested = dir_->file("a/b/supervisor.lock");
  LockManager manager(nested, "1.0.0");

  EXPECT_EQ(manager.acquire().status, LockStatus::Owned);
  EXPECT_TRUE(std::filesystem::exists(nested));
}

// A lock whose pid no longer exists is discarded and replaced
TEST_F(LockManagerTest, StaleLockIsDiscardedAndReplaced) {
  writeLock(lock_path_, lockFor(deadPid(), 9000));
  LockManager manager(lock_path_, "1.0.0");

  auto result = manager.acquire();

  EXPECT_EQ(result.status, LockStatus::Owned);
  EXPECT_TRUE(result.discarded_stale);
  auto on_disk = manager.readLock();
  ASSERT_TRUE(on_disk.has_value());
  EXPECT_EQ(on_disk->pid, getpid());
}

TEST_F(LockManagerTest, UnparseableLockIsTreatedAsStale) {
  {
    std::ofstream out(lock_path_);
    out << "{ not json";
  }
  LockManager manager(lock_path_, "1.0.0");

  auto result = manager.acquire();

  EXPECT_EQ(result.status, LockStatus::Owned);
  EXPECT_TRUE(result.discarded_stale);
}

// A live holder is reported, never overwritten
TEST_F(LockManagerTest, LiveHolderIsReportedAsConflict) {
  sleeper_ = spawnSleeper();
  ASSERT_GT(sleeper_, 0);
  writeLock(lock_path_, lockFor(sleeper_, 9000));
  LockManager manager(lock_path_, "1.0.0");

  auto result = manager.acquire();

  EXPECT_EQ(result.status, LockStatus::Conflict);
  EXPECT_EQ(result.lock.pid, sleeper_);
  ASSERT_TRUE(result.lock.port.has_value());
  EXPECT_EQ(*result.lock.port, 9000);
  EXPECT_FALSE(manager.isOwned());

  auto on_disk = manager.readLock();
  ASSERT_TRUE(on_disk.has_value());
  EXPECT_EQ(on_disk->pid, sleeper_);
}

TEST_F(LockManagerTest, LiveInstanceOnlyReportsLiveHolders) {
  LockManager manager(lock_path_, "1.0.0");
  EXPECT_FALSE(manager.liveInstance().has_value());

  writeLock(lock_path_, lockFor(deadPid()));
  EXPECT_FALSE(manager.liveInstance().has_value());

  sleeper_ = spawnSleeper();
  writeLock(lock_path_, lockFor(sleeper_));
  auto live = manager.liveInstance();
  ASSERT_TRUE(live.has_value());
  EXPECT_EQ(live->pid, sleeper_);
}

TEST_F(LockManagerTest, RecordPortUpdatesOwnedLock) {
  LockManager manager(lock_path_, "1.0.0");
  ASSERT_EQ(manager.acquire().status, LockStatus::Owned);

  EXPECT_TRUE(manager.recordPort(9003));

  auto on_disk = manager.readLock();
  ASSERT_TRUE(on_disk.has_value());
  ASSERT_TRUE(on_disk->port.has_value());
  EXPECT_EQ(*on_disk->port, 9003);
  EXPECT_EQ(on_disk->pid, getpid());
}

TEST_F(LockManagerTest, RecordPortWithoutOwnershipFails) {
  LockManager manager(lock_path_, "1.0.0");
  EXPECT_FALSE(manager.recordPort(9000));
  EXPECT_FALSE(std::filesystem::exists(lock_path_));
}

// Release is idempotent
TEST_F(LockManagerTest, ReleaseRemovesLockOnce) {
  LockManager manager(lock_path_, "1.0.0");
  ASSERT_EQ(manager.acquire().status, LockStatus::Owned);

  EXPECT_TRUE(manager.release());
  EXPECT_FALSE(std::filesystem::exists(lock_path_));
  EXPECT_FALSE(manager.isOwned());

  EXPECT_FALSE(manager.release());
}

// A lagging release never deletes a newer owner's lock
TEST_F(LockManagerTest, ReleaseLeavesForeignLockInPlace) {
  LockManager manager(lock_path_, "1.0.0");
  ASSERT_EQ(manager.acquire().status, LockStatus::Owned);

  sleeper_ = spawnSleeper();
  writeLock(lock_path_, lockFor(sleeper_));

  EXPECT_FALSE(manager.release());
  ASSERT_TRUE(std::filesystem::exists(lock_path_));
  EXPECT_EQ(manager.readLock()->pid, sleeper_);
}

TEST_F(LockManagerTest, ReleaseWithoutAcquireIsNoOp) {
  writeLock(lock_path_, lockFor(getpid()));
  LockManager manager(lock_path_, "1.0.0");

  EXPECT_FALSE(manager.release());
  EXPECT_TRUE(std::filesystem::exists(lock_path_));
}

TEST_F(LockManagerTest, DiscardIfStale) {
  LockManager manager(lock_path_, "1.0.0");
  EXPECT_FALSE(manager.discardIfStale());

  writeLock(lock_path_, lockFor(deadPid()));
  EXPECT_TRUE(manager.discardIfStale());
  EXPECT_FALSE(std::filesystem::exists(lock_path_));

  sleeper_ = spawnSleeper();
  writeLock(lock_path_, lockFor(sleeper_));
  EXPECT_FALSE(manager.discardIfStale());
  EXPECT_TRUE(std::filesystem::exists(lock_path_));
}

// Two managers racing for the same path: exactly one owns it
TEST_F(LockManagerTest, SecondManagerInSameProcessSeesExistingLock) {
  LockManager first(lock_path_, "1.0.0");
  LockManager second(lock_path_, "1.0.0");

  ASSERT_EQ(first.acquire().status, LockStatus::Owned);
  auto result = second.acquire();

  // Same pid: the record is recognised as ours rather than duplicated
  EXPECT_EQ(result.status, LockStatus::Owned);
  EXPECT_EQ(result.lock.pid, getpid());
  size_t files = 0;
  for (const auto &entry : std::filesystem::directory_iterator(dir_->path())) {
    if (entry.path() != first.guardPath()) {
      ++files;
    }
  }
  EXPECT_EQ(files, 1u);
}

// Processes released together against one lock: exactly one owns it,
// whether the existing record is stale or absent
TEST_F(LockManagerTest, ConcurrentStartersYieldSingleOwner) {
  constexpr int kStarters = 6;
  constexpr int kRounds = 25;

  for (int round = 0; round < kRounds; ++round) {
    if (round % 5 == 4) {
      std::filesystem::remove(lock_path_);
    } else {
      writeLock(lock_path_, lockFor(deadPid(), 9000));
    }

    int start_pipe[2], result_pipe[2], finish_pipe[2];
    ASSERT_EQ(pipe(start_pipe), 0);
    ASSERT_EQ(pipe(result_pipe), 0);
    ASSERT_EQ(pipe(finish_pipe), 0);

    std::vector<pid_t> starters;
    for (int i = 0; i < kStarters; ++i) {
      pid_t pid = fork();
      if (pid == 0) {
        close(start_pipe[1]);
        close(result_pipe[0]);
        close(finish_pipe[1]);
        char byte;
        // Start when the parent closes its end
        while (read(start_pipe[0], &byte, 1) > 0) {
        }

        char outcome = 'e';
        try {
          LockManager manager(lock_path_, "1.0.0");
          outcome = manager.acquire().status == LockStatus::Owned ? 'o' : 'c';
        } catch (const std::exception &) {
          outcome = 'e';
        }
        if (write(result_pipe[1], &outcome, 1) != 1) {
          _exit(2);
        }
        // Owners stay alive until every starter has reported
        while (read(finish_pipe[0], &byte, 1) > 0) {
        }
        _exit(0);
      }
      ASSERT_GT(pid, 0);
      starters.push_back(pid);
    }

    close(start_pipe[0]);
    close(result_pipe[1]);
    close(finish_pipe[0]);
    close(start_pipe[1]);

    int owners = 0, conflicts = 0, errors = 0;
    for (int i = 0; i < kStarters; ++i) {
      char outcome = 'e';
      ASSERT_EQ(read(result_pipe[0], &outcome, 1), 1);
      owners += outcome == 'o';
      conflicts += outcome == 'c';
      errors += outcome == 'e';
    }
    close(finish_pipe[1]);
    close(result_pipe[0]);
    for (pid_t pid : starters) {
      waitpid(pid, nullptr, 0);
    }

    EXPECT_EQ(owners, 1) << "round " << round;
    EXPECT_EQ(conflicts, kStarters - 1) << "round " << round;
    EXPECT_EQ(errors, 0) << "round " << round;
  }
}

TEST_F(LockManagerTest, UnwritableDirectoryIsLockIoFailure) {
  if (geteuid() == 0) {
    GTEST_SKIP() << "root ignores directory permissions";
  }
  std::filesystem::path ro = dir_->file("readonly");
  std::filesystem::create_directories(ro);
  std::filesystem::permissions(ro, std::filesystem::perms::owner_read |
                                       std::filesystem::perms::owner_exec);

  LockManager manager((ro / "supervisor.lock").string(), "1.0.0");
  try {
    manager.acquire();
    FAIL() << "expected LockIoFailure";
  } catch (const SupervisorError &e) {
    EXPECT_EQ(e.code(), SupervisorErrorCode::LockIoFailure);
  }

  std::filesystem::permissions(ro, std::filesystem::perms::owner_all);
}
