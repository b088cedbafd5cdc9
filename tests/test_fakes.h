#pragma once

#include "server/socket_layer.h"
#include "sessions/browser_launcher.h"
#include "sessions/devtools_client.h"
#include "supervisor/supervisor_error.h"
#include <atomic>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <unistd.h>
#include <vector>

// Test doubles shared by the supervisor test suites

class FakeSocketLayer : public server::ISocketLayer {
public:
  bool isHealthy() override {
    calls.push_back("isHealthy");
    return healthy.load();
  }

  size_t activeConnectionCount() override { return connections.load(); }

  void stopAccepting() override {
    calls.push_back("stopAccepting");
    accepting = false;
  }

  bool closeAllConnections(std::chrono::milliseconds timeout) override {
    calls.push_back("closeAllConnections");
    last_close_timeout = timeout;
    if (close_succeeds) {
      connections = 0;
    }
    return close_succeeds;
  }

  void restart() override {
    calls.push_back("restart");
    restarts++;
    if (restart_heals) {
      healthy = true;
    }
  }

  std::atomic<bool> healthy{true};
  std::atomic<size_t> connections{0};
  std::atomic<int> restarts{0};
  bool accepting = true;
  bool close_succeeds = true;
  bool restart_heals = true;
  std::chrono::milliseconds last_close_timeout{0};
  std::vector<std::string> calls;
};

class FakeBrowserLauncher : public sessions::IBrowserLauncher {
public:
  sessions::BrowserHandle
  launch(const sessions::BrowserLaunchRequest &request) override {
    launches++;
    if (launch_delay.count() > 0) {
      std::this_thread::sleep_for(launch_delay);
    }
    if (fail_launch) {
      throw supervisor::SupervisorError(
          supervisor::SupervisorErrorCode::SessionLaunchFailure,
          "browser not found");
    }
    std::lock_guard<std::mutex> lock(mutex);
    requests.push_back(request);
    sessions::BrowserHandle handle;
    handle.pid = next_pid++;
    handle.user_data_dir = "/tmp/continuum-devtools-" + request.session_id;
    return handle;
  }

  bool terminate(const sessions::BrowserHandle &handle) override {
    terminations++;
    if (throw_on_terminate) {
      throw std::runtime_error("kill failed");
    }
    std::lock_guard<std::mutex> lock(mutex);
    terminated_pids.insert(handle.pid);
    return true;
  }

  std::atomic<int> launches{0};
  std::atomic<int> terminations{0};
  std::atomic<bool> fail_launch{false};
  std::atomic<bool> throw_on_terminate{false};
  std::chrono::milliseconds launch_delay{0};
  pid_t next_pid = 40000;

  std::mutex mutex;
  std::vector<sessions::BrowserLaunchRequest> requests;
  std::set<pid_t> terminated_pids;
};

class FakeDevToolsClient : public sessions::IDevToolsClient {
public:
  std::optional<std::vector<sessions::DevToolsTarget>>
  listTargets(int port) override {
    std::lock_guard<std::mutex> lock(mutex);
    if (unreachable_ports.count(port) > 0) {
      return std::nullopt;
    }
    sessions::DevToolsTarget page;
    page.id = "page-" + std::to_string(port);
    page.type = "page";
    page.url = "http://localhost:9000/";
    return std::vector<sessions::DevToolsTarget>{page};
  }

  bool activateTarget(int port, const std::string &target_id) override {
    std::lock_guard<std::mutex> lock(mutex);
    activated.push_back(target_id);
    return unreachable_ports.count(port) == 0;
  }

  bool waitUntilReady(int port, std::chrono::milliseconds) override {
    std::lock_guard<std::mutex> lock(mutex);
    return ready && unreachable_ports.count(port) == 0;
  }

  void setReachable(int port, bool reachable) {
    std::lock_guard<std::mutex> lock(mutex);
    if (reachable) {
      unreachable_ports.erase(port);
    } else {
      unreachable_ports.insert(port);
    }
  }

  std::mutex mutex;
  bool ready = true;
  std::set<int> unreachable_ports;
  std::vector<std::string> activated;
};

/**
 * @brief Fresh directory under the system temp dir, removed on destruction
 */
class TempDir {
public:
  explicit TempDir(const std::string &prefix) {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            (prefix + "_" + std::to_string(getpid()) + "_" +
             std::to_string(counter++));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  std::string path() const { return path_.string(); }
  std::string file(const std::string &name) const {
    return (path_ / name).string();
  }

private:
  std::filesystem::path path_;
};
