#include "sessions/browser_launcher.h"
#include "core/env_config.h"
#include "supervisor/process_utils.h"
#include "supervisor/supervisor_error.h"
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <iomanip>
#include <plog/Log.h>
#include <sstream>
#include <unistd.h>

namespace sessions {

using supervisor::SupervisorError;
using supervisor::SupervisorErrorCode;

namespace {

const char *const kBrowserCandidates[] = {
    "google-chrome", "google-chrome-stable", "chromium", "chromium-browser",
    "opera"};

std::string searchPath(const std::string &name) {
  std::string path_str = EnvConfig::getString("PATH", "");
  std::stringstream ss(path_str);
  std::string dir;
  while (std::getline(ss, dir, ':')) {
    if (dir.empty()) {
      continue;
    }
    std::filesystem::path candidate = std::filesystem::path(dir) / name;
    if (access(candidate.c_str(), X_OK) == 0) {
      return candidate.string();
    }
  }
  return "";
}

} // namespace

ChromeBrowserLauncher::ChromeBrowserLauncher(Options options)
    : options_(std::move(options)) {}

std::string ChromeBrowserLauncher::findExecutable() const {
  std::string configured = options_.executable;
  if (configured.empty()) {
    configured = EnvConfig::getString(EnvConfig::kBrowserVariable, "");
  }

  if (!configured.empty()) {
    if (configured.find('/') != std::string::npos) {
      return access(configured.c_str(), X_OK) == 0 ? configured : "";
    }
    return searchPath(configured);
  }

  for (const char *name : kBrowserCandidates) {
    std::string found = searchPath(name);
    if (!found.empty()) {
      return found;
    }
  }
  return "";
}

std::string ChromeBrowserLauncher::urlEncode(const std::string &value) {
  std::ostringstream out;
  out << std::hex << std::uppercase;
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
      out << c;
    } else {
      out << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
    }
  }
  return out.str();
}

std::vector<std::string>
ChromeBrowserLauncher::buildArguments(const BrowserLaunchRequest &request,
                                      const std::string &user_data_dir) const {
  std::vector<std::string> args;
  args.push_back("--remote-debugging-port=" +
                 std::to_string(request.debug_port));
  args.push_back("--user-data-dir=" + user_data_dir);
  args.push_back("--no-first-run");
  args.push_back("--no-default-browser-check");
  args.push_back("--disable-extensions");
  if (options_.headless) {
    args.push_back("--headless=new");
  }

  std::string separator =
      options_.app_url.find('?') == std::string::npos ? "?" : "&";
  args.push_back("--app=" + options_.app_url + separator +
                 "session=" + urlEncode(request.session_id) +
                 "&purpose=" + urlEncode(request.purpose) +
                 "&persona=" + urlEncode(request.persona));
  return args;
}

BrowserHandle ChromeBrowserLauncher::launch(const BrowserLaunchRequest &request) {
  std::string exe_path = findExecutable();
  if (exe_path.empty()) {
    throw SupervisorError(SupervisorErrorCode::SessionLaunchFailure,
                          "No browser executable found (set " +
                              std::string(EnvConfig::kBrowserVariable) +
                              " or sessions.browser_executable)");
  }

  std::filesystem::path user_data_dir =
      std::filesystem::path(options_.user_data_root) /
      ("continuum-devtools-" + request.session_id);
  std::error_code ec;
  std::filesystem::create_directories(user_data_dir, ec);
  if (ec) {
    throw SupervisorError(SupervisorErrorCode::SessionLaunchFailure,
                          "Cannot create profile directory " +
                              user_data_dir.string() + ": " + ec.message());
  }

  std::vector<std::string> args =
      buildArguments(request, user_data_dir.string());
  std::vector<char *> argv;
  argv.push_back(const_cast<char *>(exe_path.c_str()));
  for (auto &arg : args) {
    argv.push_back(const_cast<char *>(arg.c_str()));
  }
  argv.push_back(nullptr);

  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    std::filesystem::remove_all(user_data_dir, ec);
    throw SupervisorError(SupervisorErrorCode::SessionLaunchFailure,
                          std::string("fork failed: ") + strerror(err));
  }

  if (pid == 0) {
    // Own process group, so a terminal SIGINT aimed at the supervisor does
    // not reach the browser before the coordinator tears it down.
    setpgid(0, 0);
    execv(exe_path.c_str(), argv.data());
    _exit(127);
  }

  PLOG_INFO << "[SessionCoordinator] Launched " << exe_path << " PID " << pid
            << " on debug port " << request.debug_port << " for session "
            << request.session_id;

  BrowserHandle handle;
  handle.pid = pid;
  handle.user_data_dir = user_data_dir.string();
  return handle;
}

bool ChromeBrowserLauncher::terminate(const BrowserHandle &handle) {
  bool stopped = true;
  if (handle.pid > 0) {
    auto outcome =
        supervisor::terminateProcess(handle.pid, options_.terminate_grace);
    stopped = outcome != supervisor::TerminationOutcome::Failed;
    PLOG_DEBUG << "[SessionCoordinator] Browser PID " << handle.pid << ": "
               << supervisor::toString(outcome);
  }

  if (!handle.user_data_dir.empty()) {
    std::error_code ec;
    std::filesystem::remove_all(handle.user_data_dir, ec);
    if (ec) {
      PLOG_WARNING << "[SessionCoordinator] Could not remove "
                   << handle.user_data_dir << ": " << ec.message();
    }
  }
  return stopped;
}

} // namespace sessions
