#pragma once

#include <chrono>
#include <string>
#include <sys/types.h>
#include <vector>

namespace sessions {

/**
 * @brief What to launch for one debug session
 */
struct BrowserLaunchRequest {
  std::string session_id;
  std::string purpose;
  std::string persona;
  int debug_port = 0;
};

/**
 * @brief Handle of a launched browser
 */
struct BrowserHandle {
  pid_t pid = -1;
  std::string user_data_dir;
};

/**
 * @brief Starts and stops debuggable browser processes
 *
 * Implementations throw SupervisorError(SessionLaunchFailure) when a browser
 * cannot be started.
 */
class IBrowserLauncher {
public:
  virtual ~IBrowserLauncher() = default;

  virtual BrowserHandle launch(const BrowserLaunchRequest &request) = 0;

  /**
   * @brief Stop the browser and remove its profile
   * @return false if the process could not be stopped
   */
  virtual bool terminate(const BrowserHandle &handle) = 0;
};

/**
 * @brief Launches a Chromium-family browser with remote debugging enabled
 *
 * Command line:
 *   <browser> --remote-debugging-port=<port>
 *             --user-data-dir=<user_data_root>/continuum-devtools-<session>
 *             --no-first-run --no-default-browser-check --disable-extensions
 *             [--headless=new] --app=<app_url>?session=..&purpose=..&persona=..
 */
class ChromeBrowserLauncher : public IBrowserLauncher {
public:
  struct Options {
    /// Empty: CONTINUUM_BROWSER, then PATH lookup
    std::string executable;
    std::string app_url = "http://localhost:9000";
    std::string user_data_root = "/tmp";
    bool headless = false;
    std::chrono::milliseconds terminate_grace{5000};
  };

  explicit ChromeBrowserLauncher(Options options);

  BrowserHandle launch(const BrowserLaunchRequest &request) override;
  bool terminate(const BrowserHandle &handle) override;

  /**
   * @brief Resolve the browser executable
   * @return Absolute path, or empty if none was found
   */
  std::string findExecutable() const;

  /**
   * @brief Full argument vector (without argv[0])
   */
  std::vector<std::string> buildArguments(const BrowserLaunchRequest &request,
                                          const std::string &user_data_dir) const;

  /**
   * @brief Percent-encode a query parameter value
   */
  static std::string urlEncode(const std::string &value);

private:
  Options options_;
};

} // namespace sessions
