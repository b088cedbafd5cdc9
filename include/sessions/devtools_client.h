#pragma once

#include <chrono>
#include <json/json.h>
#include <memory>
#include <optional>
#include <string>
#include <trantor/net/EventLoopThread.h>
#include <vector>

namespace sessions {

/**
 * @brief One entry of the remote-debugging target listing
 */
struct DevToolsTarget {
  std::string id;
  std::string type;
  std::string title;
  std::string url;
  std::string websocket_debugger_url;

  static DevToolsTarget fromJson(const Json::Value &json);
  Json::Value toJson() const;
};

/**
 * @brief Consumer of a browser's remote-debugging HTTP surface
 */
class IDevToolsClient {
public:
  virtual ~IDevToolsClient() = default;

  /**
   * @brief Query the target listing on a debug port
   * @return nullopt if the endpoint does not answer
   */
  virtual std::optional<std::vector<DevToolsTarget>>
  listTargets(int port) = 0;

  /**
   * @brief Bring a target to the foreground
   */
  virtual bool activateTarget(int port, const std::string &target_id) = 0;

  /**
   * @brief Wait until the listing endpoint answers
   */
  virtual bool waitUntilReady(int port, std::chrono::milliseconds timeout) = 0;
};

/**
 * @brief IDevToolsClient over Drogon's HttpClient
 *
 * Requests run on a private event loop thread so that callers (request
 * handlers, the health monitor thread) can block on the result without
 * stalling the application's own loops.
 */
class DrogonDevToolsClient : public IDevToolsClient {
public:
  explicit DrogonDevToolsClient(
      std::string host = "127.0.0.1",
      std::chrono::milliseconds request_timeout = std::chrono::seconds(2));
  ~DrogonDevToolsClient() override;

  std::optional<std::vector<DevToolsTarget>> listTargets(int port) override;
  bool activateTarget(int port, const std::string &target_id) override;
  bool waitUntilReady(int port, std::chrono::milliseconds timeout) override;

  /**
   * @brief Parse a /json/list body
   * @return nullopt if the body is not a JSON array
   */
  static std::optional<std::vector<DevToolsTarget>>
  parseTargetList(const std::string &body);

private:
  std::string baseUrl(int port) const;

  std::string host_;
  std::chrono::milliseconds request_timeout_;
  std::unique_ptr<trantor::EventLoopThread> loop_thread_;
};

} // namespace sessions
