#pragma once

#include <atomic>
#include <chrono>
#include <drogon/WebSocketConnection.h>
#include <mutex>
#include <set>

namespace server {

/**
 * @brief Open client connections of the socket layer
 *
 * Filled by the WebSocket controller, drained by shutdown and restart.
 */
class ConnectionRegistry {
public:
  /**
   * @return false if the registry is not accepting (connection should be
   * refused)
   */
  bool add(const drogon::WebSocketConnectionPtr &conn);
  void remove(const drogon::WebSocketConnectionPtr &conn);
  size_t count() const;

  bool isAccepting() const { return accepting_.load(); }
  void setAccepting(bool accepting) { accepting_.store(accepting); }

  /**
   * @brief Send a close frame to every connection and wait for them to go
   * @return true if all connections closed within timeout
   */
  bool closeAll(std::chrono::milliseconds timeout);

  /**
   * @brief Drop every connection without waiting
   */
  void forceCloseAll();

private:
  std::set<drogon::WebSocketConnectionPtr> snapshot() const;

  mutable std::mutex mutex_;
  std::set<drogon::WebSocketConnectionPtr> connections_;
  std::atomic<bool> accepting_{true};
};

} // namespace server
