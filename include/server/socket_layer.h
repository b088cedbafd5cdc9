#pragma once

#include <chrono>
#include <cstddef>

namespace server {

/**
 * @brief The service's network endpoint as seen by the supervisor
 *
 * Implemented over Drogon by DrogonSocketLayer; tests substitute fakes.
 */
class ISocketLayer {
public:
  virtual ~ISocketLayer() = default;

  /**
   * @brief Listener up and answering
   */
  virtual bool isHealthy() = 0;

  /**
   * @brief Number of connected clients
   */
  virtual size_t activeConnectionCount() = 0;

  /**
   * @brief Refuse new inbound connections and requests
   */
  virtual void stopAccepting() = 0;

  /**
   * @brief Gracefully close every open connection
   * @return false if connections were still open when timeout expired
   */
  virtual bool closeAllConnections(std::chrono::milliseconds timeout) = 0;

  /**
   * @brief Tear down and rebuild the socket layer in place
   */
  virtual void restart() = 0;
};

} // namespace server
