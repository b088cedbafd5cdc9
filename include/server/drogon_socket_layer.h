#pragma once

#include "server/connection_registry.h"
#include "server/socket_layer.h"
#include <functional>
#include <string>

namespace server {

/**
 * @brief ISocketLayer over the Drogon application
 *
 * install() must be called before drogon::app().run(): it registers the
 * advice that turns requests away with 503 once stopAccepting() was called.
 *
 * Drogon cannot rebind listeners while running, so restart() rebuilds
 * everything above the listener: connections are dropped, the registry is
 * reset to accepting, and the collaborators are injected into the
 * controllers again through the callback.
 */
class DrogonSocketLayer : public ISocketLayer {
public:
  using ReinjectFunction = std::function<void()>;

  DrogonSocketLayer(ConnectionRegistry &registry, std::string host, int port,
                    ReinjectFunction reinject);

  void install();

  bool isHealthy() override;
  size_t activeConnectionCount() override;
  void stopAccepting() override;
  bool closeAllConnections(std::chrono::milliseconds timeout) override;
  void restart() override;

  /**
   * @brief TCP connect to host:port within timeout
   */
  static bool canConnect(const std::string &host, int port,
                         std::chrono::milliseconds timeout);

private:
  ConnectionRegistry &registry_;
  std::string host_;
  int port_;
  ReinjectFunction reinject_;
};

} // namespace server
