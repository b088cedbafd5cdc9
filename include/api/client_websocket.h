#pragma once

#include <drogon/HttpRequest.h>
#include <drogon/WebSocketController.h>
#include <json/json.h>
#include <string>

using namespace drogon;

namespace server {
class ConnectionRegistry;
}

/**
 * @brief WebSocket endpoint for connected clients
 *
 * Endpoint: /v1/supervisor/ws
 * Every connection is tracked in the ConnectionRegistry so the health
 * monitor can tell whether anyone is connected and shutdown can close them.
 * Answers {"type":"ping"} with {"type":"pong"}.
 */
class ClientWebSocketController
    : public drogon::WebSocketController<ClientWebSocketController> {
public:
  void handleNewMessage(const WebSocketConnectionPtr &wsConnPtr,
                        std::string &&message,
                        const WebSocketMessageType &type) override;

  void handleNewConnection(const HttpRequestPtr &req,
                           const WebSocketConnectionPtr &wsConnPtr) override;

  void handleConnectionClosed(const WebSocketConnectionPtr &wsConnPtr) override;

  WS_PATH_LIST_BEGIN
  WS_PATH_ADD("/v1/supervisor/ws", drogon::Get);
  WS_PATH_LIST_END

  /**
   * @brief Set connection registry (dependency injection)
   */
  static void setConnectionRegistry(server::ConnectionRegistry *registry);

private:
  void sendJson(const WebSocketConnectionPtr &wsConnPtr,
                const Json::Value &message);

  static server::ConnectionRegistry *registry_;
};
