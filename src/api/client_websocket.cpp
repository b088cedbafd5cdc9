#include "api/client_websocket.h"
#include "core/time_format.h"
#include "server/connection_registry.h"
#include <json/json.h>
#include <plog/Log.h>

server::ConnectionRegistry *ClientWebSocketController::registry_ = nullptr;

void ClientWebSocketController::setConnectionRegistry(
    server::ConnectionRegistry *registry) {
  registry_ = registry;
}

void ClientWebSocketController::handleNewConnection(
    const HttpRequestPtr & /*req*/, const WebSocketConnectionPtr &wsConnPtr) {
  if (!registry_ || !registry_->add(wsConnPtr)) {
    wsConnPtr->shutdown(CloseCode::kEndpointGone, "server shutting down");
    return;
  }

  PLOG_INFO << "[Server] Client connected. Total: " << registry_->count();

  Json::Value welcome;
  welcome["type"] = "connected";
  welcome["message"] = "WebSocket connection established";
  sendJson(wsConnPtr, welcome);
}

void ClientWebSocketController::handleConnectionClosed(
    const WebSocketConnectionPtr &wsConnPtr) {
  if (!registry_) {
    return;
  }
  registry_->remove(wsConnPtr);
  PLOG_INFO << "[Server] Client disconnected. Total: " << registry_->count();
}

void ClientWebSocketController::handleNewMessage(
    const WebSocketConnectionPtr &wsConnPtr, std::string &&message,
    const WebSocketMessageType &type) {
  if (type == WebSocketMessageType::Ping) {
    wsConnPtr->send(message, WebSocketMessageType::Pong);
    return;
  }
  if (type != WebSocketMessageType::Text) {
    return;
  }

  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value json;
  std::string errors;
  if (!reader->parse(message.data(), message.data() + message.size(), &json,
                     &errors) ||
      !json.isObject()) {
    Json::Value error;
    error["type"] = "error";
    error["message"] = "Invalid JSON";
    sendJson(wsConnPtr, error);
    return;
  }

  std::string msg_type = json.get("type", "").asString();
  if (msg_type == "ping") {
    Json::Value pong;
    pong["type"] = "pong";
    pong["timestamp"] =
        TimeFormat::toIso8601(std::chrono::system_clock::now());
    sendJson(wsConnPtr, pong);
    return;
  }

  Json::Value error;
  error["type"] = "error";
  error["message"] = "Unknown message type: " + msg_type;
  sendJson(wsConnPtr, error);
}

void ClientWebSocketController::sendJson(
    const WebSocketConnectionPtr &wsConnPtr, const Json::Value &message) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "";
  wsConnPtr->send(Json::writeString(builder, message));
}
