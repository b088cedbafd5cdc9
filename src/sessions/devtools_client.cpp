#include "sessions/devtools_client.h"
#include "core/bounded_retry.h"
#include <drogon/HttpClient.h>
#include <plog/Log.h>

namespace sessions {

DevToolsTarget DevToolsTarget::fromJson(const Json::Value &json) {
  DevToolsTarget target;
  target.id = json.get("id", "").asString();
  target.type = json.get("type", "").asString();
  target.title = json.get("title", "").asString();
  target.url = json.get("url", "").asString();
  target.websocket_debugger_url =
      json.get("webSocketDebuggerUrl", "").asString();
  return target;
}

Json::Value DevToolsTarget::toJson() const {
  Json::Value json;
  json["id"] = id;
  json["type"] = type;
  json["title"] = title;
  json["url"] = url;
  json["webSocketDebuggerUrl"] = websocket_debugger_url;
  return json;
}

DrogonDevToolsClient::DrogonDevToolsClient(
    std::string host, std::chrono::milliseconds request_timeout)
    : host_(std::move(host)), request_timeout_(request_timeout),
      loop_thread_(
          std::make_unique<trantor::EventLoopThread>("DevToolsClient")) {
  loop_thread_->run();
}

DrogonDevToolsClient::~DrogonDevToolsClient() {
  if (loop_thread_) {
    loop_thread_->getLoop()->quit();
    loop_thread_->wait();
  }
}

std::string DrogonDevToolsClient::baseUrl(int port) const {
  return "http://" + host_ + ":" + std::to_string(port);
}

std::optional<std::vector<DevToolsTarget>>
DrogonDevToolsClient::parseTargetList(const std::string &body) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value json;
  std::string errors;
  if (!reader->parse(body.data(), body.data() + body.size(), &json,
                     &errors) ||
      !json.isArray()) {
    return std::nullopt;
  }

  std::vector<DevToolsTarget> targets;
  for (const auto &entry : json) {
    if (entry.isObject()) {
      targets.push_back(DevToolsTarget::fromJson(entry));
    }
  }
  return targets;
}

std::optional<std::vector<DevToolsTarget>>
DrogonDevToolsClient::listTargets(int port) {
  auto client =
      drogon::HttpClient::newHttpClient(baseUrl(port), loop_thread_->getLoop());
  auto req = drogon::HttpRequest::newHttpRequest();
  req->setMethod(drogon::Get);
  req->setPath("/json/list");

  auto [result, resp] =
      client->sendRequest(req, request_timeout_.count() / 1000.0);
  if (result != drogon::ReqResult::Ok || !resp ||
      resp->statusCode() != drogon::k200OK) {
    PLOG_VERBOSE << "[SessionCoordinator] No target listing on port " << port;
    return std::nullopt;
  }
  return parseTargetList(std::string(resp->body()));
}

bool DrogonDevToolsClient::activateTarget(int port,
                                          const std::string &target_id) {
  auto client =
      drogon::HttpClient::newHttpClient(baseUrl(port), loop_thread_->getLoop());
  auto req = drogon::HttpRequest::newHttpRequest();
  req->setMethod(drogon::Get);
  req->setPath("/json/activate/" + target_id);

  auto [result, resp] =
      client->sendRequest(req, request_timeout_.count() / 1000.0);
  if (result != drogon::ReqResult::Ok || !resp) {
    PLOG_WARNING << "[SessionCoordinator] Activate request to port " << port
                 << " failed (result " << static_cast<int>(result) << ")";
    return false;
  }
  return resp->statusCode() == drogon::k200OK;
}

bool DrogonDevToolsClient::waitUntilReady(int port,
                                          std::chrono::milliseconds timeout) {
  BoundedRetry retry;
  retry.timeout = timeout;
  retry.initial_backoff = std::chrono::milliseconds(100);
  retry.max_backoff = std::chrono::milliseconds(500);
  return retry.waitUntil([&]() { return listTargets(port).has_value(); });
}

} // namespace sessions
