#include "server/drogon_socket_layer.h"
#include <arpa/inet.h>
#include <cerrno>
#include <drogon/drogon.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <plog/Log.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace server {

DrogonSocketLayer::DrogonSocketLayer(ConnectionRegistry &registry,
                                     std::string host, int port,
                                     ReinjectFunction reinject)
    : registry_(registry), host_(std::move(host)), port_(port),
      reinject_(std::move(reinject)) {}

void DrogonSocketLayer::install() {
  ConnectionRegistry *registry = &registry_;
  drogon::app().registerPreRoutingAdvice(
      [registry](const drogon::HttpRequestPtr &req,
                 drogon::AdviceCallback &&acb,
                 drogon::AdviceChainCallback &&accb) {
        if (registry->isAccepting()) {
          accb();
          return;
        }
        Json::Value body;
        body["error"] = "Service Unavailable";
        body["message"] = "Supervisor is shutting down";
        auto resp = drogon::HttpResponse::newHttpJsonResponse(body);
        resp->setStatusCode(drogon::k503ServiceUnavailable);
        resp->setCloseConnection(true);
        PLOG_DEBUG << "[Server] Refused " << req->getPath()
                   << " (not accepting)";
        acb(resp);
      });
  if (reinject_) {
    reinject_();
  }
}

bool DrogonSocketLayer::canConnect(const std::string &host, int port,
                                   std::chrono::milliseconds timeout) {
  int sock = socket(AF_INET, SOCK_STREAM, 0);
  if (sock < 0) {
    return false;
  }

  struct sockaddr_in addr {};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port));
  std::string target = (host.empty() || host == "0.0.0.0") ? "127.0.0.1" : host;
  if (inet_pton(AF_INET, target.c_str(), &addr.sin_addr) <= 0) {
    close(sock);
    return false;
  }

  fcntl(sock, F_SETFL, fcntl(sock, F_GETFL, 0) | O_NONBLOCK);
  int rc = connect(sock, reinterpret_cast<struct sockaddr *>(&addr),
                   sizeof(addr));
  bool connected = (rc == 0);
  if (!connected && errno == EINPROGRESS) {
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = POLLOUT;
    if (poll(&pfd, 1, static_cast<int>(timeout.count())) == 1) {
      int err = 0;
      socklen_t len = sizeof(err);
      getsockopt(sock, SOL_SOCKET, SO_ERROR, &err, &len);
      connected = (err == 0);
    }
  }
  close(sock);
  return connected;
}

bool DrogonSocketLayer::isHealthy() {
  if (!drogon::app().isRunning()) {
    return false;
  }
  return canConnect(host_, port_, std::chrono::milliseconds(1000));
}

size_t DrogonSocketLayer::activeConnectionCount() { return registry_.count(); }

void DrogonSocketLayer::stopAccepting() {
  registry_.setAccepting(false);
  PLOG_INFO << "[Server] No longer accepting connections on port " << port_;
}

bool DrogonSocketLayer::closeAllConnections(std::chrono::milliseconds timeout) {
  bool drained = registry_.closeAll(timeout);
  if (!drained) {
    registry_.forceCloseAll();
  }
  return drained;
}

void DrogonSocketLayer::restart() {
  PLOG_WARNING << "[Server] Restarting socket layer on port " << port_;
  registry_.setAccepting(false);
  registry_.forceCloseAll();
  if (reinject_) {
    reinject_();
  }
  registry_.setAccepting(true);
  PLOG_INFO << "[Server] Socket layer restarted";
}

} // namespace server
