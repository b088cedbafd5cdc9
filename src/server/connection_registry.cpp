#include "server/connection_registry.h"
#include "core/bounded_retry.h"
#include <plog/Log.h>

namespace server {

bool ConnectionRegistry::add(const drogon::WebSocketConnectionPtr &conn) {
  if (!accepting_.load()) {
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  connections_.insert(conn);
  return true;
}

void ConnectionRegistry::remove(const drogon::WebSocketConnectionPtr &conn) {
  std::lock_guard<std::mutex> lock(mutex_);
  connections_.erase(conn);
}

size_t ConnectionRegistry::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::set<drogon::WebSocketConnectionPtr> ConnectionRegistry::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_;
}

bool ConnectionRegistry::closeAll(std::chrono::milliseconds timeout) {
  auto open = snapshot();
  if (open.empty()) {
    return true;
  }

  PLOG_INFO << "[Server] Closing " << open.size() << " connection(s)";
  for (const auto &conn : open) {
    if (conn->connected()) {
      conn->shutdown(drogon::CloseCode::kNormalClosure, "server shutting down");
    }
  }

  BoundedRetry retry;
  retry.timeout = timeout;
  bool drained = retry.waitUntil([this]() { return count() == 0; });
  if (!drained) {
    PLOG_WARNING << "[Server] " << count()
                 << " connection(s) still open after " << timeout.count()
                 << "ms";
  }
  return drained;
}

void ConnectionRegistry::forceCloseAll() {
  auto open = snapshot();
  for (const auto &conn : open) {
    conn->forceClose();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  connections_.clear();
}

} // namespace server
