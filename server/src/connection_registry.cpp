/*
 * 설명: 사용자별 연결을 관리하고 서버 이벤트를 안전하게 전달한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#include "arena/connection_registry.hpp"

namespace arena {

void ConnectionRegistry::AddConnectListener(UserListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  connect_listeners_.push_back(std::move(listener));
}

void ConnectionRegistry::AddDisconnectListener(UserListener listener) {
  std::lock_guard<std::mutex> lock(mutex_);
  disconnect_listeners_.push_back(std::move(listener));
}

void ConnectionRegistry::Register(int user_id, const std::shared_ptr<ClientConnection>& connection) {
  std::shared_ptr<ClientConnection> previous;
  std::vector<UserListener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(user_id);
    if (it != connections_.end() && it->second.raw != connection.get()) {
      previous = it->second.connection.lock();
    }
    connections_[user_id] = Entry{connection, connection.get()};
    listeners = connect_listeners_;
    if (observability_) {
      observability_->SetWebsocketActive(connections_.size());
    }
  }
  if (previous) {
    previous->SendServerEvent("session:superseded", {{"reason", "새 연결이 등록되었습니다"}});
    previous->Close("session_superseded");
    if (observability_) {
      observability_->Log(LogContext{.user_id = user_id, .name = "connection.superseded"});
    }
  }
  Notify(listeners, user_id);
}

void ConnectionRegistry::Unregister(int user_id, const ClientConnection* connection) {
  std::vector<UserListener> listeners;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(user_id);
    if (it == connections_.end() || it->second.raw != connection) {
      return;
    }
    connections_.erase(it);
    listeners = disconnect_listeners_;
    if (observability_) {
      observability_->SetWebsocketActive(connections_.size());
    }
  }
  Notify(listeners, user_id);
}

std::shared_ptr<ClientConnection> ConnectionRegistry::Lookup(int user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(user_id);
  if (it == connections_.end()) {
    return nullptr;
  }
  return it->second.connection.lock();
}

void ConnectionRegistry::Notify(const std::vector<UserListener>& listeners, int user_id) const {
  for (const auto& listener : listeners) {
    listener(user_id);
  }
}

void ConnectionRegistry::SendEventToUser(int user_id, const std::string& event, const nlohmann::json& payload) const {
  if (auto connection = Lookup(user_id)) {
    connection->SendServerEvent(event, payload);
  }
}

void ConnectionRegistry::SendErrorToUser(int user_id, const std::string& code, const std::string& message) const {
  if (auto connection = Lookup(user_id)) {
    connection->SendServerError(code, message);
  }
}

void ConnectionRegistry::Broadcast(const std::vector<int>& user_ids, const std::string& event,
                                   const nlohmann::json& payload) const {
  std::vector<std::shared_ptr<ClientConnection>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets.reserve(user_ids.size());
    for (int user_id : user_ids) {
      auto it = connections_.find(user_id);
      if (it == connections_.end()) {
        continue;
      }
      if (auto connection = it->second.connection.lock()) {
        targets.push_back(std::move(connection));
      }
    }
  }
  for (const auto& connection : targets) {
    connection->SendServerEvent(event, payload);
  }
}

void ConnectionRegistry::BroadcastAll(const std::string& event, const nlohmann::json& payload) const {
  std::vector<std::shared_ptr<ClientConnection>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    targets.reserve(connections_.size());
    for (const auto& [user_id, entry] : connections_) {
      if (auto connection = entry.connection.lock()) {
        targets.push_back(std::move(connection));
      }
    }
  }
  for (const auto& connection : targets) {
    connection->SendServerEvent(event, payload);
  }
}

bool ConnectionRegistry::IsConnected(int user_id) const {
  return Lookup(user_id) != nullptr;
}

std::size_t ConnectionRegistry::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

}  // namespace arena
