/*
 * 설명: 사용자당 하나의 실시간 연결을 관리하고 서버 이벤트 전달을 중계한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json.hpp>

#include "arena/observability.hpp"

namespace arena {

// 전송 계층과 무관한 클라이언트 연결 추상화. 구현체는 임의 스레드에서 호출될 수 있다.
class ClientConnection {
 public:
  virtual ~ClientConnection() = default;
  virtual void SendServerEvent(const std::string& event, const nlohmann::json& payload) = 0;
  virtual void SendServerError(const std::string& code, const std::string& message) = 0;
  virtual void Close(const std::string& reason) = 0;
};

class ConnectionRegistry : public std::enable_shared_from_this<ConnectionRegistry> {
 public:
  using UserListener = std::function<void(int user_id)>;

  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }
  void AddConnectListener(UserListener listener);
  void AddDisconnectListener(UserListener listener);

  // 기존 연결이 있으면 session:superseded 를 보낸 뒤 닫는다.
  void Register(int user_id, const std::shared_ptr<ClientConnection>& connection);
  // 현재 등록된 연결과 같을 때만 제거하고 disconnect 리스너를 호출한다.
  void Unregister(int user_id, const ClientConnection* connection);

  void SendEventToUser(int user_id, const std::string& event, const nlohmann::json& payload) const;
  void SendErrorToUser(int user_id, const std::string& code, const std::string& message) const;
  void Broadcast(const std::vector<int>& user_ids, const std::string& event, const nlohmann::json& payload) const;
  void BroadcastAll(const std::string& event, const nlohmann::json& payload) const;

  bool IsConnected(int user_id) const;
  std::size_t ActiveConnections() const;

 private:
  struct Entry {
    std::weak_ptr<ClientConnection> connection;
    const ClientConnection* raw{nullptr};
  };

  std::shared_ptr<ClientConnection> Lookup(int user_id) const;
  void Notify(const std::vector<UserListener>& listeners, int user_id) const;

  std::unordered_map<int, Entry> connections_;
  std::vector<UserListener> connect_listeners_;
  std::vector<UserListener> disconnect_listeners_;
  mutable std::mutex mutex_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace arena
