/*
 * 설명: WebSocket 연결의 프레임 수신, 송신 큐 백프레셔, 서버 이벤트 전달을 관리한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <deque>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include "arena/api_response.hpp"
#include "arena/auth.hpp"
#include "arena/connection_registry.hpp"
#include "arena/event_router.hpp"
#include "arena/observability.hpp"

namespace arena {

class WebSocketSession : public ClientConnection, public std::enable_shared_from_this<WebSocketSession> {
 public:
  WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws, const AuthUser& user,
                   std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<EventRouter> router,
                   std::shared_ptr<Observability> observability, std::size_t max_queue_messages,
                   std::size_t max_queue_bytes);
  ~WebSocketSession() override;
  void Run();

  // 임의 스레드에서 호출되며 스트림 executor 로 전달된다.
  void SendServerEvent(const std::string& event, const nlohmann::json& payload) override;
  void SendServerError(const std::string& code, const std::string& message) override;
  void Close(const std::string& reason) override;

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void Post(std::string message);
  void EnqueueMessage(std::string message);
  void WriteNext();
  void OnWrite(boost::beast::error_code ec);
  // drain 이 참이면 이미 큐에 있는 프레임을 보낸 뒤 닫는다.
  void CloseWith(boost::beast::websocket::close_code code, const std::string& reason, bool drain);
  void DoClose();
  void Detach();

  boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
  boost::beast::flat_buffer buffer_;
  AuthUser user_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<EventRouter> router_;
  std::shared_ptr<Observability> observability_;
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool closing_{false};
  bool detached_{false};
  std::optional<boost::beast::websocket::close_reason> pending_close_;
  std::size_t max_queue_messages_;
  std::size_t max_queue_bytes_;
};

}  // namespace arena
