/*
 * 설명: WebSocket 프레임을 읽어 이벤트 라우터로 넘기고, 서버 이벤트를 순서대로 송신한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/session_flow_test.cpp
 */
#include "arena/websocket_session.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/core/buffers_to_string.hpp>

namespace arena {

WebSocketSession::WebSocketSession(boost::beast::websocket::stream<boost::beast::tcp_stream> ws,
                                   const AuthUser& user, std::shared_ptr<ConnectionRegistry> registry,
                                   std::shared_ptr<EventRouter> router, std::shared_ptr<Observability> observability,
                                   std::size_t max_queue_messages, std::size_t max_queue_bytes)
    : ws_(std::move(ws)), user_(user), registry_(std::move(registry)), router_(std::move(router)),
      observability_(std::move(observability)), max_queue_messages_(max_queue_messages),
      max_queue_bytes_(max_queue_bytes) {}

WebSocketSession::~WebSocketSession() { registry_->Unregister(user_.user_id, this); }

void WebSocketSession::Run() {
  WsEnvelope env{.type = "event", .event = "connected", .seq = 0,
                 .payload = {{"userId", user_.user_id}, {"username", user_.username}}};
  EnqueueMessage(ToWsJson(env).dump());
  registry_->Register(user_.user_id, shared_from_this());
  observability_->Log(LogContext{.user_id = user_.user_id, .name = "ws.connected"});
  DoRead();
}

void WebSocketSession::DoRead() {
  if (closing_) {
    return;
  }
  auto self = shared_from_this();
  ws_.async_read(buffer_, [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
    self->OnRead(ec, bytes_transferred);
  });
}

void WebSocketSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec) {
    if (ec != boost::beast::websocket::error::closed) {
      observability_->Log(LogContext{.user_id = user_.user_id, .name = "ws.read_error", .level = LogLevel::kDebug,
                                     .message = ec.message()});
    }
    closing_ = true;
    Detach();
    return;
  }
  auto data = boost::beast::buffers_to_string(buffer_.data());
  buffer_.consume(buffer_.size());
  router_->HandleFrame(user_.user_id, data);
  DoRead();
}

void WebSocketSession::Detach() {
  if (detached_) {
    return;
  }
  detached_ = true;
  registry_->Unregister(user_.user_id, this);
  observability_->Log(LogContext{.user_id = user_.user_id, .name = "ws.disconnected"});
}

void WebSocketSession::SendServerEvent(const std::string& event, const nlohmann::json& payload) {
  WsEnvelope env{.type = "event", .event = event, .seq = 0, .payload = payload};
  Post(ToWsJson(env).dump());
}

void WebSocketSession::SendServerError(const std::string& code, const std::string& message) {
  WsEnvelope env{.type = "error", .event = "", .seq = 0, .payload = MakeErrorPayload(code, message)};
  Post(ToWsJson(env).dump());
}

void WebSocketSession::Close(const std::string& reason) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), reason]() {
    self->CloseWith(boost::beast::websocket::close_code::policy_error, reason, true);
  });
}

void WebSocketSession::Post(std::string message) {
  boost::asio::post(ws_.get_executor(), [self = shared_from_this(), message = std::move(message)]() mutable {
    self->EnqueueMessage(std::move(message));
  });
}

void WebSocketSession::EnqueueMessage(std::string message) {
  if (closing_) {
    return;
  }
  const auto message_size = message.size();
  if (send_queue_.size() >= max_queue_messages_ || queued_bytes_ + message_size > max_queue_bytes_) {
    observability_->Log(LogContext{.user_id = user_.user_id, .name = "ws.backpressure", .level = LogLevel::kWarn});
    CloseWith(boost::beast::websocket::close_code::policy_error, "backpressure_exceeded", false);
    return;
  }
  send_queue_.push_back(std::move(message));
  queued_bytes_ += message_size;
  if (!writing_) {
    WriteNext();
  }
}

void WebSocketSession::WriteNext() {
  if (send_queue_.empty()) {
    return;
  }
  writing_ = true;
  auto self = shared_from_this();
  ws_.text(true);
  ws_.async_write(boost::asio::buffer(send_queue_.front()),
                  [self](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void WebSocketSession::OnWrite(boost::beast::error_code ec) {
  if (!send_queue_.empty()) {
    queued_bytes_ -= send_queue_.front().size();
    send_queue_.pop_front();
  }
  writing_ = false;
  if (ec) {
    send_queue_.clear();
    queued_bytes_ = 0;
    Detach();
    return;
  }
  if (!send_queue_.empty()) {
    WriteNext();
    return;
  }
  if (pending_close_) {
    DoClose();
  }
}

void WebSocketSession::CloseWith(boost::beast::websocket::close_code code, const std::string& reason, bool drain) {
  if (closing_) {
    return;
  }
  closing_ = true;
  if (!drain) {
    // 송신 중인 프레임의 버퍼는 완료 시점까지 유지한다.
    while (send_queue_.size() > (writing_ ? 1u : 0u)) {
      queued_bytes_ -= send_queue_.back().size();
      send_queue_.pop_back();
    }
  }
  pending_close_ = boost::beast::websocket::close_reason{code};
  pending_close_->reason = reason;
  Detach();
  if (!writing_ && send_queue_.empty()) {
    DoClose();
  }
}

void WebSocketSession::DoClose() {
  auto reason = *pending_close_;
  pending_close_.reset();
  auto self = shared_from_this();
  ws_.async_close(reason, [self](boost::beast::error_code) {});
}

}  // namespace arena
