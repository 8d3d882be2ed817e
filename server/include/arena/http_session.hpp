/*
 * 설명: HTTP 연결을 처리하고 상태/메트릭 엔드포인트 및 인증된 WS 업그레이드를 제공한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "arena/arena_core.hpp"
#include "arena/auth.hpp"
#include "arena/config.hpp"
#include "arena/observability.hpp"

namespace arena {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
              std::shared_ptr<const CredentialVerifier> verifier, std::shared_ptr<ArenaCore> core,
              std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void SendResponse(std::shared_ptr<Response> res);
  void SendJson(boost::beast::http::status status, const nlohmann::json& body);
  void HandleWebSocket();
  std::optional<AuthUser> ExtractUser() const;
  static std::string ParseBearer(const std::string& header_value);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  AppConfig config_;
  std::shared_ptr<const CredentialVerifier> verifier_;
  std::shared_ptr<ArenaCore> core_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace arena
