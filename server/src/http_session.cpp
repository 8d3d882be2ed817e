/*
 * 설명: HTTP 요청을 처리하고 상태/메트릭/WS 업그레이드를 분기한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/session_flow_test.cpp
 */
#include "arena/http_session.hpp"

#include <cctype>
#include <unordered_map>

#include <boost/beast/version.hpp>

#include "arena/api_response.hpp"
#include "arena/websocket_session.hpp"

namespace arena {

namespace {
constexpr const char* kServerName = "arena-server";

std::string PercentDecode(const std::string& text) {
  std::string out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (c == '%' && i + 2 < text.size() && std::isxdigit(static_cast<unsigned char>(text[i + 1])) &&
        std::isxdigit(static_cast<unsigned char>(text[i + 2]))) {
      out.push_back(static_cast<char>(std::stoi(text.substr(i + 1, 2), nullptr, 16)));
      i += 2;
    } else if (c == '+') {
      out.push_back(' ');
    } else {
      out.push_back(c);
    }
  }
  return out;
}

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(pair.substr(0, eq), PercentDecode(pair.substr(eq + 1)));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

void SplitTarget(const std::string& target, std::string& path, std::string& query) {
  auto qpos = target.find('?');
  if (qpos == std::string::npos) {
    path = target;
    query.clear();
    return;
  }
  path = target.substr(0, qpos);
  query = target.substr(qpos + 1);
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                         std::shared_ptr<const CredentialVerifier> verifier, std::shared_ptr<ArenaCore> core,
                         std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), config_(config), verifier_(std::move(verifier)), core_(std::move(core)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(stream_, buffer_, req_,
                                 [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                                   self->OnRead(ec, bytes_transferred);
                                 });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }

  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  observability_->IncrementRequest();

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  namespace http = boost::beast::http;
  std::string path;
  std::string query;
  SplitTarget(std::string(req_.target()), path, query);

  if (req_.method() != http::verb::get) {
    return SendJson(http::status::method_not_allowed,
                    MakeErrorEnvelope("method_not_allowed", "GET 요청만 지원합니다"));
  }

  if (path == "/api/health") {
    return SendJson(http::status::ok, MakeSuccessEnvelope({{"status", "ok"}}));
  }

  if (path == "/metrics") {
    auto snapshot = core_->Metrics();
    nlohmann::json data{
        {"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
        {"connections", {{"websocket", snapshot.websocket_active}}},
        {"rejections",
         {{"validation", snapshot.validation_rejects}, {"conflict", snapshot.conflict_rejects}}},
        {"sessions", {{"active", snapshot.active_sessions}}},
        {"queue", {{"length", snapshot.queue_length}}},
        {"tournaments", {{"active", snapshot.active_tournaments}}}};
    return SendJson(http::status::ok, MakeSuccessEnvelope(data));
  }

  if (path == "/ws") {
    return SendJson(http::status::bad_request,
                    MakeErrorEnvelope("upgrade_required", "WebSocket 업그레이드 요청이 필요합니다"));
  }

  SendJson(http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::SendJson(boost::beast::http::status status, const nlohmann::json& body) {
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(boost::beast::http::field::server, kServerName);
  res->set(boost::beast::http::field::content_type, "application/json; charset=utf-8");
  res->result(status);
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(res);
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  bool failed = static_cast<unsigned>(res->result_int()) >= 400;
  if (failed) {
    observability_->IncrementError();
  }
  auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                       request_start_)
                     .count();
  observability_->Log(LogContext{.trace_id = trace_id_,
                                 .name = "http.request",
                                 .latency_ms = static_cast<long>(latency),
                                 .level = failed ? LogLevel::kWarn : LogLevel::kDebug,
                                 .message = std::string(req_.target()) + " " + std::to_string(res->result_int())});
  boost::beast::http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

void HttpSession::HandleWebSocket() {
  namespace http = boost::beast::http;
  namespace websocket = boost::beast::websocket;
  std::string path;
  std::string query;
  SplitTarget(std::string(req_.target()), path, query);
  if (path != "/ws") {
    return SendJson(http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
  }
  auto user = ExtractUser();
  if (!user) {
    return SendJson(http::status::unauthorized,
                    MakeErrorEnvelope("unauthorized", "WS 업그레이드에는 인증이 필요합니다"));
  }

  core_->GetProfiles()->Remember(user->user_id, user->username);
  stream_.expires_never();
  websocket::stream<boost::beast::tcp_stream> ws{std::move(stream_)};
  ws.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
  ws.set_option(websocket::stream_base::decorator(
      [](websocket::response_type& res) { res.set(http::field::server, kServerName); }));

  boost::beast::error_code ec;
  ws.accept(req_, ec);
  if (ec) {
    observability_->Log(LogContext{.trace_id = trace_id_, .user_id = user->user_id, .name = "ws.accept_failed",
                                   .level = LogLevel::kWarn, .message = ec.message()});
    observability_->IncrementError();
    return;
  }
  auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                       request_start_)
                     .count();
  observability_->Log(LogContext{.trace_id = trace_id_, .user_id = user->user_id, .name = "http.upgrade",
                                 .latency_ms = static_cast<long>(latency), .level = LogLevel::kDebug});
  std::make_shared<WebSocketSession>(std::move(ws), *user, core_->GetRegistry(), core_->GetRouter(),
                                     observability_, config_.ws_queue_limit_messages,
                                     config_.ws_queue_limit_bytes)
      ->Run();
}

std::optional<AuthUser> HttpSession::ExtractUser() const {
  std::string token;
  auto auth_it = req_.find(boost::beast::http::field::authorization);
  if (auth_it != req_.end()) {
    token = ParseBearer(std::string(auth_it->value()));
  }
  if (token.empty()) {
    std::string path;
    std::string query;
    SplitTarget(std::string(req_.target()), path, query);
    auto params = ParseQueryParams(query);
    auto it = params.find("token");
    if (it != params.end()) {
      token = it->second;
    }
  }
  if (token.empty()) {
    return std::nullopt;
  }
  return verifier_->Verify(token);
}

std::string HttpSession::ParseBearer(const std::string& header_value) {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

}  // namespace arena
