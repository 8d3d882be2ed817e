/*
 * 설명: JSON 응답 엔벨로프를 생성하고 직렬화한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "arena/api_response.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace arena {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto itt = clock::to_time_t(clock::now());
  std::tm tm_buf{};
  gmtime_r(&itt, &tm_buf);
  std::ostringstream ss;
  ss << std::put_time(&tm_buf, "%FT%TZ");
  return ss.str();
}

nlohmann::json MakeMeta() { return {{"timestamp", CurrentTimestamp()}}; }
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  return {{"success", true}, {"data", data}, {"error", nullptr}, {"meta", MakeMeta()}};
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = MakeErrorPayload(code, message);
  envelope["error"]["detail"] = nullptr;
  envelope["meta"] = MakeMeta();
  return envelope;
}

nlohmann::json MakeErrorPayload(std::string_view code, std::string_view message) {
  return {{"code", code}, {"message", message}};
}

nlohmann::json ToWsJson(const WsEnvelope& env) {
  nlohmann::json j;
  j["t"] = env.type;
  j["seq"] = env.seq;
  j["event"] = env.type == "event" ? nlohmann::json(env.event) : nlohmann::json(nullptr);
  j["p"] = env.payload.is_null() ? nlohmann::json::object() : env.payload;
  return j;
}

}  // namespace arena
