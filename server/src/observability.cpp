/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 */
#include "arena/observability.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iostream>
#include <sstream>

namespace arena {

LogLevel ParseLogLevel(const std::string& text) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "debug") return LogLevel::kDebug;
  if (lower == "warn" || lower == "warning") return LogLevel::kWarn;
  if (lower == "error") return LogLevel::kError;
  return LogLevel::kInfo;
}

const char* ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementValidationReject() { validation_rejects_.fetch_add(1); }

void Observability::IncrementConflictReject() { conflict_rejects_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_sessions, std::uint64_t queue_length,
                                        std::uint64_t active_tournaments) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.validation_rejects = validation_rejects_.load();
  snapshot.conflict_rejects = conflict_rejects_.load();
  snapshot.active_sessions = active_sessions;
  snapshot.queue_length = queue_length;
  snapshot.active_tournaments = active_tournaments;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  if (ctx.level < min_level_) {
    return;
  }
  nlohmann::json log_json;
  log_json["level"] = ToString(ctx.level);
  log_json["traceId"] = ctx.trace_id;
  log_json["eventName"] = ctx.name;
  log_json["latencyMs"] = ctx.latency_ms;
  if (ctx.user_id) {
    log_json["userId"] = *ctx.user_id;
  }
  if (ctx.game_id) {
    log_json["gameId"] = *ctx.game_id;
  }
  if (ctx.tournament_id) {
    log_json["tournamentId"] = *ctx.tournament_id;
  }
  if (!ctx.message.empty()) {
    log_json["message"] = ctx.message;
  }
  std::lock_guard<std::mutex> lock(output_mutex_);
  std::cout << log_json.dump() << std::endl;
}

}  // namespace arena
