/*
 * 설명: 구조화 로그와 간단한 메트릭 카운터를 관리한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace arena {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

LogLevel ParseLogLevel(const std::string& text);
const char* ToString(LogLevel level);

struct LogContext {
  std::string trace_id;
  std::optional<int> user_id;
  std::optional<int> game_id;
  std::optional<int> tournament_id;
  std::string name;
  long latency_ms{0};
  LogLevel level{LogLevel::kInfo};
  std::string message;
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t validation_rejects{0};
  std::uint64_t conflict_rejects{0};
  std::uint64_t active_sessions{0};
  std::uint64_t queue_length{0};
  std::uint64_t active_tournaments{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo) : min_level_(min_level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementValidationReject();
  void IncrementConflictReject();
  void SetWebsocketActive(std::uint64_t count);
  MetricsSnapshot Snapshot(std::uint64_t active_sessions, std::uint64_t queue_length,
                           std::uint64_t active_tournaments) const;
  void Log(const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> validation_rejects_{0};
  std::atomic<std::uint64_t> conflict_rejects_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex output_mutex_;
};

}  // namespace arena
