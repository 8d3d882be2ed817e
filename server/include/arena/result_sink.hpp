/*
 * 설명: 경기/토너먼트 결과 기록 인터페이스와 로그 전용 구현을 정의한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_session_test.cpp, server/tests/it/result_repository_it_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

#include "arena/observability.hpp"

namespace arena {

struct MatchResultRecord {
  std::string match_key;
  int game_id{0};
  std::string game_type;
  int player1_id{0};
  int player2_id{0};
  std::optional<int> winner_user_id;
  int player1_score{0};
  int player2_score{0};
  bool forfeit{false};
  std::optional<int> tournament_id;
  int tick_count{0};
  std::chrono::system_clock::time_point ended_at;
  nlohmann::json snapshot;
};

struct TournamentResultRecord {
  std::string tournament_key;
  int tournament_id{0};
  std::string name;
  int creator_id{0};
  int winner_user_id{0};
  int participant_count{0};
  int total_rounds{0};
  std::chrono::system_clock::time_point finished_at;
  nlohmann::json bracket;
};

// 호출자는 결과 기록 완료를 기다리지 않는다. 구현체는 실패를 내부에서 로그로 남긴다.
class ResultSink {
 public:
  virtual ~ResultSink() = default;
  virtual void RecordMatch(const MatchResultRecord& record) = 0;
  virtual void RecordTournament(const TournamentResultRecord& record) = 0;
};

class LoggingResultSink : public ResultSink {
 public:
  explicit LoggingResultSink(std::shared_ptr<Observability> observability)
      : observability_(std::move(observability)) {}

  void RecordMatch(const MatchResultRecord& record) override;
  void RecordTournament(const TournamentResultRecord& record) override;

 private:
  std::shared_ptr<Observability> observability_;
};

}  // namespace arena
