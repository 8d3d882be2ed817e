/*
 * 설명: DB 없이 실행할 때 결과를 로그로만 남긴다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 */
#include "arena/result_sink.hpp"

namespace arena {

void LoggingResultSink::RecordMatch(const MatchResultRecord& record) {
  nlohmann::json summary{{"matchKey", record.match_key},
                         {"gameType", record.game_type},
                         {"player1", record.player1_id},
                         {"player2", record.player2_id},
                         {"score", {record.player1_score, record.player2_score}},
                         {"forfeit", record.forfeit}};
  summary["winner"] = record.winner_user_id ? nlohmann::json(*record.winner_user_id) : nlohmann::json(nullptr);
  observability_->Log(LogContext{.game_id = record.game_id, .tournament_id = record.tournament_id,
                                 .name = "result.match", .message = summary.dump()});
}

void LoggingResultSink::RecordTournament(const TournamentResultRecord& record) {
  nlohmann::json summary{{"tournamentKey", record.tournament_key},
                         {"name", record.name},
                         {"winner", record.winner_user_id},
                         {"participants", record.participant_count},
                         {"rounds", record.total_rounds}};
  observability_->Log(LogContext{.user_id = record.winner_user_id, .tournament_id = record.tournament_id,
                                 .name = "result.tournament", .message = summary.dump()});
}

}  // namespace arena
