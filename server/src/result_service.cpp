/*
 * 설명: 경기/토너먼트 결과를 트랜잭션으로 저장하고 실패는 로그로만 남긴다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/result_repository_it_test.cpp
 */
#include "arena/result_service.hpp"

#include <boost/asio/post.hpp>

namespace arena {

ResultService::ResultService(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<ResultRepository> repository,
                             std::shared_ptr<Observability> observability, std::size_t threads)
    : db_client_(std::move(db_client)), repository_(std::move(repository)),
      observability_(std::move(observability)), pool_(threads == 0 ? 1 : threads) {}

ResultService::~ResultService() { Shutdown(); }

void ResultService::Shutdown() {
  stopped_ = true;
  pool_.join();
}

void ResultService::RecordMatch(const MatchResultRecord& record) {
  if (stopped_) {
    return;
  }
  boost::asio::post(pool_, [this, record]() { PersistMatch(record); });
}

void ResultService::RecordTournament(const TournamentResultRecord& record) {
  if (stopped_) {
    return;
  }
  boost::asio::post(pool_, [this, record]() { PersistTournament(record); });
}

bool ResultService::PersistMatch(const MatchResultRecord& record) {
  try {
    bool inserted = false;
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      inserted = repository_->InsertMatchResult(conn, record);
      return true;
    });
    observability_->Log(LogContext{.game_id = record.game_id, .tournament_id = record.tournament_id,
                                   .name = inserted ? "result.match.stored" : "result.match.duplicate",
                                   .level = LogLevel::kDebug, .message = record.match_key});
    return true;
  } catch (const DbException& ex) {
    failures_.fetch_add(1);
    observability_->Log(LogContext{.game_id = record.game_id, .tournament_id = record.tournament_id,
                                   .name = "result.match.failed", .level = LogLevel::kError,
                                   .message = std::string(ex.what()) + " (code " + std::to_string(ex.code) + ")"});
  } catch (const std::exception& ex) {
    failures_.fetch_add(1);
    observability_->Log(LogContext{.game_id = record.game_id, .name = "result.match.failed",
                                   .level = LogLevel::kError, .message = ex.what()});
  }
  return false;
}

bool ResultService::PersistTournament(const TournamentResultRecord& record) {
  try {
    bool inserted = false;
    db_client_->ExecuteTransactionWithRetry([&](MYSQL* conn) {
      inserted = repository_->InsertTournamentResult(conn, record);
      return true;
    });
    observability_->Log(LogContext{.tournament_id = record.tournament_id,
                                   .name = inserted ? "result.tournament.stored" : "result.tournament.duplicate",
                                   .level = LogLevel::kDebug, .message = record.tournament_key});
    return true;
  } catch (const DbException& ex) {
    failures_.fetch_add(1);
    observability_->Log(LogContext{.tournament_id = record.tournament_id, .name = "result.tournament.failed",
                                   .level = LogLevel::kError,
                                   .message = std::string(ex.what()) + " (code " + std::to_string(ex.code) + ")"});
  } catch (const std::exception& ex) {
    failures_.fetch_add(1);
    observability_->Log(LogContext{.tournament_id = record.tournament_id, .name = "result.tournament.failed",
                                   .level = LogLevel::kError, .message = ex.what()});
  }
  return false;
}

}  // namespace arena
