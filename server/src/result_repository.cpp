/*
 * 설명: 경기/토너먼트 결과 행을 MariaDB에 저장하고 조회한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/it/result_repository_it_test.cpp
 */
#include "arena/result_repository.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace arena {
namespace {
constexpr unsigned int kDuplicateEntry = 1062;

constexpr const char* kCreateMatchResults =
    "CREATE TABLE IF NOT EXISTS match_results ("
    "match_key VARCHAR(64) NOT NULL PRIMARY KEY, game_id INT NOT NULL, game_type VARCHAR(16) NOT NULL, "
    "player1_id INT NOT NULL, player2_id INT NOT NULL, winner_user_id INT NULL, "
    "player1_score INT NOT NULL, player2_score INT NOT NULL, forfeit TINYINT(1) NOT NULL DEFAULT 0, "
    "tournament_id INT NULL, tick_count INT NOT NULL, ended_at DATETIME NOT NULL, snapshot LONGTEXT NOT NULL, "
    "KEY idx_match_results_tournament (tournament_id)) ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;";

constexpr const char* kCreateTournamentResults =
    "CREATE TABLE IF NOT EXISTS tournament_results ("
    "tournament_key VARCHAR(64) NOT NULL PRIMARY KEY, tournament_id INT NOT NULL, name VARCHAR(128) NOT NULL, "
    "creator_id INT NOT NULL, winner_user_id INT NOT NULL, participant_count INT NOT NULL, "
    "total_rounds INT NOT NULL, finished_at DATETIME NOT NULL, bracket LONGTEXT NOT NULL"
    ") ENGINE=InnoDB DEFAULT CHARSET=utf8mb4;";

int ToInt(const char* value) { return value ? std::stoi(value) : 0; }

std::string ToTimestamp(const std::chrono::system_clock::time_point& tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S");
  return oss.str();
}

std::chrono::system_clock::time_point ParseTimestamp(const std::string& text) {
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  return std::chrono::system_clock::from_time_t(timegm(&tm));
}

std::string NullableInt(const std::optional<int>& value) {
  return value ? std::to_string(*value) : std::string("NULL");
}
}  // namespace

ResultRepository::ResultRepository(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void ResultRepository::EnsureSchema() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    if (mysql_query(conn, kCreateMatchResults) != 0) {
      db_client_->RaiseError(conn, "match_results 생성 실패");
    }
    if (mysql_query(conn, kCreateTournamentResults) != 0) {
      db_client_->RaiseError(conn, "tournament_results 생성 실패");
    }
  });
}

bool ResultRepository::InsertMatchResult(MYSQL* conn, const MatchResultRecord& record) const {
  std::ostringstream oss;
  oss << "INSERT INTO match_results(match_key, game_id, game_type, player1_id, player2_id, winner_user_id, "
         "player1_score, player2_score, forfeit, tournament_id, tick_count, ended_at, snapshot) VALUES('"
      << db_client_->Escape(conn, record.match_key) << "', " << record.game_id << ", '"
      << db_client_->Escape(conn, record.game_type) << "', " << record.player1_id << ", " << record.player2_id
      << ", " << NullableInt(record.winner_user_id) << ", " << record.player1_score << ", "
      << record.player2_score << ", " << (record.forfeit ? 1 : 0) << ", " << NullableInt(record.tournament_id)
      << ", " << record.tick_count << ", '" << ToTimestamp(record.ended_at) << "', '"
      << db_client_->Escape(conn, record.snapshot.dump()) << "');";
  if (mysql_query(conn, oss.str().c_str()) != 0) {
    if (mysql_errno(conn) == kDuplicateEntry) {
      return false;
    }
    db_client_->RaiseError(conn, "경기 결과 저장 실패");
  }
  return true;
}

bool ResultRepository::InsertTournamentResult(MYSQL* conn, const TournamentResultRecord& record) const {
  std::ostringstream oss;
  oss << "INSERT INTO tournament_results(tournament_key, tournament_id, name, creator_id, winner_user_id, "
         "participant_count, total_rounds, finished_at, bracket) VALUES('"
      << db_client_->Escape(conn, record.tournament_key) << "', " << record.tournament_id << ", '"
      << db_client_->Escape(conn, record.name) << "', " << record.creator_id << ", " << record.winner_user_id
      << ", " << record.participant_count << ", " << record.total_rounds << ", '"
      << ToTimestamp(record.finished_at) << "', '" << db_client_->Escape(conn, record.bracket.dump()) << "');";
  if (mysql_query(conn, oss.str().c_str()) != 0) {
    if (mysql_errno(conn) == kDuplicateEntry) {
      return false;
    }
    db_client_->RaiseError(conn, "토너먼트 결과 저장 실패");
  }
  return true;
}

std::size_t ResultRepository::CountRows(const char* sql) const {
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    if (mysql_query(conn, sql) != 0) {
      db_client_->RaiseError(conn, "결과 카운트 실패");
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "카운트 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row && row[0]) {
      count = static_cast<std::size_t>(std::stoull(row[0]));
    }
    mysql_free_result(res);
  });
  return count;
}

std::size_t ResultRepository::CountMatches() const { return CountRows("SELECT COUNT(*) FROM match_results;"); }

std::size_t ResultRepository::CountTournaments() const {
  return CountRows("SELECT COUNT(*) FROM tournament_results;");
}

std::optional<MatchResultRecord> ResultRepository::FindMatch(const std::string& match_key) const {
  std::optional<MatchResultRecord> result;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT match_key, game_id, game_type, player1_id, player2_id, winner_user_id, player1_score, "
           "player2_score, forfeit, tournament_id, tick_count, ended_at, snapshot FROM match_results "
           "WHERE match_key='"
        << db_client_->Escape(conn, match_key) << "';";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "경기 결과 조회 실패");
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "조회 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row) {
      result = BuildMatchRecord(row);
    }
    mysql_free_result(res);
  });
  return result;
}

void ResultRepository::ClearAll() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    if (mysql_query(conn, "DELETE FROM match_results;") != 0) {
      db_client_->RaiseError(conn, "match_results 삭제 실패");
    }
    if (mysql_query(conn, "DELETE FROM tournament_results;") != 0) {
      db_client_->RaiseError(conn, "tournament_results 삭제 실패");
    }
  });
}

MatchResultRecord ResultRepository::BuildMatchRecord(MYSQL_ROW row) const {
  MatchResultRecord record;
  record.match_key = row[0] ? row[0] : "";
  record.game_id = ToInt(row[1]);
  record.game_type = row[2] ? row[2] : "";
  record.player1_id = ToInt(row[3]);
  record.player2_id = ToInt(row[4]);
  if (row[5]) {
    record.winner_user_id = ToInt(row[5]);
  }
  record.player1_score = ToInt(row[6]);
  record.player2_score = ToInt(row[7]);
  record.forfeit = ToInt(row[8]) != 0;
  if (row[9]) {
    record.tournament_id = ToInt(row[9]);
  }
  record.tick_count = ToInt(row[10]);
  record.ended_at = ParseTimestamp(row[11] ? row[11] : "1970-01-01 00:00:00");
  record.snapshot = nlohmann::json::parse(row[12] ? row[12] : "{}", nullptr, false);
  return record;
}

}  // namespace arena
