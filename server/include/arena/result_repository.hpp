/*
 * 설명: 경기/토너먼트 결과를 MariaDB에 저장하고 중복을 기본 키로 차단한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md, server/db/schema.sql
 * 테스트: server/tests/it/result_repository_it_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include <mariadb/mysql.h>

#include "arena/db_client.hpp"
#include "arena/result_sink.hpp"

namespace arena {

class ResultRepository {
 public:
  explicit ResultRepository(std::shared_ptr<MariaDbClient> db_client);

  // 테이블이 없으면 만든다.
  void EnsureSchema() const;

  // 이미 같은 키가 있으면 false 를 반환한다.
  bool InsertMatchResult(MYSQL* conn, const MatchResultRecord& record) const;
  bool InsertTournamentResult(MYSQL* conn, const TournamentResultRecord& record) const;

  std::size_t CountMatches() const;
  std::size_t CountTournaments() const;
  std::optional<MatchResultRecord> FindMatch(const std::string& match_key) const;
  void ClearAll() const;

 private:
  MatchResultRecord BuildMatchRecord(MYSQL_ROW row) const;
  std::size_t CountRows(const char* sql) const;

  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace arena
