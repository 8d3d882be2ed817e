/*
 * 설명: 결과 기록을 백그라운드 스레드 풀에서 MariaDB 트랜잭션으로 수행한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/result_repository_it_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>

#include <boost/asio/thread_pool.hpp>

#include "arena/db_client.hpp"
#include "arena/observability.hpp"
#include "arena/result_repository.hpp"
#include "arena/result_sink.hpp"

namespace arena {

class ResultService : public ResultSink {
 public:
  ResultService(std::shared_ptr<MariaDbClient> db_client, std::shared_ptr<ResultRepository> repository,
                std::shared_ptr<Observability> observability, std::size_t threads = 1);
  ~ResultService() override;

  void RecordMatch(const MatchResultRecord& record) override;
  void RecordTournament(const TournamentResultRecord& record) override;

  // 대기 중인 기록을 모두 마치고 풀을 종료한다. 이후 기록 요청은 무시된다.
  void Shutdown();

  std::size_t FailureCount() const { return failures_.load(); }
  std::shared_ptr<ResultRepository> GetRepository() const { return repository_; }

 private:
  bool PersistMatch(const MatchResultRecord& record);
  bool PersistTournament(const TournamentResultRecord& record);

  std::shared_ptr<MariaDbClient> db_client_;
  std::shared_ptr<ResultRepository> repository_;
  std::shared_ptr<Observability> observability_;
  boost::asio::thread_pool pool_;
  std::atomic<bool> stopped_{false};
  std::atomic<std::size_t> failures_{0};
};

}  // namespace arena
