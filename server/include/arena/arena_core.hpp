/*
 * 설명: 연결 레지스트리, 세션 관리자, 매칭 큐, 토너먼트, 이벤트 라우터를 소유하고 연결한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_router_test.cpp, server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <memory>

#include <boost/asio/io_context.hpp>

#include "arena/connection_registry.hpp"
#include "arena/event_router.hpp"
#include "arena/game_manager.hpp"
#include "arena/match_queue.hpp"
#include "arena/observability.hpp"
#include "arena/profile_directory.hpp"
#include "arena/result_sink.hpp"
#include "arena/tournament_service.hpp"

namespace arena {

class ArenaCore {
 public:
  ArenaCore(boost::asio::io_context& ioc, const GameSessionConfig& game_config,
            std::shared_ptr<ResultSink> result_sink, std::shared_ptr<Observability> observability);
  ~ArenaCore();

  ArenaCore(const ArenaCore&) = delete;
  ArenaCore& operator=(const ArenaCore&) = delete;

  // 진행 중인 세션을 모두 승자 없이 취소한다.
  void Shutdown();

  std::shared_ptr<ConnectionRegistry> GetRegistry() const { return registry_; }
  std::shared_ptr<ProfileDirectory> GetProfiles() const { return profiles_; }
  std::shared_ptr<GameManager> GetGameManager() const { return game_manager_; }
  std::shared_ptr<MatchQueueService> GetMatchQueue() const { return match_queue_; }
  std::shared_ptr<TournamentService> GetTournaments() const { return tournaments_; }
  std::shared_ptr<EventRouter> GetRouter() const { return router_; }
  std::shared_ptr<Observability> GetObservability() const { return observability_; }
  MetricsSnapshot Metrics() const;

 private:
  void WireListeners();

  std::shared_ptr<Observability> observability_;
  std::shared_ptr<ResultSink> result_sink_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<ProfileDirectory> profiles_;
  std::shared_ptr<GameManager> game_manager_;
  std::shared_ptr<MatchQueueService> match_queue_;
  std::shared_ptr<TournamentService> tournaments_;
  std::shared_ptr<EventRouter> router_;
  bool shut_down_{false};
};

}  // namespace arena
