/*
 * 설명: 코어 컴포넌트 생성 순서와 연결/해제 알림 배선을 담당한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 */
#include "arena/arena_core.hpp"

namespace arena {

ArenaCore::ArenaCore(boost::asio::io_context& ioc, const GameSessionConfig& game_config,
                     std::shared_ptr<ResultSink> result_sink, std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)),
      result_sink_(std::move(result_sink)),
      registry_(std::make_shared<ConnectionRegistry>()),
      profiles_(std::make_shared<ProfileDirectory>()) {
  registry_->SetObservability(observability_);
  game_manager_ =
      std::make_shared<GameManager>(ioc, registry_, profiles_, result_sink_, observability_, game_config);
  match_queue_ = std::make_shared<MatchQueueService>(game_manager_, registry_, profiles_, observability_);
  tournaments_ =
      std::make_shared<TournamentService>(game_manager_, registry_, profiles_, result_sink_, observability_);
  router_ = std::make_shared<EventRouter>(registry_, game_manager_, match_queue_, tournaments_, observability_);
  WireListeners();
}

ArenaCore::~ArenaCore() { Shutdown(); }

void ArenaCore::WireListeners() {
  std::weak_ptr<GameManager> games = game_manager_;
  std::weak_ptr<MatchQueueService> queue = match_queue_;
  std::weak_ptr<TournamentService> tournaments = tournaments_;

  registry_->AddDisconnectListener([queue, tournaments, games](int user_id) {
    if (auto q = queue.lock()) {
      q->HandleDisconnect(user_id);
    }
    if (auto t = tournaments.lock()) {
      t->HandleDisconnect(user_id);
    }
    if (auto g = games.lock()) {
      g->HandleDisconnect(user_id);
    }
  });
  registry_->AddConnectListener([games](int user_id) {
    if (auto g = games.lock()) {
      g->HandleConnect(user_id);
    }
  });
}

void ArenaCore::Shutdown() {
  if (shut_down_) {
    return;
  }
  shut_down_ = true;
  game_manager_->CancelAll("server_shutdown");
}

MetricsSnapshot ArenaCore::Metrics() const {
  return observability_->Snapshot(game_manager_->ActiveSessionCount(), match_queue_->QueueLength(),
                                  tournaments_->ActiveCount());
}

}  // namespace arena
