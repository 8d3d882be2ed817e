/*
 * 설명: 대기열 입장/취소와 즉시 페어링, 초대/AI 게임 생성을 처리한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/match_queue_test.cpp
 */
#include "arena/match_queue.hpp"

#include <iterator>

namespace arena {

MatchQueueService::MatchQueueService(std::shared_ptr<GameManager> game_manager,
                                     std::shared_ptr<ConnectionRegistry> registry,
                                     std::shared_ptr<ProfileDirectory> profiles,
                                     std::shared_ptr<Observability> observability)
    : game_manager_(std::move(game_manager)), registry_(std::move(registry)), profiles_(std::move(profiles)),
      observability_(std::move(observability)) {}

bool MatchQueueService::Enqueue(int user_id, EnqueueOutcome& outcome, std::string& error_code,
                                std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (user_index_.count(user_id) > 0) {
    error_code = "already_queued";
    error_message = "이미 대기열에 있습니다";
    return false;
  }
  if (game_manager_->IsUserInSession(user_id)) {
    error_code = "already_in_session";
    error_message = "이미 게임에 참가 중입니다";
    return false;
  }

  DropStaleLocked();
  if (!queue_.empty()) {
    const QueueEntry opponent = queue_.front();
    RemoveLocked(opponent.user_id);
    outcome.game_id = game_manager_->CreateMatchSession(opponent.user_id, user_id);
    outcome.queue_length = queue_.size();
    auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                        opponent.joined_at);
    observability_->Log(LogContext{.user_id = user_id, .game_id = outcome.game_id, .name = "queue.paired",
                                   .latency_ms = static_cast<long>(waited.count())});
    return true;
  }

  queue_.push_back(QueueEntry{user_id, std::chrono::steady_clock::now()});
  user_index_[user_id] = std::prev(queue_.end());
  outcome.queue_length = queue_.size();
  observability_->Log(LogContext{.user_id = user_id, .name = "queue.joined", .level = LogLevel::kDebug});
  return true;
}

bool MatchQueueService::Cancel(int user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (user_index_.count(user_id) == 0) {
    return false;
  }
  RemoveLocked(user_id);
  return true;
}

bool MatchQueueService::CreatePrivate(int user_id, int& game_id, std::string& error_code,
                                      std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!game_manager_->CreatePrivateSession(user_id, game_id, error_code, error_message)) {
    return false;
  }
  RemoveLocked(user_id);
  return true;
}

bool MatchQueueService::CreateAi(int user_id, const std::string& difficulty, int& game_id, AiDifficulty& resolved,
                                 std::string& error_code, std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  resolved = ParseAiDifficulty(difficulty);
  if (!game_manager_->CreateAiSession(user_id, resolved, game_id, error_code, error_message)) {
    return false;
  }
  RemoveLocked(user_id);
  return true;
}

bool MatchQueueService::JoinPrivate(int user_id, int game_id, std::string& error_code, std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!game_manager_->JoinPrivateSession(user_id, game_id, error_code, error_message)) {
    return false;
  }
  RemoveLocked(user_id);
  return true;
}

bool MatchQueueService::SendInvitation(int from_user_id, int to_user_id, int& game_id, bool& delivered,
                                       std::string& error_code, std::string& error_message) {
  if (from_user_id == to_user_id) {
    error_code = "invalid_state";
    error_message = "자기 자신은 초대할 수 없습니다";
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto current = game_manager_->SessionOf(from_user_id);
    std::shared_ptr<GameSession> session = current ? game_manager_->Find(*current) : nullptr;
    if (session && session->Kind() == SessionKind::kPrivate && session->HasOpenSlot()) {
      game_id = session->Id();
    } else if (!game_manager_->CreatePrivateSession(from_user_id, game_id, error_code, error_message)) {
      return false;
    }
    RemoveLocked(from_user_id);
  }
  delivered = registry_->IsConnected(to_user_id);
  if (delivered) {
    auto inviter = profiles_->Lookup(from_user_id);
    registry_->SendEventToUser(to_user_id, "game-invitation",
                               {{"gameId", game_id}, {"inviterId", from_user_id},
                                {"inviterName", inviter.display_name}});
  }
  return true;
}

bool MatchQueueService::IsQueued(int user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return user_index_.count(user_id) > 0;
}

std::size_t MatchQueueService::QueueLength() {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void MatchQueueService::DropStaleLocked() {
  for (auto it = queue_.begin(); it != queue_.end();) {
    if (game_manager_->IsUserInSession(it->user_id)) {
      user_index_.erase(it->user_id);
      it = queue_.erase(it);
    } else {
      ++it;
    }
  }
}

void MatchQueueService::RemoveLocked(int user_id) {
  auto it = user_index_.find(user_id);
  if (it == user_index_.end()) {
    return;
  }
  queue_.erase(it->second);
  user_index_.erase(it);
}

}  // namespace arena
