/*
 * 설명: 세션 수명주기와 사용자 매핑, 종료 결과 기록을 조율한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_session_test.cpp, server/tests/unit/match_queue_test.cpp
 */
#include "arena/game_manager.hpp"

#include <algorithm>
#include <chrono>
#include <random>
#include <vector>

namespace arena {
namespace {
std::string MakeRunId() {
  auto now = std::chrono::system_clock::now().time_since_epoch();
  return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

void SetError(std::string& error_code, std::string& error_message, const char* code, const char* message) {
  error_code = code;
  error_message = message;
}
}  // namespace

GameManager::GameManager(boost::asio::io_context& ioc, std::shared_ptr<ConnectionRegistry> registry,
                         std::shared_ptr<ProfileDirectory> profiles, std::shared_ptr<ResultSink> result_sink,
                         std::shared_ptr<Observability> observability, const GameSessionConfig& config)
    : ioc_(ioc),
      registry_(std::move(registry)),
      profiles_(std::move(profiles)),
      result_sink_(std::move(result_sink)),
      observability_(std::move(observability)),
      config_(config),
      run_id_(MakeRunId()),
      seed_base_(config.seed != 0 ? config.seed : std::random_device{}()) {
  ValidateGameSessionConfig(config_);
}

void GameManager::DetachSpectatorLocked(int user_id, SpectatorDetachList& detached) {
  auto it = spectator_to_session_.find(user_id);
  if (it == spectator_to_session_.end()) {
    return;
  }
  auto session_it = sessions_.find(it->second);
  if (session_it != sessions_.end()) {
    detached.emplace_back(session_it->second, user_id);
  }
  spectator_to_session_.erase(it);
}

void GameManager::FinishDetach(const SpectatorDetachList& detached) {
  for (const auto& [previous, user_id] : detached) {
    previous->RemoveSpectator(user_id);
  }
}

std::shared_ptr<GameSession> GameManager::LaunchLocked(SessionKind kind, PlayerSlot player1, PlayerSlot player2,
                                                       std::optional<int> tournament_id,
                                                       CompletionCallback on_complete,
                                                       SpectatorDetachList& detached) {
  const int game_id = next_game_id_++;
  GameSessionConfig session_config = config_;
  session_config.seed = seed_base_ + static_cast<std::uint32_t>(game_id) * 7919u;
  std::weak_ptr<GameManager> weak_self = weak_from_this();
  auto session = std::make_shared<GameSession>(
      ioc_, game_id, kind, player1, player2, session_config, tournament_id, registry_, profiles_, observability_,
      [weak_self, on_complete = std::move(on_complete)](const SessionResult& result) {
        if (auto self = weak_self.lock()) {
          self->OnSessionEnded(result, on_complete);
        }
      });
  sessions_[game_id] = session;
  for (const auto& slot : {player1, player2}) {
    if (slot.IsHuman()) {
      user_to_session_[slot.user_id] = game_id;
      DetachSpectatorLocked(slot.user_id, detached);
    }
  }
  return session;
}

int GameManager::CreateMatchSession(int player1_id, int player2_id) {
  std::shared_ptr<GameSession> session;
  SpectatorDetachList detached;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    session = LaunchLocked(SessionKind::kMatchmaking, PlayerSlot::Human(player1_id), PlayerSlot::Human(player2_id),
                           std::nullopt, nullptr, detached);
  }
  FinishDetach(detached);
  session->Start();
  return session->Id();
}

bool GameManager::CreatePrivateSession(int owner_id, int& game_id, std::string& error_code,
                                       std::string& error_message) {
  std::shared_ptr<GameSession> session;
  SpectatorDetachList detached;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (user_to_session_.count(owner_id) > 0) {
      SetError(error_code, error_message, "already_in_session", "이미 게임에 참가 중입니다");
      return false;
    }
    session = LaunchLocked(SessionKind::kPrivate, PlayerSlot::Human(owner_id), PlayerSlot::Open(), std::nullopt,
                           nullptr, detached);
  }
  FinishDetach(detached);
  game_id = session->Id();
  session->Start();
  return true;
}

bool GameManager::CreateAiSession(int user_id, AiDifficulty difficulty, int& game_id, std::string& error_code,
                                  std::string& error_message) {
  std::shared_ptr<GameSession> session;
  SpectatorDetachList detached;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (user_to_session_.count(user_id) > 0) {
      SetError(error_code, error_message, "already_in_session", "이미 게임에 참가 중입니다");
      return false;
    }
    session = LaunchLocked(SessionKind::kAi, PlayerSlot::Human(user_id), PlayerSlot::Ai(difficulty), std::nullopt,
                           nullptr, detached);
  }
  FinishDetach(detached);
  game_id = session->Id();
  session->Start();
  return true;
}

bool GameManager::JoinPrivateSession(int user_id, int game_id, std::string& error_code, std::string& error_message) {
  SpectatorDetachList detached;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(game_id);
    if (it == sessions_.end()) {
      SetError(error_code, error_message, "game_not_found", "게임을 찾을 수 없습니다");
      return false;
    }
    if (it->second->Kind() != SessionKind::kPrivate) {
      SetError(error_code, error_message, "invalid_state", "초대 게임이 아닙니다");
      return false;
    }
    if (user_to_session_.count(user_id) > 0) {
      SetError(error_code, error_message, "already_in_session", "이미 게임에 참가 중입니다");
      return false;
    }
    if (!it->second->JoinOpenSlot(user_id, error_code, error_message)) {
      return false;
    }
    user_to_session_[user_id] = game_id;
    DetachSpectatorLocked(user_id, detached);
  }
  FinishDetach(detached);
  return true;
}

int GameManager::LaunchTournamentMatch(int tournament_id, int player1_id, int player2_id,
                                       CompletionCallback on_complete) {
  std::vector<std::pair<std::shared_ptr<GameSession>, int>> evicted;
  SpectatorDetachList detached;
  std::shared_ptr<GameSession> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (int user_id : {player1_id, player2_id}) {
      auto it = user_to_session_.find(user_id);
      if (it == user_to_session_.end()) {
        continue;
      }
      auto session_it = sessions_.find(it->second);
      if (session_it != sessions_.end()) {
        evicted.emplace_back(session_it->second, user_id);
      }
      user_to_session_.erase(it);
    }
    session = LaunchLocked(SessionKind::kTournament, PlayerSlot::Human(player1_id), PlayerSlot::Human(player2_id),
                           tournament_id, std::move(on_complete), detached);
  }
  FinishDetach(detached);
  for (const auto& [previous, user_id] : evicted) {
    previous->Leave(user_id);
  }
  session->Start();
  return session->Id();
}

void GameManager::CancelMatch(int game_id) {
  if (auto session = Find(game_id)) {
    session->Cancel("tournament_cancelled");
  }
}

bool GameManager::SubmitMove(int user_id, int game_id, PaddleDirection direction, std::string& error_code,
                             std::string& error_message) {
  auto session = Find(game_id);
  if (!session) {
    SetError(error_code, error_message, "game_not_found", "게임을 찾을 수 없습니다");
    return false;
  }
  return session->SubmitMove(user_id, direction, error_code, error_message);
}

bool GameManager::Leave(int user_id, std::string& error_code, std::string& error_message) {
  std::shared_ptr<GameSession> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = user_to_session_.find(user_id);
    if (it != user_to_session_.end()) {
      auto session_it = sessions_.find(it->second);
      if (session_it != sessions_.end()) {
        session = session_it->second;
      }
      user_to_session_.erase(it);
    } else {
      auto spectator_it = spectator_to_session_.find(user_id);
      if (spectator_it == spectator_to_session_.end()) {
        SetError(error_code, error_message, "not_in_game", "참가 중인 게임이 없습니다");
        return false;
      }
      auto session_it = sessions_.find(spectator_it->second);
      if (session_it != sessions_.end()) {
        session = session_it->second;
      }
      spectator_to_session_.erase(spectator_it);
    }
  }
  if (session) {
    session->Leave(user_id);
  }
  return true;
}

bool GameManager::Spectate(int user_id, int game_id, std::string& error_code, std::string& error_message) {
  std::shared_ptr<GameSession> session;
  std::shared_ptr<GameSession> previous;
  int previous_id = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (user_to_session_.count(user_id) > 0) {
      SetError(error_code, error_message, "already_in_session", "게임 참가 중에는 관전할 수 없습니다");
      return false;
    }
    auto it = sessions_.find(game_id);
    if (it == sessions_.end()) {
      SetError(error_code, error_message, "game_not_found", "게임을 찾을 수 없습니다");
      return false;
    }
    session = it->second;
    auto spectator_it = spectator_to_session_.find(user_id);
    if (spectator_it != spectator_to_session_.end() && spectator_it->second != game_id) {
      auto previous_it = sessions_.find(spectator_it->second);
      if (previous_it != sessions_.end()) {
        previous = previous_it->second;
      }
      previous_id = spectator_it->second;
    }
  }
  if (previous) {
    previous->RemoveSpectator(user_id);
  }
  if (!session->AddSpectator(user_id, error_code, error_message)) {
    if (previous_id != 0) {
      std::lock_guard<std::mutex> lock(mutex_);
      auto stale = spectator_to_session_.find(user_id);
      if (stale != spectator_to_session_.end() && stale->second == previous_id) {
        spectator_to_session_.erase(stale);
      }
    }
    return false;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  spectator_to_session_[user_id] = game_id;
  return true;
}

void GameManager::HandleConnect(int user_id) {
  std::shared_ptr<GameSession> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = user_to_session_.find(user_id);
    if (it == user_to_session_.end()) {
      return;
    }
    auto session_it = sessions_.find(it->second);
    if (session_it == sessions_.end()) {
      return;
    }
    session = session_it->second;
  }
  session->Reconnect(user_id);
}

void GameManager::HandleDisconnect(int user_id) {
  std::shared_ptr<GameSession> player_session;
  std::shared_ptr<GameSession> spectated;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = user_to_session_.find(user_id);
    if (it != user_to_session_.end()) {
      auto session_it = sessions_.find(it->second);
      if (session_it != sessions_.end()) {
        player_session = session_it->second;
      }
    }
    auto spectator_it = spectator_to_session_.find(user_id);
    if (spectator_it != spectator_to_session_.end()) {
      auto session_it = sessions_.find(spectator_it->second);
      if (session_it != sessions_.end()) {
        spectated = session_it->second;
      }
      spectator_to_session_.erase(spectator_it);
    }
  }
  if (spectated) {
    spectated->RemoveSpectator(user_id);
  }
  if (player_session) {
    player_session->Disconnect(user_id);
  }
}

void GameManager::CancelAll(const std::string& reason) {
  std::vector<std::shared_ptr<GameSession>> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, session] : sessions_) {
      sessions.push_back(session);
    }
  }
  for (const auto& session : sessions) {
    session->Cancel(reason);
  }
}

bool GameManager::IsUserInSession(int user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return user_to_session_.count(user_id) > 0;
}

std::optional<int> GameManager::SessionOf(int user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = user_to_session_.find(user_id);
  if (it == user_to_session_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::shared_ptr<GameSession> GameManager::Find(int game_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(game_id);
  return it == sessions_.end() ? nullptr : it->second;
}

nlohmann::json GameManager::ListActive() const {
  std::vector<std::shared_ptr<GameSession>> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, session] : sessions_) {
      sessions.push_back(session);
    }
  }
  std::sort(sessions.begin(), sessions.end(),
            [](const auto& lhs, const auto& rhs) { return lhs->Id() < rhs->Id(); });
  auto games = nlohmann::json::array();
  for (const auto& session : sessions) {
    auto status = session->Status();
    if (status == SessionStatus::kWaiting || IsTerminal(status)) {
      continue;
    }
    games.push_back(session->Describe());
  }
  return games;
}

bool GameManager::IsSpectating(int user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return spectator_to_session_.count(user_id) > 0;
}

std::size_t GameManager::ActiveSessionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

MatchResultRecord GameManager::BuildRecord(const SessionResult& result) const {
  MatchResultRecord record;
  record.match_key = run_id_ + "-g" + std::to_string(result.game_id);
  record.game_id = result.game_id;
  record.game_type = ToString(result.kind);
  record.player1_id = result.player1_id;
  record.player2_id = result.player2_id;
  if (result.HasWinner()) {
    record.winner_user_id = result.winner_user_id;
  }
  record.player1_score = result.player1_score;
  record.player2_score = result.player2_score;
  record.forfeit = result.forfeit;
  record.tournament_id = result.tournament_id;
  record.tick_count = result.tick_count;
  record.ended_at = result.ended_at;
  record.snapshot = {{"status", ToString(result.status)},
                     {"reason", result.reason},
                     {"player2IsAi", result.player2_is_ai}};
  return record;
}

void GameManager::OnSessionEnded(const SessionResult& result, const CompletionCallback& on_complete) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.erase(result.game_id);
    for (int user_id : {result.player1_id, result.player2_id}) {
      auto it = user_to_session_.find(user_id);
      if (it != user_to_session_.end() && it->second == result.game_id) {
        user_to_session_.erase(it);
      }
    }
    for (auto it = spectator_to_session_.begin(); it != spectator_to_session_.end();) {
      if (it->second == result.game_id) {
        it = spectator_to_session_.erase(it);
      } else {
        ++it;
      }
    }
  }
  if (result.HasWinner() && result_sink_) {
    result_sink_->RecordMatch(BuildRecord(result));
  }
  if (on_complete) {
    on_complete(result);
  }
}

}  // namespace arena
