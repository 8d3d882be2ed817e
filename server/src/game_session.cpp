/*
 * 설명: 세션 상태 전이, 틱 루프, 기권/재접속 처리와 결과 보고를 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_session_test.cpp
 */
#include "arena/game_session.hpp"

#include <algorithm>
#include <stdexcept>

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>

namespace arena {
namespace {
Side SideOf(int index) { return index == 0 ? Side::kLeft : Side::kRight; }

long long GraceMillis(std::chrono::milliseconds grace) { return grace.count(); }
}  // namespace

const char* ToString(SessionStatus status) {
  switch (status) {
    case SessionStatus::kWaiting:
      return "waiting";
    case SessionStatus::kCountdown:
      return "countdown";
    case SessionStatus::kPlaying:
      return "playing";
    case SessionStatus::kPaused:
      return "paused";
    case SessionStatus::kFinished:
      return "finished";
    case SessionStatus::kCancelled:
      return "cancelled";
  }
  return "waiting";
}

const char* ToString(SessionKind kind) {
  switch (kind) {
    case SessionKind::kMatchmaking:
      return "matchmaking";
    case SessionKind::kPrivate:
      return "private";
    case SessionKind::kAi:
      return "ai";
    case SessionKind::kTournament:
      return "tournament";
  }
  return "matchmaking";
}

void ValidateGameSessionConfig(const GameSessionConfig& config) {
  if (config.tick_rate <= 0) {
    throw std::invalid_argument("tick_rate 는 양수여야 합니다: " + std::to_string(config.tick_rate));
  }
  if (config.win_score <= 0) {
    throw std::invalid_argument("win_score 는 양수여야 합니다: " + std::to_string(config.win_score));
  }
  if (config.countdown_seconds < 0) {
    throw std::invalid_argument("countdown_seconds 는 음수일 수 없습니다: " +
                                std::to_string(config.countdown_seconds));
  }
  if (config.reconnect_grace.count() < 0) {
    throw std::invalid_argument("reconnect_grace 는 음수일 수 없습니다");
  }
}

GameSession::GameSession(boost::asio::io_context& ioc, int id, SessionKind kind, PlayerSlot player1,
                         PlayerSlot player2, const GameSessionConfig& config, std::optional<int> tournament_id,
                         std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<ProfileDirectory> profiles,
                         std::shared_ptr<Observability> observability, EndedCallback on_ended)
    : strand_(boost::asio::make_strand(ioc)),
      timer_(ioc),
      id_(id),
      kind_(kind),
      config_(config),
      tournament_id_(tournament_id),
      registry_(std::move(registry)),
      profiles_(std::move(profiles)),
      observability_(std::move(observability)),
      on_ended_(std::move(on_ended)),
      simulation_(config.win_score, config.seed) {
  slots_[0].slot = player1;
  slots_[1].slot = player2;
  for (int i = 0; i < 2; ++i) {
    if (slots_[i].slot.is_ai) {
      ai_[i] = std::make_unique<AiController>(SideOf(i), slots_[i].slot.difficulty, config.seed + 1 + i);
    }
  }
  last_snapshot_ = simulation_.Snapshot();
}

void GameSession::Start() {
  boost::asio::dispatch(strand_, [self = shared_from_this()]() {
    bool ready = false;
    {
      std::lock_guard<std::mutex> lock(self->mutex_);
      ready = !self->slots_[0].slot.IsOpen() && !self->slots_[1].slot.IsOpen();
    }
    if (ready) {
      self->EnterCountdown();
    } else {
      self->Log(LogLevel::kInfo, "game.waiting", "상대 참가를 기다립니다");
    }
  });
}

bool GameSession::JoinOpenSlot(int user_id, std::string& error_code, std::string& error_message) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (IndexOfLocked(user_id) >= 0) {
      error_code = "already_in_session";
      error_message = "이미 이 게임에 참가 중입니다";
      return false;
    }
    if (status_ != SessionStatus::kWaiting || !slots_[1].slot.IsOpen()) {
      error_code = "game_full";
      error_message = "게임에 빈 자리가 없습니다";
      return false;
    }
    slots_[1].slot = PlayerSlot::Human(user_id);
  }
  boost::asio::post(strand_, [self = shared_from_this()]() { self->EnterCountdown(); });
  return true;
}

bool GameSession::SubmitMove(int user_id, PaddleDirection direction, std::string& error_code,
                             std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  int index = IndexOfLocked(user_id);
  if (index < 0) {
    error_code = "not_participant";
    error_message = "게임 참가자가 아닙니다";
    return false;
  }
  if (status_ != SessionStatus::kCountdown && status_ != SessionStatus::kPlaying) {
    error_code = "invalid_state";
    error_message = "지금은 입력을 받을 수 없습니다";
    return false;
  }
  intents_.push_back(MoveIntent{index, direction});
  return true;
}

bool GameSession::AddSpectator(int user_id, std::string& error_code, std::string& error_message) {
  nlohmann::json description;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ == SessionStatus::kWaiting || IsTerminal(status_)) {
      error_code = "invalid_state";
      error_message = "진행 중인 게임만 관전할 수 있습니다";
      return false;
    }
    if (IndexOfLocked(user_id) >= 0) {
      error_code = "already_in_session";
      error_message = "게임 참가자는 관전할 수 없습니다";
      return false;
    }
    spectators_.insert(user_id);
  }
  description = Describe();
  registry_->SendEventToUser(user_id, "game:spectating", description);
  return true;
}

void GameSession::RemoveSpectator(int user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  spectators_.erase(user_id);
}

void GameSession::Leave(int user_id) {
  boost::asio::post(strand_, [self = shared_from_this(), user_id]() { self->HandleLeave(user_id); });
}

void GameSession::Disconnect(int user_id) {
  boost::asio::post(strand_, [self = shared_from_this(), user_id]() { self->HandleDisconnect(user_id); });
}

void GameSession::Reconnect(int user_id) {
  boost::asio::post(strand_, [self = shared_from_this(), user_id]() { self->HandleReconnect(user_id); });
}

void GameSession::Cancel(const std::string& reason) {
  boost::asio::post(strand_, [self = shared_from_this(), reason]() { self->CancelWithoutWinner(reason); });
}

SessionStatus GameSession::Status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

int GameSession::PlayerNumberOf(int user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return IndexOfLocked(user_id) + 1;
}

std::vector<int> GameSession::HumanPlayers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return PlayerAudienceLocked();
}

bool GameSession::HasOpenSlot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return slots_[1].slot.IsOpen();
}

nlohmann::json GameSession::Describe() const {
  std::lock_guard<std::mutex> lock(mutex_);
  nlohmann::json j{{"gameId", id_},
                   {"gameType", ToString(kind_)},
                   {"status", ToString(status_)},
                   {"player1", PlayerJson(0)},
                   {"player2", PlayerJson(1)},
                   {"state", last_snapshot_}};
  if (tournament_id_) {
    j["tournamentId"] = *tournament_id_;
  }
  return j;
}

int GameSession::IndexOfLocked(int user_id) const {
  for (int i = 0; i < 2; ++i) {
    if (slots_[i].slot.IsHuman() && slots_[i].slot.user_id == user_id) {
      return i;
    }
  }
  return -1;
}

std::vector<int> GameSession::PlayerAudienceLocked() const {
  std::vector<int> users;
  for (const auto& state : slots_) {
    if (state.slot.IsHuman()) {
      users.push_back(state.slot.user_id);
    }
  }
  return users;
}

std::vector<int> GameSession::FullAudienceLocked() const {
  auto users = PlayerAudienceLocked();
  users.insert(users.end(), spectators_.begin(), spectators_.end());
  return users;
}

nlohmann::json GameSession::PlayerJson(int index) const {
  const auto& slot = slots_[index].slot;
  if (slot.IsOpen()) {
    return nullptr;
  }
  if (slot.is_ai) {
    auto j = ProfileDirectory::AiOpponent().ToJson();
    j["difficulty"] = ToString(slot.difficulty);
    return j;
  }
  return profiles_->Lookup(slot.user_id).ToJson();
}

nlohmann::json GameSession::UpdatePayloadLocked() const {
  nlohmann::json payload = last_snapshot_;
  payload["gameId"] = id_;
  payload["status"] = ToString(status_);
  return payload;
}

nlohmann::json GameSession::StartingPayloadLocked(int countdown_seconds) const {
  nlohmann::json payload{{"gameId", id_},
                         {"gameType", ToString(kind_)},
                         {"status", ToString(status_)},
                         {"player1", PlayerJson(0)},
                         {"player2", PlayerJson(1)},
                         {"countdown", countdown_seconds},
                         {"tickRate", config_.tick_rate},
                         {"winScore", config_.win_score}};
  if (tournament_id_) {
    payload["tournamentId"] = *tournament_id_;
  }
  return payload;
}

void GameSession::Emit(const std::vector<int>& audience, const std::string& event,
                       const nlohmann::json& payload) const {
  registry_->Broadcast(audience, event, payload);
}

void GameSession::Log(LogLevel level, const std::string& name, const std::string& message) const {
  if (!observability_) {
    return;
  }
  observability_->Log(LogContext{.game_id = id_, .tournament_id = tournament_id_, .name = name, .level = level,
                                 .message = message});
}

void GameSession::EnterCountdown() {
  std::vector<int> players;
  std::vector<int> offline;
  nlohmann::json starting;
  nlohmann::json update;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (status_ != SessionStatus::kWaiting) {
      return;
    }
    status_ = SessionStatus::kCountdown;
    countdown_ticks_remaining_ = config_.countdown_seconds * config_.tick_rate;
    for (const auto& state : slots_) {
      if (state.slot.IsHuman() && !registry_->IsConnected(state.slot.user_id)) {
        offline.push_back(state.slot.user_id);
      }
    }
    players = PlayerAudienceLocked();
    starting = StartingPayloadLocked(config_.countdown_seconds);
    update = UpdatePayloadLocked();
    update["countdownValue"] = config_.countdown_seconds;
  }

  for (int user_id : players) {
    int number = PlayerNumberOf(user_id);
    registry_->SendEventToUser(user_id, "game:joined",
                               {{"gameId", id_}, {"playerNumber", number}, {"gameType", ToString(kind_)}});
  }
  Emit(players, "game-starting", starting);
  Emit(players, "game-update", update);
  Log(LogLevel::kInfo, "game.countdown", "카운트다운을 시작합니다");

  for (int user_id : offline) {
    HandleDisconnect(user_id);
  }
  if (countdown_ticks_remaining_ <= 0 && Status() == SessionStatus::kCountdown) {
    EnterPlaying();
  }
  ScheduleTick();
}

void GameSession::EnterPlaying() {
  simulation_.ServeBall();
  std::vector<int> audience;
  nlohmann::json update;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    status_ = SessionStatus::kPlaying;
    if (!started_at_) {
      started_at_ = std::chrono::system_clock::now();
    }
    last_snapshot_ = simulation_.Snapshot();
    audience = FullAudienceLocked();
    update = UpdatePayloadLocked();
    update["countdownValue"] = 0;
  }
  Emit(audience, "game-update", update);
  Log(LogLevel::kInfo, "game.playing", "경기를 시작합니다");
}

void GameSession::ScheduleTick() {
  timer_.expires_after(std::chrono::nanoseconds(1'000'000'000 / config_.tick_rate));
  timer_.async_wait(boost::asio::bind_executor(
      strand_, [self = shared_from_this()](const boost::system::error_code& ec) {
        if (!ec) {
          self->HandleTick();
        }
      }));
}

bool GameSession::CheckReconnectGrace() {
  int loser = -1;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = std::chrono::steady_clock::now();
    std::optional<std::chrono::steady_clock::time_point> earliest;
    for (int i = 0; i < 2; ++i) {
      const auto& state = slots_[i];
      if (state.connected || !state.disconnected_at) {
        continue;
      }
      if (*state.disconnected_at + config_.reconnect_grace <= now && (!earliest || *state.disconnected_at < *earliest)) {
        earliest = state.disconnected_at;
        loser = i;
      }
    }
  }
  if (loser < 0) {
    return false;
  }
  Forfeit(loser, "reconnect_timeout");
  return true;
}

void GameSession::HandleTick() {
  std::deque<MoveIntent> intents;
  SessionStatus status;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    status = status_;
    intents.swap(intents_);
  }
  if (IsTerminal(status)) {
    return;
  }
  for (const auto& intent : intents) {
    simulation_.SetCommand(SideOf(intent.slot_index), intent.direction);
  }

  switch (status) {
    case SessionStatus::kPaused:
      if (CheckReconnectGrace()) {
        return;
      }
      break;
    case SessionStatus::kCountdown:
      --countdown_ticks_remaining_;
      if (countdown_ticks_remaining_ <= 0) {
        EnterPlaying();
      } else if (countdown_ticks_remaining_ % config_.tick_rate == 0) {
        std::vector<int> audience;
        nlohmann::json update;
        {
          std::lock_guard<std::mutex> lock(mutex_);
          audience = FullAudienceLocked();
          update = UpdatePayloadLocked();
          update["countdownValue"] = countdown_ticks_remaining_ / config_.tick_rate;
        }
        Emit(audience, "game-update", update);
      }
      break;
    case SessionStatus::kPlaying: {
      for (int i = 0; i < 2; ++i) {
        if (ai_[i]) {
          simulation_.SetCommand(SideOf(i), ai_[i]->Decide(simulation_));
        }
      }
      auto outcome = simulation_.TickOnce();
      std::vector<int> audience;
      nlohmann::json update;
      {
        std::lock_guard<std::mutex> lock(mutex_);
        last_snapshot_ = simulation_.Snapshot();
        audience = FullAudienceLocked();
        update = UpdatePayloadLocked();
      }
      Emit(audience, "game-update", update);
      if (outcome.finished) {
        Finish();
        return;
      }
      break;
    }
    default:
      break;
  }
  ScheduleTick();
}

void GameSession::HandleDisconnect(int user_id) {
  bool cancel_waiting = false;
  bool newly_paused = false;
  std::vector<int> others;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    int index = IndexOfLocked(user_id);
    if (index < 0 || IsTerminal(status_)) {
      spectators_.erase(user_id);
      return;
    }
    if (status_ == SessionStatus::kWaiting) {
      cancel_waiting = true;
    } else if (slots_[index].connected) {
      slots_[index].connected = false;
      slots_[index].disconnected_at = std::chrono::steady_clock::now();
      if (status_ == SessionStatus::kCountdown || status_ == SessionStatus::kPlaying) {
        resume_status_ = status_;
        status_ = SessionStatus::kPaused;
        newly_paused = true;
      }
      others = FullAudienceLocked();
      others.erase(std::remove(others.begin(), others.end(), user_id), others.end());
    } else {
      return;
    }
  }
  if (cancel_waiting) {
    CancelWithoutWinner("owner_disconnected");
    return;
  }
  const auto grace = GraceMillis(config_.reconnect_grace);
  Emit(others, "game:opponent-disconnected",
       {{"gameId", id_}, {"userId", user_id}, {"reconnectTimeoutMs", grace}});
  if (newly_paused) {
    Emit(others, "game-paused", {{"gameId", id_}, {"reason", "player_disconnected"}, {"reconnectTimeoutMs", grace}});
  }
  if (observability_) {
    observability_->Log(LogContext{.user_id = user_id, .game_id = id_, .tournament_id = tournament_id_,
                                   .name = "game.paused", .level = LogLevel::kInfo,
                                   .message = "연결 종료로 일시정지합니다"});
  }
}

void GameSession::HandleReconnect(int user_id) {
  bool was_disconnected = false;
  bool resumed = false;
  int number = 0;
  std::vector<int> others;
  nlohmann::json starting;
  nlohmann::json update;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    int index = IndexOfLocked(user_id);
    if (index < 0 || IsTerminal(status_) || status_ == SessionStatus::kWaiting) {
      return;
    }
    was_disconnected = !slots_[index].connected;
    slots_[index].connected = true;
    slots_[index].disconnected_at.reset();
    if (was_disconnected && status_ == SessionStatus::kPaused && slots_[1 - index].connected) {
      status_ = resume_status_;
      resumed = true;
    }
    number = index + 1;
    others = FullAudienceLocked();
    others.erase(std::remove(others.begin(), others.end(), user_id), others.end());
    const bool counting = status_ == SessionStatus::kCountdown ||
                          (status_ == SessionStatus::kPaused && resume_status_ == SessionStatus::kCountdown);
    const int remaining =
        counting ? (countdown_ticks_remaining_ + config_.tick_rate - 1) / config_.tick_rate : 0;
    starting = StartingPayloadLocked(remaining);
    update = UpdatePayloadLocked();
  }
  registry_->SendEventToUser(user_id, "game:joined",
                             {{"gameId", id_}, {"playerNumber", number}, {"gameType", ToString(kind_)},
                              {"reconnected", true}});
  registry_->SendEventToUser(user_id, "game-starting", starting);
  registry_->SendEventToUser(user_id, "game-update", update);
  if (!was_disconnected) {
    return;
  }
  Emit(others, "game:opponent-reconnected", {{"gameId", id_}, {"userId", user_id}});
  if (resumed) {
    auto all = others;
    all.push_back(user_id);
    Emit(all, "game-resumed", {{"gameId", id_}, {"status", ToString(Status())}});
  }
  Log(LogLevel::kInfo, "game.reconnected", "플레이어가 재접속했습니다");
}

void GameSession::HandleLeave(int user_id) {
  int index = -1;
  SessionStatus status;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (spectators_.erase(user_id) > 0) {
      return;
    }
    index = IndexOfLocked(user_id);
    status = status_;
  }
  if (index < 0 || IsTerminal(status)) {
    return;
  }
  if (status == SessionStatus::kWaiting) {
    CancelWithoutWinner("player_left");
  } else {
    Forfeit(index, "player_left");
  }
}

void GameSession::Forfeit(int loser_index, const std::string& reason) {
  const int winner_index = 1 - loser_index;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (IsTerminal(status_)) {
      return;
    }
    status_ = SessionStatus::kCancelled;
  }
  simulation_.ForceWin(SideOf(winner_index));
  Report(winner_index, true, reason);
}

void GameSession::Finish() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (IsTerminal(status_)) {
      return;
    }
    status_ = SessionStatus::kFinished;
  }
  auto winner = simulation_.Winner();
  Report(winner ? static_cast<int>(*winner) : -1, false, "completed");
}

void GameSession::CancelWithoutWinner(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (IsTerminal(status_)) {
      return;
    }
    status_ = SessionStatus::kCancelled;
  }
  Report(-1, false, reason);
}

void GameSession::Report(int winner_index, bool forfeit, const std::string& reason) {
  timer_.cancel();
  SessionResult result;
  std::vector<int> audience;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    last_snapshot_ = simulation_.Snapshot();
    result.game_id = id_;
    result.kind = kind_;
    result.status = status_;
    result.player1_id = slots_[0].slot.user_id;
    result.player2_id = slots_[1].slot.user_id;
    result.player2_is_ai = slots_[1].slot.is_ai;
    if (winner_index >= 0) {
      result.winner_player_number = winner_index + 1;
      result.winner_user_id = slots_[winner_index].slot.user_id;
    }
    result.player1_score = simulation_.Score(Side::kLeft);
    result.player2_score = simulation_.Score(Side::kRight);
    result.forfeit = forfeit;
    result.reason = reason;
    result.tournament_id = tournament_id_;
    result.tick_count = simulation_.CurrentTick();
    result.started_at = started_at_;
    result.ended_at = std::chrono::system_clock::now();
    audience = FullAudienceLocked();
    spectators_.clear();
    intents_.clear();
  }

  nlohmann::json ended{{"gameId", id_},
                       {"status", ToString(result.status)},
                       {"winnerId", result.HasWinner() ? nlohmann::json(result.winner_user_id) : nlohmann::json(nullptr)},
                       {"winnerPlayerNumber", result.winner_player_number},
                       {"finalScore", {{"player1", result.player1_score}, {"player2", result.player2_score}}},
                       {"forfeit", forfeit},
                       {"reason", reason}};
  if (tournament_id_) {
    ended["tournamentId"] = *tournament_id_;
  }
  Emit(audience, result.HasWinner() ? "game-ended" : "game-cancelled", ended);
  Log(LogLevel::kInfo, "game.ended", reason);
  if (on_ended_) {
    on_ended_(result);
  }
}

}  // namespace arena
