/*
 * 설명: 두 슬롯 퐁 세션의 상태 머신, 틱 루프, 입력 큐, 재접속 유예를 관리한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_session_test.cpp
 */
#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

#include <nlohmann/json.hpp>

#include "arena/ai_controller.hpp"
#include "arena/connection_registry.hpp"
#include "arena/observability.hpp"
#include "arena/pong_simulation.hpp"
#include "arena/profile_directory.hpp"

namespace arena {

enum class SessionStatus { kWaiting, kCountdown, kPlaying, kPaused, kFinished, kCancelled };
enum class SessionKind { kMatchmaking, kPrivate, kAi, kTournament };

const char* ToString(SessionStatus status);
const char* ToString(SessionKind kind);
inline bool IsTerminal(SessionStatus status) {
  return status == SessionStatus::kFinished || status == SessionStatus::kCancelled;
}

struct PlayerSlot {
  int user_id{0};
  bool is_ai{false};
  AiDifficulty difficulty{AiDifficulty::kMedium};

  static PlayerSlot Human(int user_id) { return PlayerSlot{user_id, false, AiDifficulty::kMedium}; }
  static PlayerSlot Ai(AiDifficulty difficulty) { return PlayerSlot{kAiUserId, true, difficulty}; }
  static PlayerSlot Open() { return PlayerSlot{}; }
  bool IsOpen() const { return !is_ai && user_id == 0; }
  bool IsHuman() const { return !is_ai && user_id != 0; }
};

struct GameSessionConfig {
  int tick_rate{PongSimulation::kDefaultTickRate};
  int win_score{PongSimulation::kDefaultWinScore};
  int countdown_seconds{3};
  std::chrono::milliseconds reconnect_grace{std::chrono::seconds(30)};
  std::uint32_t seed{0};
};

// tick_rate/win_score 는 양수, countdown_seconds 와 reconnect_grace 는 음수가 아니어야 한다.
// 위반 시 std::invalid_argument 를 던진다.
void ValidateGameSessionConfig(const GameSessionConfig& config);

struct SessionResult {
  int game_id{0};
  SessionKind kind{SessionKind::kMatchmaking};
  SessionStatus status{SessionStatus::kCancelled};
  int player1_id{0};
  int player2_id{0};
  bool player2_is_ai{false};
  int winner_user_id{0};
  int winner_player_number{0};  // 0 이면 승자 없음
  int player1_score{0};
  int player2_score{0};
  bool forfeit{false};
  std::string reason;
  std::optional<int> tournament_id;
  int tick_count{0};
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::chrono::system_clock::time_point ended_at;

  bool HasWinner() const { return winner_player_number != 0; }
  int LoserUserId() const { return winner_player_number == 1 ? player2_id : player1_id; }
};

class GameSession : public std::enable_shared_from_this<GameSession> {
 public:
  using EndedCallback = std::function<void(const SessionResult&)>;

  GameSession(boost::asio::io_context& ioc, int id, SessionKind kind, PlayerSlot player1, PlayerSlot player2,
              const GameSessionConfig& config, std::optional<int> tournament_id,
              std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<ProfileDirectory> profiles,
              std::shared_ptr<Observability> observability, EndedCallback on_ended);

  // 두 슬롯이 모두 차 있으면 카운트다운을 시작한다.
  void Start();
  bool JoinOpenSlot(int user_id, std::string& error_code, std::string& error_message);
  bool SubmitMove(int user_id, PaddleDirection direction, std::string& error_code, std::string& error_message);
  bool AddSpectator(int user_id, std::string& error_code, std::string& error_message);
  void RemoveSpectator(int user_id);

  // 아래 호출은 세션 strand 로 전달되어 비동기로 처리된다.
  void Leave(int user_id);
  void Disconnect(int user_id);
  void Reconnect(int user_id);
  void Cancel(const std::string& reason);

  int Id() const { return id_; }
  SessionKind Kind() const { return kind_; }
  std::optional<int> TournamentId() const { return tournament_id_; }
  SessionStatus Status() const;
  int PlayerNumberOf(int user_id) const;
  std::vector<int> HumanPlayers() const;
  bool HasOpenSlot() const;
  nlohmann::json Describe() const;

 private:
  struct SlotState {
    PlayerSlot slot;
    bool connected{true};
    std::optional<std::chrono::steady_clock::time_point> disconnected_at;
  };

  struct MoveIntent {
    int slot_index;
    PaddleDirection direction;
  };

  void EnterCountdown();
  void EnterPlaying();
  void ScheduleTick();
  void HandleTick();
  bool CheckReconnectGrace();
  void HandleDisconnect(int user_id);
  void HandleReconnect(int user_id);
  void HandleLeave(int user_id);
  void Forfeit(int loser_index, const std::string& reason);
  void Finish();
  void CancelWithoutWinner(const std::string& reason);
  void Report(int winner_index, bool forfeit, const std::string& reason);

  int IndexOfLocked(int user_id) const;
  std::vector<int> PlayerAudienceLocked() const;
  std::vector<int> FullAudienceLocked() const;
  nlohmann::json PlayerJson(int index) const;
  nlohmann::json UpdatePayloadLocked() const;
  nlohmann::json StartingPayloadLocked(int countdown_seconds) const;
  void Emit(const std::vector<int>& audience, const std::string& event, const nlohmann::json& payload) const;
  void Log(LogLevel level, const std::string& name, const std::string& message) const;

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;
  const int id_;
  const SessionKind kind_;
  const GameSessionConfig config_;
  const std::optional<int> tournament_id_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<ProfileDirectory> profiles_;
  std::shared_ptr<Observability> observability_;
  EndedCallback on_ended_;

  // strand 전용
  PongSimulation simulation_;
  std::array<std::unique_ptr<AiController>, 2> ai_;
  int countdown_ticks_remaining_{0};

  // mutex_ 보호
  std::array<SlotState, 2> slots_;
  std::unordered_set<int> spectators_;
  std::deque<MoveIntent> intents_;
  SessionStatus status_{SessionStatus::kWaiting};
  SessionStatus resume_status_{SessionStatus::kPlaying};
  nlohmann::json last_snapshot_;
  std::optional<std::chrono::system_clock::time_point> started_at_;
  mutable std::mutex mutex_;
};

}  // namespace arena
