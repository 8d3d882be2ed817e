/*
 * 설명: 게임 세션 생성/조회/종료와 사용자-세션 매핑을 관리한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/game_session_test.cpp, server/tests/unit/match_queue_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <boost/asio/io_context.hpp>

#include <nlohmann/json.hpp>

#include "arena/connection_registry.hpp"
#include "arena/game_session.hpp"
#include "arena/match_launcher.hpp"
#include "arena/observability.hpp"
#include "arena/profile_directory.hpp"
#include "arena/result_sink.hpp"

namespace arena {

class GameManager : public MatchLauncher, public std::enable_shared_from_this<GameManager> {
 public:
  GameManager(boost::asio::io_context& ioc, std::shared_ptr<ConnectionRegistry> registry,
              std::shared_ptr<ProfileDirectory> profiles, std::shared_ptr<ResultSink> result_sink,
              std::shared_ptr<Observability> observability, const GameSessionConfig& config);

  // 호출자가 두 사용자 모두 세션에 없음을 보장해야 한다.
  int CreateMatchSession(int player1_id, int player2_id);
  bool CreatePrivateSession(int owner_id, int& game_id, std::string& error_code, std::string& error_message);
  bool CreateAiSession(int user_id, AiDifficulty difficulty, int& game_id, std::string& error_code,
                       std::string& error_message);
  bool JoinPrivateSession(int user_id, int game_id, std::string& error_code, std::string& error_message);

  int LaunchTournamentMatch(int tournament_id, int player1_id, int player2_id,
                            CompletionCallback on_complete) override;
  void CancelMatch(int game_id) override;

  bool SubmitMove(int user_id, int game_id, PaddleDirection direction, std::string& error_code,
                  std::string& error_message);
  bool Leave(int user_id, std::string& error_code, std::string& error_message);
  bool Spectate(int user_id, int game_id, std::string& error_code, std::string& error_message);

  void HandleConnect(int user_id);
  void HandleDisconnect(int user_id);
  void CancelAll(const std::string& reason);

  bool IsUserInSession(int user_id) const;
  std::optional<int> SessionOf(int user_id) const;
  std::shared_ptr<GameSession> Find(int game_id) const;
  // 카운트다운/진행/일시정지 상태의 세션 요약을 id 순으로 반환한다.
  nlohmann::json ListActive() const;
  bool IsSpectating(int user_id) const;
  std::size_t ActiveSessionCount() const;

 private:
  using SpectatorDetachList = std::vector<std::pair<std::shared_ptr<GameSession>, int>>;

  // 플레이어가 되는 사용자의 관전 매핑을 떼어낸다. RemoveSpectator 는 잠금 밖에서 FinishDetach 로 호출한다.
  void DetachSpectatorLocked(int user_id, SpectatorDetachList& detached);
  static void FinishDetach(const SpectatorDetachList& detached);
  std::shared_ptr<GameSession> LaunchLocked(SessionKind kind, PlayerSlot player1, PlayerSlot player2,
                                            std::optional<int> tournament_id, CompletionCallback on_complete,
                                            SpectatorDetachList& detached);
  void OnSessionEnded(const SessionResult& result, const CompletionCallback& on_complete);
  MatchResultRecord BuildRecord(const SessionResult& result) const;

  boost::asio::io_context& ioc_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<ProfileDirectory> profiles_;
  std::shared_ptr<ResultSink> result_sink_;
  std::shared_ptr<Observability> observability_;
  GameSessionConfig config_;
  std::string run_id_;
  std::uint32_t seed_base_;
  int next_game_id_{1};
  std::unordered_map<int, std::shared_ptr<GameSession>> sessions_;
  std::unordered_map<int, int> user_to_session_;
  std::unordered_map<int, int> spectator_to_session_;
  mutable std::mutex mutex_;
};

}  // namespace arena
