/*
 * 설명: 싱글 엘리미네이션 토너먼트의 등록, 대진 생성, 라운드 진행을 관리한다.
 * 버전: v2.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/tournament_service_test.cpp
 */
#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "arena/connection_registry.hpp"
#include "arena/match_launcher.hpp"
#include "arena/observability.hpp"
#include "arena/profile_directory.hpp"
#include "arena/result_sink.hpp"

namespace arena {

enum class TournamentStatus { kRegistering, kActive, kCompleted, kCancelled };

const char* ToString(TournamentStatus status);

inline constexpr const char* kSingleElimination = "single_elimination";

struct TournamentMatch {
  int match_index{0};
  int player1_id{0};
  int player2_id{0};  // 0 이면 부전승
  int game_id{0};
  int winner_id{0};

  bool IsBye() const { return player2_id == 0; }
  bool HasWinner() const { return winner_id != 0; }
};

struct TournamentRound {
  int number{0};
  std::vector<TournamentMatch> matches;

  bool Complete() const;
};

struct Tournament {
  int id{0};
  std::string name;
  int creator_id{0};
  int max_players{0};
  std::string bracket_type{kSingleElimination};
  TournamentStatus status{TournamentStatus::kRegistering};
  std::vector<int> participants;  // 등록 순서 = 시드 순서
  std::vector<TournamentRound> rounds;
  int total_rounds{0};
  int winner_id{0};
  std::unordered_map<int, int> eliminated_in_round;
  std::chrono::system_clock::time_point created_at;
  std::optional<std::chrono::system_clock::time_point> started_at;
  std::optional<std::chrono::system_clock::time_point> finished_at;

  int CurrentRound() const { return static_cast<int>(rounds.size()); }
  int SeedOf(int user_id) const;
  bool IsRegistered(int user_id) const;
};

struct TournamentSummary {
  int id;
  std::string name;
  int current_players;
  int max_players;
  TournamentStatus status;
};

int NextPowerOfTwo(int value);
// 시드 순 목록을 i 대 (size-1-i) 로 짝짓는다. 상대가 없으면 두 번째 값은 0(부전승).
std::vector<std::pair<int, int>> BuildSeedPairings(const std::vector<int>& seeded);
nlohmann::json TournamentToJson(const Tournament& tournament, const ProfileDirectory& profiles);
nlohmann::json BuildStandings(const Tournament& tournament, const ProfileDirectory& profiles);

class TournamentService : public std::enable_shared_from_this<TournamentService> {
 public:
  TournamentService(std::shared_ptr<MatchLauncher> launcher, std::shared_ptr<ConnectionRegistry> registry,
                    std::shared_ptr<ProfileDirectory> profiles, std::shared_ptr<ResultSink> result_sink,
                    std::shared_ptr<Observability> observability);

  bool Create(int creator_id, const std::string& name, int max_players, const std::string& bracket_type,
              int& tournament_id, std::string& error_code, std::string& error_message);
  bool Join(int tournament_id, int user_id, std::string& error_code, std::string& error_message);
  bool Leave(int tournament_id, int user_id, std::string& error_code, std::string& error_message);
  bool Start(int tournament_id, int requester_id, std::string& error_code, std::string& error_message);
  bool Cancel(int tournament_id, int requester_id, std::string& error_code, std::string& error_message);

  std::optional<Tournament> Get(int tournament_id) const;
  nlohmann::json Describe(const Tournament& tournament) const { return TournamentToJson(tournament, *profiles_); }
  std::vector<TournamentSummary> ListActive() const;
  std::size_t ActiveCount() const;

  // 경기 세션 종료 시 호출된다. 라운드 완료 판정과 다음 라운드 생성은 mutex_ 아래에서 한 번만 일어난다.
  void OnMatchCompleted(int tournament_id, const SessionResult& result);
  void HandleDisconnect(int user_id);

 private:
  Tournament* FindLocked(int tournament_id);
  bool RemoveParticipantLocked(Tournament& tournament, int user_id);
  void LaunchRoundLocked(Tournament& tournament, const std::vector<std::pair<int, int>>& pairings);
  void AdvanceLocked(Tournament& tournament);
  void CompleteLocked(Tournament& tournament);
  void AbortLocked(Tournament& tournament, const std::string& reason, LogLevel level);
  void Log(LogLevel level, const std::string& name, int tournament_id, const std::string& message) const;

  std::shared_ptr<MatchLauncher> launcher_;
  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<ProfileDirectory> profiles_;
  std::shared_ptr<ResultSink> result_sink_;
  std::shared_ptr<Observability> observability_;
  std::map<int, Tournament> tournaments_;
  int next_tournament_id_{1};
  std::string run_id_;
  mutable std::mutex mutex_;
};

}  // namespace arena
