/*
 * 설명: 토너먼트 등록/시작/취소, 대진 시드 배치와 라운드 진행을 구현한다.
 * 버전: v2.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/tournament_service_test.cpp
 */
#include "arena/tournament_service.hpp"

#include <algorithm>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace arena {
namespace {
std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}

nlohmann::json OptionalIso(const std::optional<std::chrono::system_clock::time_point>& tp) {
  return tp ? nlohmann::json(ToIsoString(*tp)) : nlohmann::json(nullptr);
}

void SetError(std::string& error_code, std::string& error_message, const char* code, const char* message) {
  error_code = code;
  error_message = message;
}

nlohmann::json ProfileOrNull(const ProfileDirectory& profiles, int user_id) {
  return user_id == 0 ? nlohmann::json(nullptr) : profiles.Lookup(user_id).ToJson();
}
}  // namespace

const char* ToString(TournamentStatus status) {
  switch (status) {
    case TournamentStatus::kRegistering:
      return "registering";
    case TournamentStatus::kActive:
      return "active";
    case TournamentStatus::kCompleted:
      return "completed";
    case TournamentStatus::kCancelled:
      return "cancelled";
  }
  return "registering";
}

bool TournamentRound::Complete() const {
  return std::all_of(matches.begin(), matches.end(), [](const TournamentMatch& m) { return m.HasWinner(); });
}

int Tournament::SeedOf(int user_id) const {
  auto it = std::find(participants.begin(), participants.end(), user_id);
  return it == participants.end() ? static_cast<int>(participants.size()) : static_cast<int>(it - participants.begin());
}

bool Tournament::IsRegistered(int user_id) const {
  return std::find(participants.begin(), participants.end(), user_id) != participants.end();
}

int NextPowerOfTwo(int value) {
  int size = 1;
  while (size < value) {
    size <<= 1;
  }
  return size;
}

std::vector<std::pair<int, int>> BuildSeedPairings(const std::vector<int>& seeded) {
  const int count = static_cast<int>(seeded.size());
  const int size = NextPowerOfTwo(count);
  std::vector<std::pair<int, int>> pairings;
  for (int i = 0; i < size / 2; ++i) {
    const int opponent_index = size - 1 - i;
    pairings.emplace_back(seeded[i], opponent_index < count ? seeded[opponent_index] : 0);
  }
  return pairings;
}

nlohmann::json BuildStandings(const Tournament& tournament, const ProfileDirectory& profiles) {
  auto eliminated = [&](int user_id) {
    auto it = tournament.eliminated_in_round.find(user_id);
    return it == tournament.eliminated_in_round.end() ? tournament.total_rounds + 1 : it->second;
  };
  std::vector<int> ordered = tournament.participants;
  std::stable_sort(ordered.begin(), ordered.end(), [&](int lhs, int rhs) {
    if (eliminated(lhs) != eliminated(rhs)) {
      return eliminated(lhs) > eliminated(rhs);
    }
    return tournament.SeedOf(lhs) < tournament.SeedOf(rhs);
  });

  nlohmann::json standings = nlohmann::json::array();
  int rank = 1;
  for (std::size_t i = 0; i < ordered.size(); ++i) {
    if (i > 0 && eliminated(ordered[i]) != eliminated(ordered[i - 1])) {
      rank = static_cast<int>(i) + 1;
    }
    auto it = tournament.eliminated_in_round.find(ordered[i]);
    standings.push_back({{"rank", rank},
                         {"player", profiles.Lookup(ordered[i]).ToJson()},
                         {"eliminatedInRound", it == tournament.eliminated_in_round.end()
                                                   ? nlohmann::json(nullptr)
                                                   : nlohmann::json(it->second)}});
  }
  return standings;
}

nlohmann::json TournamentToJson(const Tournament& tournament, const ProfileDirectory& profiles) {
  nlohmann::json participants = nlohmann::json::array();
  for (int user_id : tournament.participants) {
    participants.push_back(profiles.Lookup(user_id).ToJson());
  }
  nlohmann::json rounds = nlohmann::json::array();
  for (const auto& round : tournament.rounds) {
    nlohmann::json matches = nlohmann::json::array();
    for (const auto& match : round.matches) {
      matches.push_back({{"matchIndex", match.match_index},
                         {"gameId", match.game_id == 0 ? nlohmann::json(nullptr) : nlohmann::json(match.game_id)},
                         {"player1", ProfileOrNull(profiles, match.player1_id)},
                         {"player2", ProfileOrNull(profiles, match.player2_id)},
                         {"winnerId", match.HasWinner() ? nlohmann::json(match.winner_id) : nlohmann::json(nullptr)},
                         {"bye", match.IsBye()}});
    }
    rounds.push_back({{"round", round.number}, {"matches", matches}});
  }
  return {{"id", tournament.id},
          {"name", tournament.name},
          {"creatorId", tournament.creator_id},
          {"maxPlayers", tournament.max_players},
          {"currentPlayers", tournament.participants.size()},
          {"bracketType", tournament.bracket_type},
          {"status", ToString(tournament.status)},
          {"participants", participants},
          {"currentRound", tournament.CurrentRound()},
          {"totalRounds", tournament.total_rounds},
          {"winnerId", tournament.winner_id == 0 ? nlohmann::json(nullptr) : nlohmann::json(tournament.winner_id)},
          {"rounds", rounds},
          {"createdAt", ToIsoString(tournament.created_at)},
          {"startedAt", OptionalIso(tournament.started_at)},
          {"finishedAt", OptionalIso(tournament.finished_at)}};
}

TournamentService::TournamentService(std::shared_ptr<MatchLauncher> launcher,
                                     std::shared_ptr<ConnectionRegistry> registry,
                                     std::shared_ptr<ProfileDirectory> profiles,
                                     std::shared_ptr<ResultSink> result_sink,
                                     std::shared_ptr<Observability> observability)
    : launcher_(std::move(launcher)),
      registry_(std::move(registry)),
      profiles_(std::move(profiles)),
      result_sink_(std::move(result_sink)),
      observability_(std::move(observability)),
      run_id_(std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                                 std::chrono::system_clock::now().time_since_epoch())
                                 .count())) {}

Tournament* TournamentService::FindLocked(int tournament_id) {
  auto it = tournaments_.find(tournament_id);
  return it == tournaments_.end() ? nullptr : &it->second;
}

void TournamentService::Log(LogLevel level, const std::string& name, int tournament_id,
                            const std::string& message) const {
  observability_->Log(LogContext{.tournament_id = tournament_id, .name = name, .level = level, .message = message});
}

bool TournamentService::Create(int creator_id, const std::string& name, int max_players,
                               const std::string& bracket_type, int& tournament_id, std::string& error_code,
                               std::string& error_message) {
  if (max_players != 4 && max_players != 8 && max_players != 16) {
    SetError(error_code, error_message, "invalid_max_players", "최대 인원은 4, 8, 16 중 하나여야 합니다");
    return false;
  }
  if (!bracket_type.empty() && bracket_type != kSingleElimination) {
    SetError(error_code, error_message, "invalid_bracket_type", "지원하지 않는 대진 방식입니다");
    return false;
  }

  nlohmann::json created;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    Tournament tournament;
    tournament.id = next_tournament_id_++;
    tournament.name = name;
    tournament.creator_id = creator_id;
    tournament.max_players = max_players;
    tournament.participants.push_back(creator_id);
    tournament.created_at = std::chrono::system_clock::now();
    tournament_id = tournament.id;
    created = Describe(tournament);
    tournaments_.emplace(tournament.id, std::move(tournament));
  }
  registry_->BroadcastAll("tournament:created", {{"tournament", created}});
  Log(LogLevel::kInfo, "tournament.created", tournament_id, name);
  return true;
}

bool TournamentService::Join(int tournament_id, int user_id, std::string& error_code, std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  Tournament* tournament = FindLocked(tournament_id);
  if (!tournament) {
    SetError(error_code, error_message, "tournament_not_found", "토너먼트를 찾을 수 없습니다");
    return false;
  }
  if (tournament->status != TournamentStatus::kRegistering) {
    SetError(error_code, error_message, "invalid_state", "등록 중인 토너먼트가 아닙니다");
    return false;
  }
  if (tournament->IsRegistered(user_id)) {
    SetError(error_code, error_message, "already_registered", "이미 등록되어 있습니다");
    return false;
  }
  if (static_cast<int>(tournament->participants.size()) >= tournament->max_players) {
    SetError(error_code, error_message, "tournament_full", "토너먼트 정원이 가득 찼습니다");
    return false;
  }
  tournament->participants.push_back(user_id);
  registry_->Broadcast(tournament->participants, "tournament:player-joined",
                       {{"tournamentId", tournament_id},
                        {"player", profiles_->Lookup(user_id).ToJson()},
                        {"currentPlayers", tournament->participants.size()},
                        {"maxPlayers", tournament->max_players}});
  return true;
}

bool TournamentService::RemoveParticipantLocked(Tournament& tournament, int user_id) {
  auto it = std::find(tournament.participants.begin(), tournament.participants.end(), user_id);
  if (it == tournament.participants.end()) {
    return false;
  }
  tournament.participants.erase(it);
  if (tournament.participants.empty()) {
    tournament.status = TournamentStatus::kCancelled;
    tournament.finished_at = std::chrono::system_clock::now();
    Log(LogLevel::kInfo, "tournament.emptied", tournament.id, "참가자가 없어 취소합니다");
    return true;
  }
  if (tournament.creator_id == user_id) {
    tournament.creator_id = tournament.participants.front();
  }
  registry_->Broadcast(tournament.participants, "tournament:player-left",
                       {{"tournamentId", tournament.id},
                        {"userId", user_id},
                        {"currentPlayers", tournament.participants.size()},
                        {"creatorId", tournament.creator_id}});
  return true;
}

bool TournamentService::Leave(int tournament_id, int user_id, std::string& error_code, std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  Tournament* tournament = FindLocked(tournament_id);
  if (!tournament) {
    SetError(error_code, error_message, "tournament_not_found", "토너먼트를 찾을 수 없습니다");
    return false;
  }
  if (tournament->status != TournamentStatus::kRegistering) {
    SetError(error_code, error_message, "invalid_state", "등록 중에만 나갈 수 있습니다");
    return false;
  }
  if (!RemoveParticipantLocked(*tournament, user_id)) {
    SetError(error_code, error_message, "not_registered", "등록되어 있지 않습니다");
    return false;
  }
  return true;
}

bool TournamentService::Start(int tournament_id, int requester_id, std::string& error_code,
                              std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  Tournament* tournament = FindLocked(tournament_id);
  if (!tournament) {
    SetError(error_code, error_message, "tournament_not_found", "토너먼트를 찾을 수 없습니다");
    return false;
  }
  if (tournament->status != TournamentStatus::kRegistering) {
    SetError(error_code, error_message, "invalid_state", "등록 중인 토너먼트가 아닙니다");
    return false;
  }
  if (tournament->creator_id != requester_id) {
    SetError(error_code, error_message, "not_creator", "생성자만 시작할 수 있습니다");
    return false;
  }
  if (tournament->participants.size() < 2) {
    SetError(error_code, error_message, "not_enough_players", "최소 2명이 필요합니다");
    return false;
  }

  const int size = NextPowerOfTwo(static_cast<int>(tournament->participants.size()));
  int rounds = 0;
  for (int n = size; n > 1; n >>= 1) {
    ++rounds;
  }
  tournament->total_rounds = rounds;
  tournament->status = TournamentStatus::kActive;
  tournament->started_at = std::chrono::system_clock::now();
  registry_->Broadcast(tournament->participants, "tournament:started",
                       {{"tournamentId", tournament_id}, {"totalRounds", rounds}});
  Log(LogLevel::kInfo, "tournament.started", tournament_id, tournament->name);
  LaunchRoundLocked(*tournament, BuildSeedPairings(tournament->participants));
  return true;
}

bool TournamentService::Cancel(int tournament_id, int requester_id, std::string& error_code,
                               std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  Tournament* tournament = FindLocked(tournament_id);
  if (!tournament) {
    SetError(error_code, error_message, "tournament_not_found", "토너먼트를 찾을 수 없습니다");
    return false;
  }
  if (tournament->creator_id != requester_id) {
    SetError(error_code, error_message, "not_creator", "생성자만 취소할 수 있습니다");
    return false;
  }
  if (tournament->status == TournamentStatus::kCompleted || tournament->status == TournamentStatus::kCancelled) {
    SetError(error_code, error_message, "invalid_state", "이미 종료된 토너먼트입니다");
    return false;
  }
  AbortLocked(*tournament, "cancelled_by_creator", LogLevel::kInfo);
  return true;
}

std::optional<Tournament> TournamentService::Get(int tournament_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = tournaments_.find(tournament_id);
  if (it == tournaments_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<TournamentSummary> TournamentService::ListActive() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<TournamentSummary> summaries;
  for (const auto& [id, tournament] : tournaments_) {
    if (tournament.status == TournamentStatus::kRegistering || tournament.status == TournamentStatus::kActive) {
      summaries.push_back(TournamentSummary{id, tournament.name, static_cast<int>(tournament.participants.size()),
                                            tournament.max_players, tournament.status});
    }
  }
  return summaries;
}

std::size_t TournamentService::ActiveCount() const { return ListActive().size(); }

void TournamentService::LaunchRoundLocked(Tournament& tournament, const std::vector<std::pair<int, int>>& pairings) {
  TournamentRound round;
  round.number = tournament.CurrentRound() + 1;
  std::weak_ptr<TournamentService> weak_self = weak_from_this();
  const int tournament_id = tournament.id;
  for (const auto& [player1, player2] : pairings) {
    TournamentMatch match;
    match.match_index = static_cast<int>(round.matches.size());
    match.player1_id = player1;
    match.player2_id = player2;
    if (match.IsBye()) {
      match.winner_id = player1;
    } else {
      match.game_id = launcher_->LaunchTournamentMatch(
          tournament_id, player1, player2, [weak_self, tournament_id](const SessionResult& result) {
            if (auto self = weak_self.lock()) {
              self->OnMatchCompleted(tournament_id, result);
            }
          });
    }
    round.matches.push_back(match);
  }
  tournament.rounds.push_back(std::move(round));
  const auto& launched = tournament.rounds.back();

  registry_->Broadcast(tournament.participants, "tournament:round-started",
                       {{"tournamentId", tournament_id},
                        {"round", launched.number},
                        {"bracket", TournamentToJson(tournament, *profiles_)["rounds"].back()}});
  for (const auto& match : launched.matches) {
    if (match.IsBye()) {
      registry_->SendEventToUser(match.player1_id, "tournament:bye",
                                 {{"tournamentId", tournament_id}, {"round", launched.number}});
      continue;
    }
    registry_->SendEventToUser(match.player1_id, "tournament:match-ready",
                               {{"tournamentId", tournament_id},
                                {"round", launched.number},
                                {"gameId", match.game_id},
                                {"opponent", profiles_->Lookup(match.player2_id).ToJson()}});
    registry_->SendEventToUser(match.player2_id, "tournament:match-ready",
                               {{"tournamentId", tournament_id},
                                {"round", launched.number},
                                {"gameId", match.game_id},
                                {"opponent", profiles_->Lookup(match.player1_id).ToJson()}});
  }
  Log(LogLevel::kInfo, "tournament.round_started", tournament_id, "round " + std::to_string(launched.number));
}

void TournamentService::OnMatchCompleted(int tournament_id, const SessionResult& result) {
  std::lock_guard<std::mutex> lock(mutex_);
  Tournament* tournament = FindLocked(tournament_id);
  if (!tournament || tournament->status != TournamentStatus::kActive || tournament->rounds.empty()) {
    return;
  }
  auto& round = tournament->rounds.back();
  auto it = std::find_if(round.matches.begin(), round.matches.end(),
                         [&](const TournamentMatch& m) { return !m.IsBye() && m.game_id == result.game_id; });
  if (it == round.matches.end() || it->HasWinner()) {
    return;
  }
  if (!result.HasWinner() || (result.winner_user_id != it->player1_id && result.winner_user_id != it->player2_id)) {
    AbortLocked(*tournament, "match_without_winner", LogLevel::kError);
    return;
  }

  it->winner_id = result.winner_user_id;
  const int loser = it->winner_id == it->player1_id ? it->player2_id : it->player1_id;
  tournament->eliminated_in_round[loser] = round.number;
  registry_->Broadcast(tournament->participants, "tournament:match-completed",
                       {{"tournamentId", tournament_id},
                        {"round", round.number},
                        {"gameId", result.game_id},
                        {"winnerId", it->winner_id},
                        {"loserId", loser},
                        {"finalScore", {{"player1", result.player1_score}, {"player2", result.player2_score}}},
                        {"forfeit", result.forfeit}});
  if (round.Complete()) {
    AdvanceLocked(*tournament);
  }
}

void TournamentService::AdvanceLocked(Tournament& tournament) {
  std::vector<int> winners;
  for (const auto& match : tournament.rounds.back().matches) {
    winners.push_back(match.winner_id);
  }
  std::sort(winners.begin(), winners.end(),
            [&](int lhs, int rhs) { return tournament.SeedOf(lhs) < tournament.SeedOf(rhs); });
  if (winners.size() == 1) {
    tournament.winner_id = winners.front();
    CompleteLocked(tournament);
    return;
  }
  LaunchRoundLocked(tournament, BuildSeedPairings(winners));
}

void TournamentService::CompleteLocked(Tournament& tournament) {
  tournament.status = TournamentStatus::kCompleted;
  tournament.finished_at = std::chrono::system_clock::now();
  auto standings = BuildStandings(tournament, *profiles_);
  registry_->Broadcast(tournament.participants, "tournament:completed",
                       {{"tournamentId", tournament.id},
                        {"winnerId", tournament.winner_id},
                        {"winnerName", profiles_->Lookup(tournament.winner_id).display_name},
                        {"finalStandings", standings}});
  Log(LogLevel::kInfo, "tournament.completed", tournament.id, "winner " + std::to_string(tournament.winner_id));

  if (result_sink_) {
    TournamentResultRecord record;
    record.tournament_key = run_id_ + "-t" + std::to_string(tournament.id);
    record.tournament_id = tournament.id;
    record.name = tournament.name;
    record.creator_id = tournament.creator_id;
    record.winner_user_id = tournament.winner_id;
    record.participant_count = static_cast<int>(tournament.participants.size());
    record.total_rounds = tournament.total_rounds;
    record.finished_at = *tournament.finished_at;
    record.bracket = TournamentToJson(tournament, *profiles_);
    record.bracket["finalStandings"] = standings;
    result_sink_->RecordTournament(record);
  }
}

void TournamentService::AbortLocked(Tournament& tournament, const std::string& reason, LogLevel level) {
  tournament.status = TournamentStatus::kCancelled;
  tournament.finished_at = std::chrono::system_clock::now();
  if (!tournament.rounds.empty()) {
    for (const auto& match : tournament.rounds.back().matches) {
      if (!match.IsBye() && !match.HasWinner() && match.game_id != 0) {
        launcher_->CancelMatch(match.game_id);
      }
    }
  }
  registry_->Broadcast(tournament.participants, "tournament:cancelled",
                       {{"tournamentId", tournament.id}, {"reason", reason}});
  Log(level, "tournament.cancelled", tournament.id, reason);
}

void TournamentService::HandleDisconnect(int user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  for (auto& [id, tournament] : tournaments_) {
    if (tournament.status == TournamentStatus::kRegistering) {
      RemoveParticipantLocked(tournament, user_id);
    }
  }
}

}  // namespace arena
