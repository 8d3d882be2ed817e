/*
 * 설명: 이벤트 이름 테이블, 페이로드 스키마 검증, 컴포넌트 호출과 응답 전송을 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_router_test.cpp
 */
#include "arena/event_router.hpp"

#include <array>
#include <climits>

#include "arena/api_response.hpp"

namespace arena {
namespace {
struct EventSpec {
  std::string_view name;
  EventKind kind;
  ErrorScope scope;
};

constexpr std::array<EventSpec, 17> kEventTable{{
    {"game:join-matchmaking", EventKind::kJoinMatchmaking, ErrorScope::kGame},
    {"game:cancel-matchmaking", EventKind::kCancelMatchmaking, ErrorScope::kGame},
    {"game:create-private", EventKind::kCreatePrivate, ErrorScope::kGame},
    {"game:join-private", EventKind::kJoinPrivate, ErrorScope::kGame},
    {"game:create-ai", EventKind::kCreateAi, ErrorScope::kGame},
    {"game:send-invitation", EventKind::kSendInvitation, ErrorScope::kGame},
    {"game:move", EventKind::kMove, ErrorScope::kGame},
    {"game:leave", EventKind::kLeave, ErrorScope::kGame},
    {"game:spectate", EventKind::kSpectate, ErrorScope::kGame},
    {"game:get-active", EventKind::kGetActiveGames, ErrorScope::kGame},
    {"tournament:create", EventKind::kTournamentCreate, ErrorScope::kTournament},
    {"tournament:join", EventKind::kTournamentJoin, ErrorScope::kTournament},
    {"tournament:leave", EventKind::kTournamentLeave, ErrorScope::kTournament},
    {"tournament:start", EventKind::kTournamentStart, ErrorScope::kTournament},
    {"tournament:cancel", EventKind::kTournamentCancel, ErrorScope::kTournament},
    {"tournament:get", EventKind::kTournamentGet, ErrorScope::kTournament},
    {"tournament:list-active", EventKind::kTournamentListActive, ErrorScope::kTournament},
}};

constexpr std::size_t kMaxTournamentNameLength = 64;
constexpr std::size_t kMaxDifficultyLength = 16;

ErrorScope ScopeOf(EventKind kind) {
  for (const auto& entry : kEventTable) {
    if (entry.kind == kind) {
      return entry.scope;
    }
  }
  return ErrorScope::kGame;
}

bool RequirePositiveId(const nlohmann::json& payload, const char* key, std::string& reason) {
  auto it = payload.find(key);
  if (it == payload.end() || !it->is_number_integer()) {
    reason = std::string(key) + " 는 정수여야 합니다";
    return false;
  }
  const auto value = it->get<long long>();
  if (value <= 0 || value > INT_MAX) {
    reason = std::string(key) + " 범위가 올바르지 않습니다";
    return false;
  }
  return true;
}

bool OptionalString(const nlohmann::json& payload, const char* key, std::size_t max_length, std::string& reason) {
  auto it = payload.find(key);
  if (it == payload.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string() || it->get_ref<const std::string&>().size() > max_length) {
    reason = std::string(key) + " 는 문자열이어야 합니다";
    return false;
  }
  return true;
}

int IdOf(const nlohmann::json& payload, const char* key) { return static_cast<int>(payload.at(key).get<long long>()); }

std::string StringOr(const nlohmann::json& payload, const char* key, const std::string& fallback) {
  auto it = payload.find(key);
  return it != payload.end() && it->is_string() ? it->get<std::string>() : fallback;
}

std::string Trim(const std::string& text) {
  const auto first = text.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) {
    return {};
  }
  const auto last = text.find_last_not_of(" \t\r\n");
  return text.substr(first, last - first + 1);
}
}  // namespace

std::optional<EventKind> ParseEventKind(std::string_view name) {
  for (const auto& entry : kEventTable) {
    if (entry.name == name) {
      return entry.kind;
    }
  }
  return std::nullopt;
}

bool ValidatePayload(EventKind kind, const nlohmann::json& payload, std::string& reason) {
  if (!payload.is_null() && !payload.is_object()) {
    reason = "페이로드는 객체여야 합니다";
    return false;
  }
  const nlohmann::json body = payload.is_null() ? nlohmann::json::object() : payload;
  switch (kind) {
    case EventKind::kJoinMatchmaking:
    case EventKind::kCancelMatchmaking:
    case EventKind::kCreatePrivate:
    case EventKind::kLeave:
    case EventKind::kGetActiveGames:
    case EventKind::kTournamentListActive:
      return true;
    case EventKind::kJoinPrivate:
    case EventKind::kSpectate:
      return RequirePositiveId(body, "gameId", reason);
    case EventKind::kCreateAi:
      return OptionalString(body, "difficulty", kMaxDifficultyLength, reason);
    case EventKind::kSendInvitation:
      return RequirePositiveId(body, "targetUserId", reason);
    case EventKind::kMove: {
      if (!RequirePositiveId(body, "gameId", reason)) {
        return false;
      }
      auto it = body.find("direction");
      if (it == body.end() || !it->is_number_integer() || !PaddleDirectionFromCode(it->get<long long>())) {
        reason = "direction 은 0, 1, 2 중 하나여야 합니다";
        return false;
      }
      return true;
    }
    case EventKind::kTournamentCreate: {
      auto name = body.find("name");
      if (name == body.end() || !name->is_string() || Trim(name->get<std::string>()).empty() ||
          name->get_ref<const std::string&>().size() > kMaxTournamentNameLength) {
        reason = "name 은 1~64자 문자열이어야 합니다";
        return false;
      }
      auto max_players = body.find("maxPlayers");
      if (max_players == body.end() || !max_players->is_number_integer()) {
        reason = "maxPlayers 는 정수여야 합니다";
        return false;
      }
      return OptionalString(body, "bracketType", kMaxTournamentNameLength, reason);
    }
    case EventKind::kTournamentJoin:
    case EventKind::kTournamentLeave:
    case EventKind::kTournamentStart:
    case EventKind::kTournamentCancel:
    case EventKind::kTournamentGet:
      return RequirePositiveId(body, "tournamentId", reason);
  }
  reason = "알 수 없는 이벤트";
  return false;
}

EventRouter::EventRouter(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<GameManager> game_manager,
                         std::shared_ptr<MatchQueueService> match_queue,
                         std::shared_ptr<TournamentService> tournaments,
                         std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)),
      game_manager_(std::move(game_manager)),
      match_queue_(std::move(match_queue)),
      tournaments_(std::move(tournaments)),
      observability_(std::move(observability)) {}

void EventRouter::HandleFrame(int user_id, const std::string& raw) {
  auto frame = nlohmann::json::parse(raw, nullptr, false);
  if (frame.is_discarded() || !frame.is_object()) {
    RejectFrame(user_id, "invalid_json", "JSON 형식이 아닙니다");
    return;
  }
  auto type = frame.find("t");
  if (type != frame.end() && (!type->is_string() || type->get_ref<const std::string&>() != "event")) {
    RejectFrame(user_id, "invalid_frame", "t 는 event 여야 합니다");
    return;
  }
  auto event = frame.find("event");
  if (event == frame.end() || !event->is_string()) {
    RejectFrame(user_id, "invalid_frame", "event 필드가 필요합니다");
    return;
  }
  auto payload = frame.find("p");
  Dispatch(user_id, event->get<std::string>(), payload == frame.end() ? nlohmann::json(nullptr) : *payload);
}

void EventRouter::Dispatch(int user_id, const std::string& event, const nlohmann::json& payload) {
  auto kind = ParseEventKind(event);
  if (!kind) {
    RejectFrame(user_id, "unknown_event", "알 수 없는 이벤트입니다: " + event);
    return;
  }
  std::string reason;
  if (!ValidatePayload(*kind, payload, reason)) {
    ReplyValidation(user_id, ScopeOf(*kind), event, reason);
    return;
  }
  Route(user_id, *kind, payload.is_null() ? nlohmann::json::object() : payload);
}

void EventRouter::Route(int user_id, EventKind kind, const nlohmann::json& payload) {
  switch (kind) {
    case EventKind::kJoinMatchmaking:
      return OnJoinMatchmaking(user_id, payload);
    case EventKind::kCancelMatchmaking:
      return OnCancelMatchmaking(user_id, payload);
    case EventKind::kCreatePrivate:
      return OnCreatePrivate(user_id, payload);
    case EventKind::kJoinPrivate:
      return OnJoinPrivate(user_id, payload);
    case EventKind::kCreateAi:
      return OnCreateAi(user_id, payload);
    case EventKind::kSendInvitation:
      return OnSendInvitation(user_id, payload);
    case EventKind::kMove:
      return OnMove(user_id, payload);
    case EventKind::kLeave:
      return OnLeave(user_id, payload);
    case EventKind::kSpectate:
      return OnSpectate(user_id, payload);
    case EventKind::kGetActiveGames:
      return OnGetActiveGames(user_id, payload);
    case EventKind::kTournamentCreate:
      return OnTournamentCreate(user_id, payload);
    case EventKind::kTournamentJoin:
      return OnTournamentJoin(user_id, payload);
    case EventKind::kTournamentLeave:
      return OnTournamentLeave(user_id, payload);
    case EventKind::kTournamentStart:
      return OnTournamentStart(user_id, payload);
    case EventKind::kTournamentCancel:
      return OnTournamentCancel(user_id, payload);
    case EventKind::kTournamentGet:
      return OnTournamentGet(user_id, payload);
    case EventKind::kTournamentListActive:
      return OnTournamentListActive(user_id, payload);
  }
}

void EventRouter::OnJoinMatchmaking(int user_id, const nlohmann::json&) {
  EnqueueOutcome outcome;
  std::string code;
  std::string message;
  if (!match_queue_->Enqueue(user_id, outcome, code, message)) {
    ReplyConflict(user_id, ErrorScope::kGame, code, message);
    return;
  }
  if (!outcome.game_id) {
    Reply(user_id, "game:queued", {{"queueLength", outcome.queue_length}});
  }
}

void EventRouter::OnCancelMatchmaking(int user_id, const nlohmann::json&) {
  const bool removed = match_queue_->Cancel(user_id);
  Reply(user_id, "game:matchmaking-cancelled", {{"removed", removed}});
}

void EventRouter::OnCreatePrivate(int user_id, const nlohmann::json&) {
  int game_id = 0;
  std::string code;
  std::string message;
  if (!match_queue_->CreatePrivate(user_id, game_id, code, message)) {
    ReplyConflict(user_id, ErrorScope::kGame, code, message);
    return;
  }
  Reply(user_id, "game:created", {{"gameId", game_id}});
}

void EventRouter::OnJoinPrivate(int user_id, const nlohmann::json& payload) {
  std::string code;
  std::string message;
  if (!match_queue_->JoinPrivate(user_id, IdOf(payload, "gameId"), code, message)) {
    ReplyConflict(user_id, ErrorScope::kGame, code, message);
  }
}

void EventRouter::OnCreateAi(int user_id, const nlohmann::json& payload) {
  int game_id = 0;
  AiDifficulty resolved = AiDifficulty::kMedium;
  std::string code;
  std::string message;
  if (!match_queue_->CreateAi(user_id, StringOr(payload, "difficulty", "medium"), game_id, resolved, code,
                              message)) {
    ReplyConflict(user_id, ErrorScope::kGame, code, message);
    return;
  }
  Reply(user_id, "game:ai-created", {{"gameId", game_id}, {"difficulty", ToString(resolved)}});
}

void EventRouter::OnSendInvitation(int user_id, const nlohmann::json& payload) {
  const int target = IdOf(payload, "targetUserId");
  int game_id = 0;
  bool delivered = false;
  std::string code;
  std::string message;
  if (!match_queue_->SendInvitation(user_id, target, game_id, delivered, code, message)) {
    ReplyConflict(user_id, ErrorScope::kGame, code, message);
    return;
  }
  Reply(user_id, "game:created", {{"gameId", game_id}});
  Reply(user_id, "game:invitation-sent", {{"gameId", game_id}, {"targetUserId", target}, {"delivered", delivered}});
}

void EventRouter::OnMove(int user_id, const nlohmann::json& payload) {
  const auto direction = PaddleDirectionFromCode(payload.at("direction").get<long long>());
  std::string code;
  std::string message;
  if (!game_manager_->SubmitMove(user_id, IdOf(payload, "gameId"), *direction, code, message)) {
    ReplyConflict(user_id, ErrorScope::kGame, code, message);
  }
}

void EventRouter::OnLeave(int user_id, const nlohmann::json&) {
  if (match_queue_->Cancel(user_id)) {
    Reply(user_id, "game:left", {{"queue", true}});
    return;
  }
  std::string code;
  std::string message;
  if (!game_manager_->Leave(user_id, code, message)) {
    ReplyConflict(user_id, ErrorScope::kGame, code, message);
    return;
  }
  Reply(user_id, "game:left", {{"queue", false}});
}

void EventRouter::OnSpectate(int user_id, const nlohmann::json& payload) {
  std::string code;
  std::string message;
  if (!game_manager_->Spectate(user_id, IdOf(payload, "gameId"), code, message)) {
    ReplyConflict(user_id, ErrorScope::kGame, code, message);
  }
}

void EventRouter::OnGetActiveGames(int user_id, const nlohmann::json&) {
  Reply(user_id, "game:active-games", {{"games", game_manager_->ListActive()}});
}

void EventRouter::OnTournamentCreate(int user_id, const nlohmann::json& payload) {
  int tournament_id = 0;
  std::string code;
  std::string message;
  const long long max_players = payload.at("maxPlayers").get<long long>();
  if (!tournaments_->Create(user_id, Trim(payload.at("name").get<std::string>()),
                            max_players > INT_MAX || max_players < INT_MIN ? 0 : static_cast<int>(max_players),
                            StringOr(payload, "bracketType", kSingleElimination), tournament_id, code, message)) {
    ReplyConflict(user_id, ErrorScope::kTournament, code, message);
  }
}

void EventRouter::OnTournamentJoin(int user_id, const nlohmann::json& payload) {
  const int tournament_id = IdOf(payload, "tournamentId");
  std::string code;
  std::string message;
  if (!tournaments_->Join(tournament_id, user_id, code, message)) {
    ReplyConflict(user_id, ErrorScope::kTournament, code, message);
    return;
  }
  Reply(user_id, "tournament:joined", {{"tournamentId", tournament_id}});
}

void EventRouter::OnTournamentLeave(int user_id, const nlohmann::json& payload) {
  const int tournament_id = IdOf(payload, "tournamentId");
  std::string code;
  std::string message;
  if (!tournaments_->Leave(tournament_id, user_id, code, message)) {
    ReplyConflict(user_id, ErrorScope::kTournament, code, message);
    return;
  }
  Reply(user_id, "tournament:left", {{"tournamentId", tournament_id}});
}

void EventRouter::OnTournamentStart(int user_id, const nlohmann::json& payload) {
  std::string code;
  std::string message;
  if (!tournaments_->Start(IdOf(payload, "tournamentId"), user_id, code, message)) {
    ReplyConflict(user_id, ErrorScope::kTournament, code, message);
  }
}

void EventRouter::OnTournamentCancel(int user_id, const nlohmann::json& payload) {
  std::string code;
  std::string message;
  if (!tournaments_->Cancel(IdOf(payload, "tournamentId"), user_id, code, message)) {
    ReplyConflict(user_id, ErrorScope::kTournament, code, message);
  }
}

void EventRouter::OnTournamentGet(int user_id, const nlohmann::json& payload) {
  auto tournament = tournaments_->Get(IdOf(payload, "tournamentId"));
  if (!tournament) {
    ReplyConflict(user_id, ErrorScope::kTournament, "tournament_not_found", "토너먼트를 찾을 수 없습니다");
    return;
  }
  Reply(user_id, "tournament:state", {{"tournament", tournaments_->Describe(*tournament)}});
}

void EventRouter::OnTournamentListActive(int user_id, const nlohmann::json&) {
  nlohmann::json list = nlohmann::json::array();
  for (const auto& summary : tournaments_->ListActive()) {
    list.push_back({{"id", summary.id},
                    {"name", summary.name},
                    {"currentPlayers", summary.current_players},
                    {"maxPlayers", summary.max_players},
                    {"status", ToString(summary.status)}});
  }
  Reply(user_id, "tournament:active-list", {{"tournaments", list}});
}

void EventRouter::Reply(int user_id, const std::string& event, const nlohmann::json& payload) const {
  registry_->SendEventToUser(user_id, event, payload);
}

void EventRouter::ReplyConflict(int user_id, ErrorScope scope, const std::string& code,
                                const std::string& message) const {
  observability_->IncrementConflictReject();
  observability_->Log(LogContext{.user_id = user_id, .name = "event.conflict", .level = LogLevel::kInfo,
                                 .message = code});
  Reply(user_id, scope == ErrorScope::kGame ? "game:error" : "tournament:error", MakeErrorPayload(code, message));
}

void EventRouter::ReplyValidation(int user_id, ErrorScope scope, const std::string& event,
                                  const std::string& reason) const {
  observability_->IncrementValidationReject();
  observability_->Log(LogContext{.user_id = user_id, .name = "event.invalid", .level = LogLevel::kWarn,
                                 .message = event + ": " + reason});
  Reply(user_id, scope == ErrorScope::kGame ? "game:error" : "tournament:error",
        MakeErrorPayload("validation_error", reason));
}

void EventRouter::RejectFrame(int user_id, const std::string& code, const std::string& message) const {
  observability_->IncrementValidationReject();
  observability_->Log(LogContext{.user_id = user_id, .name = "event.rejected", .level = LogLevel::kWarn,
                                 .message = code});
  registry_->SendErrorToUser(user_id, code, message);
}

}  // namespace arena
