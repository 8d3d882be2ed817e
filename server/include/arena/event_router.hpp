/*
 * 설명: 인바운드 WS 이벤트를 스키마 검증 후 담당 컴포넌트로 전달한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_router_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "arena/connection_registry.hpp"
#include "arena/game_manager.hpp"
#include "arena/match_queue.hpp"
#include "arena/observability.hpp"
#include "arena/tournament_service.hpp"

namespace arena {

enum class EventKind {
  kJoinMatchmaking,
  kCancelMatchmaking,
  kCreatePrivate,
  kJoinPrivate,
  kCreateAi,
  kSendInvitation,
  kMove,
  kLeave,
  kSpectate,
  kGetActiveGames,
  kTournamentCreate,
  kTournamentJoin,
  kTournamentLeave,
  kTournamentStart,
  kTournamentCancel,
  kTournamentGet,
  kTournamentListActive,
};

enum class ErrorScope { kGame, kTournament };

std::optional<EventKind> ParseEventKind(std::string_view name);
// 스키마에 맞지 않으면 false 와 함께 reason 을 채운다.
bool ValidatePayload(EventKind kind, const nlohmann::json& payload, std::string& reason);

class EventRouter : public std::enable_shared_from_this<EventRouter> {
 public:
  EventRouter(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<GameManager> game_manager,
              std::shared_ptr<MatchQueueService> match_queue, std::shared_ptr<TournamentService> tournaments,
              std::shared_ptr<Observability> observability);

  // {"t":"event","seq":n,"event":name,"p":{...}} 프레임을 처리한다.
  void HandleFrame(int user_id, const std::string& raw);
  void Dispatch(int user_id, const std::string& event, const nlohmann::json& payload);

 private:
  void Route(int user_id, EventKind kind, const nlohmann::json& payload);

  void OnJoinMatchmaking(int user_id, const nlohmann::json& payload);
  void OnCancelMatchmaking(int user_id, const nlohmann::json& payload);
  void OnCreatePrivate(int user_id, const nlohmann::json& payload);
  void OnJoinPrivate(int user_id, const nlohmann::json& payload);
  void OnCreateAi(int user_id, const nlohmann::json& payload);
  void OnSendInvitation(int user_id, const nlohmann::json& payload);
  void OnMove(int user_id, const nlohmann::json& payload);
  void OnLeave(int user_id, const nlohmann::json& payload);
  void OnSpectate(int user_id, const nlohmann::json& payload);
  void OnGetActiveGames(int user_id, const nlohmann::json& payload);
  void OnTournamentCreate(int user_id, const nlohmann::json& payload);
  void OnTournamentJoin(int user_id, const nlohmann::json& payload);
  void OnTournamentLeave(int user_id, const nlohmann::json& payload);
  void OnTournamentStart(int user_id, const nlohmann::json& payload);
  void OnTournamentCancel(int user_id, const nlohmann::json& payload);
  void OnTournamentGet(int user_id, const nlohmann::json& payload);
  void OnTournamentListActive(int user_id, const nlohmann::json& payload);

  void Reply(int user_id, const std::string& event, const nlohmann::json& payload) const;
  void ReplyConflict(int user_id, ErrorScope scope, const std::string& code, const std::string& message) const;
  void ReplyValidation(int user_id, ErrorScope scope, const std::string& event, const std::string& reason) const;
  void RejectFrame(int user_id, const std::string& code, const std::string& message) const;

  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<GameManager> game_manager_;
  std::shared_ptr<MatchQueueService> match_queue_;
  std::shared_ptr<TournamentService> tournaments_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace arena
