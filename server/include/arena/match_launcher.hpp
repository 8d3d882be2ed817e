/*
 * 설명: 토너먼트가 대진 경기를 띄우고 취소할 때 쓰는 인터페이스.
 * 버전: v2.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/tournament_service_test.cpp
 */
#pragma once

#include <functional>

#include "arena/game_session.hpp"

namespace arena {

class MatchLauncher {
 public:
  using CompletionCallback = std::function<void(const SessionResult&)>;

  virtual ~MatchLauncher() = default;
  // 경기 종료 시 on_complete 가 정확히 한 번 호출된다. 반환값은 game id.
  virtual int LaunchTournamentMatch(int tournament_id, int player1_id, int player2_id,
                                    CompletionCallback on_complete) = 0;
  virtual void CancelMatch(int game_id) = 0;
};

}  // namespace arena
