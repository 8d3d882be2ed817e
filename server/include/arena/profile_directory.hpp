/*
 * 설명: 사용자 표시 이름/아바타 조회를 제공한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/event_router_test.cpp
 */
#pragma once

#include <mutex>
#include <string>
#include <unordered_map>

#include <nlohmann/json.hpp>

namespace arena {

inline constexpr int kAiUserId = 0;

struct PlayerProfile {
  int user_id{0};
  std::string display_name;
  std::string avatar;

  nlohmann::json ToJson() const;
};

class ProfileDirectory {
 public:
  void Remember(int user_id, const std::string& display_name, const std::string& avatar = {});
  // 알 수 없는 사용자는 "Player <id>" 로 대체한다.
  PlayerProfile Lookup(int user_id) const;
  static PlayerProfile AiOpponent();

 private:
  std::unordered_map<int, PlayerProfile> profiles_;
  mutable std::mutex mutex_;
};

}  // namespace arena
