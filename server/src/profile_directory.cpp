/*
 * 설명: 인증 시 기억한 사용자 프로필을 조회한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 */
#include "arena/profile_directory.hpp"

namespace arena {

nlohmann::json PlayerProfile::ToJson() const {
  nlohmann::json j{{"id", user_id}, {"name", display_name}};
  j["avatar"] = avatar.empty() ? nlohmann::json(nullptr) : nlohmann::json(avatar);
  return j;
}

void ProfileDirectory::Remember(int user_id, const std::string& display_name, const std::string& avatar) {
  std::lock_guard<std::mutex> lock(mutex_);
  profiles_[user_id] = PlayerProfile{user_id, display_name, avatar};
}

PlayerProfile ProfileDirectory::Lookup(int user_id) const {
  if (user_id == kAiUserId) {
    return AiOpponent();
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = profiles_.find(user_id);
  if (it != profiles_.end()) {
    return it->second;
  }
  return PlayerProfile{user_id, "Player " + std::to_string(user_id), {}};
}

PlayerProfile ProfileDirectory::AiOpponent() { return PlayerProfile{kAiUserId, "AI Opponent", {}}; }

}  // namespace arena
