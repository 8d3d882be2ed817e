/*
 * 설명: 난이도별 반응 지연과 오차를 가진 AI 패들 조작기를 제공한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/ai_controller_test.cpp
 */
#pragma once

#include <cstdint>
#include <deque>
#include <random>
#include <string>

#include "arena/pong_simulation.hpp"

namespace arena {

enum class AiDifficulty { kEasy, kMedium, kHard };

// 알 수 없는 문자열은 medium 으로 처리한다.
AiDifficulty ParseAiDifficulty(const std::string& text);
const char* ToString(AiDifficulty difficulty);

struct AiProfile {
  int reaction_ticks;            // 관측 지연
  int prediction_horizon_ticks;  // 0 이면 공의 현재 y 만 추적
  double max_position_error;
  double dead_zone;
};

AiProfile ProfileFor(AiDifficulty difficulty);

class AiController {
 public:
  AiController(Side side, AiDifficulty difficulty, std::uint32_t seed);

  // 매 틱 호출된다. 지연된 관측을 기준으로 패들 방향을 결정한다.
  PaddleDirection Decide(const PongSimulation& simulation);

  Side GetSide() const { return side_; }
  AiDifficulty GetDifficulty() const { return difficulty_; }
  double LastTarget() const { return last_target_; }

 private:
  bool IsApproaching(const Ball& ball) const;
  double PredictInterceptY(const Ball& ball) const;

  Side side_;
  AiDifficulty difficulty_;
  AiProfile profile_;
  std::deque<Ball> observations_;
  std::mt19937 rng_;
  double error_offset_{0.0};
  bool was_approaching_{false};
  double last_target_{Playfield::kHeight / 2};
};

}  // namespace arena
