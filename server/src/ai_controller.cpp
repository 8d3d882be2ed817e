/*
 * 설명: AI 패들의 목표 위치 예측과 방향 결정을 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/ai_controller_test.cpp
 */
#include "arena/ai_controller.hpp"

#include <algorithm>
#include <cmath>

namespace arena {

AiDifficulty ParseAiDifficulty(const std::string& text) {
  if (text == "easy") return AiDifficulty::kEasy;
  if (text == "hard") return AiDifficulty::kHard;
  return AiDifficulty::kMedium;
}

const char* ToString(AiDifficulty difficulty) {
  switch (difficulty) {
    case AiDifficulty::kEasy:
      return "easy";
    case AiDifficulty::kMedium:
      return "medium";
    case AiDifficulty::kHard:
      return "hard";
  }
  return "medium";
}

AiProfile ProfileFor(AiDifficulty difficulty) {
  switch (difficulty) {
    case AiDifficulty::kEasy:
      return AiProfile{12, 0, 12.0, 4.0};
    case AiDifficulty::kMedium:
      return AiProfile{6, 45, 6.0, 2.5};
    case AiDifficulty::kHard:
      return AiProfile{2, 240, 2.0, 1.5};
  }
  return AiProfile{6, 45, 6.0, 2.5};
}

AiController::AiController(Side side, AiDifficulty difficulty, std::uint32_t seed)
    : side_(side), difficulty_(difficulty), profile_(ProfileFor(difficulty)), rng_(seed) {}

bool AiController::IsApproaching(const Ball& ball) const {
  return side_ == Side::kLeft ? ball.vx < 0.0 : ball.vx > 0.0;
}

double AiController::PredictInterceptY(const Ball& ball) const {
  const double r = Playfield::kBallRadius;
  const double face = side_ == Side::kLeft ? Playfield::kLeftPaddleX + Playfield::kPaddleWidth + r
                                           : Playfield::kRightPaddleX - Playfield::kPaddleWidth - r;
  double x = ball.x;
  double y = ball.y;
  double vy = ball.vy;
  for (int tick = 0; tick < profile_.prediction_horizon_ticks; ++tick) {
    x += ball.vx;
    y += vy;
    if (y - r <= 0.0) {
      y = r;
      vy = std::abs(vy);
    } else if (y + r >= Playfield::kHeight) {
      y = Playfield::kHeight - r;
      vy = -std::abs(vy);
    }
    if ((side_ == Side::kLeft && x <= face) || (side_ == Side::kRight && x >= face)) {
      break;
    }
  }
  return y;
}

PaddleDirection AiController::Decide(const PongSimulation& simulation) {
  observations_.push_back(simulation.GetBall());
  while (static_cast<int>(observations_.size()) > profile_.reaction_ticks + 1) {
    observations_.pop_front();
  }
  const Ball& observed = observations_.front();

  const bool approaching = IsApproaching(observed);
  if (approaching && !was_approaching_) {
    std::uniform_real_distribution<double> error_dist(-profile_.max_position_error, profile_.max_position_error);
    error_offset_ = error_dist(rng_);
  }
  was_approaching_ = approaching;

  double target = Playfield::kHeight / 2;
  if (profile_.prediction_horizon_ticks == 0) {
    target = observed.y;
  } else if (approaching) {
    target = PredictInterceptY(observed);
  }
  target += error_offset_;
  const double half = Playfield::kPaddleHeight / 2;
  target = std::clamp(target, half, Playfield::kHeight - half);
  last_target_ = target;

  const double center = simulation.GetPaddle(side_).y + half;
  const double diff = target - center;
  if (std::abs(diff) <= profile_.dead_zone) {
    return PaddleDirection::kNone;
  }
  return diff > 0 ? PaddleDirection::kDown : PaddleDirection::kUp;
}

}  // namespace arena
