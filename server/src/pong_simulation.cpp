/*
 * 설명: 퐁 물리 한 틱을 결정적으로 계산한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/pong_simulation_test.cpp
 */
#include "arena/pong_simulation.hpp"

#include <algorithm>
#include <cmath>

namespace arena {
namespace {
double PaddleVelocity(PaddleDirection direction) {
  switch (direction) {
    case PaddleDirection::kUp:
      return -Playfield::kPaddleSpeed;
    case PaddleDirection::kDown:
      return Playfield::kPaddleSpeed;
    case PaddleDirection::kNone:
      break;
  }
  return 0.0;
}
}  // namespace

std::optional<PaddleDirection> PaddleDirectionFromCode(long long code) {
  switch (code) {
    case 0:
      return PaddleDirection::kNone;
    case 1:
      return PaddleDirection::kUp;
    case 2:
      return PaddleDirection::kDown;
    default:
      return std::nullopt;
  }
}

PongSimulation::PongSimulation(int win_score, std::uint32_t seed) : win_score_(win_score), rng_(seed) {}

void PongSimulation::SetCommand(Side side, PaddleDirection direction) {
  paddles_[Index(side)].command = direction;
}

void PongSimulation::SetPaddleY(Side side, double y) {
  paddles_[Index(side)].y = std::clamp(y, 0.0, Playfield::kHeight - Playfield::kPaddleHeight);
}

void PongSimulation::ServeBall() {
  std::uniform_real_distribution<double> angle_dist(-Playfield::kMaxServeAngle, Playfield::kMaxServeAngle);
  std::bernoulli_distribution coin(0.5);
  const double angle = angle_dist(rng_);
  const double direction = coin(rng_) ? 1.0 : -1.0;
  ball_.x = Playfield::kWidth / 2;
  ball_.y = Playfield::kHeight / 2;
  ball_.vx = direction * Playfield::kInitialBallSpeed * std::cos(angle);
  ball_.vy = Playfield::kInitialBallSpeed * std::sin(angle);
}

void PongSimulation::MovePaddles() {
  for (auto& paddle : paddles_) {
    paddle.y = std::clamp(paddle.y + PaddleVelocity(paddle.command), 0.0,
                          Playfield::kHeight - Playfield::kPaddleHeight);
  }
}

bool PongSimulation::TryPaddleBounce(Side side, const Ball& previous, Ball& next) {
  const auto& paddle = paddles_[Index(side)];
  const double r = Playfield::kBallRadius;
  double face = 0.0;
  double previous_edge = 0.0;
  double next_edge = 0.0;
  if (side == Side::kLeft) {
    if (next.vx >= 0) return false;
    face = Playfield::kLeftPaddleX + Playfield::kPaddleWidth;
    previous_edge = previous.x - r;
    next_edge = next.x - r;
    if (!(previous_edge >= face && next_edge <= face)) return false;
  } else {
    if (next.vx <= 0) return false;
    face = Playfield::kRightPaddleX - Playfield::kPaddleWidth;
    previous_edge = previous.x + r;
    next_edge = next.x + r;
    if (!(previous_edge <= face && next_edge >= face)) return false;
  }

  // 패들 면을 지나는 시점의 y 를 보간한다.
  const double span = previous_edge - next_edge;
  const double t = span == 0.0 ? 0.0 : (previous_edge - face) / span;
  const double hit_y = previous.y + t * (next.y - previous.y);
  if (hit_y < paddle.y - r || hit_y > paddle.y + Playfield::kPaddleHeight + r) {
    return false;
  }

  const double offset = std::clamp(2.0 * (hit_y - paddle.y) / Playfield::kPaddleHeight - 1.0, -1.0, 1.0);
  const double speed = std::min(std::hypot(next.vx, next.vy) * Playfield::kBallAcceleration,
                                Playfield::kMaxBallSpeed);
  const double angle = offset * Playfield::kMaxBounceAngle;
  const double direction = side == Side::kLeft ? 1.0 : -1.0;
  next.vx = direction * speed * std::cos(angle);
  next.vy = speed * std::sin(angle);
  next.x = side == Side::kLeft ? face + r : face - r;
  next.y = hit_y;
  return true;
}

void PongSimulation::AwardPoint(Side scorer, StepOutcome& outcome) {
  outcome.scorer = scorer;
  auto& score = scores_[Index(scorer)];
  score = std::min(score + 1, win_score_);
  ServeBall();
  if (score >= win_score_) {
    winner_ = scorer;
    outcome.finished = true;
    ball_.vx = 0.0;
    ball_.vy = 0.0;
  }
}

StepOutcome PongSimulation::TickOnce() {
  StepOutcome outcome;
  if (IsFinished()) {
    outcome.finished = true;
    return outcome;
  }
  ++current_tick_;
  MovePaddles();

  const double r = Playfield::kBallRadius;
  const Ball previous = ball_;
  Ball next = ball_;
  next.x += next.vx;
  next.y += next.vy;

  if (next.y - r <= 0.0) {
    next.y = r;
    next.vy = std::abs(next.vy);
    outcome.wall_hit = true;
  } else if (next.y + r >= Playfield::kHeight) {
    next.y = Playfield::kHeight - r;
    next.vy = -std::abs(next.vy);
    outcome.wall_hit = true;
  }

  outcome.paddle_hit = TryPaddleBounce(Side::kLeft, previous, next) || TryPaddleBounce(Side::kRight, previous, next);
  ball_ = next;

  if (ball_.x + r < 0.0) {
    AwardPoint(Side::kRight, outcome);
  } else if (ball_.x - r > Playfield::kWidth) {
    AwardPoint(Side::kLeft, outcome);
  }
  return outcome;
}

void PongSimulation::ForceWin(Side winner) {
  if (IsFinished()) {
    return;
  }
  scores_[Index(winner)] = win_score_;
  winner_ = winner;
  ball_ = Ball{};
}

nlohmann::json PongSimulation::Snapshot() const {
  return nlohmann::json{{"tick", current_tick_},
                        {"paddleLeft", paddles_[0].y},
                        {"paddleRight", paddles_[1].y},
                        {"ballX", ball_.x},
                        {"ballY", ball_.y},
                        {"player1Score", scores_[0]},
                        {"player2Score", scores_[1]}};
}

}  // namespace arena
