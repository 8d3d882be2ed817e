/*
 * 설명: 고정 틱 기반 퐁 물리 시뮬레이션(패들, 공, 득점)을 제공한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/pong_simulation_test.cpp
 */
#pragma once

#include <cstdint>
#include <optional>
#include <random>

#include <nlohmann/json.hpp>

namespace arena {

enum class PaddleDirection : int { kNone = 0, kUp = 1, kDown = 2 };

// 와이어 코드(0/1/2)를 방향으로 변환한다. 범위 밖이면 nullopt.
std::optional<PaddleDirection> PaddleDirectionFromCode(long long code);

enum class Side : int { kLeft = 0, kRight = 1 };

inline Side Opposite(Side side) { return side == Side::kLeft ? Side::kRight : Side::kLeft; }

struct Playfield {
  static constexpr double kWidth = 100.0;
  static constexpr double kHeight = 100.0;
  static constexpr double kPaddleHeight = 10.0;
  static constexpr double kPaddleWidth = 1.0;
  static constexpr double kLeftPaddleX = 3.0;
  static constexpr double kRightPaddleX = 97.0;
  static constexpr double kBallRadius = 1.0;
  static constexpr double kPaddleSpeed = 1.5;
  static constexpr double kInitialBallSpeed = 0.6;
  static constexpr double kMaxBallSpeed = 2.0;
  static constexpr double kBallAcceleration = 1.08;
  static constexpr double kMaxBounceAngle = 0.8377580409572781;  // 48도
  static constexpr double kMaxServeAngle = 0.5235987755982988;   // 30도
};

struct Ball {
  double x{Playfield::kWidth / 2};
  double y{Playfield::kHeight / 2};
  double vx{0.0};
  double vy{0.0};
};

struct Paddle {
  double y{(Playfield::kHeight - Playfield::kPaddleHeight) / 2};  // 상단 좌표
  PaddleDirection command{PaddleDirection::kNone};
};

struct StepOutcome {
  bool paddle_hit{false};
  bool wall_hit{false};
  std::optional<Side> scorer;
  bool finished{false};
};

class PongSimulation {
 public:
  static constexpr int kDefaultTickRate = 60;
  static constexpr int kDefaultWinScore = 11;

  PongSimulation(int win_score, std::uint32_t seed);

  void SetCommand(Side side, PaddleDirection direction);
  // 공을 중앙에 두고 무작위 방향으로 초기 속도를 부여한다.
  void ServeBall();
  StepOutcome TickOnce();
  // 기권 처리: 승자 점수를 승리 점수로 올리고 종료한다.
  void ForceWin(Side winner);

  void SetBall(const Ball& ball) { ball_ = ball; }
  void SetPaddleY(Side side, double y);

  const Ball& GetBall() const { return ball_; }
  const Paddle& GetPaddle(Side side) const { return paddles_[Index(side)]; }
  int Score(Side side) const { return scores_[Index(side)]; }
  int WinScore() const { return win_score_; }
  int CurrentTick() const { return current_tick_; }
  bool IsFinished() const { return winner_.has_value(); }
  std::optional<Side> Winner() const { return winner_; }
  nlohmann::json Snapshot() const;

 private:
  static int Index(Side side) { return static_cast<int>(side); }
  void MovePaddles();
  bool TryPaddleBounce(Side side, const Ball& previous, Ball& next);
  void AwardPoint(Side scorer, StepOutcome& outcome);

  int win_score_;
  int current_tick_{0};
  Ball ball_;
  Paddle paddles_[2];
  int scores_[2]{0, 0};
  std::optional<Side> winner_;
  std::mt19937 rng_;
};

}  // namespace arena
