#include <chrono>
#include <stdexcept>
#include <vector>
#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "arena/game_manager.hpp"
#include "support/test_support.hpp"

using arena::GameManager;
using arena::GameSessionConfig;
using arena::PaddleDirection;
using arena::SessionStatus;
using arena::test_support::Connect;
using arena::test_support::RecordingSink;
using arena::test_support::RunUntil;

namespace {

class GameSessionTest : public ::testing::Test {
 protected:
  void SetUp() override { Build(std::chrono::seconds(5), 11); }

  void Build(std::chrono::milliseconds grace, int win_score, int countdown_seconds = 0, int tick_rate = 500) {
    registry_ = std::make_shared<arena::ConnectionRegistry>();
    profiles_ = std::make_shared<arena::ProfileDirectory>();
    sink_ = std::make_shared<RecordingSink>();
    auto observability = std::make_shared<arena::Observability>(arena::LogLevel::kError);
    GameSessionConfig config;
    config.tick_rate = tick_rate;
    config.win_score = win_score;
    config.countdown_seconds = countdown_seconds;
    config.reconnect_grace = grace;
    config.seed = 42;
    manager_ = std::make_shared<GameManager>(ioc_, registry_, profiles_, sink_, observability, config);
    registry_->AddConnectListener([this](int user_id) { manager_->HandleConnect(user_id); });
    registry_->AddDisconnectListener([this](int user_id) { manager_->HandleDisconnect(user_id); });
    profiles_->Remember(1, "alice");
    profiles_->Remember(2, "bob");
  }

  bool WaitForStatus(int game_id, SessionStatus status,
                     std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    return RunUntil(
        ioc_,
        [&]() {
          auto session = manager_->Find(game_id);
          return session && session->Status() == status;
        },
        timeout);
  }

  // 대기 중인 타이머를 주어진 시간 동안 돌린다.
  void RunFor(std::chrono::milliseconds duration) { RunUntil(ioc_, []() { return false; }, duration); }

  static std::size_t UpdatesFor(const arena::test_support::FakeConnection& connection, int game_id) {
    std::size_t count = 0;
    for (const auto& update : connection.All("game-update")) {
      if (update["gameId"] == game_id) {
        ++count;
      }
    }
    return count;
  }

  // 두 패들을 맨 위로 올려 첫 서브가 득점으로 끝나게 한다.
  void MovePaddlesAway(int game_id) {
    std::string code;
    std::string message;
    ASSERT_TRUE(manager_->SubmitMove(1, game_id, PaddleDirection::kUp, code, message)) << code;
    ASSERT_TRUE(manager_->SubmitMove(2, game_id, PaddleDirection::kUp, code, message)) << code;
  }

  boost::asio::io_context ioc_;
  std::shared_ptr<arena::ConnectionRegistry> registry_;
  std::shared_ptr<arena::ProfileDirectory> profiles_;
  std::shared_ptr<RecordingSink> sink_;
  std::shared_ptr<GameManager> manager_;
};

}  // namespace

TEST_F(GameSessionTest, MatchStartsWithJoinedAndStartingEvents) {
  auto alice = Connect(*registry_, 1);
  auto bob = Connect(*registry_, 2);
  int game_id = manager_->CreateMatchSession(1, 2);
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kPlaying));

  auto joined = alice->Last("game:joined");
  ASSERT_TRUE(joined.has_value());
  EXPECT_EQ((*joined)["playerNumber"], 1);
  EXPECT_EQ((*bob->Last("game:joined"))["playerNumber"], 2);

  auto starting = bob->Last("game-starting");
  ASSERT_TRUE(starting.has_value());
  EXPECT_EQ((*starting)["gameId"], game_id);
  EXPECT_EQ((*starting)["gameType"], "matchmaking");
  EXPECT_EQ((*starting)["player1"]["name"], "alice");
  EXPECT_EQ((*starting)["tickRate"], 500);
  EXPECT_EQ((*starting)["winScore"], 11);
  EXPECT_TRUE(manager_->IsUserInSession(1));
  EXPECT_EQ(manager_->SessionOf(2), game_id);
}

TEST_F(GameSessionTest, MoveValidation) {
  auto alice = Connect(*registry_, 1);
  auto bob = Connect(*registry_, 2);
  std::string code;
  std::string message;
  EXPECT_FALSE(manager_->SubmitMove(1, 999, PaddleDirection::kUp, code, message));
  EXPECT_EQ(code, "game_not_found");

  int private_id = 0;
  ASSERT_TRUE(manager_->CreatePrivateSession(1, private_id, code, message));
  EXPECT_FALSE(manager_->SubmitMove(1, private_id, PaddleDirection::kUp, code, message));
  EXPECT_EQ(code, "invalid_state");
  EXPECT_FALSE(manager_->SubmitMove(2, private_id, PaddleDirection::kUp, code, message));
  EXPECT_EQ(code, "not_participant");
}

TEST_F(GameSessionTest, PlayedMatchFinishesAndIsRecorded) {
  Build(std::chrono::seconds(5), 1);
  auto alice = Connect(*registry_, 1);
  auto bob = Connect(*registry_, 2);
  int game_id = manager_->CreateMatchSession(1, 2);
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kPlaying));
  MovePaddlesAway(game_id);

  ASSERT_TRUE(RunUntil(ioc_, [&]() { return sink_->Matches().size() == 1; }));
  auto ended = alice->Last("game-ended");
  ASSERT_TRUE(ended.has_value());
  EXPECT_EQ((*ended)["status"], "finished");
  EXPECT_EQ((*ended)["forfeit"], false);
  EXPECT_EQ((*ended)["reason"], "completed");
  int winner = (*ended)["winnerId"].get<int>();
  EXPECT_TRUE(winner == 1 || winner == 2);
  EXPECT_EQ((*ended)["finalScore"]["player1"].get<int>() + (*ended)["finalScore"]["player2"].get<int>(), 1);

  auto record = sink_->Matches().front();
  EXPECT_EQ(record.game_id, game_id);
  EXPECT_EQ(record.game_type, "matchmaking");
  EXPECT_EQ(record.winner_user_id.value_or(-1), winner);
  EXPECT_FALSE(record.forfeit);
  EXPECT_GT(record.tick_count, 0);
  EXPECT_NE(record.match_key.find("-g" + std::to_string(game_id)), std::string::npos);
  EXPECT_FALSE(manager_->IsUserInSession(1));
  EXPECT_EQ(manager_->Find(game_id), nullptr);

  int last_tick = -1;
  for (const auto& update : bob->All("game-update")) {
    int tick = update["tick"].get<int>();
    EXPECT_GE(tick, last_tick);
    last_tick = tick;
  }
}

TEST_F(GameSessionTest, LeavingForfeitsToOpponent) {
  auto alice = Connect(*registry_, 1);
  auto bob = Connect(*registry_, 2);
  int game_id = manager_->CreateMatchSession(1, 2);
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kPlaying));

  std::string code;
  std::string message;
  ASSERT_TRUE(manager_->Leave(1, code, message));
  ASSERT_TRUE(RunUntil(ioc_, [&]() { return bob->Has("game-ended"); }));
  auto ended = *bob->Last("game-ended");
  EXPECT_EQ(ended["winnerId"], 2);
  EXPECT_EQ(ended["forfeit"], true);
  EXPECT_EQ(ended["reason"], "player_left");
  EXPECT_EQ(ended["status"], "cancelled");
  EXPECT_EQ(ended["finalScore"]["player2"], 11);

  EXPECT_FALSE(manager_->Leave(1, code, message));
  EXPECT_EQ(code, "not_in_game");
  ASSERT_EQ(sink_->Matches().size(), 1u);
  EXPECT_TRUE(sink_->Matches().front().forfeit);
}

TEST_F(GameSessionTest, LeavingWaitingPrivateGameCancelsWithoutRecord) {
  auto alice = Connect(*registry_, 1);
  std::string code;
  std::string message;
  int game_id = 0;
  ASSERT_TRUE(manager_->CreatePrivateSession(1, game_id, code, message));
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kWaiting));
  ASSERT_TRUE(manager_->Leave(1, code, message));
  ASSERT_TRUE(RunUntil(ioc_, [&]() { return manager_->Find(game_id) == nullptr; }));
  EXPECT_TRUE(alice->Has("game-cancelled"));
  EXPECT_TRUE(sink_->Matches().empty());
}

TEST_F(GameSessionTest, JoinPrivateErrors) {
  auto alice = Connect(*registry_, 1);
  auto bob = Connect(*registry_, 2);
  auto carol = Connect(*registry_, 3);
  std::string code;
  std::string message;
  EXPECT_FALSE(manager_->JoinPrivateSession(2, 77, code, message));
  EXPECT_EQ(code, "game_not_found");

  int match_id = manager_->CreateMatchSession(1, 2);
  EXPECT_FALSE(manager_->JoinPrivateSession(3, match_id, code, message));
  EXPECT_EQ(code, "invalid_state");

  int private_id = 0;
  ASSERT_TRUE(manager_->CreatePrivateSession(3, private_id, code, message));
  EXPECT_FALSE(manager_->JoinPrivateSession(1, private_id, code, message));
  EXPECT_EQ(code, "already_in_session");
  EXPECT_FALSE(manager_->CreatePrivateSession(3, private_id, code, message));
  EXPECT_EQ(code, "already_in_session");
}

TEST_F(GameSessionTest, PrivateGameStartsWhenGuestJoins) {
  auto alice = Connect(*registry_, 1);
  auto bob = Connect(*registry_, 2);
  auto carol = Connect(*registry_, 3);
  std::string code;
  std::string message;
  int game_id = 0;
  ASSERT_TRUE(manager_->CreatePrivateSession(1, game_id, code, message));
  ASSERT_TRUE(manager_->JoinPrivateSession(2, game_id, code, message)) << code;
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kPlaying));
  EXPECT_EQ((*bob->Last("game:joined"))["playerNumber"], 2);
  EXPECT_EQ((*alice->Last("game-starting"))["gameType"], "private");

  EXPECT_FALSE(manager_->JoinPrivateSession(3, game_id, code, message));
  EXPECT_EQ(code, "game_full");
}

TEST_F(GameSessionTest, DisconnectPausesAndReconnectResumes) {
  auto alice = Connect(*registry_, 1);
  auto bob = Connect(*registry_, 2);
  int game_id = manager_->CreateMatchSession(1, 2);
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kPlaying));

  registry_->Unregister(2, bob.get());
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kPaused));
  ASSERT_TRUE(RunUntil(ioc_, [&]() { return alice->Has("game-paused"); }));
  EXPECT_EQ((*alice->Last("game:opponent-disconnected"))["userId"], 2);

  std::string code;
  std::string message;
  EXPECT_FALSE(manager_->SubmitMove(1, game_id, PaddleDirection::kDown, code, message));
  EXPECT_EQ(code, "invalid_state");

  auto bob_again = Connect(*registry_, 2);
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kPlaying));
  ASSERT_TRUE(RunUntil(ioc_, [&]() { return bob_again->Has("game-resumed"); }));
  EXPECT_TRUE(alice->Has("game:opponent-reconnected"));
  EXPECT_EQ((*bob_again->Last("game:joined"))["reconnected"], true);
  auto starting = bob_again->Last("game-starting");
  ASSERT_TRUE(starting.has_value());
  EXPECT_EQ((*starting)["gameId"], game_id);
  EXPECT_EQ((*starting)["countdown"], 0);
  EXPECT_EQ((*starting)["tickRate"], 500);
  EXPECT_EQ((*starting)["winScore"], 11);
  EXPECT_EQ((*starting)["player2"]["name"], "bob");
}

TEST_F(GameSessionTest, ReconnectGraceExpiryForfeits) {
  Build(std::chrono::milliseconds(100), 11);
  auto alice = Connect(*registry_, 1);
  auto bob = Connect(*registry_, 2);
  int game_id = manager_->CreateMatchSession(1, 2);
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kPlaying));

  registry_->Unregister(1, alice.get());
  ASSERT_TRUE(RunUntil(ioc_, [&]() { return bob->Has("game-ended"); }));
  auto ended = *bob->Last("game-ended");
  EXPECT_EQ(ended["winnerId"], 2);
  EXPECT_EQ(ended["reason"], "reconnect_timeout");
  EXPECT_EQ(ended["forfeit"], true);
  EXPECT_FALSE(alice->Has("game-ended"));
}

TEST_F(GameSessionTest, SpectatorReceivesUpdatesOnlyWhileInProgress) {
  auto alice = Connect(*registry_, 1);
  auto bob = Connect(*registry_, 2);
  auto viewer = Connect(*registry_, 9);
  std::string code;
  std::string message;

  int private_id = 0;
  auto carol = Connect(*registry_, 3);
  ASSERT_TRUE(manager_->CreatePrivateSession(3, private_id, code, message));
  ASSERT_TRUE(WaitForStatus(private_id, SessionStatus::kWaiting));
  EXPECT_FALSE(manager_->Spectate(9, private_id, code, message));
  EXPECT_EQ(code, "invalid_state");

  int game_id = manager_->CreateMatchSession(1, 2);
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kPlaying));
  EXPECT_FALSE(manager_->Spectate(1, game_id, code, message));
  EXPECT_EQ(code, "already_in_session");
  ASSERT_TRUE(manager_->Spectate(9, game_id, code, message)) << code;
  EXPECT_EQ((*viewer->Last("game:spectating"))["gameId"], game_id);
  ASSERT_TRUE(RunUntil(ioc_, [&]() { return viewer->Count("game-update") >= 3; }));

  ASSERT_TRUE(manager_->Leave(9, code, message));
  EXPECT_TRUE(manager_->IsUserInSession(1));
  EXPECT_FALSE(manager_->IsUserInSession(9));
}

TEST_F(GameSessionTest, AiGameRunsWithoutSecondHuman) {
  auto alice = Connect(*registry_, 1);
  std::string code;
  std::string message;
  int game_id = 0;
  ASSERT_TRUE(manager_->CreateAiSession(1, arena::AiDifficulty::kEasy, game_id, code, message));
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kPlaying));
  auto starting = *alice->Last("game-starting");
  EXPECT_EQ(starting["gameType"], "ai");
  EXPECT_EQ(starting["player2"]["difficulty"], "easy");

  ASSERT_TRUE(manager_->Leave(1, code, message));
  ASSERT_TRUE(RunUntil(ioc_, [&]() { return manager_->Find(game_id) == nullptr; }));
  ASSERT_EQ(sink_->Matches().size(), 1u);
  EXPECT_EQ(sink_->Matches().front().winner_user_id.value_or(-1), arena::kAiUserId);
}

TEST_F(GameSessionTest, CancelAllEndsWithoutWinner) {
  auto alice = Connect(*registry_, 1);
  auto bob = Connect(*registry_, 2);
  int game_id = manager_->CreateMatchSession(1, 2);
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kPlaying));
  manager_->CancelAll("server_shutdown");
  ASSERT_TRUE(RunUntil(ioc_, [&]() { return alice->Has("game-cancelled"); }));
  EXPECT_EQ((*bob->Last("game-cancelled"))["reason"], "server_shutdown");
  EXPECT_TRUE(sink_->Matches().empty());
  EXPECT_EQ(manager_->ActiveSessionCount(), 0u);
}

TEST_F(GameSessionTest, SpectatorStartingOwnGameLeavesPreviousAudience) {
  auto alice = Connect(*registry_, 1);
  auto bob = Connect(*registry_, 2);
  auto viewer = Connect(*registry_, 3);
  std::string code;
  std::string message;
  int watched_id = manager_->CreateMatchSession(1, 2);
  ASSERT_TRUE(WaitForStatus(watched_id, SessionStatus::kPlaying));
  ASSERT_TRUE(manager_->Spectate(3, watched_id, code, message)) << code;
  ASSERT_TRUE(RunUntil(ioc_, [&]() { return UpdatesFor(*viewer, watched_id) >= 2; }));

  int own_id = 0;
  ASSERT_TRUE(manager_->CreateAiSession(3, arena::AiDifficulty::kEasy, own_id, code, message)) << code;
  EXPECT_FALSE(manager_->IsSpectating(3));
  viewer->Clear();
  ASSERT_TRUE(WaitForStatus(own_id, SessionStatus::kPlaying));
  RunFor(std::chrono::milliseconds(200));
  EXPECT_EQ(UpdatesFor(*viewer, watched_id), 0u);
  EXPECT_GT(UpdatesFor(*viewer, own_id), 0u);

  ASSERT_TRUE(manager_->Leave(3, code, message));
  ASSERT_TRUE(RunUntil(ioc_, [&]() { return manager_->Find(own_id) == nullptr; }));
  EXPECT_EQ(manager_->SessionOf(1), watched_id);
}

TEST_F(GameSessionTest, SpectatorJoiningPrivateGameLeavesPreviousAudience) {
  auto alice = Connect(*registry_, 1);
  auto bob = Connect(*registry_, 2);
  auto carol = Connect(*registry_, 3);
  auto viewer = Connect(*registry_, 9);
  std::string code;
  std::string message;
  int watched_id = manager_->CreateMatchSession(1, 2);
  ASSERT_TRUE(WaitForStatus(watched_id, SessionStatus::kPlaying));
  ASSERT_TRUE(manager_->Spectate(9, watched_id, code, message)) << code;

  int private_id = 0;
  ASSERT_TRUE(manager_->CreatePrivateSession(3, private_id, code, message));
  ASSERT_TRUE(manager_->JoinPrivateSession(9, private_id, code, message)) << code;
  viewer->Clear();
  ASSERT_TRUE(WaitForStatus(private_id, SessionStatus::kPlaying));
  RunFor(std::chrono::milliseconds(200));
  EXPECT_EQ(UpdatesFor(*viewer, watched_id), 0u);
  EXPECT_GT(UpdatesFor(*viewer, private_id), 0u);
}

TEST_F(GameSessionTest, FailedSpectateDropsPreviousMapping) {
  auto alice = Connect(*registry_, 1);
  auto bob = Connect(*registry_, 2);
  auto carol = Connect(*registry_, 3);
  auto viewer = Connect(*registry_, 9);
  std::string code;
  std::string message;
  int watched_id = manager_->CreateMatchSession(1, 2);
  ASSERT_TRUE(WaitForStatus(watched_id, SessionStatus::kPlaying));
  ASSERT_TRUE(manager_->Spectate(9, watched_id, code, message)) << code;

  int private_id = 0;
  ASSERT_TRUE(manager_->CreatePrivateSession(3, private_id, code, message));
  ASSERT_TRUE(WaitForStatus(private_id, SessionStatus::kWaiting));
  EXPECT_FALSE(manager_->Spectate(9, private_id, code, message));
  EXPECT_EQ(code, "invalid_state");
  EXPECT_FALSE(manager_->IsSpectating(9));

  EXPECT_FALSE(manager_->Leave(9, code, message));
  EXPECT_EQ(code, "not_in_game");
}

TEST_F(GameSessionTest, CountdownAnnouncesEverySecondBeforePlaying) {
  Build(std::chrono::seconds(5), 11, 2, 100);
  auto alice = Connect(*registry_, 1);
  auto bob = Connect(*registry_, 2);
  int game_id = manager_->CreateMatchSession(1, 2);
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kCountdown));
  auto starting = *alice->Last("game-starting");
  EXPECT_EQ(starting["countdown"], 2);
  EXPECT_EQ(starting["status"], "countdown");

  std::string code;
  std::string message;
  EXPECT_TRUE(manager_->SubmitMove(1, game_id, PaddleDirection::kUp, code, message)) << code;
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kPlaying, std::chrono::seconds(10)));

  std::vector<int> countdown_values;
  for (const auto& update : bob->All("game-update")) {
    if (update.contains("countdownValue")) {
      countdown_values.push_back(update["countdownValue"].get<int>());
    }
  }
  EXPECT_EQ(countdown_values, (std::vector<int>{2, 1, 0}));
}

TEST_F(GameSessionTest, DisconnectDuringCountdownResumesIntoCountdown) {
  Build(std::chrono::seconds(5), 11, 2, 100);
  auto alice = Connect(*registry_, 1);
  auto bob = Connect(*registry_, 2);
  int game_id = manager_->CreateMatchSession(1, 2);
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kCountdown));

  registry_->Unregister(2, bob.get());
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kPaused));
  ASSERT_TRUE(RunUntil(ioc_, [&]() { return alice->Has("game-paused"); }));

  auto bob_again = Connect(*registry_, 2);
  ASSERT_TRUE(RunUntil(ioc_, [&]() { return bob_again->Has("game-resumed"); }));
  EXPECT_EQ((*bob_again->Last("game-resumed"))["status"], "countdown");
  auto starting = *bob_again->Last("game-starting");
  EXPECT_EQ(starting["status"], "countdown");
  EXPECT_GE(starting["countdown"].get<int>(), 1);
  EXPECT_LE(starting["countdown"].get<int>(), 2);
  EXPECT_EQ(starting["tickRate"], 100);
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kPlaying, std::chrono::seconds(10)));
}

TEST_F(GameSessionTest, OfflinePlayerAtCountdownEntryPausesSession) {
  Build(std::chrono::seconds(5), 11, 1, 100);
  auto alice = Connect(*registry_, 1);
  int game_id = manager_->CreateMatchSession(1, 2);
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kPaused));
  ASSERT_TRUE(RunUntil(ioc_, [&]() { return alice->Has("game-paused"); }));
  EXPECT_EQ((*alice->Last("game:opponent-disconnected"))["userId"], 2);

  auto bob = Connect(*registry_, 2);
  ASSERT_TRUE(RunUntil(ioc_, [&]() { return bob->Has("game:joined"); }));
  EXPECT_EQ((*bob->Last("game:joined"))["reconnected"], true);
  ASSERT_TRUE(WaitForStatus(game_id, SessionStatus::kPlaying, std::chrono::seconds(10)));
}

TEST(GameSessionConfigTest, NonPositiveTimingIsRejected) {
  GameSessionConfig config;
  EXPECT_NO_THROW(arena::ValidateGameSessionConfig(config));

  config.tick_rate = 0;
  EXPECT_THROW(arena::ValidateGameSessionConfig(config), std::invalid_argument);
  config.tick_rate = -60;
  EXPECT_THROW(arena::ValidateGameSessionConfig(config), std::invalid_argument);

  config = GameSessionConfig{};
  config.win_score = 0;
  EXPECT_THROW(arena::ValidateGameSessionConfig(config), std::invalid_argument);

  config = GameSessionConfig{};
  config.countdown_seconds = -1;
  EXPECT_THROW(arena::ValidateGameSessionConfig(config), std::invalid_argument);

  config = GameSessionConfig{};
  config.tick_rate = 0;
  boost::asio::io_context ioc;
  EXPECT_THROW(std::make_shared<GameManager>(ioc, std::make_shared<arena::ConnectionRegistry>(),
                                             std::make_shared<arena::ProfileDirectory>(),
                                             std::make_shared<RecordingSink>(), nullptr, config),
               std::invalid_argument);
}
