#include <memory>
#include <string>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "arena/arena_core.hpp"
#include "support/test_support.hpp"

using arena::EventKind;
using arena::test_support::Connect;
using arena::test_support::FakeConnection;

namespace {

class EventRouterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    arena::GameSessionConfig config;
    config.tick_rate = 200;
    config.countdown_seconds = 3;
    core_ = std::make_unique<arena::ArenaCore>(ioc_, config, std::make_shared<arena::test_support::RecordingSink>(),
                                               std::make_shared<arena::Observability>(arena::LogLevel::kError));
    alice_ = Connect(*core_->GetRegistry(), 1);
    bob_ = Connect(*core_->GetRegistry(), 2);
  }

  void Send(int user_id, const std::string& event, const nlohmann::json& payload) {
    core_->GetRouter()->HandleFrame(user_id,
                                    nlohmann::json{{"t", "event"}, {"seq", 1}, {"event", event}, {"p", payload}}.dump());
  }

  static std::string LastErrorCode(const FakeConnection& connection, const std::string& event) {
    auto error = connection.Last(event);
    return error ? (*error)["code"].get<std::string>() : "";
  }

  boost::asio::io_context ioc_;
  std::unique_ptr<arena::ArenaCore> core_;
  std::shared_ptr<FakeConnection> alice_;
  std::shared_ptr<FakeConnection> bob_;
};

}  // namespace

TEST(EventSchemaTest, EventNamesMapToKinds) {
  EXPECT_EQ(arena::ParseEventKind("game:join-matchmaking"), EventKind::kJoinMatchmaking);
  EXPECT_EQ(arena::ParseEventKind("game:move"), EventKind::kMove);
  EXPECT_EQ(arena::ParseEventKind("tournament:list-active"), EventKind::kTournamentListActive);
  EXPECT_EQ(arena::ParseEventKind("game:get-active"), EventKind::kGetActiveGames);
  EXPECT_FALSE(arena::ParseEventKind("game:teleport").has_value());
  EXPECT_FALSE(arena::ParseEventKind("").has_value());
}

TEST(EventSchemaTest, MoveDirectionMustBeIntegerCode) {
  std::string reason;
  EXPECT_TRUE(arena::ValidatePayload(EventKind::kMove, {{"gameId", 1}, {"direction", 0}}, reason));
  EXPECT_TRUE(arena::ValidatePayload(EventKind::kMove, {{"gameId", 1}, {"direction", 2}}, reason));
  EXPECT_FALSE(arena::ValidatePayload(EventKind::kMove, {{"gameId", 1}, {"direction", 3}}, reason));
  EXPECT_FALSE(arena::ValidatePayload(EventKind::kMove, {{"gameId", 1}, {"direction", -1}}, reason));
  EXPECT_FALSE(arena::ValidatePayload(EventKind::kMove, {{"gameId", 1}, {"direction", "1"}}, reason));
  EXPECT_FALSE(arena::ValidatePayload(EventKind::kMove, {{"gameId", 1}, {"direction", 1.0}}, reason));
  EXPECT_FALSE(arena::ValidatePayload(EventKind::kMove, {{"direction", 1}}, reason));
  EXPECT_FALSE(arena::ValidatePayload(EventKind::kMove, {{"gameId", 0}, {"direction", 1}}, reason));
}

TEST(EventSchemaTest, TournamentCreateRequiresNameAndSize) {
  std::string reason;
  EXPECT_TRUE(arena::ValidatePayload(EventKind::kTournamentCreate, {{"name", "cup"}, {"maxPlayers", 4}}, reason));
  EXPECT_FALSE(arena::ValidatePayload(EventKind::kTournamentCreate, {{"name", "   "}, {"maxPlayers", 4}}, reason));
  EXPECT_FALSE(arena::ValidatePayload(EventKind::kTournamentCreate, {{"maxPlayers", 4}}, reason));
  EXPECT_FALSE(arena::ValidatePayload(EventKind::kTournamentCreate, {{"name", "cup"}, {"maxPlayers", "4"}}, reason));
  EXPECT_FALSE(
      arena::ValidatePayload(EventKind::kTournamentCreate, {{"name", std::string(65, 'x')}, {"maxPlayers", 4}}, reason));
  EXPECT_FALSE(arena::ValidatePayload(EventKind::kTournamentCreate,
                                      {{"name", "cup"}, {"maxPlayers", 4}, {"bracketType", 3}}, reason));
}

TEST(EventSchemaTest, PayloadMustBeObjectOrAbsent) {
  std::string reason;
  EXPECT_TRUE(arena::ValidatePayload(EventKind::kJoinMatchmaking, nullptr, reason));
  EXPECT_FALSE(arena::ValidatePayload(EventKind::kJoinMatchmaking, nlohmann::json::array(), reason));
  EXPECT_FALSE(arena::ValidatePayload(EventKind::kTournamentJoin, nullptr, reason));
  EXPECT_TRUE(arena::ValidatePayload(EventKind::kCreateAi, {{"difficulty", nullptr}}, reason));
  EXPECT_FALSE(arena::ValidatePayload(EventKind::kCreateAi, {{"difficulty", 2}}, reason));
}

TEST_F(EventRouterTest, MalformedFramesUseErrorChannel) {
  core_->GetRouter()->HandleFrame(1, "{not json");
  core_->GetRouter()->HandleFrame(1, "[1,2]");
  core_->GetRouter()->HandleFrame(1, R"({"t":"ack","event":"game:leave"})");
  core_->GetRouter()->HandleFrame(1, R"({"t":"event"})");
  Send(1, "game:teleport", {});
  EXPECT_EQ(alice_->ErrorCodes(),
            (std::vector<std::string>{"invalid_json", "invalid_json", "invalid_frame", "invalid_frame", "unknown_event"}));
  EXPECT_EQ(core_->Metrics().validation_rejects, 5u);
}

TEST_F(EventRouterTest, ValidationFailuresReplyOnScopedErrorEvent) {
  Send(1, "game:move", {{"gameId", 1}, {"direction", "1"}});
  EXPECT_EQ(LastErrorCode(*alice_, "game:error"), "validation_error");
  Send(1, "tournament:join", {{"tournamentId", "x"}});
  EXPECT_EQ(LastErrorCode(*alice_, "tournament:error"), "validation_error");
  EXPECT_TRUE(alice_->ErrorCodes().empty());
}

TEST_F(EventRouterTest, MatchmakingQueueAndCancel) {
  Send(1, "game:join-matchmaking", nullptr);
  auto queued = alice_->Last("game:queued");
  ASSERT_TRUE(queued.has_value());
  EXPECT_EQ((*queued)["queueLength"], 1);

  Send(1, "game:join-matchmaking", {});
  EXPECT_EQ(LastErrorCode(*alice_, "game:error"), "already_queued");
  EXPECT_EQ(core_->Metrics().conflict_rejects, 1u);

  Send(1, "game:cancel-matchmaking", {});
  EXPECT_EQ((*alice_->Last("game:matchmaking-cancelled"))["removed"], true);
  Send(1, "game:cancel-matchmaking", {});
  EXPECT_EQ((*alice_->Last("game:matchmaking-cancelled"))["removed"], false);
}

TEST_F(EventRouterTest, LeavePrefersQueueThenGame) {
  Send(1, "game:leave", {});
  EXPECT_EQ(LastErrorCode(*alice_, "game:error"), "not_in_game");

  Send(1, "game:join-matchmaking", {});
  Send(1, "game:leave", {});
  EXPECT_EQ((*alice_->Last("game:left"))["queue"], true);
  EXPECT_EQ(core_->Metrics().queue_length, 0u);

  Send(1, "game:create-private", {});
  auto created = alice_->Last("game:created");
  ASSERT_TRUE(created.has_value());
  Send(1, "game:leave", {});
  EXPECT_EQ((*alice_->Last("game:left"))["queue"], false);
}

TEST_F(EventRouterTest, PairingThroughRouterStartsGame) {
  Send(1, "game:join-matchmaking", {});
  Send(2, "game:join-matchmaking", {});
  EXPECT_FALSE(bob_->Has("game:queued"));
  ASSERT_TRUE(arena::test_support::RunUntil(ioc_, [&]() { return alice_->Has("game-starting"); }));
  int game_id = (*alice_->Last("game-starting"))["gameId"].get<int>();

  Send(2, "game:move", {{"gameId", game_id}, {"direction", 1}});
  EXPECT_FALSE(bob_->Has("game:error"));
  Send(3, "game:move", {{"gameId", game_id}, {"direction", 1}});
  Send(2, "game:move", {{"gameId", game_id + 50}, {"direction", 1}});
  EXPECT_EQ(LastErrorCode(*bob_, "game:error"), "game_not_found");
  EXPECT_EQ(core_->Metrics().active_sessions, 1u);
}

TEST_F(EventRouterTest, AiGameFallsBackToMediumDifficulty) {
  Send(1, "game:create-ai", {{"difficulty", "nightmare"}});
  auto created = alice_->Last("game:ai-created");
  ASSERT_TRUE(created.has_value());
  EXPECT_EQ((*created)["difficulty"], "medium");
  Send(1, "game:create-ai", {});
  EXPECT_EQ(LastErrorCode(*alice_, "game:error"), "already_in_session");
}

TEST_F(EventRouterTest, InvitationRepliesAndNotifiesTarget) {
  Send(1, "game:send-invitation", {{"targetUserId", 2}});
  auto sent = alice_->Last("game:invitation-sent");
  ASSERT_TRUE(sent.has_value());
  EXPECT_EQ((*sent)["delivered"], true);
  int game_id = (*sent)["gameId"].get<int>();
  EXPECT_EQ((*alice_->Last("game:created"))["gameId"], game_id);
  EXPECT_EQ((*bob_->Last("game-invitation"))["gameId"], game_id);

  Send(2, "game:join-private", {{"gameId", game_id}});
  EXPECT_FALSE(bob_->Has("game:error"));
  ASSERT_TRUE(arena::test_support::RunUntil(ioc_, [&]() { return bob_->Has("game:joined"); }));
}

TEST_F(EventRouterTest, TournamentLifecycleThroughRouter) {
  Send(1, "tournament:create", {{"name", "  weekly  "}, {"maxPlayers", 4}});
  auto created = bob_->Last("tournament:created");
  ASSERT_TRUE(created.has_value());
  EXPECT_EQ((*created)["tournament"]["name"], "weekly");
  int tournament_id = (*created)["tournament"]["id"].get<int>();

  Send(1, "tournament:create", {{"name", "big"}, {"maxPlayers", 5}});
  EXPECT_EQ(LastErrorCode(*alice_, "tournament:error"), "invalid_max_players");

  Send(2, "tournament:join", {{"tournamentId", tournament_id}});
  EXPECT_EQ((*bob_->Last("tournament:joined"))["tournamentId"], tournament_id);
  EXPECT_TRUE(alice_->Has("tournament:player-joined"));

  Send(2, "tournament:get", {{"tournamentId", tournament_id}});
  EXPECT_EQ((*bob_->Last("tournament:state"))["tournament"]["currentPlayers"], 2);
  Send(2, "tournament:get", {{"tournamentId", 999}});
  EXPECT_EQ(LastErrorCode(*bob_, "tournament:error"), "tournament_not_found");

  Send(2, "tournament:list-active", {});
  auto list = bob_->Last("tournament:active-list");
  ASSERT_TRUE(list.has_value());
  ASSERT_EQ((*list)["tournaments"].size(), 1u);
  EXPECT_EQ((*list)["tournaments"][0]["status"], "registering");

  Send(2, "tournament:start", {{"tournamentId", tournament_id}});
  EXPECT_EQ(LastErrorCode(*bob_, "tournament:error"), "not_creator");
  Send(1, "tournament:start", {{"tournamentId", tournament_id}});
  EXPECT_TRUE(bob_->Has("tournament:match-ready"));
  EXPECT_EQ(core_->Metrics().active_tournaments, 1u);

  Send(1, "tournament:cancel", {{"tournamentId", tournament_id}});
  EXPECT_TRUE(bob_->Has("tournament:cancelled"));
}

TEST_F(EventRouterTest, ActiveGamesListsOnlyStartedSessions) {
  auto carol = Connect(*core_->GetRegistry(), 3);
  auto viewer = Connect(*core_->GetRegistry(), 9);
  Send(9, "game:get-active", nullptr);
  auto empty = viewer->Last("game:active-games");
  ASSERT_TRUE(empty.has_value());
  EXPECT_TRUE((*empty)["games"].is_array());
  EXPECT_TRUE((*empty)["games"].empty());

  Send(3, "game:create-private", {});
  ASSERT_TRUE(carol->Has("game:created"));
  Send(1, "game:join-matchmaking", {});
  Send(2, "game:join-matchmaking", {});
  ASSERT_TRUE(arena::test_support::RunUntil(ioc_, [&]() { return alice_->Has("game-starting"); }));
  int game_id = (*alice_->Last("game-starting"))["gameId"].get<int>();

  Send(9, "game:get-active", {});
  auto games = (*viewer->Last("game:active-games"))["games"];
  ASSERT_EQ(games.size(), 1u);
  EXPECT_EQ(games[0]["gameId"], game_id);
  EXPECT_EQ(games[0]["gameType"], "matchmaking");
  EXPECT_EQ(games[0]["status"], "countdown");
  EXPECT_EQ(games[0]["player1"]["id"], 1);

  Send(9, "game:spectate", {{"gameId", games[0]["gameId"]}});
  EXPECT_EQ((*viewer->Last("game:spectating"))["gameId"], game_id);
  EXPECT_FALSE(viewer->Has("game:error"));
}
