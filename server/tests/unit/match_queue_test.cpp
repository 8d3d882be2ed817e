#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <gtest/gtest.h>

#include "arena/match_queue.hpp"
#include "support/test_support.hpp"

using arena::EnqueueOutcome;
using arena::MatchQueueService;
using arena::test_support::Connect;
using arena::test_support::RunUntil;

namespace {

class MatchQueueTest : public ::testing::Test {
 protected:
  void SetUp() override {
    registry_ = std::make_shared<arena::ConnectionRegistry>();
    profiles_ = std::make_shared<arena::ProfileDirectory>();
    auto observability = std::make_shared<arena::Observability>(arena::LogLevel::kError);
    arena::GameSessionConfig config;
    config.tick_rate = 200;
    config.countdown_seconds = 1;
    config.seed = 7;
    manager_ = std::make_shared<arena::GameManager>(ioc_, registry_, profiles_,
                                                    std::make_shared<arena::test_support::RecordingSink>(),
                                                    observability, config);
    queue_ = std::make_shared<MatchQueueService>(manager_, registry_, profiles_, observability);
  }

  boost::asio::io_context ioc_;
  std::shared_ptr<arena::ConnectionRegistry> registry_;
  std::shared_ptr<arena::ProfileDirectory> profiles_;
  std::shared_ptr<arena::GameManager> manager_;
  std::shared_ptr<MatchQueueService> queue_;
};

}  // namespace

TEST_F(MatchQueueTest, PairsInArrivalOrder) {
  auto a = Connect(*registry_, 1);
  auto b = Connect(*registry_, 2);
  std::string code;
  std::string message;
  EnqueueOutcome first;
  ASSERT_TRUE(queue_->Enqueue(1, first, code, message));
  EXPECT_FALSE(first.game_id.has_value());
  EXPECT_EQ(first.queue_length, 1u);
  EXPECT_TRUE(queue_->IsQueued(1));

  EnqueueOutcome second;
  ASSERT_TRUE(queue_->Enqueue(2, second, code, message));
  ASSERT_TRUE(second.game_id.has_value());
  EXPECT_EQ(second.queue_length, 0u);
  EXPECT_EQ(queue_->QueueLength(), 0u);

  auto session = manager_->Find(*second.game_id);
  ASSERT_NE(session, nullptr);
  EXPECT_EQ(session->PlayerNumberOf(1), 1);
  EXPECT_EQ(session->PlayerNumberOf(2), 2);
  ASSERT_TRUE(RunUntil(ioc_, [&]() { return a->Has("game-starting") && b->Has("game-starting"); }));
}

TEST_F(MatchQueueTest, RejectsDuplicateAndBusyUsers) {
  std::string code;
  std::string message;
  EnqueueOutcome outcome;
  ASSERT_TRUE(queue_->Enqueue(1, outcome, code, message));
  EXPECT_FALSE(queue_->Enqueue(1, outcome, code, message));
  EXPECT_EQ(code, "already_queued");

  int game_id = 0;
  ASSERT_TRUE(queue_->CreatePrivate(3, game_id, code, message));
  EXPECT_FALSE(queue_->Enqueue(3, outcome, code, message));
  EXPECT_EQ(code, "already_in_session");
  EXPECT_EQ(queue_->QueueLength(), 1u);
}

TEST_F(MatchQueueTest, CancelRemovesEntry) {
  std::string code;
  std::string message;
  EnqueueOutcome outcome;
  EXPECT_FALSE(queue_->Cancel(1));
  ASSERT_TRUE(queue_->Enqueue(1, outcome, code, message));
  EXPECT_TRUE(queue_->Cancel(1));
  EXPECT_FALSE(queue_->IsQueued(1));

  ASSERT_TRUE(queue_->Enqueue(2, outcome, code, message));
  EXPECT_FALSE(outcome.game_id.has_value());
  queue_->HandleDisconnect(2);
  EXPECT_EQ(queue_->QueueLength(), 0u);
}

TEST_F(MatchQueueTest, CreatingGameLeavesQueue) {
  std::string code;
  std::string message;
  EnqueueOutcome outcome;
  ASSERT_TRUE(queue_->Enqueue(1, outcome, code, message));
  int game_id = 0;
  arena::AiDifficulty resolved = arena::AiDifficulty::kEasy;
  ASSERT_TRUE(queue_->CreateAi(1, "impossible", game_id, resolved, code, message));
  EXPECT_EQ(resolved, arena::AiDifficulty::kMedium);
  EXPECT_FALSE(queue_->IsQueued(1));
  EXPECT_EQ(manager_->Find(game_id)->Kind(), arena::SessionKind::kAi);

  EXPECT_FALSE(queue_->CreateAi(1, "hard", game_id, resolved, code, message));
  EXPECT_EQ(code, "already_in_session");
}

TEST_F(MatchQueueTest, JoinPrivateLeavesQueue) {
  std::string code;
  std::string message;
  int game_id = 0;
  ASSERT_TRUE(queue_->CreatePrivate(1, game_id, code, message));
  EnqueueOutcome outcome;
  ASSERT_TRUE(queue_->Enqueue(2, outcome, code, message));
  ASSERT_TRUE(queue_->JoinPrivate(2, game_id, code, message)) << code;
  EXPECT_FALSE(queue_->IsQueued(2));
  EXPECT_EQ(manager_->SessionOf(2), game_id);

  EXPECT_FALSE(queue_->JoinPrivate(3, 4242, code, message));
  EXPECT_EQ(code, "game_not_found");
}

TEST_F(MatchQueueTest, InvitationReusesWaitingPrivateGame) {
  auto invitee = Connect(*registry_, 2);
  profiles_->Remember(1, "host");
  std::string code;
  std::string message;
  int game_id = 0;
  bool delivered = false;
  ASSERT_TRUE(queue_->SendInvitation(1, 2, game_id, delivered, code, message));
  EXPECT_TRUE(delivered);
  auto invitation = invitee->Last("game-invitation");
  ASSERT_TRUE(invitation.has_value());
  EXPECT_EQ((*invitation)["gameId"], game_id);
  EXPECT_EQ((*invitation)["inviterId"], 1);
  EXPECT_EQ((*invitation)["inviterName"], "host");

  int again = 0;
  ASSERT_TRUE(queue_->SendInvitation(1, 3, again, delivered, code, message));
  EXPECT_EQ(again, game_id);
  EXPECT_FALSE(delivered);

  EXPECT_FALSE(queue_->SendInvitation(1, 1, again, delivered, code, message));
  EXPECT_EQ(code, "invalid_state");
}

TEST_F(MatchQueueTest, InvitationFromActiveMatchIsRejected) {
  std::string code;
  std::string message;
  EnqueueOutcome outcome;
  ASSERT_TRUE(queue_->Enqueue(1, outcome, code, message));
  ASSERT_TRUE(queue_->Enqueue(2, outcome, code, message));
  int game_id = 0;
  bool delivered = false;
  EXPECT_FALSE(queue_->SendInvitation(1, 3, game_id, delivered, code, message));
  EXPECT_EQ(code, "already_in_session");
}

TEST_F(MatchQueueTest, ConcurrentEnqueuePairsEveryoneOnce) {
  constexpr int kUsers = 40;
  std::vector<std::thread> threads;
  std::atomic<int> failures{0};
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t]() {
      for (int user = t + 1; user <= kUsers; user += 4) {
        std::string code;
        std::string message;
        EnqueueOutcome outcome;
        if (!queue_->Enqueue(user, outcome, code, message)) {
          ++failures;
        }
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(failures.load(), 0);
  EXPECT_EQ(queue_->QueueLength(), 0u);
  EXPECT_EQ(manager_->ActiveSessionCount(), static_cast<std::size_t>(kUsers / 2));

  std::set<int> games;
  for (int user = 1; user <= kUsers; ++user) {
    auto game_id = manager_->SessionOf(user);
    ASSERT_TRUE(game_id.has_value()) << user;
    games.insert(*game_id);
  }
  EXPECT_EQ(games.size(), static_cast<std::size_t>(kUsers / 2));
}
