#include <atomic>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "arena/connection_registry.hpp"
#include "support/test_support.hpp"

using arena::ConnectionRegistry;
using arena::test_support::FakeConnection;

TEST(ConnectionRegistryTest, DeliversEventsToRegisteredUser) {
  ConnectionRegistry registry;
  auto conn = std::make_shared<FakeConnection>();
  registry.Register(1, conn);
  registry.SendEventToUser(1, "ping", {{"n", 1}});
  registry.SendEventToUser(2, "ping", {{"n", 2}});
  EXPECT_EQ(conn->Count("ping"), 1u);
  EXPECT_EQ((*conn->Last("ping"))["n"], 1);
  EXPECT_TRUE(registry.IsConnected(1));
  EXPECT_FALSE(registry.IsConnected(2));
}

TEST(ConnectionRegistryTest, NewConnectionSupersedesOldOne) {
  ConnectionRegistry registry;
  int disconnects = 0;
  registry.AddDisconnectListener([&](int) { ++disconnects; });
  auto first = std::make_shared<FakeConnection>();
  auto second = std::make_shared<FakeConnection>();
  registry.Register(1, first);
  registry.Register(1, second);

  EXPECT_TRUE(first->Has("session:superseded"));
  EXPECT_EQ(first->CloseReason(), "session_superseded");
  EXPECT_EQ(registry.ActiveConnections(), 1u);

  // 밀려난 연결의 해제는 현재 연결에 영향을 주지 않는다.
  registry.Unregister(1, first.get());
  EXPECT_TRUE(registry.IsConnected(1));
  EXPECT_EQ(disconnects, 0);

  registry.SendEventToUser(1, "ping", {});
  EXPECT_FALSE(first->Has("ping"));
  EXPECT_TRUE(second->Has("ping"));
}

TEST(ConnectionRegistryTest, UnregisterNotifiesListenersOnce) {
  ConnectionRegistry registry;
  std::vector<int> connected;
  std::vector<int> disconnected;
  registry.AddConnectListener([&](int user_id) { connected.push_back(user_id); });
  registry.AddDisconnectListener([&](int user_id) { disconnected.push_back(user_id); });
  auto conn = std::make_shared<FakeConnection>();
  registry.Register(5, conn);
  registry.Unregister(5, conn.get());
  registry.Unregister(5, conn.get());
  EXPECT_EQ(connected, std::vector<int>{5});
  EXPECT_EQ(disconnected, std::vector<int>{5});
  EXPECT_FALSE(registry.IsConnected(5));
}

TEST(ConnectionRegistryTest, BroadcastReachesOnlyConnectedTargets) {
  ConnectionRegistry registry;
  auto a = std::make_shared<FakeConnection>();
  auto b = std::make_shared<FakeConnection>();
  auto c = std::make_shared<FakeConnection>();
  registry.Register(1, a);
  registry.Register(2, b);
  registry.Register(3, c);
  registry.Broadcast({1, 3, 99}, "news", {});
  EXPECT_TRUE(a->Has("news"));
  EXPECT_FALSE(b->Has("news"));
  EXPECT_TRUE(c->Has("news"));

  registry.BroadcastAll("all", {});
  EXPECT_TRUE(a->Has("all"));
  EXPECT_TRUE(b->Has("all"));
  EXPECT_TRUE(c->Has("all"));
}

TEST(ConnectionRegistryTest, ExpiredConnectionIsTreatedAsOffline) {
  ConnectionRegistry registry;
  {
    auto conn = std::make_shared<FakeConnection>();
    registry.Register(1, conn);
  }
  EXPECT_FALSE(registry.IsConnected(1));
  registry.SendEventToUser(1, "ping", {});
}

TEST(ConnectionRegistryTest, ErrorsUseErrorChannel) {
  ConnectionRegistry registry;
  auto conn = std::make_shared<FakeConnection>();
  registry.Register(1, conn);
  registry.SendErrorToUser(1, "unknown_event", "x");
  EXPECT_EQ(conn->ErrorCodes(), std::vector<std::string>{"unknown_event"});
}

TEST(ConnectionRegistryTest, ConcurrentRegistrationKeepsOneEntryPerUser) {
  ConnectionRegistry registry;
  std::vector<std::shared_ptr<FakeConnection>> connections(64);
  for (auto& conn : connections) {
    conn = std::make_shared<FakeConnection>();
  }
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&, t]() {
      for (int i = t; i < 64; i += 4) {
        registry.Register(i % 8 + 1, connections[i]);
        registry.SendEventToUser(i % 8 + 1, "ping", {});
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(registry.ActiveConnections(), 8u);
}
