#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "chatrelay/connection_registry.hpp"
#include "support/test_support.hpp"

namespace {

class CountingListener : public chatrelay::PresenceListener {
 public:
  void OnFirstConnection(const chatrelay::ChatUser& user) override { online.push_back(user.user_id); }
  void OnLastDisconnection(const chatrelay::ChatUser& user, const std::vector<std::string>& rooms) override {
    offline.push_back(user.user_id);
    purged = rooms;
  }

  std::vector<std::string> online;
  std::vector<std::string> offline;
  std::vector<std::string> purged;
};

class ConnectionRegistryTest : public ::testing::Test {
 protected:
  void SetUp() override {
    subscriptions_ = std::make_shared<chatrelay::SubscriptionIndex>();
    registry_ = std::make_shared<chatrelay::ConnectionRegistry>(subscriptions_, 5);
    listener_ = std::make_shared<CountingListener>();
    registry_->SetPresenceListener(listener_);
  }

  std::shared_ptr<testsupport::FakeConnection> Add(const std::string& user_id) {
    auto conn = std::make_shared<testsupport::FakeConnection>(testsupport::MakeUser(user_id));
    auto result = registry_->Add(conn->User(), conn);
    EXPECT_TRUE(result.accepted);
    return conn;
  }

  std::shared_ptr<chatrelay::SubscriptionIndex> subscriptions_;
  std::shared_ptr<chatrelay::ConnectionRegistry> registry_;
  std::shared_ptr<CountingListener> listener_;
};

}  // namespace

TEST_F(ConnectionRegistryTest, UserStaysOnlineUntilLastConnectionRemoved) {
  std::vector<std::shared_ptr<testsupport::FakeConnection>> conns;
  for (int i = 0; i < 3; ++i) {
    conns.push_back(Add("u1"));
  }
  EXPECT_EQ(listener_->online.size(), 1u);
  EXPECT_EQ(registry_->ConnectionCount("u1"), 3u);

  EXPECT_TRUE(registry_->Remove(conns[0]->Id()));
  EXPECT_TRUE(registry_->Remove(conns[1]->Id()));
  EXPECT_TRUE(registry_->IsOnline("u1"));
  EXPECT_TRUE(listener_->offline.empty());

  EXPECT_TRUE(registry_->Remove(conns[2]->Id()));
  EXPECT_FALSE(registry_->IsOnline("u1"));
  EXPECT_EQ(listener_->offline.size(), 1u);
}

TEST_F(ConnectionRegistryTest, RemoveIsIdempotent) {
  auto conn = Add("u1");
  EXPECT_TRUE(registry_->Remove(conn->Id()));
  EXPECT_FALSE(registry_->Remove(conn->Id()));
  EXPECT_EQ(listener_->offline.size(), 1u);
}

TEST_F(ConnectionRegistryTest, LastRemovalPurgesSubscriptionsBeforeNotifying) {
  auto conn = Add("u1");
  ASSERT_TRUE(registry_->Subscribe(conn->Id(), "r1"));
  ASSERT_TRUE(registry_->Subscribe(conn->Id(), "r2"));

  registry_->Remove(conn->Id());
  EXPECT_FALSE(subscriptions_->Contains("r1", "u1"));
  EXPECT_FALSE(subscriptions_->Contains("r2", "u1"));
  EXPECT_EQ(listener_->purged.size(), 2u);
}

TEST_F(ConnectionRegistryTest, SubscribeRejectedAfterRemoval) {
  auto conn = Add("u1");
  registry_->Remove(conn->Id());
  EXPECT_FALSE(registry_->Subscribe(conn->Id(), "r1"));
  EXPECT_FALSE(subscriptions_->Contains("r1", "u1"));
}

TEST_F(ConnectionRegistryTest, DeliverySkipsFailedConnectionAndRemovesIt) {
  auto healthy = Add("u1");
  auto broken = Add("u1");
  broken->Break();

  auto frame = chatrelay::Serialize(chatrelay::MakePongEvent());
  EXPECT_EQ(registry_->Deliver("u1", frame), 1u);
  EXPECT_EQ(healthy->Count("pong"), 1u);
  EXPECT_EQ(registry_->ConnectionCount("u1"), 1u);
  EXPECT_TRUE(registry_->IsOnline("u1"));
}

TEST_F(ConnectionRegistryTest, EnforcesPerUserConnectionCap) {
  auto limited = std::make_shared<chatrelay::ConnectionRegistry>(subscriptions_, 2);
  auto first = std::make_shared<testsupport::FakeConnection>(testsupport::MakeUser("u1"));
  auto second = std::make_shared<testsupport::FakeConnection>(testsupport::MakeUser("u1"));
  auto third = std::make_shared<testsupport::FakeConnection>(testsupport::MakeUser("u1"));
  EXPECT_TRUE(limited->Add(first->User(), first).first_for_user);
  EXPECT_TRUE(limited->Add(second->User(), second).accepted);
  EXPECT_FALSE(limited->Add(third->User(), third).accepted);
  EXPECT_EQ(limited->ConnectionCount("u1"), 2u);
  EXPECT_FALSE(limited->Remove(third->Id()));
}

TEST_F(ConnectionRegistryTest, SnapshotAndTotals) {
  auto a = Add("u1");
  auto b = Add("u1");
  auto c = Add("u2");
  EXPECT_EQ(registry_->TotalConnections(), 3u);
  EXPECT_EQ(registry_->OnlineUsers().size(), 2u);
  EXPECT_EQ(registry_->Snapshot().size(), 3u);
}

TEST_F(ConnectionRegistryTest, ConcurrentRemovalsOfLastConnectionCascadeOnce) {
  for (int round = 0; round < 50; ++round) {
    auto conn = Add("u1");
    ASSERT_TRUE(registry_->Subscribe(conn->Id(), "r1"));
    listener_->offline.clear();

    std::atomic<int> removed{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
      threads.emplace_back([&] {
        if (registry_->Remove(conn->Id())) {
          removed.fetch_add(1);
        }
      });
    }
    for (auto& thread : threads) {
      thread.join();
    }

    EXPECT_EQ(removed.load(), 1);
    EXPECT_EQ(listener_->offline.size(), 1u);
    EXPECT_FALSE(subscriptions_->Contains("r1", "u1"));
    EXPECT_FALSE(registry_->IsOnline("u1"));
  }
}
