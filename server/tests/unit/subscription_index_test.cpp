#include <algorithm>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "chatrelay/subscription_index.hpp"

TEST(SubscriptionIndexTest, JoinAndLeaveAreIdempotent) {
  chatrelay::SubscriptionIndex index;
  EXPECT_TRUE(index.Join("u1", "r1"));
  EXPECT_FALSE(index.Join("u1", "r1"));
  EXPECT_EQ(index.Members("r1").size(), 1u);

  EXPECT_TRUE(index.Leave("u1", "r1"));
  EXPECT_FALSE(index.Leave("u1", "r1"));
  EXPECT_TRUE(index.Members("r1").empty());
  EXPECT_EQ(index.RoomCount(), 0u);
}

TEST(SubscriptionIndexTest, LeaveByNonMemberIsNoop) {
  chatrelay::SubscriptionIndex index;
  index.Join("u1", "r1");
  EXPECT_FALSE(index.Leave("u2", "r1"));
  EXPECT_TRUE(index.Contains("r1", "u1"));
}

TEST(SubscriptionIndexTest, NonMemberNeverAppearsInMembers) {
  chatrelay::SubscriptionIndex index;
  index.Join("u1", "r1");
  index.Join("u2", "r2");
  auto members = index.Members("r1");
  EXPECT_EQ(members.count("u1"), 1u);
  EXPECT_EQ(members.count("u2"), 0u);
  EXPECT_FALSE(index.Contains("r1", "u2"));
}

TEST(SubscriptionIndexTest, PurgeUserRemovesFromEveryRoom) {
  chatrelay::SubscriptionIndex index;
  index.Join("u1", "r1");
  index.Join("u1", "r2");
  index.Join("u2", "r1");

  auto purged = index.PurgeUser("u1");
  std::sort(purged.begin(), purged.end());
  EXPECT_EQ(purged, (std::vector<std::string>{"r1", "r2"}));
  EXPECT_FALSE(index.Contains("r1", "u1"));
  EXPECT_TRUE(index.Contains("r1", "u2"));
  EXPECT_TRUE(index.RoomsOf("u1").empty());
  EXPECT_EQ(index.RoomCount(), 1u);
  EXPECT_TRUE(index.PurgeUser("u1").empty());
}

TEST(SubscriptionIndexTest, CountsRoomsAndSubscriptions) {
  chatrelay::SubscriptionIndex index;
  index.Join("u1", "r1");
  index.Join("u2", "r1");
  index.Join("u1", "r2");
  EXPECT_EQ(index.RoomCount(), 2u);
  EXPECT_EQ(index.SubscriptionCount(), 3u);
  EXPECT_EQ(index.RoomsOf("u1").size(), 2u);
}

TEST(SubscriptionIndexTest, ConcurrentJoinsAcrossShards) {
  chatrelay::SubscriptionIndex index;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&index, t]() {
      for (int i = 0; i < 200; ++i) {
        index.Join("u" + std::to_string(t), "r" + std::to_string(i % 50));
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(index.RoomCount(), 50u);
  EXPECT_EQ(index.SubscriptionCount(), 200u);
}
