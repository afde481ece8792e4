#include <gtest/gtest.h>

#include "support/test_support.hpp"

namespace {

class DispatcherTest : public ::testing::Test {
 protected:
  std::shared_ptr<testsupport::FakeConnection> Add(const std::string& user_id) {
    auto conn = std::make_shared<testsupport::FakeConnection>(testsupport::MakeUser(user_id));
    stack_.services.registry->Add(conn->User(), conn);
    return conn;
  }

  void Subscribe(const std::shared_ptr<testsupport::FakeConnection>& conn, const std::string& chatroom_id) {
    ASSERT_TRUE(stack_.services.registry->Subscribe(conn->Id(), chatroom_id));
  }

  chatrelay::Dispatcher& Dispatcher() { return *stack_.services.dispatcher; }

  testsupport::TestStack stack_;
};

}  // namespace

TEST_F(DispatcherTest, ChatroomDeliveryReachesOnlySubscribers) {
  auto a = Add("a");
  auto b = Add("b");
  auto outsider = Add("c");
  Subscribe(a, "r1");
  Subscribe(b, "r1");

  auto recipients = Dispatcher().ToChatroom("r1", chatrelay::MakePongEvent());
  EXPECT_EQ(recipients, 2u);
  EXPECT_EQ(a->Count("pong"), 1u);
  EXPECT_EQ(b->Count("pong"), 1u);
  EXPECT_EQ(outsider->Count("pong"), 0u);
}

TEST_F(DispatcherTest, ExcludedUserIsSkipped) {
  auto a = Add("a");
  auto b = Add("b");
  Subscribe(a, "r1");
  Subscribe(b, "r1");

  EXPECT_EQ(Dispatcher().ToChatroom("r1", chatrelay::MakePongEvent(), std::string("a")), 1u);
  EXPECT_EQ(a->Count("pong"), 0u);
  EXPECT_EQ(b->Count("pong"), 1u);
}

TEST_F(DispatcherTest, FailedRecipientDoesNotAffectOthers) {
  auto a = Add("a");
  auto b = Add("b");
  Subscribe(a, "r1");
  Subscribe(b, "r1");
  a->Break();

  EXPECT_EQ(Dispatcher().ToChatroom("r1", chatrelay::MakePongEvent()), 1u);
  EXPECT_EQ(b->Count("pong"), 1u);
  EXPECT_FALSE(stack_.services.registry->IsOnline("a"));
  EXPECT_FALSE(stack_.services.subscriptions->Contains("r1", "a"));
  EXPECT_EQ(stack_.observability->Value(chatrelay::Metric::kDeliveryFailures), 1u);
}

TEST_F(DispatcherTest, ToUserReachesEveryConnectionOfUser) {
  auto phone = Add("a");
  auto laptop = Add("a");
  EXPECT_EQ(Dispatcher().ToUser("a", chatrelay::MakePongEvent()), 2u);
  EXPECT_EQ(phone->Count("pong"), 1u);
  EXPECT_EQ(laptop->Count("pong"), 1u);
  EXPECT_EQ(Dispatcher().ToUser("nobody", chatrelay::MakePongEvent()), 0u);
}

TEST_F(DispatcherTest, ToAllCoversOnlineUsers) {
  auto a = Add("a");
  auto b = Add("b");
  EXPECT_EQ(Dispatcher().ToAll(chatrelay::MakePongEvent(), std::string("b")), 1u);
  EXPECT_EQ(a->Count("pong"), 1u);
  EXPECT_EQ(b->Count("pong"), 0u);
}

TEST_F(DispatcherTest, SuccessiveEventsArriveInIssueOrder) {
  auto a = Add("a");
  Subscribe(a, "r1");
  for (int i = 0; i < 5; ++i) {
    Dispatcher().ToChatroom("r1", chatrelay::MakeErrorEvent("seq", std::to_string(i)));
  }
  auto frames = a->Events("error");
  ASSERT_EQ(frames.size(), 5u);
  for (int i = 0; i < 5; ++i) {
    EXPECT_EQ(frames[i]["data"]["message"], std::to_string(i));
  }
}
