#include <gtest/gtest.h>

#include <set>
#include <thread>

#include "support/test_support.hpp"

using chatrelay::MessageRecord;

namespace {
MessageRecord MakeRecord(const std::string& id, const std::string& content) {
  MessageRecord record;
  record.id = id;
  record.chatroom_id = "r1";
  record.sender = testsupport::MakeUser("alice");
  record.content = content;
  record.timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
  return record;
}
}  // namespace

TEST(MessageRecordTest, JsonShape) {
  auto json = chatrelay::ToJson(MakeRecord("msg-a-1", "hi"));
  EXPECT_EQ(json["id"], "msg-a-1");
  EXPECT_EQ(json["chatroom_id"], "r1");
  EXPECT_EQ(json["user_id"], "alice");
  EXPECT_EQ(json["username"], "alice");
  EXPECT_EQ(json["display_name"], "User alice");
  EXPECT_EQ(json["content"], "hi");
  EXPECT_EQ(json["message_type"], "text");
  EXPECT_EQ(json["timestamp"], "2023-11-14T22:13:20.123Z");
  EXPECT_TRUE(json["client_id"].is_null());
  EXPECT_FALSE(json["edited"].get<bool>());
  EXPECT_TRUE(json["reactions"].is_array());
}

TEST(MessageIdGeneratorTest, SequentialAndUniqueAcrossThreads) {
  chatrelay::MessageIdGenerator ids("s1");
  EXPECT_EQ(ids.Next(), "msg-s1-1");
  EXPECT_EQ(ids.Next(), "msg-s1-2");

  std::mutex mutex;
  std::set<std::string> seen;
  std::vector<std::thread> threads;
  for (int t = 0; t < 4; ++t) {
    threads.emplace_back([&] {
      for (int i = 0; i < 100; ++i) {
        auto id = ids.Next();
        std::lock_guard<std::mutex> lock(mutex);
        seen.insert(id);
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(seen.size(), 400u);
}

TEST(AsyncMessageWriterTest, ShutdownDrainsPendingWrites) {
  auto store = std::make_shared<testsupport::RecordingMessageStore>();
  auto observability = std::make_shared<chatrelay::Observability>(chatrelay::LogLevel::kError);
  chatrelay::AsyncMessageWriter writer(store, observability, 2);
  for (int i = 0; i < 20; ++i) {
    writer.Submit(MakeRecord("msg-a-" + std::to_string(i), "m"));
  }
  writer.Shutdown();
  EXPECT_EQ(store->Records().size(), 20u);

  writer.Submit(MakeRecord("msg-a-late", "late"));
  writer.Shutdown();
  EXPECT_EQ(store->Records().size(), 20u);
}

TEST(AsyncMessageWriterTest, FailuresAreCountedNotThrown) {
  auto store = std::make_shared<testsupport::RecordingMessageStore>();
  store->SetFailing(true);
  auto observability = std::make_shared<chatrelay::Observability>(chatrelay::LogLevel::kError);
  chatrelay::AsyncMessageWriter writer(store, observability, 1);
  writer.Submit(MakeRecord("msg-a-1", "x"));
  writer.Submit(MakeRecord("msg-a-2", "y"));
  writer.Shutdown();
  EXPECT_EQ(observability->Value(chatrelay::Metric::kPersistFailures), 2u);
  EXPECT_TRUE(store->Records().empty());
}

TEST(LoggingMessageStoreTest, AlwaysAccepts) {
  auto observability = std::make_shared<chatrelay::Observability>(chatrelay::LogLevel::kError);
  chatrelay::LoggingMessageStore store(observability);
  EXPECT_TRUE(store.Store(MakeRecord("msg-a-1", "hello")));
}
