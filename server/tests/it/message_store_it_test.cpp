#include <cstdlib>
#include <string>

#include <gtest/gtest.h>
#include <mariadb/mysql.h>

#include "chatrelay/chat_directory.hpp"
#include "chatrelay/db_client.hpp"
#include "chatrelay/message_store.hpp"

namespace {

chatrelay::DbConfig TestDbConfig() {
  chatrelay::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "chat_db";
  return cfg;
}

void Exec(chatrelay::MariaDbClient& db, const std::string& sql) {
  db.WithConnectionRetry([&](MYSQL* conn) {
    if (mysql_query(conn, sql.c_str()) != 0) {
      db.RaiseError(conn, "테스트 스키마 준비 실패");
    }
  });
}

void PrepareSchema(chatrelay::MariaDbClient& db) {
  Exec(db,
       "CREATE TABLE IF NOT EXISTS users (id VARCHAR(64) PRIMARY KEY, username VARCHAR(64) NOT NULL, "
       "display_name VARCHAR(128), is_active TINYINT(1) NOT NULL DEFAULT 1) DEFAULT CHARSET=utf8mb4;");
  Exec(db,
       "CREATE TABLE IF NOT EXISTS chatroom_members (chatroom_id VARCHAR(64) NOT NULL, user_id VARCHAR(64) NOT NULL, "
       "PRIMARY KEY (chatroom_id, user_id)) DEFAULT CHARSET=utf8mb4;");
  Exec(db,
       "CREATE TABLE IF NOT EXISTS messages (id VARCHAR(96) PRIMARY KEY, chatroom_id VARCHAR(64) NOT NULL, "
       "user_id VARCHAR(64) NOT NULL, content TEXT NOT NULL, message_type VARCHAR(16) NOT NULL, "
       "created_at DATETIME(6) NOT NULL, INDEX idx_messages_room (chatroom_id)) DEFAULT CHARSET=utf8mb4;");
  Exec(db, "DELETE FROM messages;");
  Exec(db, "DELETE FROM chatroom_members;");
  Exec(db, "DELETE FROM users;");
  Exec(db,
       "INSERT INTO users(id, username, display_name, is_active) VALUES "
       "('u1', 'alpha', 'Alpha', 1), ('u2', 'beta', NULL, 1), ('u3', 'gamma', 'Gamma', 0);");
  Exec(db, "INSERT INTO chatroom_members(chatroom_id, user_id) VALUES ('room-1', 'u1');");
}

chatrelay::MessageRecord SampleRecord(const std::string& id, const std::string& content) {
  chatrelay::MessageRecord record;
  record.id = id;
  record.chatroom_id = "room-1";
  record.sender = chatrelay::ChatUser{"u1", "alpha", "Alpha"};
  record.content = content;
  record.timestamp = std::chrono::system_clock::now();
  return record;
}

class MariaDbFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    db_client_ = std::make_shared<chatrelay::MariaDbClient>(TestDbConfig());
    PrepareSchema(*db_client_);
  }

  std::shared_ptr<chatrelay::MariaDbClient> db_client_;
};

}  // namespace

TEST_F(MariaDbFixture, DuplicateMessageIdIsStoredOnce) {
  chatrelay::MariaDbMessageStore store(db_client_);
  EXPECT_TRUE(store.Store(SampleRecord("msg-it-1", "안녕하세요 👋")));
  EXPECT_FALSE(store.Store(SampleRecord("msg-it-1", "again")));
  EXPECT_TRUE(store.Store(SampleRecord("msg-it-2", "it's quoted")));
  EXPECT_EQ(store.CountInChatroom("room-1"), 2u);
  EXPECT_EQ(store.CountInChatroom("room-2"), 0u);
}

TEST_F(MariaDbFixture, AsyncWriterPersistsInBackground) {
  auto store = std::make_shared<chatrelay::MariaDbMessageStore>(db_client_);
  auto observability = std::make_shared<chatrelay::Observability>(chatrelay::LogLevel::kError);
  chatrelay::AsyncMessageWriter writer(store, observability, 2);
  for (int i = 0; i < 10; ++i) {
    writer.Submit(SampleRecord("msg-it-async-" + std::to_string(i), "payload"));
  }
  writer.Shutdown();
  EXPECT_EQ(store->CountInChatroom("room-1"), 10u);
  EXPECT_EQ(observability->Value(chatrelay::Metric::kPersistFailures), 0u);
}

TEST_F(MariaDbFixture, TransientFailureIsRetried) {
  chatrelay::MariaDbMessageStore store(db_client_);
  db_client_->SetTransientInjector([](std::size_t attempt) { return attempt == 1; });
  EXPECT_TRUE(store.Store(SampleRecord("msg-it-retry", "retry")));
  db_client_->SetTransientInjector(nullptr);
  EXPECT_EQ(store.CountInChatroom("room-1"), 1u);
}

TEST_F(MariaDbFixture, PersistentFailureSurfacesAfterRetries) {
  chatrelay::MariaDbMessageStore store(db_client_);
  db_client_->SetTransientInjector([](std::size_t) { return true; });
  EXPECT_THROW(store.Store(SampleRecord("msg-it-fail", "never")), chatrelay::DbException);
  db_client_->SetTransientInjector(nullptr);
  EXPECT_EQ(store.CountInChatroom("room-1"), 0u);
}

TEST_F(MariaDbFixture, DirectoryResolvesActiveUsersAndMembership) {
  chatrelay::MariaDbChatDirectory directory(db_client_);
  chatrelay::TokenClaims claims;
  claims.subject = "u1";
  auto alpha = directory.FindActiveUser(claims);
  ASSERT_TRUE(alpha.has_value());
  EXPECT_EQ(alpha->username, "alpha");
  EXPECT_EQ(alpha->display_name, "Alpha");

  claims.subject = "u2";
  auto beta = directory.FindActiveUser(claims);
  ASSERT_TRUE(beta.has_value());
  EXPECT_EQ(beta->display_name, "beta");

  claims.subject = "u3";
  EXPECT_FALSE(directory.FindActiveUser(claims).has_value());
  claims.subject = "nobody";
  EXPECT_FALSE(directory.FindActiveUser(claims).has_value());

  EXPECT_TRUE(directory.IsMember("u1", "room-1"));
  EXPECT_FALSE(directory.IsMember("u2", "room-1"));
}
