/*
 * 설명: 메시지 레코드 직렬화, MariaDB 저장, 스레드 풀 기반 비동기 기록을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_store_test.cpp, server/tests/it/message_store_it_test.cpp
 */
#include "chatrelay/message_store.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include <boost/asio/post.hpp>

#include "chatrelay/envelope.hpp"

namespace chatrelay {
namespace {
constexpr unsigned int kDuplicateEntry = 1062;

std::string ToDbTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp.time_since_epoch()).count() % 1000000;
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(6) << std::setfill('0') << micros;
  return oss.str();
}
}  // namespace

nlohmann::json ToJson(const MessageRecord& record) {
  return nlohmann::json{{"id", record.id},
                        {"chatroom_id", record.chatroom_id},
                        {"user_id", record.sender.user_id},
                        {"username", record.sender.username},
                        {"display_name", record.sender.display_name},
                        {"content", record.content},
                        {"message_type", record.message_type},
                        {"timestamp", ToIsoString(record.timestamp)},
                        {"client_id", record.client_id ? nlohmann::json(*record.client_id) : nlohmann::json(nullptr)},
                        {"edited", false},
                        {"reactions", nlohmann::json::array()}};
}

std::string MessageIdGenerator::Next() {
  return "msg-" + server_id_ + "-" + std::to_string(sequence_.fetch_add(1) + 1);
}

MariaDbMessageStore::MariaDbMessageStore(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

bool MariaDbMessageStore::Store(const MessageRecord& record) {
  bool inserted = true;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "INSERT INTO messages(id, chatroom_id, user_id, content, message_type, created_at) VALUES('"
        << db_client_->Escape(conn, record.id) << "', '" << db_client_->Escape(conn, record.chatroom_id) << "', '"
        << db_client_->Escape(conn, record.sender.user_id) << "', '" << db_client_->Escape(conn, record.content)
        << "', '" << db_client_->Escape(conn, record.message_type) << "', '" << ToDbTimestamp(record.timestamp)
        << "');";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      if (mysql_errno(conn) == kDuplicateEntry) {
        inserted = false;
        return;
      }
      db_client_->RaiseError(conn, "메시지 저장 실패");
    }
  });
  return inserted;
}

std::size_t MariaDbMessageStore::CountInChatroom(const std::string& chatroom_id) const {
  std::size_t count = 0;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT COUNT(*) FROM messages WHERE chatroom_id='" << db_client_->Escape(conn, chatroom_id) << "';";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "메시지 카운트 실패");
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "카운트 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row && row[0]) {
      count = static_cast<std::size_t>(std::stoull(row[0]));
    }
    mysql_free_result(res);
  });
  return count;
}

bool LoggingMessageStore::Store(const MessageRecord& record) {
  if (observability_) {
    observability_->Info("message_stored", {{"messageId", record.id},
                                            {"chatroomId", record.chatroom_id},
                                            {"userId", record.sender.user_id},
                                            {"length", record.content.size()}});
  }
  return true;
}

AsyncMessageWriter::AsyncMessageWriter(std::shared_ptr<MessageStore> store,
                                       std::shared_ptr<Observability> observability, std::size_t workers)
    : store_(std::move(store)), observability_(std::move(observability)), pool_(workers == 0 ? 1 : workers) {}

AsyncMessageWriter::~AsyncMessageWriter() { Shutdown(); }

void AsyncMessageWriter::Submit(MessageRecord record) {
  if (stopped_) {
    return;
  }
  boost::asio::post(pool_, [store = store_, observability = observability_, record = std::move(record)]() {
    try {
      store->Store(record);
    } catch (const std::exception& ex) {
      if (observability) {
        observability->Increment(Metric::kPersistFailures);
        observability->Error("message_persist_failed",
                             {{"messageId", record.id}, {"chatroomId", record.chatroom_id}, {"reason", ex.what()}});
      }
    }
  });
}

void AsyncMessageWriter::Shutdown() {
  if (stopped_.exchange(true)) {
    return;
  }
  pool_.join();
}

}  // namespace chatrelay
