/*
 * 설명: 채팅 메시지 레코드와 비동기 영속화 협력자(MariaDB/로그)를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/message_store_test.cpp, server/tests/it/message_store_it_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/thread_pool.hpp>
#include <nlohmann/json.hpp>

#include "chatrelay/connection.hpp"
#include "chatrelay/db_client.hpp"
#include "chatrelay/observability.hpp"

namespace chatrelay {

struct MessageRecord {
  std::string id;
  std::string chatroom_id;
  ChatUser sender;
  std::string content;
  std::string message_type{"text"};
  std::chrono::system_clock::time_point timestamp;
  std::optional<std::string> client_id;
};

nlohmann::json ToJson(const MessageRecord& record);

// msg-<server_id>-<sequence> 형식의 프로세스 내 유일 ID.
class MessageIdGenerator {
 public:
  explicit MessageIdGenerator(std::string server_id) : server_id_(std::move(server_id)) {}
  std::string Next();

 private:
  std::string server_id_;
  std::atomic<std::uint64_t> sequence_{0};
};

class MessageStore {
 public:
  virtual ~MessageStore() = default;
  // 이미 저장된 ID면 false.
  virtual bool Store(const MessageRecord& record) = 0;
};

class MariaDbMessageStore : public MessageStore {
 public:
  explicit MariaDbMessageStore(std::shared_ptr<MariaDbClient> db_client);

  bool Store(const MessageRecord& record) override;
  std::size_t CountInChatroom(const std::string& chatroom_id) const;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

// DB 없이 실행할 때 저장 대신 구조화 로그를 남긴다.
class LoggingMessageStore : public MessageStore {
 public:
  explicit LoggingMessageStore(std::shared_ptr<Observability> observability)
      : observability_(std::move(observability)) {}

  bool Store(const MessageRecord& record) override;

 private:
  std::shared_ptr<Observability> observability_;
};

// 영속화를 별도 스레드 풀에서 fire-and-forget으로 실행한다. 재시도하지 않는다.
class AsyncMessageWriter {
 public:
  AsyncMessageWriter(std::shared_ptr<MessageStore> store, std::shared_ptr<Observability> observability,
                     std::size_t workers);
  ~AsyncMessageWriter();

  void Submit(MessageRecord record);
  // 대기 중인 작업을 모두 처리하고 풀을 종료한다.
  void Shutdown();

 private:
  std::shared_ptr<MessageStore> store_;
  std::shared_ptr<Observability> observability_;
  boost::asio::thread_pool pool_;
  std::atomic<bool> stopped_{false};
};

}  // namespace chatrelay
