#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "chatrelay/auth.hpp"
#include "chatrelay/chat_directory.hpp"
#include "chatrelay/connection.hpp"
#include "chatrelay/connection_registry.hpp"
#include "chatrelay/dispatcher.hpp"
#include "chatrelay/fanout_bridge.hpp"
#include "chatrelay/message_store.hpp"
#include "chatrelay/observability.hpp"
#include "chatrelay/presence_tracker.hpp"
#include "chatrelay/protocol_handler.hpp"
#include "chatrelay/pubsub.hpp"
#include "chatrelay/subscription_index.hpp"

namespace testsupport {

inline constexpr const char* kSecret = "test-secret";

inline std::string MakeToken(const std::string& subject, const std::string& username,
                             const std::string& type = "access",
                             std::chrono::seconds ttl = std::chrono::seconds(3600),
                             const std::string& secret = kSecret) {
  auto exp = std::chrono::duration_cast<std::chrono::seconds>(
                 (std::chrono::system_clock::now() + ttl).time_since_epoch())
                 .count();
  nlohmann::json header{{"alg", "HS256"}, {"typ", "JWT"}};
  nlohmann::json payload{{"sub", subject}, {"username", username}, {"type", type}, {"exp", exp}};
  auto signing_input = chatrelay::Base64UrlEncode(header.dump()) + "." + chatrelay::Base64UrlEncode(payload.dump());
  return signing_input + "." + chatrelay::Base64UrlEncode(chatrelay::HmacSha256(secret, signing_input));
}

// 보낸 프레임과 종료 요청을 기록한다.
class Recorder {
 public:
  bool Record(const std::shared_ptr<const std::string>& frame) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (broken_ || close_code_) {
      return false;
    }
    frames_.push_back(nlohmann::json::parse(*frame));
    return true;
  }

  void RecordClose(std::uint16_t code, const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!close_code_) {
      close_code_ = code;
      close_reason_ = reason;
    }
  }

  void Break() {
    std::lock_guard<std::mutex> lock(mutex_);
    broken_ = true;
  }

  std::vector<nlohmann::json> Frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_;
  }

  std::vector<nlohmann::json> Events(const std::string& event) const {
    std::vector<nlohmann::json> matched;
    for (const auto& frame : Frames()) {
      if (frame["event"] == event) {
        matched.push_back(frame);
      }
    }
    return matched;
  }

  std::size_t Count(const std::string& event) const { return Events(event).size(); }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.clear();
  }

  std::optional<std::uint16_t> CloseCode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_code_;
  }

  std::string CloseReason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_reason_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<nlohmann::json> frames_;
  bool broken_{false};
  std::optional<std::uint16_t> close_code_;
  std::string close_reason_;
};

class FakeConnection : public chatrelay::Connection, public Recorder {
 public:
  explicit FakeConnection(chatrelay::ChatUser user)
      : id_(chatrelay::NextConnectionId()),
        user_(std::move(user)),
        created_at_(std::chrono::system_clock::now()),
        last_activity_(std::chrono::steady_clock::now()) {}

  chatrelay::ConnectionId Id() const override { return id_; }
  const chatrelay::ChatUser& User() const override { return user_; }
  bool Send(std::shared_ptr<const std::string> frame) override { return Record(frame); }
  void Close(std::uint16_t code, const std::string& reason) override { RecordClose(code, reason); }
  std::chrono::system_clock::time_point CreatedAt() const override { return created_at_; }
  std::chrono::steady_clock::time_point LastActivity() const override { return last_activity_; }

  void SetLastActivity(std::chrono::steady_clock::time_point when) { last_activity_ = when; }

 private:
  chatrelay::ConnectionId id_;
  chatrelay::ChatUser user_;
  std::chrono::system_clock::time_point created_at_;
  std::chrono::steady_clock::time_point last_activity_;
};

inline chatrelay::ChatUser MakeUser(const std::string& id) { return {id, id, "User " + id}; }

// 프로토콜 핸들러를 실제 소켓 없이 구동한다.
class FakeClient : public chatrelay::Connection, public Recorder, public std::enable_shared_from_this<FakeClient> {
 public:
  explicit FakeClient(chatrelay::RealtimeServices services)
      : id_(chatrelay::NextConnectionId()),
        created_at_(std::chrono::system_clock::now()),
        last_activity_(std::chrono::steady_clock::now()),
        handler_(*this, std::move(services)) {}

  ~FakeClient() override { handler_.HandleClosed(); }

  bool Open(const std::string& token) { return handler_.Open(token, shared_from_this()); }
  void Receive(const nlohmann::json& frame) { ReceiveText(frame.dump()); }
  void ReceiveText(const std::string& text) {
    last_activity_ = std::chrono::steady_clock::now();
    handler_.HandleFrame(text);
  }
  void Disconnect() { handler_.HandleClosed(); }

  void Join(const std::string& chatroom_id) {
    Receive({{"event", "join_chatroom"}, {"data", {{"chatroom_id", chatroom_id}}}});
  }
  void Leave(const std::string& chatroom_id) {
    Receive({{"event", "leave_chatroom"}, {"data", {{"chatroom_id", chatroom_id}}}});
  }
  void Say(const std::string& chatroom_id, const std::string& content) {
    Receive({{"event", "send_message"}, {"data", {{"chatroom_id", chatroom_id}, {"content", content}}}});
  }

  chatrelay::ConnectionState State() const { return handler_.State(); }

  chatrelay::ConnectionId Id() const override { return id_; }
  const chatrelay::ChatUser& User() const override { return handler_.User(); }
  bool Send(std::shared_ptr<const std::string> frame) override { return Record(frame); }
  void Close(std::uint16_t code, const std::string& reason) override {
    RecordClose(code, reason);
    handler_.HandleClosed();
  }
  std::chrono::system_clock::time_point CreatedAt() const override { return created_at_; }
  std::chrono::steady_clock::time_point LastActivity() const override { return last_activity_; }

  void SetLastActivity(std::chrono::steady_clock::time_point when) { last_activity_ = when; }

 private:
  chatrelay::ConnectionId id_;
  std::chrono::system_clock::time_point created_at_;
  std::chrono::steady_clock::time_point last_activity_;
  chatrelay::ProtocolHandler handler_;
};

// 기본 허용. 거부 목록과 비활성 사용자, 장애 주입을 지원한다.
class ScriptedDirectory : public chatrelay::ChatDirectory {
 public:
  std::optional<chatrelay::ChatUser> FindActiveUser(const chatrelay::TokenClaims& claims) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (inactive_.count(claims.subject) > 0) {
      return std::nullopt;
    }
    return chatrelay::ChatUser{claims.subject, claims.username, "User " + claims.subject};
  }

  bool IsMember(const std::string& user_id, const std::string& chatroom_id) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing_) {
      throw chatrelay::DbException("주입된 디렉터리 장애", 2013, true);
    }
    return denied_.count({user_id, chatroom_id}) == 0;
  }

  void Deny(const std::string& user_id, const std::string& chatroom_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    denied_.insert({user_id, chatroom_id});
  }
  void Deactivate(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    inactive_.insert(user_id);
  }
  void SetFailing(bool failing) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_ = failing;
  }

 private:
  std::mutex mutex_;
  std::set<std::pair<std::string, std::string>> denied_;
  std::set<std::string> inactive_;
  bool failing_{false};
};

class RecordingMessageStore : public chatrelay::MessageStore {
 public:
  bool Store(const chatrelay::MessageRecord& record) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing_) {
      throw std::runtime_error("저장소 장애");
    }
    records_.push_back(record);
    return true;
  }

  std::vector<chatrelay::MessageRecord> Records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
  }

  void SetFailing(bool failing) {
    std::lock_guard<std::mutex> lock(mutex_);
    failing_ = failing;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<chatrelay::MessageRecord> records_;
  bool failing_{false};
};

// 한 서버 프로세스에 해당하는 구성 요소 묶음.
struct TestStack {
  explicit TestStack(std::size_t max_connections_per_user = 5,
                     std::shared_ptr<chatrelay::PubSubTransport> transport = nullptr,
                     const std::string& server_id = "node-a") {
    observability = std::make_shared<chatrelay::Observability>(chatrelay::LogLevel::kError);
    directory = std::make_shared<ScriptedDirectory>();
    store = std::make_shared<RecordingMessageStore>();

    services.observability = observability;
    services.token_verifier = std::make_shared<chatrelay::TokenVerifier>(kSecret);
    services.directory = directory;
    services.subscriptions = std::make_shared<chatrelay::SubscriptionIndex>();
    services.registry =
        std::make_shared<chatrelay::ConnectionRegistry>(services.subscriptions, max_connections_per_user);
    services.registry->SetObservability(observability);
    services.dispatcher =
        std::make_shared<chatrelay::Dispatcher>(services.registry, services.subscriptions, observability);
    presence = std::make_shared<chatrelay::PresenceTracker>(services.registry, services.subscriptions,
                                                            services.dispatcher);
    services.registry->SetPresenceListener(presence);
    services.message_writer = std::make_shared<chatrelay::AsyncMessageWriter>(store, observability, 1);
    services.message_ids = std::make_shared<chatrelay::MessageIdGenerator>(server_id);
    if (transport) {
      services.bridge = std::make_shared<chatrelay::FanoutBridge>(server_id, "", transport, services.dispatcher,
                                                                  observability);
      services.bridge->Start();
    }
  }

  ~TestStack() {
    if (services.bridge) {
      services.bridge->Stop();
    }
  }

  std::shared_ptr<FakeClient> Connect(const std::string& user_id) {
    auto client = std::make_shared<FakeClient>(services);
    client->Open(MakeToken(user_id, user_id));
    return client;
  }

  std::shared_ptr<chatrelay::Observability> observability;
  std::shared_ptr<ScriptedDirectory> directory;
  std::shared_ptr<RecordingMessageStore> store;
  std::shared_ptr<chatrelay::PresenceTracker> presence;
  chatrelay::RealtimeServices services;
};

}  // namespace testsupport
