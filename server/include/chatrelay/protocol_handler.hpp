/*
 * 설명: 연결 하나의 상태 머신(CONNECTING → AUTHENTICATED → ACTIVE → CLOSED)과 수신 이벤트 라우팅.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_handler_test.cpp, server/tests/e2e/realtime_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "chatrelay/auth.hpp"
#include "chatrelay/chat_directory.hpp"
#include "chatrelay/connection.hpp"
#include "chatrelay/connection_registry.hpp"
#include "chatrelay/dispatcher.hpp"
#include "chatrelay/fanout_bridge.hpp"
#include "chatrelay/message_store.hpp"
#include "chatrelay/observability.hpp"
#include "chatrelay/subscription_index.hpp"

namespace chatrelay {

// 모든 연결이 공유하는 서비스 묶음. bridge와 message_writer는 비어 있을 수 있다.
struct RealtimeServices {
  std::shared_ptr<TokenVerifier> token_verifier;
  std::shared_ptr<ChatDirectory> directory;
  std::shared_ptr<ConnectionRegistry> registry;
  std::shared_ptr<SubscriptionIndex> subscriptions;
  std::shared_ptr<Dispatcher> dispatcher;
  std::shared_ptr<FanoutBridge> bridge;
  std::shared_ptr<AsyncMessageWriter> message_writer;
  std::shared_ptr<MessageIdGenerator> message_ids;
  std::shared_ptr<Observability> observability;
};

enum class ConnectionState { kConnecting, kAuthenticated, kActive, kClosed };

std::string_view ToString(ConnectionState state);

// 연결의 strand 위에서만 호출된다. HandleClosed만 다른 스레드(소멸자)에서 올 수 있다.
class ProtocolHandler {
 public:
  ProtocolHandler(Connection& connection, RealtimeServices services);

  // 토큰 검증, 사용자 조회, 레지스트리 등록을 수행한다. 실패하면 연결을 닫고 false.
  bool Open(const std::string& token, const std::shared_ptr<Connection>& self);
  void HandleFrame(std::string_view text);
  // 멱등. ACTIVE였던 경우에만 레지스트리에서 제거한다.
  void HandleClosed();

  ConnectionState State() const { return state_.load(); }
  const ChatUser& User() const { return user_; }

 private:
  void HandleJoin(const nlohmann::json& data);
  void HandleLeave(const nlohmann::json& data);
  void HandleSendMessage(const nlohmann::json& data);
  void HandleTyping(const nlohmann::json& data, bool is_typing);
  void HandlePing();

  std::optional<std::string> ReadChatroomId(const nlohmann::json& data);
  bool Authorize(const std::string& chatroom_id);
  void Broadcast(const std::string& chatroom_id, const Envelope& env, const std::optional<std::string>& exclude);
  void SendError(std::string_view code, std::string_view message,
                 const std::optional<std::string>& chatroom_id = std::nullopt);
  void Reject(std::uint16_t code, const std::string& reason, const std::string& message);

  Connection& connection_;
  RealtimeServices services_;
  std::atomic<ConnectionState> state_{ConnectionState::kConnecting};
  ChatUser user_;
};

}  // namespace chatrelay
