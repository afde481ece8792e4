/*
 * 설명: 연결 인증/등록과 join/leave/send/typing/ping 이벤트 처리를 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_handler_test.cpp, server/tests/e2e/realtime_flow_test.cpp
 */
#include "chatrelay/protocol_handler.hpp"

#include <chrono>

#include "chatrelay/envelope.hpp"

namespace chatrelay {
namespace {
std::optional<std::string> ReadOptionalString(const nlohmann::json& data, const char* key) {
  auto it = data.find(key);
  if (it == data.end() || !it->is_string()) {
    return std::nullopt;
  }
  return it->get<std::string>();
}
}  // namespace

std::string_view ToString(ConnectionState state) {
  switch (state) {
    case ConnectionState::kConnecting:
      return "CONNECTING";
    case ConnectionState::kAuthenticated:
      return "AUTHENTICATED";
    case ConnectionState::kActive:
      return "ACTIVE";
    case ConnectionState::kClosed:
      return "CLOSED";
  }
  return "UNKNOWN";
}

ProtocolHandler::ProtocolHandler(Connection& connection, RealtimeServices services)
    : connection_(connection), services_(std::move(services)) {}

bool ProtocolHandler::Open(const std::string& token, const std::shared_ptr<Connection>& self) {
  std::string error_code;
  std::string error_message;
  auto claims = services_.token_verifier->Verify(token, error_code, error_message);
  if (!claims) {
    Reject(kCloseAuthenticationFailed, "authentication_failed", error_message);
    return false;
  }

  std::optional<ChatUser> user;
  try {
    user = services_.directory->FindActiveUser(*claims);
  } catch (const std::exception& ex) {
    services_.observability->Error("directory_lookup_failed", {{"userId", claims->subject}, {"reason", ex.what()}});
  }
  if (!user) {
    Reject(kCloseAuthenticationFailed, "authentication_failed", "비활성 또는 존재하지 않는 사용자입니다");
    return false;
  }
  user_ = std::move(*user);
  state_ = ConnectionState::kAuthenticated;

  auto added = services_.registry->Add(user_, self);
  if (!added.accepted) {
    Reject(kCloseTooManyConnections, "too_many_connections", "사용자당 최대 연결 수를 초과했습니다");
    return false;
  }
  state_ = ConnectionState::kActive;
  connection_.Send(Serialize(MakeConnectedEvent(user_, connection_.Id())));
  return true;
}

void ProtocolHandler::HandleFrame(std::string_view text) {
  if (state_ != ConnectionState::kActive) {
    return;
  }
  std::string error;
  auto env = ParseInbound(text, error);
  if (!env) {
    services_.observability->Warn("ws_frame_malformed",
                                  {{"userId", user_.user_id}, {"connectionId", connection_.Id()}, {"reason", error}});
    SendError("bad_request", error);
    return;
  }

  const auto& event = env->event;
  if (event == events::kJoinChatroom) {
    HandleJoin(env->data);
  } else if (event == events::kLeaveChatroom) {
    HandleLeave(env->data);
  } else if (event == events::kSendMessage) {
    HandleSendMessage(env->data);
  } else if (event == events::kTypingStart) {
    HandleTyping(env->data, true);
  } else if (event == events::kTypingStop) {
    HandleTyping(env->data, false);
  } else if (event == events::kPing) {
    HandlePing();
  } else {
    services_.observability->Info("ws_event_unknown", {{"userId", user_.user_id}, {"event", event}});
  }
}

void ProtocolHandler::HandleClosed() {
  auto previous = state_.exchange(ConnectionState::kClosed);
  if (previous == ConnectionState::kActive) {
    services_.registry->Remove(connection_.Id());
  }
}

void ProtocolHandler::HandleJoin(const nlohmann::json& data) {
  auto chatroom_id = ReadChatroomId(data);
  if (!chatroom_id) {
    return;
  }
  if (!Authorize(*chatroom_id)) {
    SendError("authorization_denied", "채팅방에 접근할 권한이 없습니다", chatroom_id);
    return;
  }
  if (!services_.registry->Subscribe(connection_.Id(), *chatroom_id)) {
    return;
  }
  services_.observability->Info("chatroom_joined", {{"userId", user_.user_id}, {"chatroomId", *chatroom_id}});
  Broadcast(*chatroom_id, MakeUserJoinedEvent(user_, *chatroom_id), user_.user_id);
}

void ProtocolHandler::HandleLeave(const nlohmann::json& data) {
  auto chatroom_id = ReadChatroomId(data);
  if (!chatroom_id) {
    return;
  }
  if (!services_.registry->Unsubscribe(connection_.Id(), *chatroom_id)) {
    return;
  }
  services_.observability->Info("chatroom_left", {{"userId", user_.user_id}, {"chatroomId", *chatroom_id}});
  Broadcast(*chatroom_id, MakeUserLeftEvent(user_, *chatroom_id), user_.user_id);
}

void ProtocolHandler::HandleSendMessage(const nlohmann::json& data) {
  auto chatroom_id = ReadChatroomId(data);
  if (!chatroom_id) {
    return;
  }
  auto content = ReadOptionalString(data, "content");
  if (!content || content->empty()) {
    SendError("bad_request", "content 필드가 필요합니다", chatroom_id);
    return;
  }
  // 구독하지 않은 채팅방으로의 전송은 거부한다.
  if (!services_.subscriptions->Contains(*chatroom_id, user_.user_id) || !Authorize(*chatroom_id)) {
    SendError("authorization_denied", "참여하지 않은 채팅방입니다", chatroom_id);
    return;
  }

  MessageRecord record;
  record.id = services_.message_ids->Next();
  record.chatroom_id = *chatroom_id;
  record.sender = user_;
  record.content = std::move(*content);
  record.message_type = ReadOptionalString(data, "message_type").value_or("text");
  record.timestamp = std::chrono::system_clock::now();
  record.client_id = ReadOptionalString(data, "client_id");

  auto env = MakeMessageReceivedEvent(ToJson(record));
  if (services_.message_writer) {
    services_.message_writer->Submit(record);
  }
  services_.observability->Increment(Metric::kMessagesSent);
  Broadcast(*chatroom_id, env, std::nullopt);
}

void ProtocolHandler::HandleTyping(const nlohmann::json& data, bool is_typing) {
  auto chatroom_id = ReadChatroomId(data);
  if (!chatroom_id) {
    return;
  }
  if (!services_.subscriptions->Contains(*chatroom_id, user_.user_id)) {
    services_.observability->Debug("typing_dropped", {{"userId", user_.user_id}, {"chatroomId", *chatroom_id}});
    return;
  }
  Broadcast(*chatroom_id, MakeTypingIndicatorEvent(user_, *chatroom_id, is_typing), user_.user_id);
}

void ProtocolHandler::HandlePing() { connection_.Send(Serialize(MakePongEvent())); }

std::optional<std::string> ProtocolHandler::ReadChatroomId(const nlohmann::json& data) {
  auto it = data.find("chatroom_id");
  if (it != data.end()) {
    if (it->is_string() && !it->get_ref<const std::string&>().empty()) {
      return it->get<std::string>();
    }
    if (it->is_number_integer()) {
      return std::to_string(it->get<long long>());
    }
  }
  SendError("bad_request", "chatroom_id 필드가 필요합니다");
  return std::nullopt;
}

bool ProtocolHandler::Authorize(const std::string& chatroom_id) {
  try {
    if (services_.directory->IsMember(user_.user_id, chatroom_id)) {
      return true;
    }
  } catch (const std::exception& ex) {
    services_.observability->Error("directory_membership_failed",
                                   {{"userId", user_.user_id}, {"chatroomId", chatroom_id}, {"reason", ex.what()}});
  }
  services_.observability->Warn("authorization_denied", {{"userId", user_.user_id}, {"chatroomId", chatroom_id}});
  return false;
}

void ProtocolHandler::Broadcast(const std::string& chatroom_id, const Envelope& env,
                                const std::optional<std::string>& exclude) {
  services_.dispatcher->ToChatroom(chatroom_id, env, exclude);
  if (services_.bridge) {
    services_.bridge->Publish(chatroom_id, env, exclude);
  }
}

void ProtocolHandler::SendError(std::string_view code, std::string_view message,
                                const std::optional<std::string>& chatroom_id) {
  connection_.Send(Serialize(MakeErrorEvent(code, message, chatroom_id)));
}

void ProtocolHandler::Reject(std::uint16_t code, const std::string& reason, const std::string& message) {
  if (code == kCloseAuthenticationFailed) {
    services_.observability->Increment(Metric::kAuthFailures);
  }
  services_.observability->Warn("ws_connection_rejected",
                                {{"connectionId", connection_.Id()}, {"code", code}, {"reason", reason},
                                 {"message", message}, {"state", ToString(state_.load())}});
  state_ = ConnectionState::kClosed;
  connection_.Close(code, reason);
}

}  // namespace chatrelay
