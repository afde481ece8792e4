/*
 * 설명: WS 이벤트 엔벨로프({event, data})와 REST 응답 엔벨로프 생성/파싱을 담당한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/envelope_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "chatrelay/connection.hpp"

namespace chatrelay {

namespace events {
// 수신
inline constexpr std::string_view kJoinChatroom = "join_chatroom";
inline constexpr std::string_view kLeaveChatroom = "leave_chatroom";
inline constexpr std::string_view kSendMessage = "send_message";
inline constexpr std::string_view kTypingStart = "typing_start";
inline constexpr std::string_view kTypingStop = "typing_stop";
inline constexpr std::string_view kPing = "ping";
// 송신
inline constexpr std::string_view kConnected = "connected";
inline constexpr std::string_view kUserJoined = "user_joined";
inline constexpr std::string_view kUserLeft = "user_left";
inline constexpr std::string_view kMessageReceived = "message_received";
inline constexpr std::string_view kTypingIndicator = "typing_indicator";
inline constexpr std::string_view kUserOnline = "user_online";
inline constexpr std::string_view kUserOffline = "user_offline";
inline constexpr std::string_view kPong = "pong";
inline constexpr std::string_view kError = "error";
}  // namespace events

struct Envelope {
  std::string event;
  nlohmann::json data;
  std::chrono::system_clock::time_point timestamp;
};

std::string ToIsoString(std::chrono::system_clock::time_point tp);

Envelope MakeEnvelope(std::string_view event, nlohmann::json data);
nlohmann::json ToWire(const Envelope& env);
// 직렬화는 한 번만 하고 모든 수신 연결이 같은 버퍼를 공유한다.
std::shared_ptr<const std::string> Serialize(const Envelope& env);

// 수신 프레임을 파싱한다. 실패 시 std::nullopt와 함께 error에 사유를 채운다.
std::optional<Envelope> ParseInbound(std::string_view text, std::string& error);
std::optional<Envelope> FromWire(const nlohmann::json& wire);

Envelope MakeConnectedEvent(const ChatUser& user, ConnectionId connection_id);
Envelope MakeUserJoinedEvent(const ChatUser& user, const std::string& chatroom_id);
Envelope MakeUserLeftEvent(const ChatUser& user, const std::string& chatroom_id);
Envelope MakeMessageReceivedEvent(const nlohmann::json& message);
Envelope MakeTypingIndicatorEvent(const ChatUser& user, const std::string& chatroom_id, bool is_typing);
Envelope MakePresenceEvent(const ChatUser& user, bool online);
Envelope MakePongEvent();
Envelope MakeErrorEvent(std::string_view code, std::string_view message,
                        const std::optional<std::string>& chatroom_id = std::nullopt);

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);

}  // namespace chatrelay
