/*
 * 설명: 엔벨로프 직렬화/파싱과 송신 이벤트 페이로드 구성을 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/envelope_test.cpp
 */
#include "chatrelay/envelope.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

namespace chatrelay {

std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  auto millis =
      std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  if (millis < 0) {
    millis += 1000;
  }
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return oss.str();
}

Envelope MakeEnvelope(std::string_view event, nlohmann::json data) {
  return Envelope{std::string(event), std::move(data), std::chrono::system_clock::now()};
}

nlohmann::json ToWire(const Envelope& env) {
  nlohmann::json j;
  j["event"] = env.event;
  j["data"] = env.data.is_null() ? nlohmann::json::object() : env.data;
  return j;
}

std::shared_ptr<const std::string> Serialize(const Envelope& env) {
  return std::make_shared<const std::string>(
      ToWire(env).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

std::optional<Envelope> ParseInbound(std::string_view text, std::string& error) {
  nlohmann::json message;
  try {
    message = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error&) {
    error = "JSON 파싱 오류";
    return std::nullopt;
  }
  if (!message.is_object()) {
    error = "메시지는 JSON 객체여야 합니다";
    return std::nullopt;
  }
  auto env = FromWire(message);
  if (!env) {
    error = "event 또는 data 형식이 올바르지 않습니다";
  }
  return env;
}

std::optional<Envelope> FromWire(const nlohmann::json& wire) {
  if (!wire.is_object()) {
    return std::nullopt;
  }
  auto event_it = wire.find("event");
  if (event_it == wire.end() || !event_it->is_string()) {
    return std::nullopt;
  }
  nlohmann::json data = nlohmann::json::object();
  auto data_it = wire.find("data");
  if (data_it != wire.end() && !data_it->is_null()) {
    if (!data_it->is_object()) {
      return std::nullopt;
    }
    data = *data_it;
  }
  return Envelope{event_it->get<std::string>(), std::move(data), std::chrono::system_clock::now()};
}

Envelope MakeConnectedEvent(const ChatUser& user, ConnectionId connection_id) {
  auto now = std::chrono::system_clock::now();
  return Envelope{std::string(events::kConnected),
                  {{"user_id", user.user_id},
                   {"username", user.username},
                   {"display_name", user.display_name},
                   {"connection_id", connection_id},
                   {"timestamp", ToIsoString(now)}},
                  now};
}

Envelope MakeUserJoinedEvent(const ChatUser& user, const std::string& chatroom_id) {
  auto now = std::chrono::system_clock::now();
  return Envelope{
      std::string(events::kUserJoined),
      {{"user", {{"id", user.user_id}, {"username", user.username}, {"display_name", user.display_name}}},
       {"chatroom_id", chatroom_id},
       {"timestamp", ToIsoString(now)}},
      now};
}

Envelope MakeUserLeftEvent(const ChatUser& user, const std::string& chatroom_id) {
  auto now = std::chrono::system_clock::now();
  return Envelope{std::string(events::kUserLeft),
                  {{"user_id", user.user_id}, {"chatroom_id", chatroom_id}, {"timestamp", ToIsoString(now)}},
                  now};
}

Envelope MakeMessageReceivedEvent(const nlohmann::json& message) {
  return Envelope{std::string(events::kMessageReceived), {{"message", message}}, std::chrono::system_clock::now()};
}

Envelope MakeTypingIndicatorEvent(const ChatUser& user, const std::string& chatroom_id, bool is_typing) {
  auto now = std::chrono::system_clock::now();
  return Envelope{std::string(events::kTypingIndicator),
                  {{"user_id", user.user_id},
                   {"username", user.username},
                   {"chatroom_id", chatroom_id},
                   {"is_typing", is_typing},
                   {"timestamp", ToIsoString(now)}},
                  now};
}

Envelope MakePresenceEvent(const ChatUser& user, bool online) {
  auto now = std::chrono::system_clock::now();
  return Envelope{std::string(online ? events::kUserOnline : events::kUserOffline),
                  {{"user_id", user.user_id},
                   {"username", user.username},
                   {"display_name", user.display_name},
                   {"status", online ? "online" : "offline"},
                   {"timestamp", ToIsoString(now)}},
                  now};
}

Envelope MakePongEvent() {
  auto now = std::chrono::system_clock::now();
  return Envelope{std::string(events::kPong), {{"timestamp", ToIsoString(now)}}, now};
}

Envelope MakeErrorEvent(std::string_view code, std::string_view message,
                        const std::optional<std::string>& chatroom_id) {
  auto now = std::chrono::system_clock::now();
  nlohmann::json data{{"code", code}, {"message", message}, {"timestamp", ToIsoString(now)}};
  if (chatroom_id) {
    data["chatroom_id"] = *chatroom_id;
  }
  return Envelope{std::string(events::kError), std::move(data), now};
}

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", ToIsoString(std::chrono::system_clock::now())}};
  return envelope;
}

}  // namespace chatrelay
