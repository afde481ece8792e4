/*
 * 설명: 사용자/채팅방/전체 대상 이벤트 전달을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/dispatcher_test.cpp
 */
#include "chatrelay/dispatcher.hpp"

namespace chatrelay {

Dispatcher::Dispatcher(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<SubscriptionIndex> subscriptions,
                       std::shared_ptr<Observability> observability)
    : registry_(std::move(registry)),
      subscriptions_(std::move(subscriptions)),
      observability_(std::move(observability)) {}

std::size_t Dispatcher::ToUser(const std::string& user_id, const Envelope& env) {
  return registry_->Deliver(user_id, Serialize(env));
}

std::size_t Dispatcher::ToChatroom(const std::string& chatroom_id, const Envelope& env,
                                   const std::optional<std::string>& exclude_user_id) {
  auto members = subscriptions_->Members(chatroom_id);
  if (members.empty()) {
    return 0;
  }
  auto recipients = Fanout(members, Serialize(env), exclude_user_id);
  if (observability_ && observability_->Enabled(LogLevel::kDebug)) {
    observability_->Debug("chatroom_dispatch",
                          {{"chatroomId", chatroom_id}, {"event", env.event}, {"recipients", recipients}});
  }
  return recipients;
}

std::size_t Dispatcher::ToAll(const Envelope& env, const std::optional<std::string>& exclude_user_id) {
  return Fanout(registry_->OnlineUsers(), Serialize(env), exclude_user_id);
}

std::size_t Dispatcher::ToUsers(const UserSet& user_ids, const Envelope& env,
                                const std::optional<std::string>& exclude_user_id) {
  if (user_ids.empty()) {
    return 0;
  }
  return Fanout(user_ids, Serialize(env), exclude_user_id);
}

std::size_t Dispatcher::Fanout(const UserSet& user_ids, const std::shared_ptr<const std::string>& frame,
                               const std::optional<std::string>& exclude_user_id) {
  std::size_t recipients = 0;
  for (const auto& user_id : user_ids) {
    if (exclude_user_id && user_id == *exclude_user_id) {
      continue;
    }
    // 실패한 연결은 Deliver 안에서 제거되고 나머지 수신자에는 영향이 없다.
    if (registry_->Deliver(user_id, frame) > 0) {
      ++recipients;
    }
  }
  return recipients;
}

}  // namespace chatrelay
