/*
 * 설명: 전달 대상(사용자/채팅방/전체)을 연결 집합으로 풀어 비차단 전송을 요청한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/dispatcher_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "chatrelay/connection_registry.hpp"
#include "chatrelay/envelope.hpp"
#include "chatrelay/observability.hpp"
#include "chatrelay/subscription_index.hpp"

namespace chatrelay {

// 모든 전송은 호출 스레드에서 순서대로 요청되고, 각 연결은 자기 strand에서 FIFO로 내보낸다.
// 따라서 같은 발신자가 연속 호출한 이벤트는 모든 수신 연결에 호출 순서대로 도착한다.
class Dispatcher {
 public:
  Dispatcher(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<SubscriptionIndex> subscriptions,
             std::shared_ptr<Observability> observability = nullptr);

  std::size_t ToUser(const std::string& user_id, const Envelope& env);
  // 전송을 요청한 수신 사용자 수를 반환한다.
  std::size_t ToChatroom(const std::string& chatroom_id, const Envelope& env,
                         const std::optional<std::string>& exclude_user_id = std::nullopt);
  std::size_t ToAll(const Envelope& env, const std::optional<std::string>& exclude_user_id = std::nullopt);
  std::size_t ToUsers(const UserSet& user_ids, const Envelope& env,
                      const std::optional<std::string>& exclude_user_id = std::nullopt);

 private:
  std::size_t Fanout(const UserSet& user_ids, const std::shared_ptr<const std::string>& frame,
                     const std::optional<std::string>& exclude_user_id);

  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<SubscriptionIndex> subscriptions_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace chatrelay
