/*
 * 설명: 채팅방 이벤트를 pub/sub 채널로 내보내고, 다른 프로세스가 보낸 이벤트를 로컬로 재전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/fanout_bridge_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "chatrelay/dispatcher.hpp"
#include "chatrelay/envelope.hpp"
#include "chatrelay/observability.hpp"
#include "chatrelay/pubsub.hpp"

namespace chatrelay {

class FanoutBridge : public std::enable_shared_from_this<FanoutBridge> {
 public:
  FanoutBridge(std::string server_id, std::string channel_prefix, std::shared_ptr<PubSubTransport> transport,
               std::shared_ptr<Dispatcher> dispatcher, std::shared_ptr<Observability> observability);

  // 최대 한 번 전달. 실패는 기록만 하고 호출자에게 전파하지 않는다.
  void Publish(const std::string& chatroom_id, const Envelope& env,
               const std::optional<std::string>& exclude_user_id = std::nullopt);

  void Start();
  void Stop();

  std::string ChannelFor(const std::string& chatroom_id) const;
  const std::string& ServerId() const { return server_id_; }

  // 구독 루프가 호출한다. 자기 프로세스가 보낸 프레임은 건너뛴다.
  void HandleIncoming(const std::string& channel, const std::string& payload);

 private:
  std::string server_id_;
  std::string channel_prefix_;
  std::shared_ptr<PubSubTransport> transport_;
  std::shared_ptr<Dispatcher> dispatcher_;
  std::shared_ptr<Observability> observability_;
};

}  // namespace chatrelay
