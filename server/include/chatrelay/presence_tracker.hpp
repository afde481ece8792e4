/*
 * 설명: 레지스트리 전이로부터 사용자 프레즌스를 파생하고 user_online/user_offline을 알린다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/presence_tracker_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "chatrelay/connection_registry.hpp"
#include "chatrelay/dispatcher.hpp"
#include "chatrelay/sharding.hpp"
#include "chatrelay/subscription_index.hpp"

namespace chatrelay {

struct PresenceRecord {
  bool online{false};
  std::optional<std::chrono::system_clock::time_point> last_seen;
};

class PresenceTracker : public PresenceListener {
 public:
  PresenceTracker(std::shared_ptr<ConnectionRegistry> registry, std::shared_ptr<SubscriptionIndex> subscriptions,
                  std::shared_ptr<Dispatcher> dispatcher);

  void OnFirstConnection(const ChatUser& user) override;
  void OnLastDisconnection(const ChatUser& user, const std::vector<std::string>& purged_rooms) override;

  // online은 저장하지 않고 조회 시점의 연결 수로 계산한다.
  PresenceRecord Get(const std::string& user_id) const;
  std::size_t TrackedCount() const;

 private:
  struct Shard {
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::chrono::system_clock::time_point> last_seen;
  };

  void Touch(const std::string& user_id, std::chrono::system_clock::time_point when);
  UserSet Audience(const std::vector<std::string>& rooms) const;

  std::shared_ptr<ConnectionRegistry> registry_;
  std::shared_ptr<SubscriptionIndex> subscriptions_;
  std::shared_ptr<Dispatcher> dispatcher_;
  ShardArray<Shard> shards_;
};

}  // namespace chatrelay
