/*
 * 설명: 첫 연결/마지막 연결 해제 시 last_seen 갱신과 프레즌스 이벤트 전파를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/presence_tracker_test.cpp
 */
#include "chatrelay/presence_tracker.hpp"

#include "chatrelay/envelope.hpp"

namespace chatrelay {

PresenceTracker::PresenceTracker(std::shared_ptr<ConnectionRegistry> registry,
                                 std::shared_ptr<SubscriptionIndex> subscriptions,
                                 std::shared_ptr<Dispatcher> dispatcher)
    : registry_(std::move(registry)), subscriptions_(std::move(subscriptions)), dispatcher_(std::move(dispatcher)) {}

void PresenceTracker::OnFirstConnection(const ChatUser& user) {
  auto env = MakePresenceEvent(user, true);
  Touch(user.user_id, env.timestamp);
  auto audience = Audience(subscriptions_->RoomsOf(user.user_id));
  dispatcher_->ToUsers(audience, env, user.user_id);
}

void PresenceTracker::OnLastDisconnection(const ChatUser& user, const std::vector<std::string>& purged_rooms) {
  auto env = MakePresenceEvent(user, false);
  Touch(user.user_id, env.timestamp);
  auto audience = Audience(purged_rooms);
  dispatcher_->ToUsers(audience, env, user.user_id);
}

PresenceRecord PresenceTracker::Get(const std::string& user_id) const {
  PresenceRecord record;
  record.online = registry_->ConnectionCount(user_id) > 0;
  const auto& shard = shards_.For(user_id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.last_seen.find(user_id);
  if (it != shard.last_seen.end()) {
    record.last_seen = it->second;
  }
  return record;
}

std::size_t PresenceTracker::TrackedCount() const {
  std::size_t count = 0;
  for (const auto& shard : shards_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    count += shard.last_seen.size();
  }
  return count;
}

void PresenceTracker::Touch(const std::string& user_id, std::chrono::system_clock::time_point when) {
  auto& shard = shards_.For(user_id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  shard.last_seen[user_id] = when;
}

UserSet PresenceTracker::Audience(const std::vector<std::string>& rooms) const {
  UserSet audience;
  for (const auto& chatroom_id : rooms) {
    auto members = subscriptions_->Members(chatroom_id);
    audience.insert(members.begin(), members.end());
  }
  return audience;
}

}  // namespace chatrelay
