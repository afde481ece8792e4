/*
 * 설명: 채팅방 구독 인덱스의 입장/퇴장/일괄 정리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/subscription_index_test.cpp
 */
#include "chatrelay/subscription_index.hpp"

namespace chatrelay {

// 잠금 순서: 채팅방 샤드 → 사용자 샤드. PurgeUser는 두 샤드를 동시에 잡지 않는다.
bool SubscriptionIndex::Join(const std::string& user_id, const std::string& chatroom_id) {
  auto& room_shard = rooms_.For(chatroom_id);
  std::lock_guard<std::mutex> room_lock(room_shard.mutex);
  bool inserted = room_shard.members[chatroom_id].insert(user_id).second;
  if (inserted) {
    auto& user_shard = users_.For(user_id);
    std::lock_guard<std::mutex> user_lock(user_shard.mutex);
    user_shard.rooms[user_id].insert(chatroom_id);
  }
  return inserted;
}

bool SubscriptionIndex::Leave(const std::string& user_id, const std::string& chatroom_id) {
  auto& room_shard = rooms_.For(chatroom_id);
  std::lock_guard<std::mutex> room_lock(room_shard.mutex);
  auto it = room_shard.members.find(chatroom_id);
  if (it == room_shard.members.end() || it->second.erase(user_id) == 0) {
    return false;
  }
  if (it->second.empty()) {
    room_shard.members.erase(it);
  }
  auto& user_shard = users_.For(user_id);
  std::lock_guard<std::mutex> user_lock(user_shard.mutex);
  auto user_it = user_shard.rooms.find(user_id);
  if (user_it != user_shard.rooms.end()) {
    user_it->second.erase(chatroom_id);
    if (user_it->second.empty()) {
      user_shard.rooms.erase(user_it);
    }
  }
  return true;
}

std::vector<std::string> SubscriptionIndex::PurgeUser(const std::string& user_id) {
  std::unordered_set<std::string> joined;
  {
    auto& user_shard = users_.For(user_id);
    std::lock_guard<std::mutex> lock(user_shard.mutex);
    auto it = user_shard.rooms.find(user_id);
    if (it == user_shard.rooms.end()) {
      return {};
    }
    joined = std::move(it->second);
    user_shard.rooms.erase(it);
  }

  std::vector<std::string> purged;
  purged.reserve(joined.size());
  for (const auto& chatroom_id : joined) {
    auto& room_shard = rooms_.For(chatroom_id);
    std::lock_guard<std::mutex> lock(room_shard.mutex);
    auto it = room_shard.members.find(chatroom_id);
    if (it == room_shard.members.end()) {
      continue;
    }
    if (it->second.erase(user_id) > 0) {
      purged.push_back(chatroom_id);
    }
    if (it->second.empty()) {
      room_shard.members.erase(it);
    }
  }
  return purged;
}

UserSet SubscriptionIndex::Members(const std::string& chatroom_id) const {
  const auto& shard = rooms_.For(chatroom_id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.members.find(chatroom_id);
  if (it == shard.members.end()) {
    return {};
  }
  return it->second;
}

bool SubscriptionIndex::Contains(const std::string& chatroom_id, const std::string& user_id) const {
  const auto& shard = rooms_.For(chatroom_id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.members.find(chatroom_id);
  return it != shard.members.end() && it->second.count(user_id) > 0;
}

std::vector<std::string> SubscriptionIndex::RoomsOf(const std::string& user_id) const {
  const auto& shard = users_.For(user_id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.rooms.find(user_id);
  if (it == shard.rooms.end()) {
    return {};
  }
  return {it->second.begin(), it->second.end()};
}

std::size_t SubscriptionIndex::RoomCount() const {
  std::size_t count = 0;
  for (const auto& shard : rooms_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    count += shard.members.size();
  }
  return count;
}

std::size_t SubscriptionIndex::SubscriptionCount() const {
  std::size_t count = 0;
  for (const auto& shard : rooms_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (const auto& [chatroom_id, members] : shard.members) {
      count += members.size();
    }
  }
  return count;
}

}  // namespace chatrelay
