/*
 * 설명: 채팅방 ID → 구독 사용자 집합 인덱스. 채팅방/사용자 양방향을 샤드 단위로 잠근다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/subscription_index_test.cpp
 */
#pragma once

#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "chatrelay/sharding.hpp"

namespace chatrelay {

using UserSet = std::unordered_set<std::string>;

class SubscriptionIndex {
 public:
  // 새로 추가되었으면 true. 이미 구독 중이면 아무것도 하지 않는다.
  bool Join(const std::string& user_id, const std::string& chatroom_id);
  // 실제로 제거되었으면 true. 비구독자는 no-op.
  bool Leave(const std::string& user_id, const std::string& chatroom_id);
  // 사용자를 모든 채팅방에서 제거하고 소속되어 있던 채팅방 목록을 반환한다.
  std::vector<std::string> PurgeUser(const std::string& user_id);

  UserSet Members(const std::string& chatroom_id) const;
  bool Contains(const std::string& chatroom_id, const std::string& user_id) const;
  std::vector<std::string> RoomsOf(const std::string& user_id) const;

  std::size_t RoomCount() const;
  std::size_t SubscriptionCount() const;

 private:
  struct RoomShard {
    mutable std::mutex mutex;
    std::unordered_map<std::string, UserSet> members;
  };
  struct UserShard {
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::unordered_set<std::string>> rooms;
  };

  ShardArray<RoomShard> rooms_;
  ShardArray<UserShard> users_;
};

}  // namespace chatrelay
