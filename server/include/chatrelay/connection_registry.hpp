/*
 * 설명: 사용자별 WebSocket 연결 집합을 샤드 단위로 관리하고, 마지막 연결 종료 시 구독 정리와
 *       프레즌스 전이를 연쇄 처리한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp, server/tests/unit/presence_tracker_test.cpp
 */
#pragma once

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "chatrelay/connection.hpp"
#include "chatrelay/observability.hpp"
#include "chatrelay/sharding.hpp"
#include "chatrelay/subscription_index.hpp"

namespace chatrelay {

// 레지스트리의 사용자 단위 전이(첫 연결/마지막 연결 해제)를 통지받는다.
class PresenceListener {
 public:
  virtual ~PresenceListener() = default;
  virtual void OnFirstConnection(const ChatUser& user) = 0;
  // purged_rooms: 연쇄 정리로 사용자가 빠져나간 채팅방. 호출 시점에는 정리가 이미 끝나 있다.
  virtual void OnLastDisconnection(const ChatUser& user, const std::vector<std::string>& purged_rooms) = 0;
};

struct AddResult {
  bool accepted{false};
  bool first_for_user{false};
};

class ConnectionRegistry {
 public:
  // max_connections_per_user가 0이면 제한하지 않는다.
  ConnectionRegistry(std::shared_ptr<SubscriptionIndex> subscriptions, std::size_t max_connections_per_user);

  // 서비스 시작 전에 한 번만 설정한다.
  void SetObservability(const std::shared_ptr<Observability>& observability) { observability_ = observability; }
  void SetPresenceListener(const std::shared_ptr<PresenceListener>& listener) { presence_listener_ = listener; }

  AddResult Add(const ChatUser& user, const std::shared_ptr<Connection>& connection);
  // 멱등. 처음 제거한 호출자만 true를 받고 연쇄 정리를 수행한다.
  bool Remove(ConnectionId connection_id);
  // 사용자의 모든 살아있는 연결에 전송을 요청하고 성공한 연결 수를 반환한다.
  std::size_t Deliver(const std::string& user_id, const std::shared_ptr<const std::string>& frame);

  // 해당 연결이 아직 등록되어 있을 때만 구독한다. 마지막 연결 정리와 같은 잠금 아래에서 수행된다.
  bool Subscribe(ConnectionId connection_id, const std::string& chatroom_id);
  bool Unsubscribe(ConnectionId connection_id, const std::string& chatroom_id);

  std::size_t ConnectionCount(const std::string& user_id) const;
  bool IsOnline(const std::string& user_id) const { return ConnectionCount(user_id) > 0; }
  UserSet OnlineUsers() const;
  std::size_t TotalConnections() const;
  std::vector<std::shared_ptr<Connection>> Snapshot() const;

 private:
  struct Entry {
    ConnectionId id;
    std::weak_ptr<Connection> connection;
  };
  struct UserConnections {
    ChatUser user;
    std::vector<Entry> entries;
  };
  struct UserShard {
    mutable std::mutex mutex;
    std::unordered_map<std::string, UserConnections> users;
  };
  struct OwnerShard {
    mutable std::mutex mutex;
    std::unordered_map<ConnectionId, std::string> owners;
  };

  std::string OwnerOf(ConnectionId connection_id) const;

  std::shared_ptr<SubscriptionIndex> subscriptions_;
  std::size_t max_connections_per_user_;
  ShardArray<UserShard> users_;
  ShardArray<OwnerShard> owners_;
  std::shared_ptr<Observability> observability_;
  std::weak_ptr<PresenceListener> presence_listener_;
};

}  // namespace chatrelay
