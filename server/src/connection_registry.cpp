/*
 * 설명: 사용자별 연결 등록/해제/전달과 마지막 연결 해제 시의 연쇄 정리를 구현한다.
 * 버전: v1.2.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp, server/tests/unit/presence_tracker_test.cpp
 */
#include "chatrelay/connection_registry.hpp"

#include <algorithm>
#include <optional>

namespace chatrelay {

ConnectionRegistry::ConnectionRegistry(std::shared_ptr<SubscriptionIndex> subscriptions,
                                       std::size_t max_connections_per_user)
    : subscriptions_(std::move(subscriptions)), max_connections_per_user_(max_connections_per_user) {}

AddResult ConnectionRegistry::Add(const ChatUser& user, const std::shared_ptr<Connection>& connection) {
  AddResult result;
  {
    auto& shard = users_.For(user.user_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.users.find(user.user_id);
    if (it != shard.users.end() && max_connections_per_user_ > 0 &&
        it->second.entries.size() >= max_connections_per_user_) {
      return result;
    }
    if (it == shard.users.end()) {
      it = shard.users.emplace(user.user_id, UserConnections{user, {}}).first;
      result.first_for_user = true;
    }
    it->second.entries.push_back(Entry{connection->Id(), connection});

    // 잠금 순서: 사용자 샤드 → 소유자 샤드
    auto& owner_shard = owners_.For(connection->Id());
    std::lock_guard<std::mutex> owner_lock(owner_shard.mutex);
    owner_shard.owners[connection->Id()] = user.user_id;
  }
  result.accepted = true;

  if (observability_) {
    observability_->Increment(Metric::kConnectionsOpened);
    observability_->Info("connection_registered", {{"userId", user.user_id},
                                                   {"connectionId", connection->Id()},
                                                   {"firstForUser", result.first_for_user}});
  }
  if (result.first_for_user) {
    if (auto listener = presence_listener_.lock()) {
      listener->OnFirstConnection(user);
    }
  }
  return result;
}

bool ConnectionRegistry::Remove(ConnectionId connection_id) {
  std::string user_id;
  {
    auto& owner_shard = owners_.For(connection_id);
    std::lock_guard<std::mutex> lock(owner_shard.mutex);
    auto it = owner_shard.owners.find(connection_id);
    if (it == owner_shard.owners.end()) {
      return false;
    }
    user_id = std::move(it->second);
    owner_shard.owners.erase(it);
  }

  std::optional<ChatUser> departed;
  std::vector<std::string> purged_rooms;
  std::size_t remaining = 0;
  {
    auto& shard = users_.For(user_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.users.find(user_id);
    if (it != shard.users.end()) {
      auto& entries = it->second.entries;
      entries.erase(std::remove_if(entries.begin(), entries.end(),
                                   [connection_id](const Entry& e) { return e.id == connection_id; }),
                    entries.end());
      remaining = entries.size();
      if (entries.empty()) {
        departed = std::move(it->second.user);
        shard.users.erase(it);
        // 같은 잠금 아래에서 정리해야 동시에 들어온 Subscribe가 유령 구독을 남기지 않는다.
        purged_rooms = subscriptions_->PurgeUser(user_id);
      }
    }
  }

  if (observability_) {
    observability_->Increment(Metric::kConnectionsClosed);
    observability_->Info("connection_removed",
                         {{"userId", user_id}, {"connectionId", connection_id}, {"remaining", remaining}});
  }
  if (departed) {
    if (auto listener = presence_listener_.lock()) {
      listener->OnLastDisconnection(*departed, purged_rooms);
    }
  }
  return true;
}

std::size_t ConnectionRegistry::Deliver(const std::string& user_id, const std::shared_ptr<const std::string>& frame) {
  std::vector<std::pair<ConnectionId, std::shared_ptr<Connection>>> targets;
  {
    const auto& shard = users_.For(user_id);
    std::lock_guard<std::mutex> lock(shard.mutex);
    auto it = shard.users.find(user_id);
    if (it == shard.users.end()) {
      return 0;
    }
    targets.reserve(it->second.entries.size());
    for (const auto& entry : it->second.entries) {
      targets.emplace_back(entry.id, entry.connection.lock());
    }
  }

  std::size_t delivered = 0;
  std::vector<ConnectionId> failed;
  for (auto& [id, connection] : targets) {
    if (connection && connection->Send(frame)) {
      ++delivered;
    } else {
      failed.push_back(id);
    }
  }

  for (auto id : failed) {
    if (observability_) {
      observability_->Increment(Metric::kDeliveryFailures);
      observability_->Warn("delivery_failed", {{"userId", user_id}, {"connectionId", id}});
    }
    Remove(id);
  }
  if (observability_ && delivered > 0) {
    observability_->Increment(Metric::kDeliveries, delivered);
  }
  return delivered;
}

bool ConnectionRegistry::Subscribe(ConnectionId connection_id, const std::string& chatroom_id) {
  auto user_id = OwnerOf(connection_id);
  if (user_id.empty()) {
    return false;
  }
  auto& shard = users_.For(user_id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.users.find(user_id);
  if (it == shard.users.end()) {
    return false;
  }
  const auto& entries = it->second.entries;
  bool live = std::any_of(entries.begin(), entries.end(),
                          [connection_id](const Entry& e) { return e.id == connection_id; });
  if (!live) {
    return false;
  }
  subscriptions_->Join(user_id, chatroom_id);
  return true;
}

bool ConnectionRegistry::Unsubscribe(ConnectionId connection_id, const std::string& chatroom_id) {
  auto user_id = OwnerOf(connection_id);
  if (user_id.empty()) {
    return false;
  }
  return subscriptions_->Leave(user_id, chatroom_id);
}

std::size_t ConnectionRegistry::ConnectionCount(const std::string& user_id) const {
  const auto& shard = users_.For(user_id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.users.find(user_id);
  return it == shard.users.end() ? 0 : it->second.entries.size();
}

UserSet ConnectionRegistry::OnlineUsers() const {
  UserSet online;
  for (const auto& shard : users_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (const auto& [user_id, record] : shard.users) {
      online.insert(user_id);
    }
  }
  return online;
}

std::size_t ConnectionRegistry::TotalConnections() const {
  std::size_t total = 0;
  for (const auto& shard : users_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (const auto& [user_id, record] : shard.users) {
      total += record.entries.size();
    }
  }
  return total;
}

std::vector<std::shared_ptr<Connection>> ConnectionRegistry::Snapshot() const {
  std::vector<std::shared_ptr<Connection>> connections;
  for (const auto& shard : users_) {
    std::lock_guard<std::mutex> lock(shard.mutex);
    for (const auto& [user_id, record] : shard.users) {
      for (const auto& entry : record.entries) {
        if (auto connection = entry.connection.lock()) {
          connections.push_back(std::move(connection));
        }
      }
    }
  }
  return connections;
}

std::string ConnectionRegistry::OwnerOf(ConnectionId connection_id) const {
  const auto& shard = owners_.For(connection_id);
  std::lock_guard<std::mutex> lock(shard.mutex);
  auto it = shard.owners.find(connection_id);
  return it == shard.owners.end() ? std::string{} : it->second;
}

}  // namespace chatrelay
