/*
 * 설명: 키 해시로 샤드를 고르는 고정 크기 샤드 배열. 샤드마다 자체 mutex를 가진다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/subscription_index_test.cpp, server/tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>

namespace chatrelay {

inline constexpr std::size_t kShardCount = 16;

template <typename Shard>
class ShardArray {
 public:
  Shard& For(const std::string& key) { return shards_[std::hash<std::string>{}(key) % kShardCount]; }
  const Shard& For(const std::string& key) const { return shards_[std::hash<std::string>{}(key) % kShardCount]; }
  Shard& For(std::uint64_t key) { return shards_[key % kShardCount]; }
  const Shard& For(std::uint64_t key) const { return shards_[key % kShardCount]; }

  auto begin() { return shards_.begin(); }
  auto end() { return shards_.end(); }
  auto begin() const { return shards_.begin(); }
  auto end() const { return shards_.end(); }

 private:
  std::array<Shard, kShardCount> shards_;
};

}  // namespace chatrelay
