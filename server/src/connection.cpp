/*
 * 설명: 연결 ID 발급기를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "chatrelay/connection.hpp"

#include <atomic>

namespace chatrelay {

ConnectionId NextConnectionId() {
  static std::atomic<ConnectionId> next{1};
  return next.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace chatrelay
