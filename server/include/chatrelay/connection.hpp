/*
 * 설명: 레지스트리와 디스패처가 참조하는 연결 전달 핸들 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/connection_registry_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace chatrelay {

using ConnectionId = std::uint64_t;

// 프로세스 수명 동안 유일한 연결 ID를 발급한다.
ConnectionId NextConnectionId();

struct ChatUser {
  std::string user_id;
  std::string username;
  std::string display_name;
};

// 연결 종료 코드. 1000번대는 RFC 6455 표준, 4000번대는 애플리케이션 정의.
inline constexpr std::uint16_t kCloseNormal = 1000;
inline constexpr std::uint16_t kClosePolicy = 1008;
inline constexpr std::uint16_t kCloseServerError = 4000;
inline constexpr std::uint16_t kCloseIdleTimeout = 4001;
inline constexpr std::uint16_t kCloseAuthenticationFailed = 4401;
inline constexpr std::uint16_t kCloseTooManyConnections = 4429;

class Connection {
 public:
  virtual ~Connection() = default;

  virtual ConnectionId Id() const = 0;
  virtual const ChatUser& User() const = 0;

  // 비차단 전송 요청. 연결이 이미 닫혔거나 죽은 경우 false를 반환한다.
  virtual bool Send(std::shared_ptr<const std::string> frame) = 0;
  virtual void Close(std::uint16_t code, const std::string& reason) = 0;

  virtual std::chrono::system_clock::time_point CreatedAt() const = 0;
  virtual std::chrono::steady_clock::time_point LastActivity() const = 0;
};

}  // namespace chatrelay
