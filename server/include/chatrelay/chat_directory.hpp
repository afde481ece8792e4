/*
 * 설명: 사용자 프로필 조회와 채팅방 멤버십 인가를 담당하는 디렉터리 협력자.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_handler_test.cpp, server/tests/it/message_store_it_test.cpp
 */
#pragma once

#include <memory>
#include <optional>
#include <string>

#include "chatrelay/auth.hpp"
#include "chatrelay/connection.hpp"
#include "chatrelay/db_client.hpp"

namespace chatrelay {

class ChatDirectory {
 public:
  virtual ~ChatDirectory() = default;

  // 토큰 subject에 해당하는 활성 사용자를 찾는다. 비활성이거나 없으면 std::nullopt.
  virtual std::optional<ChatUser> FindActiveUser(const TokenClaims& claims) = 0;
  virtual bool IsMember(const std::string& user_id, const std::string& chatroom_id) = 0;
};

class MariaDbChatDirectory : public ChatDirectory {
 public:
  explicit MariaDbChatDirectory(std::shared_ptr<MariaDbClient> db_client);

  std::optional<ChatUser> FindActiveUser(const TokenClaims& claims) override;
  bool IsMember(const std::string& user_id, const std::string& chatroom_id) override;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

// 단일 노드/로컬 모드용. 토큰 클레임으로 프로필을 만들고 모든 채팅방을 허용한다.
class OpenChatDirectory : public ChatDirectory {
 public:
  std::optional<ChatUser> FindActiveUser(const TokenClaims& claims) override;
  bool IsMember(const std::string& user_id, const std::string& chatroom_id) override;
};

}  // namespace chatrelay
