/*
 * 설명: MariaDB users/chatroom_members 테이블 기반 디렉터리 조회를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/protocol_handler_test.cpp, server/tests/it/message_store_it_test.cpp
 */
#include "chatrelay/chat_directory.hpp"

#include <sstream>

namespace chatrelay {

MariaDbChatDirectory::MariaDbChatDirectory(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

std::optional<ChatUser> MariaDbChatDirectory::FindActiveUser(const TokenClaims& claims) {
  std::optional<ChatUser> user;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT id, username, display_name FROM users WHERE id='" << db_client_->Escape(conn, claims.subject)
        << "' AND is_active=1 LIMIT 1;";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "사용자 조회 실패");
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "사용자 조회 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row) {
      ChatUser found;
      found.user_id = row[0] ? row[0] : claims.subject;
      found.username = row[1] ? row[1] : "";
      found.display_name = row[2] ? row[2] : found.username;
      user = std::move(found);
    }
    mysql_free_result(res);
  });
  return user;
}

bool MariaDbChatDirectory::IsMember(const std::string& user_id, const std::string& chatroom_id) {
  bool member = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT 1 FROM chatroom_members WHERE chatroom_id='" << db_client_->Escape(conn, chatroom_id)
        << "' AND user_id='" << db_client_->Escape(conn, user_id) << "' LIMIT 1;";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "멤버십 조회 실패");
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "멤버십 조회 결과 없음");
    }
    member = mysql_fetch_row(res) != nullptr;
    mysql_free_result(res);
  });
  return member;
}

std::optional<ChatUser> OpenChatDirectory::FindActiveUser(const TokenClaims& claims) {
  ChatUser user;
  user.user_id = claims.subject;
  user.username = claims.username.empty() ? claims.subject : claims.username;
  user.display_name = claims.display_name.empty() ? user.username : claims.display_name;
  return user;
}

bool OpenChatDirectory::IsMember(const std::string&, const std::string&) { return true; }

}  // namespace chatrelay
