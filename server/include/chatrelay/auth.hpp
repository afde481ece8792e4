/*
 * 설명: HS256 액세스 토큰 검증과 base64url/HMAC 보조 함수를 제공한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_verifier_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace chatrelay {

std::string Base64UrlEncode(std::string_view data);
std::optional<std::string> Base64UrlDecode(std::string_view text);
// 원시 32바이트 다이제스트를 반환한다.
std::string HmacSha256(std::string_view key, std::string_view data);

struct TokenClaims {
  std::string subject;
  std::string username;
  std::string display_name;
  std::string type;
  std::chrono::system_clock::time_point expires_at;
};

class TokenVerifier {
 public:
  explicit TokenVerifier(std::string secret) : secret_(std::move(secret)) {}

  std::optional<TokenClaims> Verify(std::string_view token, std::string& error_code,
                                    std::string& error_message) const;
  std::optional<TokenClaims> Verify(std::string_view token, std::chrono::system_clock::time_point now,
                                    std::string& error_code, std::string& error_message) const;

 private:
  std::string secret_;
};

}  // namespace chatrelay
