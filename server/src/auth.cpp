/*
 * 설명: HS256 액세스 토큰 서명/만료/타입 검증을 구현한다.
 * 버전: v1.1.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/token_verifier_test.cpp
 */
#include "chatrelay/auth.hpp"

#include <vector>

#include <nlohmann/json.hpp>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace chatrelay {

namespace {
bool Fail(std::string& error_code, std::string& error_message, const char* message) {
  error_code = "authentication_failed";
  error_message = message;
  return false;
}

std::optional<nlohmann::json> DecodeSegment(std::string_view segment) {
  auto raw = Base64UrlDecode(segment);
  if (!raw) {
    return std::nullopt;
  }
  auto parsed = nlohmann::json::parse(*raw, nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    return std::nullopt;
  }
  return parsed;
}

std::string StringClaim(const nlohmann::json& payload, const char* key) {
  auto it = payload.find(key);
  if (it == payload.end()) {
    return {};
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_number_integer()) {
    return std::to_string(it->get<long long>());
  }
  return {};
}
}  // namespace

std::string Base64UrlEncode(std::string_view data) {
  std::vector<unsigned char> out(4 * ((data.size() + 2) / 3) + 1);
  int len = EVP_EncodeBlock(out.data(), reinterpret_cast<const unsigned char*>(data.data()),
                            static_cast<int>(data.size()));
  std::string encoded(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(len));
  while (!encoded.empty() && encoded.back() == '=') {
    encoded.pop_back();
  }
  for (auto& c : encoded) {
    if (c == '+') {
      c = '-';
    } else if (c == '/') {
      c = '_';
    }
  }
  return encoded;
}

std::optional<std::string> Base64UrlDecode(std::string_view text) {
  if (text.size() % 4 == 1) {
    return std::nullopt;
  }
  std::string standard;
  standard.reserve(text.size() + 3);
  for (char c : text) {
    if (c == '-') {
      standard.push_back('+');
    } else if (c == '_') {
      standard.push_back('/');
    } else if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9')) {
      standard.push_back(c);
    } else {
      return std::nullopt;
    }
  }
  std::size_t padding = (4 - standard.size() % 4) % 4;
  standard.append(padding, '=');
  if (standard.empty()) {
    return std::string{};
  }

  std::vector<unsigned char> out(standard.size() / 4 * 3);
  int len = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(standard.data()),
                            static_cast<int>(standard.size()));
  if (len < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock은 패딩 자리까지 0으로 채워 길이를 돌려준다.
  return std::string(reinterpret_cast<const char*>(out.data()), static_cast<std::size_t>(len) - padding);
}

std::string HmacSha256(std::string_view key, std::string_view data) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), reinterpret_cast<const unsigned char*>(data.data()),
       data.size(), digest, &digest_len);
  return std::string(reinterpret_cast<const char*>(digest), digest_len);
}

std::optional<TokenClaims> TokenVerifier::Verify(std::string_view token, std::string& error_code,
                                                 std::string& error_message) const {
  return Verify(token, std::chrono::system_clock::now(), error_code, error_message);
}

std::optional<TokenClaims> TokenVerifier::Verify(std::string_view token, std::chrono::system_clock::time_point now,
                                                 std::string& error_code, std::string& error_message) const {
  if (token.empty()) {
    Fail(error_code, error_message, "토큰이 필요합니다");
    return std::nullopt;
  }
  auto first = token.find('.');
  auto second = first == std::string_view::npos ? std::string_view::npos : token.find('.', first + 1);
  if (second == std::string_view::npos || token.find('.', second + 1) != std::string_view::npos) {
    Fail(error_code, error_message, "토큰 형식이 올바르지 않습니다");
    return std::nullopt;
  }

  auto header = DecodeSegment(token.substr(0, first));
  if (!header || header->value("alg", "") != "HS256") {
    Fail(error_code, error_message, "지원하지 않는 토큰 알고리즘입니다");
    return std::nullopt;
  }

  auto signing_input = token.substr(0, second);
  auto signature = Base64UrlDecode(token.substr(second + 1));
  auto expected = HmacSha256(secret_, signing_input);
  if (!signature || signature->size() != expected.size() ||
      CRYPTO_memcmp(signature->data(), expected.data(), expected.size()) != 0) {
    Fail(error_code, error_message, "토큰 서명이 올바르지 않습니다");
    return std::nullopt;
  }

  auto payload = DecodeSegment(token.substr(first + 1, second - first - 1));
  if (!payload) {
    Fail(error_code, error_message, "토큰 페이로드가 올바르지 않습니다");
    return std::nullopt;
  }

  TokenClaims claims;
  claims.type = StringClaim(*payload, "type");
  if (claims.type != "access") {
    Fail(error_code, error_message, "액세스 토큰이 아닙니다");
    return std::nullopt;
  }
  auto exp_it = payload->find("exp");
  if (exp_it == payload->end() || !exp_it->is_number()) {
    Fail(error_code, error_message, "토큰 만료 시각이 없습니다");
    return std::nullopt;
  }
  claims.expires_at = std::chrono::system_clock::time_point(std::chrono::seconds(exp_it->get<long long>()));
  if (claims.expires_at <= now) {
    Fail(error_code, error_message, "토큰이 만료되었습니다");
    return std::nullopt;
  }
  claims.subject = StringClaim(*payload, "sub");
  if (claims.subject.empty()) {
    Fail(error_code, error_message, "토큰 subject가 없습니다");
    return std::nullopt;
  }
  claims.username = StringClaim(*payload, "username");
  claims.display_name = StringClaim(*payload, "display_name");
  return claims;
}

}  // namespace chatrelay
