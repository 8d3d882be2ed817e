/*
 * 설명: HMAC-SHA256 서명 토큰의 발급과 상수 시간 검증을 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/auth_token_test.cpp
 */
#include "arena/auth.hpp"

#include <iomanip>
#include <sstream>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

namespace arena {

namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

bool ParsePositiveInt(const std::string& text, long long& out) {
  if (text.empty() || text.size() > 18) {
    return false;
  }
  out = 0;
  for (char c : text) {
    if (c < '0' || c > '9') {
      return false;
    }
    out = out * 10 + (c - '0');
  }
  return true;
}
}  // namespace

std::string HmacTokenVerifier::Sign(const std::string& message) const {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  HMAC(EVP_sha256(), secret_.data(), static_cast<int>(secret_.size()),
       reinterpret_cast<const unsigned char*>(message.data()), message.size(), digest, &digest_len);
  return BytesToHex(digest, digest_len);
}

std::string HmacTokenVerifier::Issue(const AuthUser& user, std::chrono::seconds ttl) const {
  return IssueWithExpiry(user, std::chrono::system_clock::now() + ttl);
}

std::string HmacTokenVerifier::IssueWithExpiry(const AuthUser& user,
                                               std::chrono::system_clock::time_point expires_at) const {
  const auto expires = std::chrono::duration_cast<std::chrono::seconds>(expires_at.time_since_epoch()).count();
  std::string body = std::to_string(user.user_id) + "." + std::to_string(expires) + "." + user.username;
  return body + "." + Sign(body);
}

std::optional<AuthUser> HmacTokenVerifier::Verify(const std::string& token) const {
  const auto first = token.find('.');
  const auto second = first == std::string::npos ? std::string::npos : token.find('.', first + 1);
  const auto last = token.rfind('.');
  if (second == std::string::npos || last == std::string::npos || last <= second) {
    return std::nullopt;
  }

  long long user_id = 0;
  long long expires = 0;
  if (!ParsePositiveInt(token.substr(0, first), user_id) ||
      !ParsePositiveInt(token.substr(first + 1, second - first - 1), expires) || user_id <= 0 ||
      user_id > 0x7fffffff) {
    return std::nullopt;
  }
  std::string username = token.substr(second + 1, last - second - 1);
  if (username.empty()) {
    return std::nullopt;
  }

  const std::string body = token.substr(0, last);
  const std::string signature = token.substr(last + 1);
  const std::string expected = Sign(body);
  if (signature.size() != expected.size() ||
      CRYPTO_memcmp(signature.data(), expected.data(), expected.size()) != 0) {
    return std::nullopt;
  }

  const auto now = std::chrono::duration_cast<std::chrono::seconds>(
                       std::chrono::system_clock::now().time_since_epoch())
                       .count();
  if (expires <= now) {
    return std::nullopt;
  }
  return AuthUser{static_cast<int>(user_id), std::move(username)};
}

}  // namespace arena
