/*
 * 설명: 외부 인증 서비스가 발급한 토큰을 검증하는 인터페이스와 HMAC 구현을 제공한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/auth_token_test.cpp
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace arena {

struct AuthUser {
  int user_id;
  std::string username;
};

class CredentialVerifier {
 public:
  virtual ~CredentialVerifier() = default;
  virtual std::optional<AuthUser> Verify(const std::string& token) const = 0;
};

// 토큰 형식: <userId>.<expiresUnix>.<username>.<hex(HMAC-SHA256)>
class HmacTokenVerifier : public CredentialVerifier {
 public:
  explicit HmacTokenVerifier(std::string secret) : secret_(std::move(secret)) {}

  std::optional<AuthUser> Verify(const std::string& token) const override;
  std::string Issue(const AuthUser& user, std::chrono::seconds ttl) const;
  std::string IssueWithExpiry(const AuthUser& user, std::chrono::system_clock::time_point expires_at) const;

 private:
  std::string Sign(const std::string& message) const;

  std::string secret_;
};

}  // namespace arena
