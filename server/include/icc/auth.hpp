/*
 * 설명: 요청을 사용자 ID(또는 익명)로 해석하는 인증기. fake 모드와 서명 티켓 모드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/auth_test.cpp, server/tests/unit/gateway_test.cpp
 */
#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include "icc/http_types.hpp"

namespace icc {

inline constexpr int kAnonymousUser = 0;

struct AuthContext {
  int user_id{kAnonymousUser};
};

class Authenticator {
 public:
  virtual ~Authenticator() = default;
  // 토큰이 잘못되었으면 ClientError(kNotAllowed). 헤더가 없으면 익명 컨텍스트.
  virtual AuthContext Authenticate(const HttpRequest& req) = 0;
  virtual int FromContext(const AuthContext& ctx) const { return ctx.user_id; }
};

// 모든 요청을 고정된 사용자로 본다. 개발용.
class FakeAuthenticator : public Authenticator {
 public:
  explicit FakeAuthenticator(int user_id) : user_id_(user_id) {}
  AuthContext Authenticate(const HttpRequest& req) override;

 private:
  int user_id_;
};

std::int64_t UnixNow();

// Authorization: Bearer <user_id>.<expires_unix>.<hex HMAC-SHA256(key, "<user_id>.<expires_unix>")>
class TokenAuthenticator : public Authenticator {
 public:
  explicit TokenAuthenticator(std::string key, std::function<std::int64_t()> clock = UnixNow);

  AuthContext Authenticate(const HttpRequest& req) override;
  std::string Sign(int user_id, std::int64_t expires_unix) const;

 private:
  std::string Hmac(const std::string& data) const;
  std::string ParseBearer(const std::string& header_value) const;

  std::string key_;
  std::function<std::int64_t()> clock_;
};

}  // namespace icc
