/*
 * 설명: fake 인증과 HMAC 서명 티켓 검증을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/auth_test.cpp
 */
#include "icc/auth.hpp"

#include <chrono>
#include <iomanip>
#include <limits>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include "icc/errors.hpp"

namespace icc {
namespace {
std::string BytesToHex(const unsigned char* data, std::size_t len) {
  std::ostringstream oss;
  for (std::size_t i = 0; i < len; ++i) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
  }
  return oss.str();
}

std::vector<std::string> Split(const std::string& text, char sep) {
  std::vector<std::string> parts;
  std::size_t pos = 0;
  while (true) {
    auto next = text.find(sep, pos);
    parts.push_back(text.substr(pos, next == std::string::npos ? std::string::npos : next - pos));
    if (next == std::string::npos) {
      break;
    }
    pos = next + 1;
  }
  return parts;
}

std::optional<long long> ParseNumber(const std::string& value) {
  try {
    std::size_t idx = 0;
    auto parsed = std::stoll(value, &idx);
    if (idx != value.size()) {
      return std::nullopt;
    }
    return parsed;
  } catch (const std::logic_error&) {
    return std::nullopt;
  }
}

ClientError InvalidToken() { return ClientError(ErrorKind::kNotAllowed, "인증 토큰이 올바르지 않습니다"); }
}  // namespace

std::int64_t UnixNow() {
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch())
      .count();
}

AuthContext FakeAuthenticator::Authenticate(const HttpRequest& /*req*/) { return AuthContext{user_id_}; }

TokenAuthenticator::TokenAuthenticator(std::string key, std::function<std::int64_t()> clock)
    : key_(std::move(key)), clock_(std::move(clock)) {}

AuthContext TokenAuthenticator::Authenticate(const HttpRequest& req) {
  auto auth_it = req.find(boost::beast::http::field::authorization);
  if (auth_it == req.end()) {
    return AuthContext{};
  }
  auto token = ParseBearer(std::string(auth_it->value()));
  if (token.empty()) {
    throw InvalidToken();
  }

  auto parts = Split(token, '.');
  if (parts.size() != 3) {
    throw InvalidToken();
  }
  auto user_id = ParseNumber(parts[0]);
  auto expires = ParseNumber(parts[1]);
  if (!user_id || !expires || *user_id <= 0 || *user_id > std::numeric_limits<int>::max()) {
    throw InvalidToken();
  }
  auto expected = Hmac(parts[0] + "." + parts[1]);
  if (expected.size() != parts[2].size() ||
      CRYPTO_memcmp(expected.data(), parts[2].data(), expected.size()) != 0) {
    throw InvalidToken();
  }
  if (clock_() > *expires) {
    throw ClientError(ErrorKind::kNotAllowed, "인증 토큰이 만료되었습니다");
  }
  return AuthContext{static_cast<int>(*user_id)};
}

std::string TokenAuthenticator::Sign(int user_id, std::int64_t expires_unix) const {
  auto data = std::to_string(user_id) + "." + std::to_string(expires_unix);
  return data + "." + Hmac(data);
}

std::string TokenAuthenticator::Hmac(const std::string& data) const {
  std::vector<unsigned char> input(data.begin(), data.end());
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int digest_len = 0;
  if (!HMAC(EVP_sha256(), key_.data(), static_cast<int>(key_.size()), input.data(), input.size(), digest,
            &digest_len)) {
    throw std::runtime_error("HMAC 계산 실패");
  }
  return BytesToHex(digest, digest_len);
}

std::string TokenAuthenticator::ParseBearer(const std::string& header_value) const {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

}  // namespace icc
