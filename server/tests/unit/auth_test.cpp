#include <cstdint>
#include <string>

#include <boost/beast/http.hpp>
#include <gtest/gtest.h>

#include "icc/auth.hpp"
#include "icc/errors.hpp"

namespace {

icc::HttpRequest RequestWithAuthorization(const std::string& value) {
  icc::HttpRequest req{boost::beast::http::verb::get, "/system/icc", 11};
  if (!value.empty()) {
    req.set(boost::beast::http::field::authorization, value);
  }
  return req;
}

void ExpectNotAllowed(icc::TokenAuthenticator& auth, const std::string& header) {
  try {
    auth.Authenticate(RequestWithAuthorization(header));
    ADD_FAILURE() << "accepted: " << header;
  } catch (const icc::ClientError& ex) {
    EXPECT_EQ(ex.kind, icc::ErrorKind::kNotAllowed) << header;
  }
}

}  // namespace

TEST(AuthTest, FakeAuthenticatorAlwaysReturnsConfiguredUser) {
  icc::FakeAuthenticator auth(1);
  auto ctx = auth.Authenticate(RequestWithAuthorization(""));
  EXPECT_EQ(auth.FromContext(ctx), 1);
}

TEST(AuthTest, MissingHeaderIsAnonymous) {
  icc::TokenAuthenticator auth("secret", []() -> std::int64_t { return 1000; });
  auto ctx = auth.Authenticate(RequestWithAuthorization(""));
  EXPECT_EQ(auth.FromContext(ctx), icc::kAnonymousUser);
}

TEST(AuthTest, SignedTokenResolvesUser) {
  icc::TokenAuthenticator auth("secret", []() -> std::int64_t { return 1000; });
  auto token = auth.Sign(42, 2000);
  auto ctx = auth.Authenticate(RequestWithAuthorization("Bearer " + token));
  EXPECT_EQ(auth.FromContext(ctx), 42);
}

TEST(AuthTest, SignatureIsHexHmacSha256OfPayload) {
  icc::TokenAuthenticator auth("secret", []() -> std::int64_t { return 1000; });
  EXPECT_EQ(auth.Sign(42, 2000), "42.2000.5b2fab05d9046beee38efe8ed00da32deeb3a56465d19f61d923028d3237693f");
}

TEST(AuthTest, ExpiredTokenIsRejected) {
  icc::TokenAuthenticator auth("secret", []() -> std::int64_t { return 3000; });
  ExpectNotAllowed(auth, "Bearer " + auth.Sign(42, 2000));
}

TEST(AuthTest, TokenFromOtherKeyIsRejected) {
  icc::TokenAuthenticator signer("other", []() -> std::int64_t { return 1000; });
  icc::TokenAuthenticator auth("secret", []() -> std::int64_t { return 1000; });
  ExpectNotAllowed(auth, "Bearer " + signer.Sign(42, 2000));
}

TEST(AuthTest, MalformedTokensAreRejected) {
  icc::TokenAuthenticator auth("secret", []() -> std::int64_t { return 1000; });
  auto valid = auth.Sign(42, 2000);
  ExpectNotAllowed(auth, "Bearer ");
  ExpectNotAllowed(auth, "Basic " + valid);
  ExpectNotAllowed(auth, "Bearer garbage");
  ExpectNotAllowed(auth, "Bearer x.2000." + valid.substr(valid.rfind('.') + 1));
  ExpectNotAllowed(auth, "Bearer 43" + valid.substr(2));
  ExpectNotAllowed(auth, "Bearer " + valid + ".extra");
}
