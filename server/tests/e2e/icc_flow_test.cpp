#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "icc/app.hpp"
#include "icc/auth.hpp"

namespace {

icc::AppConfig TestConfig(unsigned short port) {
  icc::AppConfig cfg{};
  cfg.port = port;
  cfg.backend = icc::BackendKind::kMemory;
  cfg.applause_interval_seconds = 5;
  cfg.applause_retention_seconds = 300;
  cfg.applause_tick_ms = 20;
  cfg.prune_tick_seconds = 60;
  cfg.applause_refresh_ticks = 60;
  cfg.auth = icc::AuthMode::kFake;
  cfg.settings = icc::SettingsMode::kStatic;
  cfg.log_level = "error";
  return cfg;
}

struct SimpleHttpResponse {
  boost::beast::http::status status;
  std::string body;

  nlohmann::json Json() const { return nlohmann::json::parse(body); }
};

void ExpectErrorEnvelope(const nlohmann::json& body, const std::string& code) {
  ASSERT_TRUE(body.is_object());
  EXPECT_FALSE(body["success"].get<bool>());
  EXPECT_TRUE(body["data"].is_null());
  ASSERT_TRUE(body["error"].is_object());
  EXPECT_EQ(body["error"]["code"], code);
}

class IccFlowFixture : public ::testing::Test {
 protected:
  void SetUp() override { Start(TestConfig(18091)); }

  void TearDown() override {
    app_->Stop();
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  void Start(const icc::AppConfig& config) {
    config_ = config;
    app_ = std::make_unique<icc::ServerApp>(config_);
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
  }

  SimpleHttpResponse Request(boost::beast::http::verb verb, const std::string& target, const std::string& body = "",
                             const std::string& authorization = "") {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    auto const results = resolver.resolve("127.0.0.1", std::to_string(config_.port));
    stream.connect(results);
    stream.expires_after(std::chrono::seconds(10));

    boost::beast::http::request<boost::beast::http::string_body> req{verb, target, 11};
    req.set(boost::beast::http::field::host, "localhost");
    req.set(boost::beast::http::field::user_agent, BOOST_BEAST_VERSION_STRING);
    if (!authorization.empty()) {
      req.set(boost::beast::http::field::authorization, authorization);
    }
    if (!body.empty()) {
      req.set(boost::beast::http::field::content_type, "application/json");
      req.body() = body;
    }
    req.prepare_payload();
    boost::beast::http::write(stream, req);

    boost::beast::flat_buffer buffer;
    boost::beast::http::response<boost::beast::http::string_body> res;
    boost::beast::http::read(stream, buffer, res);

    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    return SimpleHttpResponse{res.result(), res.body()};
  }

  SimpleHttpResponse Get(const std::string& target) { return Request(boost::beast::http::verb::get, target); }

  SimpleHttpResponse Post(const std::string& target, const std::string& body, const std::string& authorization = "") {
    return Request(boost::beast::http::verb::post, target, body, authorization);
  }

  bool WaitForWaiting(std::size_t expected) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
    while (std::chrono::steady_clock::now() < deadline) {
      if (app_->GetObservability()->Snapshot().waiting == expected) {
        return true;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return false;
  }

  icc::AppConfig config_;
  std::unique_ptr<icc::ServerApp> app_;
  std::thread server_thread_;
};

}  // namespace

TEST_F(IccFlowFixture, HealthReportsHealthy) {
  auto res = Get("/system/icc/health");
  ASSERT_EQ(res.status, boost::beast::http::status::ok);
  auto body = res.Json();
  EXPECT_TRUE(body["success"].get<bool>());
  EXPECT_TRUE(body["data"]["healthy"].get<bool>());
}

TEST_F(IccFlowFixture, UnknownPathIsNotFound) {
  auto res = Get("/system/unknown");
  ASSERT_EQ(res.status, boost::beast::http::status::not_found);
  ExpectErrorEnvelope(res.Json(), "not_found");
}

TEST_F(IccFlowFixture, MessagesArriveInSendOrder) {
  ASSERT_EQ(Post("/system/icc/send", R"({"name":"first","message":1})").status, boost::beast::http::status::ok);
  ASSERT_EQ(Post("/system/icc/send", R"({"name":"second","message":2})").status, boost::beast::http::status::ok);

  auto first = Get("/system/icc");
  ASSERT_EQ(first.status, boost::beast::http::status::ok);
  EXPECT_EQ(first.Json()["name"], "first");
  EXPECT_EQ(first.Json()["sender_user_id"], 1);

  auto second = Get("/system/icc");
  ASSERT_EQ(second.status, boost::beast::http::status::ok);
  EXPECT_EQ(second.Json()["name"], "second");
}

TEST_F(IccFlowFixture, LongPollWakesOnSend) {
  auto pending = std::async(std::launch::async, [this]() { return Get("/system/icc"); });
  ASSERT_TRUE(WaitForWaiting(1));
  EXPECT_EQ(pending.wait_for(std::chrono::milliseconds(50)), std::future_status::timeout);

  ASSERT_EQ(Post("/system/icc/send", R"({"name":"wake","message":"up"})").status, boost::beast::http::status::ok);
  auto res = pending.get();
  ASSERT_EQ(res.status, boost::beast::http::status::ok);
  EXPECT_EQ(res.Json()["name"], "wake");
  EXPECT_EQ(res.Json()["message"], "up");
}

TEST_F(IccFlowFixture, InvalidMessageIsRejected) {
  auto res = Post("/system/icc/send", R"({"message":"no name"})");
  ASSERT_EQ(res.status, boost::beast::http::status::bad_request);
  ExpectErrorEnvelope(res.Json(), "invalid");
}

TEST_F(IccFlowFixture, DisconnectReleasesParkedReceive) {
  {
    boost::asio::io_context ioc;
    boost::asio::ip::tcp::resolver resolver{ioc};
    boost::beast::tcp_stream stream{ioc};
    stream.connect(resolver.resolve("127.0.0.1", std::to_string(config_.port)));
    boost::beast::http::request<boost::beast::http::string_body> req{boost::beast::http::verb::get, "/system/icc",
                                                                       11};
    req.set(boost::beast::http::field::host, "localhost");
    boost::beast::http::write(stream, req);
    ASSERT_TRUE(WaitForWaiting(1));
    boost::beast::error_code ec;
    stream.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    stream.socket().close(ec);
  }
  EXPECT_TRUE(WaitForWaiting(0));

  // 끊긴 요청은 커서를 옮기지 않는다.
  ASSERT_EQ(Post("/system/icc/send", R"({"name":"kept","message":0})").status, boost::beast::http::status::ok);
  auto res = Get("/system/icc");
  ASSERT_EQ(res.status, boost::beast::http::status::ok);
  EXPECT_EQ(res.Json()["name"], "kept");
}

TEST_F(IccFlowFixture, ApplauseLevelIsPublished) {
  auto pending = std::async(std::launch::async, [this]() { return Get("/system/applause?version=0"); });
  ASSERT_TRUE(WaitForWaiting(1));

  auto sent = Post("/system/applause/send", "");
  ASSERT_EQ(sent.status, boost::beast::http::status::ok);
  EXPECT_TRUE(sent.Json()["data"]["sent"].get<bool>());

  auto res = pending.get();
  ASSERT_EQ(res.status, boost::beast::http::status::ok);
  auto body = res.Json();
  EXPECT_EQ(body["level"], 1);
  EXPECT_GE(body["version"].get<int>(), 1);
}

TEST_F(IccFlowFixture, ApplauseChangeBetweenPollsIsDelivered) {
  auto current = Get("/system/applause");
  ASSERT_EQ(current.status, boost::beast::http::status::ok);
  auto seen = current.Json()["version"].get<std::uint64_t>();

  // 다음 요청을 보내기 전에 레벨이 바뀐다.
  ASSERT_EQ(Post("/system/applause/send", "").status, boost::beast::http::status::ok);
  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
  while (Get("/system/applause").Json()["version"].get<std::uint64_t>() == seen &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  auto res = Get("/system/applause?version=" + std::to_string(seen));
  ASSERT_EQ(res.status, boost::beast::http::status::ok);
  EXPECT_GT(res.Json()["version"].get<std::uint64_t>(), seen);
  EXPECT_EQ(res.Json()["level"], 1);
}

class TicketAuthFixture : public IccFlowFixture {
 protected:
  void SetUp() override {
    auto cfg = TestConfig(18092);
    cfg.auth = icc::AuthMode::kTicket;
    cfg.auth_token_key = "e2e-key";
    Start(cfg);
  }
};

TEST_F(TicketAuthFixture, AnonymousCannotSend) {
  auto res = Post("/system/icc/send", R"({"name":"x","message":1})");
  ASSERT_EQ(res.status, boost::beast::http::status::unauthorized);
  ExpectErrorEnvelope(res.Json(), "not-allowed");

  auto applause = Post("/system/applause/send", "");
  ASSERT_EQ(applause.status, boost::beast::http::status::unauthorized);
}

TEST_F(TicketAuthFixture, SignedUserCanSend) {
  icc::TokenAuthenticator signer("e2e-key");
  auto token = signer.Sign(5, icc::UnixNow() + 60);
  auto res = Post("/system/icc/send", R"({"name":"x","message":1})", "Bearer " + token);
  ASSERT_EQ(res.status, boost::beast::http::status::ok);

  auto received = Get("/system/icc");
  ASSERT_EQ(received.status, boost::beast::http::status::ok);
  EXPECT_EQ(received.Json()["sender_user_id"], 5);
}

TEST_F(TicketAuthFixture, BadTokenIsNotAllowed) {
  auto res = Post("/system/icc/send", R"({"name":"x","message":1})", "Bearer 5.1.deadbeef");
  ASSERT_EQ(res.status, boost::beast::http::status::unauthorized);
  ExpectErrorEnvelope(res.Json(), "not-allowed");
}
