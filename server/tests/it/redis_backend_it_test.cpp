#include <chrono>
#include <cstdlib>
#include <future>
#include <memory>
#include <string>
#include <thread>

#include <gtest/gtest.h>

#include "icc/auth.hpp"
#include "icc/errors.hpp"
#include "icc/redis_backend.hpp"
#include "icc/redis_pool.hpp"

namespace {

icc::RedisConfig TestRedisConfig() {
  icc::RedisConfig cfg;
  const char* host = std::getenv("ICC_REDIS_HOST");
  const char* port = std::getenv("ICC_REDIS_PORT");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 6379;
  return cfg;
}

class RedisBackendItFixture : public ::testing::Test {
 protected:
  void SetUp() override {
    auto suffix = std::to_string(icc::UnixNow()) + "-" +
                  ::testing::UnitTest::GetInstance()->current_test_info()->name();
    stream_key_ = "icc-it-stream-" + suffix;
    applause_key_ = "icc-it-applause-" + suffix;
    backend_ = std::make_unique<icc::RedisBackend>(TestRedisConfig(), stream_key_, applause_key_);
    try {
      backend_->Ping();
    } catch (const icc::StoreError& ex) {
      GTEST_SKIP() << "Redis에 연결할 수 없습니다: " << ex.what();
    }
  }

  void TearDown() override {
    if (!backend_) {
      return;
    }
    backend_->Close();
    try {
      icc::RedisPool pool(TestRedisConfig());
      auto conn = pool.Acquire();
      conn->Execute({"DEL", stream_key_, applause_key_});
    } catch (const icc::StoreError&) {
      // SetUp에서 건너뛴 경우 서버가 없다.
    }
  }

  std::string stream_key_;
  std::string applause_key_;
  std::unique_ptr<icc::RedisBackend> backend_;
};

}  // namespace

TEST_F(RedisBackendItFixture, StreamPreservesOrder) {
  EXPECT_EQ(backend_->StreamTail(), icc::kStreamEmptyId);
  backend_->AppendStream("one");
  backend_->AppendStream("two");

  auto first = backend_->ReadNextStream(icc::kStreamEmptyId);
  EXPECT_EQ(first.payload, "one");
  auto second = backend_->ReadNextStream(first.id);
  EXPECT_EQ(second.payload, "two");
  EXPECT_EQ(backend_->StreamTail(), second.id);
}

TEST_F(RedisBackendItFixture, BlockingReadWakesOnAppend) {
  auto tail = backend_->StreamTail();
  auto reader = std::async(std::launch::async, [this, tail]() { return backend_->ReadNextStream(tail); });
  EXPECT_EQ(reader.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);
  backend_->AppendStream("wake");
  EXPECT_EQ(reader.get().payload, "wake");
}

TEST_F(RedisBackendItFixture, CloseReleasesBlockedReader) {
  auto reader = std::async(std::launch::async, [this]() { return backend_->ReadNextStream(icc::kStreamFromNow); });
  EXPECT_EQ(reader.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);
  backend_->Close();
  EXPECT_THROW(reader.get(), icc::StoreError);
}

TEST_F(RedisBackendItFixture, ScoredSetCountsAndPrunes) {
  backend_->AddScored("1", 100);
  backend_->AddScored("1", 105);
  backend_->AddScored("2", 99);
  backend_->AddScored("3", 110);

  EXPECT_EQ(backend_->CountInRange(100), 2u);
  EXPECT_EQ(backend_->CountInRange(99), 3u);

  backend_->DeleteBelow(105);
  EXPECT_EQ(backend_->CountInRange(0), 2u);
  EXPECT_EQ(backend_->CountInRange(105), 2u);
}
