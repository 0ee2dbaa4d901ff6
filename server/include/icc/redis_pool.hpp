/*
 * 설명: Redis TCP 연결과 연결 풀(최대 활성/유휴 제한, 유휴 만료, 종료 시 강제 해제)을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/redis_backend_test.cpp, server/tests/it/redis_backend_it_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "icc/resp.hpp"

namespace icc {

struct RedisConfig {
  std::string host;
  unsigned short port;
  std::size_t max_active{100};
  std::size_t max_idle{10};
  std::chrono::seconds idle_timeout{std::chrono::seconds(240)};
  // XREAD BLOCK 전용 연결 수. 일반 명령의 max_active와 따로 센다.
  std::size_t max_blocking_reads{16};
};

class RedisConnection {
 public:
  RedisConnection(const std::string& host, unsigned short port);

  // 응답이 -ERR이면 StoreError. 소켓/프로토콜 오류면 연결을 broken으로 표시한다.
  RespReply Execute(const std::vector<std::string>& args);
  void Shutdown();

  bool Broken() const { return broken_; }
  std::chrono::steady_clock::time_point LastUsed() const { return last_used_; }
  void Touch() { last_used_ = std::chrono::steady_clock::now(); }

 private:
  boost::asio::io_context ioc_;
  boost::asio::ip::tcp::socket socket_;
  std::string buffer_;
  std::atomic<bool> broken_{false};
  boost::asio::ip::tcp::socket::native_handle_type native_handle_{-1};
  std::chrono::steady_clock::time_point last_used_;
};

class RedisPool {
 public:
  class Lease {
   public:
    Lease(RedisPool* pool, std::shared_ptr<RedisConnection> conn);
    Lease(Lease&& other) noexcept;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    Lease& operator=(Lease&&) = delete;
    ~Lease();

    RedisConnection* operator->() const { return conn_.get(); }

   private:
    RedisPool* pool_;
    std::shared_ptr<RedisConnection> conn_;
  };

  explicit RedisPool(RedisConfig config);
  ~RedisPool();

  // 활성 연결이 max_active에 도달하면 반납될 때까지 기다린다.
  Lease Acquire();
  // 유휴/대여 중인 모든 소켓을 닫는다. 블로킹 읽기 중인 작업 스레드는 오류로 깨어난다.
  void Close();
  std::size_t ActiveCount() const;

 private:
  void Release(const std::shared_ptr<RedisConnection>& conn);

  RedisConfig config_;
  mutable std::mutex mutex_;
  std::condition_variable available_;
  std::deque<std::shared_ptr<RedisConnection>> idle_;
  std::unordered_set<std::shared_ptr<RedisConnection>> leased_;
  std::size_t active_{0};
  bool closed_{false};
};

}  // namespace icc
