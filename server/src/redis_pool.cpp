/*
 * 설명: Redis 연결 생성/명령 실행과 연결 풀 대여/반납 정책을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/redis_backend_test.cpp, server/tests/it/redis_backend_it_test.cpp
 */
#include "icc/redis_pool.hpp"

#include <array>

#include <sys/socket.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/write.hpp>

#include "icc/errors.hpp"

namespace icc {

RedisConnection::RedisConnection(const std::string& host, unsigned short port)
    : socket_(ioc_), last_used_(std::chrono::steady_clock::now()) {
  boost::system::error_code ec;
  boost::asio::ip::tcp::resolver resolver{ioc_};
  auto const results = resolver.resolve(host, std::to_string(port), ec);
  if (ec) {
    throw StoreError("redis 주소 해석 실패(" + host + "): " + ec.message());
  }
  boost::asio::connect(socket_, results, ec);
  if (ec) {
    throw StoreError("redis 연결 실패(" + host + ":" + std::to_string(port) + "): " + ec.message());
  }
  socket_.set_option(boost::asio::ip::tcp::no_delay(true), ec);
  native_handle_ = socket_.native_handle();
}

RespReply RedisConnection::Execute(const std::vector<std::string>& args) {
  const std::string name = args.empty() ? std::string{} : args.front();
  boost::system::error_code ec;
  auto request = EncodeCommand(args);
  boost::asio::write(socket_, boost::asio::buffer(request), ec);
  if (ec) {
    broken_ = true;
    throw StoreError(name + " 전송 실패: " + ec.message());
  }

  std::array<char, 4096> chunk{};
  for (;;) {
    std::size_t consumed = 0;
    std::optional<RespReply> reply;
    try {
      reply = RespParser::Parse(buffer_, consumed);
    } catch (const StoreError&) {
      broken_ = true;
      throw;
    }
    if (reply) {
      buffer_.erase(0, consumed);
      if (reply->type == RespReply::Type::kError) {
        throw StoreError(name + ": " + reply->str);
      }
      return *reply;
    }
    auto n = socket_.read_some(boost::asio::buffer(chunk), ec);
    if (ec) {
      broken_ = true;
      throw StoreError(name + " 응답 수신 실패: " + ec.message());
    }
    buffer_.append(chunk.data(), n);
  }
}

void RedisConnection::Shutdown() {
  broken_ = true;
  // 다른 스레드가 read_some 중일 수 있어 소켓 객체 대신 디스크립터에 직접 shutdown 한다.
  // 디스크립터는 소켓이 파괴될 때까지 닫히지 않으므로 읽기 쪽은 EOF/오류로 깨어난다.
  if (native_handle_ >= 0) {
    ::shutdown(native_handle_, SHUT_RDWR);
  }
}

RedisPool::Lease::Lease(RedisPool* pool, std::shared_ptr<RedisConnection> conn)
    : pool_(pool), conn_(std::move(conn)) {}

RedisPool::Lease::Lease(Lease&& other) noexcept : pool_(other.pool_), conn_(std::move(other.conn_)) {
  other.pool_ = nullptr;
}

RedisPool::Lease::~Lease() {
  if (pool_ && conn_) {
    pool_->Release(conn_);
  }
}

RedisPool::RedisPool(RedisConfig config) : config_(std::move(config)) {}

RedisPool::~RedisPool() { Close(); }

RedisPool::Lease RedisPool::Acquire() {
  std::unique_lock<std::mutex> lock(mutex_);
  available_.wait(lock, [this]() { return closed_ || active_ < config_.max_active; });
  if (closed_) {
    throw StoreError("redis 연결 풀이 닫혔습니다");
  }

  auto now = std::chrono::steady_clock::now();
  while (!idle_.empty() && now - idle_.front()->LastUsed() > config_.idle_timeout) {
    idle_.front()->Shutdown();
    idle_.pop_front();
  }
  if (!idle_.empty()) {
    auto conn = idle_.back();
    idle_.pop_back();
    ++active_;
    leased_.insert(conn);
    return Lease(this, conn);
  }

  // 연결 수립은 락 밖에서 한다. 자리는 미리 확보해 둔다.
  ++active_;
  lock.unlock();
  std::shared_ptr<RedisConnection> conn;
  try {
    conn = std::make_shared<RedisConnection>(config_.host, config_.port);
  } catch (const StoreError&) {
    lock.lock();
    --active_;
    available_.notify_one();
    throw;
  }
  lock.lock();
  if (closed_) {
    --active_;
    conn->Shutdown();
    available_.notify_one();
    throw StoreError("redis 연결 풀이 닫혔습니다");
  }
  leased_.insert(conn);
  return Lease(this, conn);
}

void RedisPool::Release(const std::shared_ptr<RedisConnection>& conn) {
  std::lock_guard<std::mutex> lock(mutex_);
  leased_.erase(conn);
  --active_;
  if (!closed_ && !conn->Broken() && idle_.size() < config_.max_idle) {
    conn->Touch();
    idle_.push_back(conn);
  } else {
    conn->Shutdown();
  }
  available_.notify_one();
}

void RedisPool::Close() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_) {
    return;
  }
  closed_ = true;
  for (auto& conn : idle_) {
    conn->Shutdown();
  }
  idle_.clear();
  for (const auto& conn : leased_) {
    conn->Shutdown();
  }
  available_.notify_all();
}

std::size_t RedisPool::ActiveCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

}  // namespace icc
