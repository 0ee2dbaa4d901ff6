/*
 * 설명: 설정 데이터스토어 연결과 재시도 로직을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/settings_it_test.cpp
 */
#include "icc/db_client.hpp"

#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace icc {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kLockWaitTimeout = 1205;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kTooManyConnections = 1040;

// 연결 단위 자원 해제용.
struct ConnectionCloser {
  MYSQL* conn;
  ~ConnectionCloser() {
    if (conn) {
      mysql_close(conn);
    }
  }
};
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MYSQL* MariaDbClient::Connect() const {
  MYSQL* conn = mysql_init(nullptr);
  if (!conn) {
    throw DbException("설정 DB 초기화 실패", 0, true);
  }
  mysql_options(conn, MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn, MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  if (!mysql_real_connect(conn, config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    ConnectionCloser closer{conn};
    RaiseError(conn, "설정 DB 연결 실패");
  }
  return conn;
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  for (std::size_t attempt = 1; attempt <= kMaxAttempts; ++attempt) {
    try {
      ConnectionCloser closer{Connect()};
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", CR_SERVER_LOST, true);
      }
      work(closer.conn);
      return;
    } catch (const DbException& ex) {
      if (ex.retryable && attempt < kMaxAttempts) {
        Backoff(attempt);
        continue;
      }
      throw;
    }
  }
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, IsRetryable(code));
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kDeadlock || code == kLockWaitTimeout || code == kTooManyConnections || code == CR_SERVER_LOST ||
         code == CR_SERVER_GONE_ERROR || code == CR_CONN_HOST_ERROR || code == CR_CONNECTION_ERROR;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  std::size_t base_ms = 100 * (1u << (attempt - 1));
  std::random_device rd;
  std::mt19937 gen(rd());
  std::uniform_int_distribution<int> dist(0, 50);
  std::this_thread::sleep_for(std::chrono::milliseconds(base_ms + static_cast<std::size_t>(dist(gen))));
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace icc
