/*
 * 설명: 설정 데이터스토어(MariaDB) 연결과 일시 오류 재시도 정책을 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/settings_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace icc {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  // 연결을 열어 work를 실행하고 닫는다. 재시도 가능한 오류면 최대 3회까지 백오프 후 다시 시도한다.
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  // 테스트에서 n번째 시도를 일시 오류로 만들 때 쓴다.
  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

 private:
  MYSQL* Connect() const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace icc
