/*
 * 설명: MariaDB 설정 테이블 조회/저장을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/settings_it_test.cpp
 */
#include "icc/settings.hpp"

#include <sstream>
#include <string>

#include "icc/errors.hpp"

namespace icc {
namespace {
constexpr char kApplauseIntervalName[] = "applause_interval_seconds";
}  // namespace

MariaDbSettingsSource::MariaDbSettingsSource(std::shared_ptr<MariaDbClient> db_client)
    : db_client_(std::move(db_client)) {}

std::optional<std::chrono::seconds> MariaDbSettingsSource::ApplauseInterval() {
  std::optional<std::string> value;
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "SELECT value FROM icc_settings WHERE name='" << kApplauseIntervalName << "' LIMIT 1;";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "설정 조회 실패");
    }
    MYSQL_RES* res = mysql_store_result(conn);
    if (!res) {
      db_client_->RaiseError(conn, "설정 결과 없음");
    }
    MYSQL_ROW row = mysql_fetch_row(res);
    if (row && row[0]) {
      value = row[0];
    }
    mysql_free_result(res);
  });
  if (!value) {
    return std::nullopt;
  }
  try {
    std::size_t idx = 0;
    auto parsed = std::stoll(*value, &idx);
    if (idx != value->size() || parsed <= 0) {
      throw StoreError("applause 간격 설정 값이 올바르지 않습니다: " + *value);
    }
    return std::chrono::seconds(parsed);
  } catch (const std::logic_error&) {
    throw StoreError("applause 간격 설정 값이 올바르지 않습니다: " + *value);
  }
}

void MariaDbSettingsSource::EnsureSchema() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    const char* ddl =
        "CREATE TABLE IF NOT EXISTS icc_settings ("
        "name VARCHAR(64) NOT NULL PRIMARY KEY, "
        "value VARCHAR(255) NOT NULL);";
    if (mysql_query(conn, ddl) != 0) {
      db_client_->RaiseError(conn, "설정 테이블 생성 실패");
    }
  });
}

void MariaDbSettingsSource::StoreApplauseInterval(std::chrono::seconds interval) const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    std::ostringstream oss;
    oss << "REPLACE INTO icc_settings(name, value) VALUES('" << kApplauseIntervalName << "', '"
        << interval.count() << "');";
    if (mysql_query(conn, oss.str().c_str()) != 0) {
      db_client_->RaiseError(conn, "설정 저장 실패");
    }
  });
}

void MariaDbSettingsSource::Clear() const {
  db_client_->WithConnectionRetry([&](MYSQL* conn) {
    if (mysql_query(conn, "DELETE FROM icc_settings;") != 0) {
      db_client_->RaiseError(conn, "설정 삭제 실패");
    }
  });
}

}  // namespace icc
