/*
 * 설명: 박수 집계 간격 같은 회의 설정을 공급하는 설정 소스(정적/MariaDB).
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/applause_service_test.cpp, server/tests/it/settings_it_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>

#include "icc/db_client.hpp"

namespace icc {

class SettingsSource {
 public:
  virtual ~SettingsSource() = default;
  // 값이 설정되지 않았으면 std::nullopt. 조회 실패는 예외로 알린다.
  virtual std::optional<std::chrono::seconds> ApplauseInterval() = 0;
};

class StaticSettingsSource : public SettingsSource {
 public:
  explicit StaticSettingsSource(std::optional<std::chrono::seconds> interval) : interval_(interval) {}
  std::optional<std::chrono::seconds> ApplauseInterval() override { return interval_; }

 private:
  std::optional<std::chrono::seconds> interval_;
};

// icc_settings(name, value) 테이블에서 applause_interval_seconds 를 읽는다.
class MariaDbSettingsSource : public SettingsSource {
 public:
  explicit MariaDbSettingsSource(std::shared_ptr<MariaDbClient> db_client);
  std::optional<std::chrono::seconds> ApplauseInterval() override;

  // icc_settings(name, value) 테이블이 없으면 만든다.
  void EnsureSchema() const;
  void StoreApplauseInterval(std::chrono::seconds interval) const;
  void Clear() const;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace icc
