/*
 * 설명: 사용자별 중복 제거 박수 신호를 시간 창으로 집계하고, 오래된 항목 정리와 레벨 변경 발행을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/applause_service_test.cpp, server/tests/e2e/icc_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "icc/auth.hpp"
#include "icc/backend.hpp"
#include "icc/capability.hpp"
#include "icc/observability.hpp"
#include "icc/settings.hpp"

namespace icc {

inline constexpr std::chrono::seconds kDefaultApplauseInterval{5};

struct ApplauseConfig {
  std::chrono::seconds retention{std::chrono::seconds(300)};
  std::chrono::milliseconds tick{std::chrono::milliseconds(1000)};
  std::chrono::milliseconds prune_tick{std::chrono::seconds(60)};
  std::size_t refresh_ticks{60};
};

struct ApplauseLevel {
  std::size_t level{0};
  std::uint64_t version{0};
};

class ApplauseService : public Receiver, public Sender {
 public:
  ApplauseService(std::shared_ptr<Backend> backend, std::shared_ptr<SettingsSource> settings, ApplauseConfig config,
                  std::shared_ptr<Observability> observability, std::function<std::int64_t()> clock = UnixNow);

  // 같은 사용자의 이전 박수는 덮어쓴다.
  void Send(int user_id, std::int64_t timestamp);
  // timestamp >= since 인 서로 다른 사용자 수.
  std::size_t Receive(std::int64_t since);

  // 롱폴: 발행된 버전이 known_version과 달라질 때까지 기다린 뒤 {"level","version"} JSON을 돌려준다.
  // known_version이 없으면 현재 레벨을 바로 돌려준다.
  std::string Receive(std::optional<std::uint64_t> known_version, CancelSignal& cancel);
  // 호출 시점 이후의 다음 변경을 기다린다.
  std::string Receive(CancelSignal& cancel) override;
  // 쿼리의 version 매개변수를 known_version으로 쓴다. 숫자가 아니면 invalid.
  std::string ReceiveWithQuery(std::string_view query, CancelSignal& cancel) override;
  // 롱폴 송신: 현재 시각으로 박수를 기록한다. 본문은 쓰지 않는다.
  void Send(int user_id, const std::string& payload) override;

  void Loop(CancelSignal& cancel);
  void PruneOldData(CancelSignal& cancel);

  // 집계 한 번. 값이 바뀌어 발행했으면 true.
  bool PublishIfChanged();
  // 정리 한 번. 사용한 경계를 돌려준다.
  std::int64_t PruneOnce();
  void RefreshInterval();

  ApplauseLevel CurrentLevel() const;
  std::chrono::seconds Interval() const;
  std::chrono::seconds Retention() const;

 private:
  std::shared_ptr<Backend> backend_;
  std::shared_ptr<SettingsSource> settings_;
  ApplauseConfig config_;
  std::shared_ptr<Observability> observability_;
  std::function<std::int64_t()> clock_;

  mutable std::mutex mutex_;
  std::condition_variable level_cv_;
  std::chrono::seconds interval_{kDefaultApplauseInterval};
  ApplauseLevel level_;
};

}  // namespace icc
