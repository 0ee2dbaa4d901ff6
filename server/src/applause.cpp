/*
 * 설명: 박수 기록/집계, 주기 집계 루프, 보존 기간 정리 루프를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/applause_service_test.cpp
 */
#include "icc/applause.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "icc/errors.hpp"

namespace icc {
namespace {
std::string LevelBody(const ApplauseLevel& level) {
  nlohmann::json body{{"level", level.level}, {"version", level.version}};
  return body.dump();
}

// "a=1&version=3" 에서 name의 값. 없으면 std::nullopt.
std::optional<std::string_view> QueryValue(std::string_view query, std::string_view name) {
  while (!query.empty()) {
    auto amp = query.find('&');
    auto pair = query.substr(0, amp);
    auto eq = pair.find('=');
    if (pair.substr(0, eq) == name) {
      return eq == std::string_view::npos ? std::string_view{} : pair.substr(eq + 1);
    }
    if (amp == std::string_view::npos) {
      break;
    }
    query.remove_prefix(amp + 1);
  }
  return std::nullopt;
}
}  // namespace

ApplauseService::ApplauseService(std::shared_ptr<Backend> backend, std::shared_ptr<SettingsSource> settings,
                                 ApplauseConfig config, std::shared_ptr<Observability> observability,
                                 std::function<std::int64_t()> clock)
    : backend_(std::move(backend)), settings_(std::move(settings)), config_(config),
      observability_(std::move(observability)), clock_(std::move(clock)) {
  RefreshInterval();
}

void ApplauseService::Send(int user_id, std::int64_t timestamp) {
  backend_->AddScored(std::to_string(user_id), timestamp);
}

std::size_t ApplauseService::Receive(std::int64_t since) { return backend_->CountInRange(since); }

std::string ApplauseService::Receive(CancelSignal& cancel) { return Receive(CurrentLevel().version, cancel); }

std::string ApplauseService::Receive(std::optional<std::uint64_t> known_version, CancelSignal& cancel) {
  if (cancel.IsCancelled()) {
    throw CancelledError();
  }
  if (!known_version) {
    return LevelBody(CurrentLevel());
  }
  const std::uint64_t seen = *known_version;
  bool cancelled = false;
  auto subscription = cancel.Subscribe([this, &cancelled]() {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      cancelled = true;
    }
    level_cv_.notify_all();
  });

  std::unique_lock<std::mutex> lock(mutex_);
  level_cv_.wait(lock, [&]() { return level_.version != seen || cancelled; });
  ApplauseLevel current = level_;
  lock.unlock();
  // 신호 락 -> 레벨 락 순서를 지키기 위해 레벨 락을 푼 뒤 해제한다.
  cancel.Unsubscribe(subscription);

  if (current.version == seen) {
    throw CancelledError();
  }
  return LevelBody(current);
}

std::string ApplauseService::ReceiveWithQuery(std::string_view query, CancelSignal& cancel) {
  auto raw = QueryValue(query, "version");
  if (!raw) {
    return Receive(std::nullopt, cancel);
  }
  if (raw->empty() || raw->find_first_not_of("0123456789") != std::string_view::npos || raw->size() > 19) {
    throw ClientError(ErrorKind::kInvalid, "version 값이 올바르지 않습니다");
  }
  return Receive(std::stoull(std::string(*raw)), cancel);
}

void ApplauseService::Send(int user_id, const std::string& /*payload*/) { Send(user_id, clock_()); }

void ApplauseService::Loop(CancelSignal& cancel) {
  std::size_t ticks = 0;
  while (!cancel.WaitFor(config_.tick)) {
    if (config_.refresh_ticks > 0 && ++ticks % config_.refresh_ticks == 0) {
      RefreshInterval();
    }
    try {
      PublishIfChanged();
    } catch (const std::exception& ex) {
      if (observability_) {
        observability_->Error("applause_publish", ex.what());
      }
    }
  }
}

void ApplauseService::PruneOldData(CancelSignal& cancel) {
  while (!cancel.WaitFor(config_.prune_tick)) {
    try {
      PruneOnce();
    } catch (const std::exception& ex) {
      if (observability_) {
        observability_->Error("applause_prune", ex.what());
      }
    }
  }
}

bool ApplauseService::PublishIfChanged() {
  auto since = clock_() - Interval().count();
  auto count = backend_->CountInRange(since);
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (count == level_.level) {
      return false;
    }
    level_.level = count;
    ++level_.version;
  }
  level_cv_.notify_all();
  return true;
}

std::int64_t ApplauseService::PruneOnce() {
  // 경계는 삭제 명령 전에 한 번만 계산한다. 이후 들어온 박수는 경계보다 크므로 지워지지 않는다.
  auto boundary = clock_() - Retention().count();
  backend_->DeleteBelow(boundary);
  return boundary;
}

void ApplauseService::RefreshInterval() {
  if (!settings_) {
    return;
  }
  try {
    auto interval = settings_->ApplauseInterval().value_or(kDefaultApplauseInterval);
    std::lock_guard<std::mutex> lock(mutex_);
    interval_ = interval;
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Error("applause_settings", std::string{"간격 설정을 갱신하지 못했습니다: "} + ex.what());
    }
  }
}

ApplauseLevel ApplauseService::CurrentLevel() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return level_;
}

std::chrono::seconds ApplauseService::Interval() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return interval_;
}

std::chrono::seconds ApplauseService::Retention() const {
  std::lock_guard<std::mutex> lock(mutex_);
  // 보존 기간은 집계 창보다 짧아질 수 없다.
  return std::max(config_.retention, interval_);
}

}  // namespace icc
