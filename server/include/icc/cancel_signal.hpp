/*
 * 설명: 요청 단위/서버 종료 단위 취소 신호를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/cancellable_call_test.cpp
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace icc {

// 한 번만 발생하는 취소 플래그. 부모 신호가 취소되면 자식도 함께 취소된다.
class CancelSignal {
 public:
  using Callback = std::function<void()>;

  CancelSignal() = default;
  ~CancelSignal();
  CancelSignal(const CancelSignal&) = delete;
  CancelSignal& operator=(const CancelSignal&) = delete;

  static std::shared_ptr<CancelSignal> ChildOf(const std::shared_ptr<CancelSignal>& parent);

  void Cancel();
  bool IsCancelled() const;

  // 이미 취소된 상태면 콜백을 즉시 호출하고 0을 돌려준다.
  // 콜백은 내부 락을 잡은 채 호출되므로 같은 신호를 다시 건드리면 안 된다.
  std::uint64_t Subscribe(Callback callback);
  void Unsubscribe(std::uint64_t id);

  // 주기 루프용 대기. 취소되었으면 true.
  bool WaitFor(std::chrono::milliseconds duration) const;

 private:
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  bool cancelled_{false};
  std::uint64_t next_id_{1};
  std::map<std::uint64_t, Callback> callbacks_;
  std::shared_ptr<CancelSignal> parent_;
  std::uint64_t parent_subscription_{0};
};

}  // namespace icc
