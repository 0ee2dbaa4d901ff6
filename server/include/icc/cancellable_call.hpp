/*
 * 설명: 중단할 수 없는 블로킹 호출을 별도 스레드에서 실행하고 취소 신호와 경합시킨다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/cancellable_call_test.cpp
 */
#pragma once

#include <condition_variable>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <utility>

#include "icc/cancel_signal.hpp"
#include "icc/errors.hpp"

namespace icc {

// 분리된 스레드에서 한 번 실행되는 블로킹 호출. 여러 대기자가 같은 결과를 기다릴 수 있고,
// 각자 자기 cancel로 먼저 빠져나갈 수 있다. 호출 자체는 강제로 멈추지 않는다.
template <typename Result>
class PendingCall : public std::enable_shared_from_this<PendingCall<Result>> {
 public:
  static std::shared_ptr<PendingCall> Start(std::function<Result()> call) {
    auto pending = std::shared_ptr<PendingCall>(new PendingCall());
    std::thread([pending, call = std::move(call)]() {
      std::optional<Result> result;
      std::exception_ptr error;
      try {
        result.emplace(call());
      } catch (...) {
        error = std::current_exception();
      }
      {
        std::lock_guard<std::mutex> lock(pending->mutex_);
        pending->result_ = std::move(result);
        pending->error_ = error;
        pending->done_ = true;
      }
      pending->cv_.notify_all();
    }).detach();
    return pending;
  }

  // 결과가 먼저면 그 값(또는 호출이 던진 예외), cancel이 먼저면 CancelledError.
  Result Wait(CancelSignal& cancel) {
    if (cancel.IsCancelled()) {
      throw CancelledError();
    }
    auto self = this->shared_from_this();
    auto cancelled = std::make_shared<bool>(false);
    auto subscription = cancel.Subscribe([self, cancelled]() {
      {
        std::lock_guard<std::mutex> lock(self->mutex_);
        *cancelled = true;
      }
      self->cv_.notify_all();
    });

    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this, &cancelled]() { return done_ || *cancelled; });
    bool finished = done_;
    std::optional<Result> result = result_;
    std::exception_ptr error = error_;
    lock.unlock();
    // 신호 락 -> 상태 락 순서를 지키기 위해 상태 락을 푼 뒤 구독을 해제한다.
    cancel.Unsubscribe(subscription);

    if (!finished) {
      throw CancelledError();
    }
    if (error) {
      std::rethrow_exception(error);
    }
    return std::move(*result);
  }

  bool Done() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return done_;
  }

 private:
  PendingCall() = default;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::optional<Result> result_;
  std::exception_ptr error_;
  bool done_{false};
};

// call 결과와 cancel 중 먼저 도착한 쪽을 돌려준다. 취소가 먼저면 CancelledError.
// 작업 스레드는 강제로 멈추지 않는다. 나중에 끝나면 결과는 공유 상태에 남았다가 버려진다.
template <typename Result>
Result RunCancellable(CancelSignal& cancel, std::function<Result()> call) {
  if (cancel.IsCancelled()) {
    throw CancelledError();
  }
  return PendingCall<Result>::Start(std::move(call))->Wait(cancel);
}

}  // namespace icc
