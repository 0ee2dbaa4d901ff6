/*
 * 설명: 취소 신호 구독/해제와 부모-자식 전파를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/cancellable_call_test.cpp
 */
#include "icc/cancel_signal.hpp"

namespace icc {

CancelSignal::~CancelSignal() {
  if (parent_ && parent_subscription_ != 0) {
    parent_->Unsubscribe(parent_subscription_);
  }
}

std::shared_ptr<CancelSignal> CancelSignal::ChildOf(const std::shared_ptr<CancelSignal>& parent) {
  auto child = std::make_shared<CancelSignal>();
  if (!parent) {
    return child;
  }
  child->parent_ = parent;
  CancelSignal* raw = child.get();
  // 자식 소멸자가 구독을 해제하므로 raw 포인터 캡처가 안전하다.
  child->parent_subscription_ = parent->Subscribe([raw]() { raw->Cancel(); });
  return child;
}

void CancelSignal::Cancel() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_) {
    return;
  }
  cancelled_ = true;
  cv_.notify_all();
  for (auto& entry : callbacks_) {
    entry.second();
  }
  callbacks_.clear();
}

bool CancelSignal::IsCancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return cancelled_;
}

std::uint64_t CancelSignal::Subscribe(Callback callback) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!cancelled_) {
      auto id = next_id_++;
      callbacks_.emplace(id, std::move(callback));
      return id;
    }
  }
  callback();
  return 0;
}

void CancelSignal::Unsubscribe(std::uint64_t id) {
  if (id == 0) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  callbacks_.erase(id);
}

bool CancelSignal::WaitFor(std::chrono::milliseconds duration) const {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, duration, [this]() { return cancelled_; });
  return cancelled_;
}

}  // namespace icc
