/*
 * 설명: 저장소 준비 대기 루프를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "icc/backend.hpp"

#include <chrono>

#include "icc/errors.hpp"

namespace icc {

bool WaitForReady(Backend& backend, CancelSignal& cancel, const std::shared_ptr<Observability>& observability) {
  while (!cancel.IsCancelled()) {
    try {
      backend.Ping();
      return true;
    } catch (const StoreError& ex) {
      if (observability) {
        observability->Info("store_wait", std::string{"저장소 대기 중: "} + ex.what());
      }
    }
    if (cancel.WaitFor(std::chrono::milliseconds(500))) {
      break;
    }
  }
  return false;
}

}  // namespace icc
