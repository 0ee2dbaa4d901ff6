/*
 * 설명: ICC 알림 스트림 서비스. 단일 읽기 커서로 스트림을 순서대로 전달한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/notify_service_test.cpp, server/tests/e2e/icc_flow_test.cpp
 */
#pragma once

#include <memory>
#include <mutex>
#include <string>

#include "icc/backend.hpp"
#include "icc/cancellable_call.hpp"
#include "icc/capability.hpp"

namespace icc {

// 커서는 이 인스턴스 하나가 소유한다. 한 번에 하나의 논리적 읽기 주체만 Receive를 호출해야 하며,
// 동시에 호출하면 같은 저장소 읽기를 공유하므로 모두 같은 항목을 받는다.
class NotifyService : public Receiver, public Sender {
 public:
  // 생성 시점의 스트림 끝을 커서로 잡는다. 이전 백로그는 전달하지 않는다.
  explicit NotifyService(std::shared_ptr<Backend> backend);

  void Send(const std::string& payload);
  std::string Receive(CancelSignal& cancel) override;

  // HTTP 송신 경로: JSON 메시지를 검증하고 보낸 사용자를 기록한 뒤 Send 한다.
  void Send(int user_id, const std::string& payload) override;

  std::string Cursor() const;

 private:
  std::shared_ptr<Backend> backend_;
  mutable std::mutex cursor_mutex_;
  std::string cursor_;
  // 커서당 진행 중인 저장소 읽기는 하나뿐이다. 취소된 요청이 남긴 읽기는 다음 Receive가 이어받는다.
  std::shared_ptr<PendingCall<StreamEntry>> pending_;
  std::string pending_cursor_;
};

}  // namespace icc
