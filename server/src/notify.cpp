/*
 * 설명: ICC 메시지 발행 검증과 취소 가능한 스트림 수신을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/notify_service_test.cpp
 */
#include "icc/notify.hpp"

#include <exception>

#include <nlohmann/json.hpp>

#include "icc/cancellable_call.hpp"
#include "icc/errors.hpp"

namespace icc {

NotifyService::NotifyService(std::shared_ptr<Backend> backend)
    : backend_(std::move(backend)), cursor_(backend_->StreamTail()) {}

void NotifyService::Send(const std::string& payload) { backend_->AppendStream(payload); }

std::string NotifyService::Receive(CancelSignal& cancel) {
  if (cancel.IsCancelled()) {
    throw CancelledError();
  }
  std::string last_id;
  std::shared_ptr<PendingCall<StreamEntry>> read;
  {
    std::lock_guard<std::mutex> lock(cursor_mutex_);
    last_id = cursor_;
    // 같은 커서의 읽기가 이미 진행 중이면 새로 시작하지 않고 그 결과를 기다린다.
    if (!pending_ || pending_cursor_ != last_id) {
      auto backend = backend_;
      // 작업 스레드가 요청보다 오래 살 수 있으므로 this가 아닌 값만 캡처한다.
      pending_ = PendingCall<StreamEntry>::Start([backend, last_id]() { return backend->ReadNextStream(last_id); });
      pending_cursor_ = last_id;
    }
    read = pending_;
  }

  StreamEntry entry;
  try {
    entry = read->Wait(cancel);
  } catch (const CancelledError&) {
    throw;
  } catch (const std::exception&) {
    // 실패한 읽기는 다음 Receive가 다시 시작하도록 버린다.
    std::lock_guard<std::mutex> lock(cursor_mutex_);
    if (pending_ == read) {
      pending_.reset();
    }
    throw;
  }

  std::lock_guard<std::mutex> lock(cursor_mutex_);
  if (pending_ == read) {
    pending_.reset();
  }
  if (cursor_ == last_id) {
    cursor_ = entry.id;
  }
  return entry.payload;
}

void NotifyService::Send(int user_id, const std::string& payload) {
  nlohmann::json message;
  try {
    message = nlohmann::json::parse(payload);
  } catch (const nlohmann::json::parse_error&) {
    throw ClientError(ErrorKind::kInvalid, "메시지가 올바른 JSON이 아닙니다");
  }
  if (!message.is_object()) {
    throw ClientError(ErrorKind::kInvalid, "메시지는 JSON 객체여야 합니다");
  }
  if (!message.contains("name") || !message["name"].is_string() || message["name"].get<std::string>().empty()) {
    throw ClientError(ErrorKind::kInvalid, "name 필드가 필요합니다");
  }
  if (!message.contains("message")) {
    throw ClientError(ErrorKind::kInvalid, "message 필드가 필요합니다");
  }
  message["sender_user_id"] = user_id;
  Send(message.dump());
}

std::string NotifyService::Cursor() const {
  std::lock_guard<std::mutex> lock(cursor_mutex_);
  return cursor_;
}

}  // namespace icc
