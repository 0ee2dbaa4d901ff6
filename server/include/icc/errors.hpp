/*
 * 설명: 저장소/취소/클라이언트 노출 오류 타입을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/gateway_test.cpp, server/tests/unit/notify_service_test.cpp
 */
#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace icc {

// 백엔드 저장소와의 연결/프로토콜 실패. 클라이언트에 그대로 노출하지 않는다.
class StoreError : public std::runtime_error {
 public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

// 호출자의 취소 신호가 먼저 발생해 블로킹 작업을 포기했다.
class CancelledError : public std::runtime_error {
 public:
  CancelledError() : std::runtime_error("작업이 취소되었습니다") {}
};

enum class ErrorKind { kInvalid, kNotAllowed, kNotFound };

inline std::string_view KindTag(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalid:
      return "invalid";
    case ErrorKind::kNotAllowed:
      return "not-allowed";
    case ErrorKind::kNotFound:
      return "not-found";
  }
  return "invalid";
}

// 클라이언트에 안전하게 돌려줄 수 있는 오류. kind 태그는 클라이언트 재시도 로직이 사용한다.
class ClientError : public std::runtime_error {
 public:
  ClientError(ErrorKind kind, const std::string& message) : std::runtime_error(message), kind(kind) {}
  std::string_view Type() const { return KindTag(kind); }
  ErrorKind kind;
};

}  // namespace icc
