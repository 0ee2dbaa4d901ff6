/*
 * 설명: 롱폴 게이트웨이가 Notify/Applause 서비스를 다루는 좁은 수신/송신 인터페이스.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/gateway_test.cpp
 */
#pragma once

#include <string>
#include <string_view>

#include "icc/cancel_signal.hpp"

namespace icc {

class Receiver {
 public:
  virtual ~Receiver() = default;
  // 새 데이터가 생길 때까지 블로킹한다. cancel이 먼저 발생하면 CancelledError.
  virtual std::string Receive(CancelSignal& cancel) = 0;
  // query는 요청 대상의 '?' 뒤 문자열. 매개변수가 필요한 수신자만 재정의한다.
  virtual std::string ReceiveWithQuery(std::string_view /*query*/, CancelSignal& cancel) { return Receive(cancel); }
};

class Sender {
 public:
  virtual ~Sender() = default;
  virtual void Send(int user_id, const std::string& payload) = 0;
  virtual bool RequiresIdentity() const { return true; }
};

}  // namespace icc
