/*
 * 설명: 스트림/점수 집합 저장소 추상화와 기동 시 준비 대기를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_backend_test.cpp, server/tests/it/redis_backend_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

#include "icc/cancel_signal.hpp"
#include "icc/observability.hpp"

namespace icc {

// "$"는 "지금 이후에 추가되는 항목만"을 뜻한다.
inline constexpr char kStreamFromNow[] = "$";
inline constexpr char kStreamEmptyId[] = "0-0";

struct StreamEntry {
  std::string id;
  std::string payload;
};

class Backend {
 public:
  virtual ~Backend() = default;

  virtual void AppendStream(const std::string& payload) = 0;
  // last_id 이후 첫 항목이 생길 때까지 무기한 블로킹한다. 중단 API는 없다.
  virtual StreamEntry ReadNextStream(const std::string& last_id) = 0;
  // 가장 최근 항목의 ID. 비어 있으면 kStreamEmptyId.
  virtual std::string StreamTail() = 0;

  virtual void AddScored(const std::string& key, std::int64_t score) = 0;
  virtual std::size_t CountInRange(std::int64_t min_score) = 0;
  // score < boundary 인 항목을 모두 지운다.
  virtual void DeleteBelow(std::int64_t boundary) = 0;

  virtual void Ping() = 0;
  virtual void Close() = 0;
};

// 저장소가 응답하거나 cancel이 발생할 때까지 500ms 간격으로 PING 한다. 기동 시에만 사용한다.
bool WaitForReady(Backend& backend, CancelSignal& cancel, const std::shared_ptr<Observability>& observability);

}  // namespace icc
