/*
 * 설명: JSON 라인 구조화 로그와 요청/대기 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/icc_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace icc {

enum class LogLevel { kDebug, kInfo, kError };

LogLevel ParseLogLevel(const std::string& text);

struct LogContext {
  std::string trace_id;
  std::optional<int> user_id;
  std::string name;
  unsigned status{0};
  long latency_ms{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t waiting{0};
};

class Observability {
 public:
  explicit Observability(LogLevel level = LogLevel::kInfo) : level_(level) {}

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void IncrementWaiting();
  void DecrementWaiting();
  MetricsSnapshot Snapshot() const;

  void Log(const LogContext& ctx) const;
  void Debug(const std::string& event, const std::string& message) const;
  void Info(const std::string& event, const std::string& message) const;
  void Error(const std::string& event, const std::string& message) const;

 private:
  void Write(LogLevel level, nlohmann::json line) const;

  LogLevel level_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> waiting_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
  mutable std::mutex write_mutex_;
};

}  // namespace icc
