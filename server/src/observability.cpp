/*
 * 설명: 구조화 로그 출력과 카운터를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#include "icc/observability.hpp"

#include <chrono>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace icc {
namespace {
const char* LevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}
}  // namespace

LogLevel ParseLogLevel(const std::string& text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "info") {
    return LogLevel::kInfo;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  throw std::invalid_argument("알 수 없는 로그 레벨: " + text);
}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::IncrementWaiting() { waiting_.fetch_add(1); }

void Observability::DecrementWaiting() { waiting_.fetch_sub(1); }

MetricsSnapshot Observability::Snapshot() const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.waiting = waiting_.load();
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  nlohmann::json line;
  line["event"] = "request";
  line["traceId"] = ctx.trace_id;
  line["path"] = ctx.name;
  line["status"] = ctx.status;
  line["latencyMs"] = ctx.latency_ms;
  if (ctx.user_id) {
    line["userId"] = *ctx.user_id;
  }
  Write(LogLevel::kInfo, std::move(line));
}

void Observability::Debug(const std::string& event, const std::string& message) const {
  Write(LogLevel::kDebug, {{"event", event}, {"message", message}});
}

void Observability::Info(const std::string& event, const std::string& message) const {
  Write(LogLevel::kInfo, {{"event", event}, {"message", message}});
}

void Observability::Error(const std::string& event, const std::string& message) const {
  Write(LogLevel::kError, {{"event", event}, {"message", message}});
}

void Observability::Write(LogLevel level, nlohmann::json line) const {
  if (level < level_) {
    return;
  }
  line["level"] = LevelName(level);
  // 잘못된 UTF-8이 섞인 저장소 오류 문구도 로그 한 줄로 남긴다.
  auto text = line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(write_mutex_);
  std::cout << text << std::endl;
}

}  // namespace icc
