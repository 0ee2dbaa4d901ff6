/*
 * 설명: Redis 스트림/정렬 집합을 모사한 프로세스 내 저장소. 테스트와 개발 실행에 쓴다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_backend_test.cpp
 */
#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "icc/backend.hpp"

namespace icc {

class MemoryBackend : public Backend {
 public:
  void AppendStream(const std::string& payload) override;
  StreamEntry ReadNextStream(const std::string& last_id) override;
  std::string StreamTail() override;

  void AddScored(const std::string& key, std::int64_t score) override;
  std::size_t CountInRange(std::int64_t min_score) override;
  void DeleteBelow(std::int64_t boundary) override;

  void Ping() override;
  void Close() override;

  std::size_t ScoredSize() const;
  std::optional<std::int64_t> ScoreOf(const std::string& key) const;
  std::size_t ParkedReaders() const;

 private:
  std::uint64_t ResolveSequence(const std::string& id) const;
  void EnsureOpen() const;

  mutable std::mutex mutex_;
  std::condition_variable stream_cv_;
  std::vector<std::string> stream_;
  std::unordered_map<std::string, std::int64_t> scores_;
  std::size_t parked_readers_{0};
  bool closed_{false};
};

}  // namespace icc
