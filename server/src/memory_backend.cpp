/*
 * 설명: 프로세스 내 스트림/점수 저장소를 구현한다. ID는 "<순번>-0" 형식이다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/memory_backend_test.cpp
 */
#include "icc/memory_backend.hpp"

#include "icc/errors.hpp"

namespace icc {
namespace {
std::string FormatId(std::uint64_t sequence) { return std::to_string(sequence) + "-0"; }
}  // namespace

void MemoryBackend::EnsureOpen() const {
  if (closed_) {
    throw StoreError("메모리 저장소가 닫혔습니다");
  }
}

std::uint64_t MemoryBackend::ResolveSequence(const std::string& id) const {
  if (id.empty() || id == kStreamFromNow) {
    return stream_.size();
  }
  auto dash = id.find('-');
  try {
    std::size_t idx = 0;
    auto head = id.substr(0, dash);
    auto parsed = std::stoull(head, &idx);
    if (idx != head.size()) {
      throw StoreError("잘못된 스트림 ID: " + id);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw StoreError("잘못된 스트림 ID: " + id);
  }
}

void MemoryBackend::AppendStream(const std::string& payload) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    EnsureOpen();
    stream_.push_back(payload);
  }
  stream_cv_.notify_all();
}

StreamEntry MemoryBackend::ReadNextStream(const std::string& last_id) {
  std::unique_lock<std::mutex> lock(mutex_);
  EnsureOpen();
  auto after = ResolveSequence(last_id);
  ++parked_readers_;
  stream_cv_.wait(lock, [&]() { return closed_ || stream_.size() > after; });
  --parked_readers_;
  EnsureOpen();
  return StreamEntry{FormatId(after + 1), stream_[after]};
}

std::string MemoryBackend::StreamTail() {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureOpen();
  if (stream_.empty()) {
    return kStreamEmptyId;
  }
  return FormatId(stream_.size());
}

void MemoryBackend::AddScored(const std::string& key, std::int64_t score) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureOpen();
  scores_[key] = score;
}

std::size_t MemoryBackend::CountInRange(std::int64_t min_score) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureOpen();
  std::size_t count = 0;
  for (const auto& entry : scores_) {
    if (entry.second >= min_score) {
      ++count;
    }
  }
  return count;
}

void MemoryBackend::DeleteBelow(std::int64_t boundary) {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureOpen();
  for (auto it = scores_.begin(); it != scores_.end();) {
    if (it->second < boundary) {
      it = scores_.erase(it);
    } else {
      ++it;
    }
  }
}

void MemoryBackend::Ping() {
  std::lock_guard<std::mutex> lock(mutex_);
  EnsureOpen();
}

void MemoryBackend::Close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  stream_cv_.notify_all();
}

std::size_t MemoryBackend::ScoredSize() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return scores_.size();
}

std::optional<std::int64_t> MemoryBackend::ScoreOf(const std::string& key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = scores_.find(key);
  if (it == scores_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::size_t MemoryBackend::ParkedReaders() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return parked_readers_;
}

}  // namespace icc
