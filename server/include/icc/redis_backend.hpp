/*
 * 설명: Redis 스트림(icc)과 정렬 집합(applause) 위에 저장소 인터페이스를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/resp_codec_test.cpp, server/tests/unit/redis_backend_test.cpp,
 *         server/tests/it/redis_backend_it_test.cpp
 */
#pragma once

#include <string>

#include "icc/backend.hpp"
#include "icc/redis_pool.hpp"

namespace icc {

inline constexpr char kIccStreamKey[] = "icc";
inline constexpr char kApplauseKey[] = "applause";
inline constexpr char kStreamContentField[] = "content";

// XREAD 응답([[key, [[id, [field, value, ...]]]]])에서 첫 항목을 꺼낸다.
StreamEntry DecodeStreamReply(const RespReply& reply);

class RedisBackend : public Backend {
 public:
  explicit RedisBackend(RedisConfig config, std::string stream_key = kIccStreamKey,
                        std::string applause_key = kApplauseKey);

  void AppendStream(const std::string& payload) override;
  StreamEntry ReadNextStream(const std::string& last_id) override;
  std::string StreamTail() override;

  void AddScored(const std::string& key, std::int64_t score) override;
  std::size_t CountInRange(std::int64_t min_score) override;
  void DeleteBelow(std::int64_t boundary) override;

  void Ping() override;
  void Close() override;

 private:
  RespReply Execute(const std::vector<std::string>& args);

  RedisPool pool_;
  // 블로킹 읽기는 별도 풀을 쓴다. 읽기가 연결을 오래 잡아도 XADD/ZADD 등은 막히지 않는다.
  RedisPool blocking_pool_;
  std::string stream_key_;
  std::string applause_key_;
};

}  // namespace icc
