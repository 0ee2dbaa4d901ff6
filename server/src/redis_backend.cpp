/*
 * 설명: Redis 명령(XADD/XREAD/XREVRANGE/ZADD/ZCOUNT/ZREMRANGEBYSCORE/PING)으로 저장소를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/resp_codec_test.cpp, server/tests/unit/redis_backend_test.cpp,
 *         server/tests/it/redis_backend_it_test.cpp
 */
#include "icc/redis_backend.hpp"

#include <algorithm>

#include "icc/errors.hpp"

namespace icc {
namespace {
bool IsArray(const RespReply& reply, std::size_t min_size) {
  return reply.type == RespReply::Type::kArray && reply.elements.size() >= min_size;
}

// [id, [field, value, ...]] 형태의 스트림 항목을 해석한다.
StreamEntry DecodeEntry(const RespReply& entry) {
  if (!IsArray(entry, 2) || !IsArray(entry.elements[1], 0)) {
    throw StoreError("스트림 항목 형식 오류");
  }
  StreamEntry result;
  result.id = entry.elements[0].str;
  const auto& fields = entry.elements[1].elements;
  for (std::size_t i = 0; i + 1 < fields.size(); i += 2) {
    if (fields[i].str == kStreamContentField) {
      result.payload = fields[i + 1].str;
      return result;
    }
  }
  throw StoreError("스트림 항목에 content 필드가 없습니다: " + result.id);
}
}  // namespace

StreamEntry DecodeStreamReply(const RespReply& reply) {
  if (reply.IsNil()) {
    throw StoreError("XREAD 응답이 비어 있습니다");
  }
  if (!IsArray(reply, 1) || !IsArray(reply.elements[0], 2)) {
    throw StoreError("XREAD 응답 형식 오류");
  }
  const auto& entries = reply.elements[0].elements[1];
  if (!IsArray(entries, 1)) {
    throw StoreError("XREAD 응답에 항목이 없습니다");
  }
  return DecodeEntry(entries.elements[0]);
}

namespace {
RedisConfig BlockingReadConfig(RedisConfig config) {
  config.max_active = config.max_blocking_reads;
  config.max_idle = std::min(config.max_idle, config.max_blocking_reads);
  return config;
}
}  // namespace

RedisBackend::RedisBackend(RedisConfig config, std::string stream_key, std::string applause_key)
    : pool_(config), blocking_pool_(BlockingReadConfig(config)), stream_key_(std::move(stream_key)),
      applause_key_(std::move(applause_key)) {}

RespReply RedisBackend::Execute(const std::vector<std::string>& args) {
  auto conn = pool_.Acquire();
  return conn->Execute(args);
}

void RedisBackend::AppendStream(const std::string& payload) {
  Execute({"XADD", stream_key_, "*", kStreamContentField, payload});
}

StreamEntry RedisBackend::ReadNextStream(const std::string& last_id) {
  const std::string id = last_id.empty() ? std::string{kStreamFromNow} : last_id;
  auto conn = blocking_pool_.Acquire();
  auto reply = conn->Execute({"XREAD", "COUNT", "1", "BLOCK", "0", "STREAMS", stream_key_, id});
  return DecodeStreamReply(reply);
}

std::string RedisBackend::StreamTail() {
  auto reply = Execute({"XREVRANGE", stream_key_, "+", "-", "COUNT", "1"});
  if (reply.type != RespReply::Type::kArray) {
    throw StoreError("XREVRANGE 응답 형식 오류");
  }
  if (reply.elements.empty()) {
    return kStreamEmptyId;
  }
  return DecodeEntry(reply.elements[0]).id;
}

void RedisBackend::AddScored(const std::string& key, std::int64_t score) {
  Execute({"ZADD", applause_key_, std::to_string(score), key});
}

std::size_t RedisBackend::CountInRange(std::int64_t min_score) {
  auto reply = Execute({"ZCOUNT", applause_key_, std::to_string(min_score), "+inf"});
  if (reply.type != RespReply::Type::kInteger || reply.integer < 0) {
    throw StoreError("ZCOUNT 응답 형식 오류");
  }
  return static_cast<std::size_t>(reply.integer);
}

void RedisBackend::DeleteBelow(std::int64_t boundary) {
  Execute({"ZREMRANGEBYSCORE", applause_key_, "-inf", "(" + std::to_string(boundary)});
}

void RedisBackend::Ping() {
  auto reply = Execute({"PING"});
  if (reply.str != "PONG") {
    throw StoreError("PING 응답이 올바르지 않습니다: " + reply.str);
  }
}

void RedisBackend::Close() {
  pool_.Close();
  blocking_pool_.Close();
}

}  // namespace icc
