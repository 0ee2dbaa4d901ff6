/*
 * 설명: Redis 직렬화 프로토콜(RESP) 명령 인코딩과 점진적 응답 파싱을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/resp_codec_test.cpp
 */
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace icc {

struct RespReply {
  enum class Type { kSimpleString, kError, kInteger, kBulkString, kArray, kNil };

  Type type{Type::kNil};
  std::string str;
  long long integer{0};
  std::vector<RespReply> elements;

  bool IsNil() const { return type == Type::kNil; }
};

std::string EncodeCommand(const std::vector<std::string>& args);

class RespParser {
 public:
  // data 앞부분에 완전한 응답이 있으면 돌려주고 consumed에 사용한 바이트 수를 기록한다.
  // 아직 덜 도착했으면 std::nullopt, 형식이 깨졌으면 StoreError.
  static std::optional<RespReply> Parse(std::string_view data, std::size_t& consumed);

 private:
  static std::optional<RespReply> ParseAt(std::string_view data, std::size_t& pos);
};

}  // namespace icc
