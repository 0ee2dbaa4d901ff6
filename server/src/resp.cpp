/*
 * 설명: RESP 명령 인코딩과 응답 파서를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/resp_codec_test.cpp
 */
#include "icc/resp.hpp"

#include <sstream>

#include "icc/errors.hpp"

namespace icc {
namespace {
constexpr std::string_view kCrlf = "\r\n";

long long ParseInteger(std::string_view text) {
  try {
    std::size_t idx = 0;
    std::string value{text};
    auto parsed = std::stoll(value, &idx);
    if (idx != value.size()) {
      throw StoreError("RESP 정수 형식 오류: " + value);
    }
    return parsed;
  } catch (const std::logic_error&) {
    throw StoreError("RESP 정수 형식 오류: " + std::string{text});
  }
}
}  // namespace

std::string EncodeCommand(const std::vector<std::string>& args) {
  std::ostringstream oss;
  oss << '*' << args.size() << kCrlf;
  for (const auto& arg : args) {
    oss << '$' << arg.size() << kCrlf << arg << kCrlf;
  }
  return oss.str();
}

std::optional<RespReply> RespParser::Parse(std::string_view data, std::size_t& consumed) {
  std::size_t pos = 0;
  auto reply = ParseAt(data, pos);
  if (reply) {
    consumed = pos;
  }
  return reply;
}

std::optional<RespReply> RespParser::ParseAt(std::string_view data, std::size_t& pos) {
  if (pos >= data.size()) {
    return std::nullopt;
  }
  auto line_end = data.find(kCrlf, pos);
  if (line_end == std::string_view::npos) {
    return std::nullopt;
  }
  char marker = data[pos];
  std::string_view line = data.substr(pos + 1, line_end - pos - 1);
  std::size_t next = line_end + kCrlf.size();

  RespReply reply;
  switch (marker) {
    case '+':
      reply.type = RespReply::Type::kSimpleString;
      reply.str = std::string{line};
      pos = next;
      return reply;
    case '-':
      reply.type = RespReply::Type::kError;
      reply.str = std::string{line};
      pos = next;
      return reply;
    case ':':
      reply.type = RespReply::Type::kInteger;
      reply.integer = ParseInteger(line);
      pos = next;
      return reply;
    case '$': {
      auto length = ParseInteger(line);
      if (length < 0) {
        pos = next;
        return reply;
      }
      auto size = static_cast<std::size_t>(length);
      if (data.size() < next + size + kCrlf.size()) {
        return std::nullopt;
      }
      if (data.substr(next + size, kCrlf.size()) != kCrlf) {
        throw StoreError("RESP 벌크 문자열 종료 표식이 없습니다");
      }
      reply.type = RespReply::Type::kBulkString;
      reply.str = std::string{data.substr(next, size)};
      pos = next + size + kCrlf.size();
      return reply;
    }
    case '*': {
      auto count = ParseInteger(line);
      if (count < 0) {
        pos = next;
        return reply;
      }
      reply.type = RespReply::Type::kArray;
      std::size_t cursor = next;
      for (long long i = 0; i < count; ++i) {
        auto element = ParseAt(data, cursor);
        if (!element) {
          return std::nullopt;
        }
        reply.elements.push_back(std::move(*element));
      }
      pos = cursor;
      return reply;
    }
    default:
      throw StoreError(std::string{"RESP 타입 표식을 알 수 없습니다: "} + marker);
  }
}

}  // namespace icc
