/*
 * 설명: JSON 응답 엔벨로프를 생성한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#include "icc/api_response.hpp"

#include <chrono>
#include <iomanip>
#include <sstream>

namespace icc {
namespace {
std::string CurrentTimestamp() {
  using clock = std::chrono::system_clock;
  auto itt = clock::to_time_t(clock::now());
  std::tm tm{};
  gmtime_r(&itt, &tm);
  std::ostringstream ss;
  ss << std::put_time(&tm, "%FT%TZ");
  return ss.str();
}
}  // namespace

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data) {
  nlohmann::json envelope;
  envelope["success"] = true;
  envelope["data"] = data;
  envelope["error"] = nullptr;
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message) {
  nlohmann::json envelope;
  envelope["success"] = false;
  envelope["data"] = nullptr;
  envelope["error"] = {{"code", code}, {"message", message}, {"detail", nullptr}};
  envelope["meta"] = {{"timestamp", CurrentTimestamp()}};
  return envelope;
}

nlohmann::json MakeClientErrorEnvelope(const ClientError& error) { return MakeErrorEnvelope(error.Type(), error.what()); }

nlohmann::json MakeInternalErrorEnvelope() {
  return MakeErrorEnvelope(kInternalErrorCode, "서버 내부 오류가 발생했습니다");
}

}  // namespace icc
