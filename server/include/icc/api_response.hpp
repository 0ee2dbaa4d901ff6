/*
 * 설명: HTTP 응답 엔벨로프(성공/클라이언트 오류/내부 오류) 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/json_envelope_test.cpp
 */
#pragma once

#include <string_view>

#include <nlohmann/json.hpp>

#include "icc/errors.hpp"

namespace icc {

inline constexpr char kInternalErrorCode[] = "internal";

nlohmann::json MakeSuccessEnvelope(const nlohmann::json& data);
nlohmann::json MakeErrorEnvelope(std::string_view code, std::string_view message);
nlohmann::json MakeClientErrorEnvelope(const ClientError& error);
// 내부 오류 원문은 절대 담지 않는다.
nlohmann::json MakeInternalErrorEnvelope();

}  // namespace icc
