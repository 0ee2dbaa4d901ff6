/*
 * 설명: 롱폴 HTTP 게이트웨이. 경로별 핸들러를 등록하고 수신/송신 요청을 서비스 호출로 변환하며
 *       오류 종류에 따라 응답 상태와 본문을 결정한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/gateway_test.cpp, server/tests/e2e/icc_flow_test.cpp
 */
#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include <nlohmann/json.hpp>

#include "icc/auth.hpp"
#include "icc/cancel_signal.hpp"
#include "icc/capability.hpp"
#include "icc/errors.hpp"
#include "icc/http_types.hpp"
#include "icc/observability.hpp"

namespace icc {

inline constexpr char kIccReceivePath[] = "/system/icc";
inline constexpr char kIccSendPath[] = "/system/icc/send";
inline constexpr char kApplauseReceivePath[] = "/system/applause";
inline constexpr char kApplauseSendPath[] = "/system/applause/send";
inline constexpr char kHealthPath[] = "/system/icc/health";

// std::nullopt 이면 응답을 쓰지 않고 연결을 닫는다(클라이언트 이탈/종료).
using Handler = std::function<std::optional<HttpResponse>(const HttpRequest&, CancelSignal&)>;

class Router {
 public:
  void Handle(const std::string& path, Handler handler);
  // 쿼리 문자열을 뗀 경로로 찾는다.
  const Handler* Find(std::string_view target) const;

 private:
  std::unordered_map<std::string, Handler> routes_;
};

HttpResponse MakeJsonResponse(const HttpRequest& req, boost::beast::http::status status, const nlohmann::json& body);
boost::beast::http::status StatusForKind(ErrorKind kind);

// 익명 허용. 성공하면 페이로드를 그대로 200으로, 클라이언트 오류는 200 + 오류 본문,
// 내부 오류는 200 + 고정 문구로 응답한다.
void HandleReceive(Router& router, const std::string& path, std::shared_ptr<Receiver> receiver,
                   std::shared_ptr<Authenticator> authenticator, std::shared_ptr<Observability> observability);

// 익명이면 401 not-allowed, 클라이언트 오류는 종류별 상태, 내부 오류는 500.
void HandleSend(Router& router, const std::string& path, std::shared_ptr<Sender> sender,
                std::shared_ptr<Authenticator> authenticator, std::shared_ptr<Observability> observability);

void HandleHealth(Router& router, const std::string& path, std::shared_ptr<Observability> observability);

}  // namespace icc
