/*
 * 설명: HTTP 연결 하나를 처리한다. 요청을 라우터 핸들러로 넘기고, 롱폴 대기 중 클라이언트가
 *       연결을 끊으면 요청 취소 신호를 발생시킨다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/icc_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "icc/cancel_signal.hpp"
#include "icc/gateway.hpp"
#include "icc/http_types.hpp"
#include "icc/observability.hpp"

namespace icc {

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const Router> router,
              std::shared_ptr<CancelSignal> shutdown, std::shared_ptr<Observability> observability);
  void Run();

 private:
  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void WatchDisconnect();
  void OnHandlerDone(std::optional<HttpResponse> res);
  void SendResponse(std::shared_ptr<HttpResponse> res);
  void Close();

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  HttpRequest req_;
  std::shared_ptr<const Router> router_;
  std::shared_ptr<CancelSignal> shutdown_;
  std::shared_ptr<CancelSignal> request_cancel_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  bool finished_{false};
};

}  // namespace icc
