/*
 * 설명: HTTP 요청 읽기, 핸들러 실행, 연결 끊김 감지, 응답 기록을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/icc_flow_test.cpp
 */
#include "icc/http_session.hpp"

#include <thread>

#include <boost/asio/post.hpp>
#include <boost/beast/version.hpp>

#include "icc/api_response.hpp"

namespace icc {

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const Router> router,
                         std::shared_ptr<CancelSignal> shutdown, std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), router_(std::move(router)), shutdown_(std::move(shutdown)),
      observability_(std::move(observability)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(
      stream_, buffer_, req_,
      [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
        self->OnRead(ec, bytes_transferred);
      });
}

void HttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  namespace http = boost::beast::http;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_ ? observability_->NextTraceId() : std::string{};
  if (observability_) {
    observability_->IncrementRequest();
  }

  const Handler* handler = router_->Find(std::string_view{req_.target().data(), req_.target().size()});
  if (handler == nullptr) {
    auto res = std::make_shared<HttpResponse>(
        MakeJsonResponse(req_, http::status::not_found, MakeErrorEnvelope("not_found", "경로를 찾을 수 없습니다")));
    return SendResponse(res);
  }

  // 롱폴은 무기한 대기하므로 읽기 타임아웃을 해제한다.
  stream_.expires_never();
  request_cancel_ = CancelSignal::ChildOf(shutdown_);
  WatchDisconnect();

  if (observability_) {
    observability_->IncrementWaiting();
  }
  auto self = shared_from_this();
  Handler call = *handler;
  std::thread([self, call = std::move(call)]() {
    std::optional<HttpResponse> res;
    try {
      res = call(self->req_, *self->request_cancel_);
    } catch (const std::exception& ex) {
      if (self->observability_) {
        self->observability_->Error("handler_failed", ex.what());
      }
      res = MakeJsonResponse(self->req_, boost::beast::http::status::internal_server_error,
                             MakeInternalErrorEnvelope());
    }
    boost::asio::post(self->stream_.get_executor(),
                      [self, res = std::move(res)]() mutable { self->OnHandlerDone(std::move(res)); });
    if (self->observability_) {
      self->observability_->DecrementWaiting();
    }
  }).detach();
}

void HttpSession::WatchDisconnect() {
  auto self = shared_from_this();
  stream_.socket().async_wait(boost::asio::ip::tcp::socket::wait_read,
                              [self](boost::beast::error_code ec) {
                                if (ec == boost::asio::error::operation_aborted || self->finished_) {
                                  return;
                                }
                                // 요청 이후 읽을 데이터가 생겼다는 것은 EOF(클라이언트 이탈)이다.
                                self->request_cancel_->Cancel();
                              });
}

void HttpSession::OnHandlerDone(std::optional<HttpResponse> res) {
  finished_ = true;
  boost::beast::error_code ignored;
  stream_.socket().cancel(ignored);
  if (!res) {
    if (observability_) {
      auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                            request_start_)
                         .count();
      observability_->Log(LogContext{trace_id_, std::nullopt, std::string(req_.target()), 0, latency});
    }
    return Close();
  }
  SendResponse(std::make_shared<HttpResponse>(std::move(*res)));
}

void HttpSession::SendResponse(std::shared_ptr<HttpResponse> res) {
  auto self = shared_from_this();
  if (observability_) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      observability_->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_)
                       .count();
    observability_->Log(LogContext{trace_id_, std::nullopt, std::string(req_.target()),
                                   static_cast<unsigned>(res->result_int()), latency});
  }
  boost::beast::http::async_write(
      stream_, *res,
      [self, res](boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
        if (ec) {
          return;
        }
        self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
      });
}

void HttpSession::Close() {
  boost::beast::error_code ec;
  stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  stream_.socket().close(ec);
}

}  // namespace icc
