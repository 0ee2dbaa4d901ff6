/*
 * 설명: 롱폴 수신/송신/헬스 핸들러와 오류 가시성 분류를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/unit/gateway_test.cpp
 */
#include "icc/gateway.hpp"

#include <boost/beast/version.hpp>

#include "icc/api_response.hpp"
#include "icc/errors.hpp"

namespace icc {
namespace http = boost::beast::http;

namespace {
std::string_view QueryOf(const HttpRequest& req) {
  std::string_view target{req.target().data(), req.target().size()};
  auto qpos = target.find('?');
  return qpos == std::string_view::npos ? std::string_view{} : target.substr(qpos + 1);
}

HttpResponse MakeRawResponse(const HttpRequest& req, http::status status, std::string body) {
  HttpResponse res{status, req.version()};
  res.set(http::field::server, "icc-server");
  res.set(http::field::content_type, "application/json; charset=utf-8");
  res.keep_alive(false);
  res.body() = std::move(body);
  res.prepare_payload();
  return res;
}
}  // namespace

void Router::Handle(const std::string& path, Handler handler) { routes_[path] = std::move(handler); }

const Handler* Router::Find(std::string_view target) const {
  auto qpos = target.find('?');
  std::string path{qpos == std::string_view::npos ? target : target.substr(0, qpos)};
  auto it = routes_.find(path);
  if (it == routes_.end()) {
    return nullptr;
  }
  return &it->second;
}

HttpResponse MakeJsonResponse(const HttpRequest& req, http::status status, const nlohmann::json& body) {
  return MakeRawResponse(req, status, body.dump());
}

http::status StatusForKind(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::kInvalid:
      return http::status::bad_request;
    case ErrorKind::kNotAllowed:
      return http::status::unauthorized;
    case ErrorKind::kNotFound:
      return http::status::not_found;
  }
  return http::status::bad_request;
}

void HandleReceive(Router& router, const std::string& path, std::shared_ptr<Receiver> receiver,
                   std::shared_ptr<Authenticator> authenticator, std::shared_ptr<Observability> observability) {
  router.Handle(path, [receiver, authenticator, observability](
                          const HttpRequest& req, CancelSignal& cancel) -> std::optional<HttpResponse> {
    try {
      authenticator->Authenticate(req);
      return MakeRawResponse(req, http::status::ok, receiver->ReceiveWithQuery(QueryOf(req), cancel));
    } catch (const CancelledError&) {
      return std::nullopt;
    } catch (const ClientError& ex) {
      return MakeJsonResponse(req, http::status::ok, MakeClientErrorEnvelope(ex));
    } catch (const std::exception& ex) {
      if (observability) {
        observability->Error("receive_failed", ex.what());
      }
      return MakeJsonResponse(req, http::status::ok, MakeInternalErrorEnvelope());
    }
  });
}

void HandleSend(Router& router, const std::string& path, std::shared_ptr<Sender> sender,
                std::shared_ptr<Authenticator> authenticator, std::shared_ptr<Observability> observability) {
  router.Handle(path, [sender, authenticator, observability](
                          const HttpRequest& req, CancelSignal& /*cancel*/) -> std::optional<HttpResponse> {
    try {
      auto ctx = authenticator->Authenticate(req);
      int user_id = authenticator->FromContext(ctx);
      if (user_id == kAnonymousUser && sender->RequiresIdentity()) {
        throw ClientError(ErrorKind::kNotAllowed, "익명 사용자는 보낼 수 없습니다");
      }
      sender->Send(user_id, req.body());
      return MakeJsonResponse(req, http::status::ok, MakeSuccessEnvelope({{"sent", true}}));
    } catch (const ClientError& ex) {
      return MakeJsonResponse(req, StatusForKind(ex.kind), MakeClientErrorEnvelope(ex));
    } catch (const std::exception& ex) {
      if (observability) {
        observability->Error("send_failed", ex.what());
      }
      return MakeJsonResponse(req, http::status::internal_server_error, MakeInternalErrorEnvelope());
    }
  });
}

void HandleHealth(Router& router, const std::string& path, std::shared_ptr<Observability> observability) {
  router.Handle(path, [observability](const HttpRequest& req, CancelSignal& /*cancel*/) -> std::optional<HttpResponse> {
    nlohmann::json data{{"healthy", true}};
    if (observability) {
      auto snapshot = observability->Snapshot();
      data["requests"] = {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}};
      data["waiting"] = snapshot.waiting;
    }
    return MakeJsonResponse(req, http::status::ok, MakeSuccessEnvelope(data));
  });
}

}  // namespace icc
