/*
 * 설명: 게이트웨이 전반에서 쓰는 Beast HTTP 요청/응답 타입 별칭.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md
 */
#pragma once

#include <boost/beast/http.hpp>

namespace icc {

using HttpRequest = boost::beast::http::request<boost::beast::http::string_body>;
using HttpResponse = boost::beast::http::response<boost::beast::http::string_body>;

}  // namespace icc
