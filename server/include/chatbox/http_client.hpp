/*
 * 설명: 기한과 취소 토큰을 지키는 아웃바운드 HTTP(S) 클라이언트를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Outbound HTTP)
 * 테스트: server/tests/unit/llm_provider_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <boost/beast/http/verb.hpp>

#include "chatbox/client_connection.hpp"

namespace chatbox {

struct ParsedUrl {
  bool tls{false};
  std::string host;
  std::string port;
  std::string target;
};

std::optional<ParsedUrl> ParseUrl(const std::string& url);

class HttpClientError : public std::runtime_error {
 public:
  enum class Kind { kInvalidUrl, kNetwork, kTimeout, kCancelled };
  HttpClientError(const std::string& message, Kind kind) : std::runtime_error(message), kind(kind) {}
  Kind kind;
};

struct HttpClientRequest {
  boost::beast::http::verb method{boost::beast::http::verb::get};
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
  std::chrono::milliseconds timeout{10000};
  std::shared_ptr<CancelToken> cancel;
};

struct HttpClientResponse {
  unsigned int status{0};
  std::string content_type;
  std::string body;
};

using BodyChunkHandler = std::function<void(std::string_view)>;

// 2xx 응답 본문은 도착하는 대로 on_body에 전달하고 response.body에는 남기지 않는다.
// 그 외 응답은 본문 전체를 response.body에 담는다.
HttpClientResponse PerformRequest(const HttpClientRequest& request, const BodyChunkHandler& on_body = nullptr);

}  // namespace chatbox
