/*
 * 설명: Beast 비동기 연산을 전용 io_context에서 구동해 기한/취소가 가능한 HTTP 호출을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Outbound HTTP)
 * 테스트: server/tests/unit/llm_provider_test.cpp
 */
#include "chatbox/http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/version.hpp>

namespace chatbox {
namespace {
namespace beast = boost::beast;
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

constexpr std::chrono::milliseconds kWatchInterval{50};
constexpr std::uint64_t kMaxBodyBytes = 8 * 1024 * 1024;

// 전용 io_context에서 한 번에 하나의 비동기 연산을 완료까지 구동하고,
// 감시 타이머로 기한 초과와 취소를 감지해 진행 중인 연산을 중단시킨다.
class CallContext {
 public:
  CallContext(boost::asio::io_context& ioc, std::chrono::steady_clock::time_point deadline,
              std::shared_ptr<CancelToken> cancel)
      : ioc_(ioc), timer_(ioc), deadline_(deadline), cancel_(std::move(cancel)) {
    Watch();
  }

  ~CallContext() {
    boost::system::error_code ignored;
    timer_.cancel(ignored);
  }

  void SetAbort(std::function<void()> abort) { abort_ = std::move(abort); }

  template <class Initiate>
  boost::system::error_code Await(Initiate&& initiate) {
    bool done = false;
    boost::system::error_code result;
    initiate([&done, &result](const boost::system::error_code& ec, auto&&...) {
      result = ec;
      done = true;
    });
    ioc_.restart();
    while (!done && ioc_.run_one() > 0) {
    }
    if (reason_) {
      throw HttpClientError(*reason_ == HttpClientError::Kind::kTimeout ? "HTTP 호출 기한 초과" : "HTTP 호출 취소",
                            *reason_);
    }
    return result;
  }

 private:
  void Watch() {
    timer_.expires_after(kWatchInterval);
    timer_.async_wait([this](const boost::system::error_code& ec) {
      if (ec) {
        return;
      }
      if (cancel_ && cancel_->Cancelled()) {
        Abort(HttpClientError::Kind::kCancelled);
        return;
      }
      if (std::chrono::steady_clock::now() >= deadline_) {
        Abort(HttpClientError::Kind::kTimeout);
        return;
      }
      Watch();
    });
  }

  void Abort(HttpClientError::Kind kind) {
    reason_ = kind;
    if (abort_) {
      abort_();
    }
  }

  boost::asio::io_context& ioc_;
  boost::asio::steady_timer timer_;
  std::chrono::steady_clock::time_point deadline_;
  std::shared_ptr<CancelToken> cancel_;
  std::function<void()> abort_;
  std::optional<HttpClientError::Kind> reason_;
};

void ThrowOnError(const boost::system::error_code& ec, const char* stage) {
  if (ec) {
    throw HttpClientError(std::string(stage) + ": " + ec.message(), HttpClientError::Kind::kNetwork);
  }
}

template <class Stream>
HttpClientResponse Exchange(Stream& stream, CallContext& ctx, const HttpClientRequest& request, const ParsedUrl& url,
                            const BodyChunkHandler& on_body) {
  http::request<http::string_body> req{request.method, url.target, 11};
  req.set(http::field::host, url.host);
  req.set(http::field::user_agent, BOOST_BEAST_VERSION_STRING);
  for (const auto& [name, value] : request.headers) {
    req.set(name, value);
  }
  req.body() = request.body;
  req.prepare_payload();

  ThrowOnError(ctx.Await([&](auto handler) {
                 http::async_write(stream, req,
                                   [handler](const boost::system::error_code& ec, std::size_t) mutable { handler(ec); });
               }),
               "요청 전송 실패");

  beast::flat_buffer buffer;
  http::response_parser<http::string_body> parser;
  parser.body_limit(kMaxBodyBytes);
  ThrowOnError(ctx.Await([&](auto handler) {
                 http::async_read_header(
                     stream, buffer, parser,
                     [handler](const boost::system::error_code& ec, std::size_t) mutable { handler(ec); });
               }),
               "응답 헤더 수신 실패");

  HttpClientResponse response;
  response.status = parser.get().result_int();
  auto content_type = parser.get().find(http::field::content_type);
  if (content_type != parser.get().end()) {
    response.content_type = std::string(content_type->value());
  }
  bool stream_body = on_body && response.status >= 200 && response.status < 300;

  while (!parser.is_done()) {
    auto ec = ctx.Await([&](auto handler) {
      http::async_read_some(stream, buffer, parser,
                            [handler](const boost::system::error_code& ec, std::size_t) mutable { handler(ec); });
    });
    if (ec == http::error::end_of_stream) {
      break;
    }
    ThrowOnError(ec, "응답 본문 수신 실패");
    if (stream_body && !parser.get().body().empty()) {
      on_body(parser.get().body());
      parser.get().body().clear();
    }
  }
  if (stream_body) {
    if (!parser.get().body().empty()) {
      on_body(parser.get().body());
    }
  } else {
    response.body = parser.get().body();
  }
  return response;
}
}  // namespace

std::optional<ParsedUrl> ParseUrl(const std::string& url) {
  ParsedUrl parsed;
  std::string rest;
  if (url.rfind("https://", 0) == 0) {
    parsed.tls = true;
    rest = url.substr(8);
  } else if (url.rfind("http://", 0) == 0) {
    rest = url.substr(7);
  } else {
    return std::nullopt;
  }
  auto slash = rest.find('/');
  std::string authority = rest.substr(0, slash);
  parsed.target = slash == std::string::npos ? "/" : rest.substr(slash);
  auto colon = authority.rfind(':');
  if (colon != std::string::npos && authority.find(']') == std::string::npos) {
    parsed.host = authority.substr(0, colon);
    parsed.port = authority.substr(colon + 1);
  } else {
    parsed.host = authority;
    parsed.port = parsed.tls ? "443" : "80";
  }
  if (parsed.host.empty() || parsed.port.empty()) {
    return std::nullopt;
  }
  return parsed;
}

HttpClientResponse PerformRequest(const HttpClientRequest& request, const BodyChunkHandler& on_body) {
  auto url = ParseUrl(request.url);
  if (!url) {
    throw HttpClientError("잘못된 URL: " + request.url, HttpClientError::Kind::kInvalidUrl);
  }
  boost::asio::io_context ioc;
  CallContext ctx(ioc, std::chrono::steady_clock::now() + request.timeout, request.cancel);

  tcp::resolver resolver(ioc);
  ctx.SetAbort([&resolver]() { resolver.cancel(); });
  tcp::resolver::results_type endpoints;
  ThrowOnError(ctx.Await([&](auto handler) {
                 resolver.async_resolve(url->host, url->port,
                                        [&endpoints, handler](const boost::system::error_code& ec,
                                                              tcp::resolver::results_type results) mutable {
                                          endpoints = std::move(results);
                                          handler(ec);
                                        });
               }),
               "호스트 조회 실패");

  if (!url->tls) {
    beast::tcp_stream stream(ioc);
    ctx.SetAbort([&stream]() { stream.close(); });
    ThrowOnError(ctx.Await([&](auto handler) {
                   stream.async_connect(endpoints, [handler](const boost::system::error_code& ec,
                                                             const tcp::endpoint&) mutable { handler(ec); });
                 }),
                 "연결 실패");
    auto response = Exchange(stream, ctx, request, *url, on_body);
    boost::system::error_code ignored;
    stream.socket().shutdown(tcp::socket::shutdown_both, ignored);
    return response;
  }

  boost::asio::ssl::context ssl_ctx(boost::asio::ssl::context::tls_client);
  ssl_ctx.set_default_verify_paths();
  ssl_ctx.set_verify_mode(boost::asio::ssl::verify_peer);
  beast::ssl_stream<beast::tcp_stream> stream(ioc, ssl_ctx);
  if (!SSL_set_tlsext_host_name(stream.native_handle(), url->host.c_str())) {
    throw HttpClientError("SNI 설정 실패", HttpClientError::Kind::kNetwork);
  }
  stream.set_verify_callback(boost::asio::ssl::host_name_verification(url->host));
  ctx.SetAbort([&stream]() { beast::get_lowest_layer(stream).close(); });
  ThrowOnError(ctx.Await([&](auto handler) {
                 beast::get_lowest_layer(stream).async_connect(
                     endpoints,
                     [handler](const boost::system::error_code& ec, const tcp::endpoint&) mutable { handler(ec); });
               }),
               "연결 실패");
  ThrowOnError(ctx.Await([&](auto handler) {
                 stream.async_handshake(boost::asio::ssl::stream_base::client,
                                        [handler](const boost::system::error_code& ec) mutable { handler(ec); });
               }),
               "TLS 핸드셰이크 실패");
  auto response = Exchange(stream, ctx, request, *url, on_body);
  boost::system::error_code ignored;
  beast::get_lowest_layer(stream).socket().shutdown(tcp::socket::shutdown_both, ignored);
  return response;
}

}  // namespace chatbox
