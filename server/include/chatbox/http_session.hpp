/*
 * 설명: HTTP 연결을 처리하고 상태/지표/세션 조회/관리자 엔드포인트 및 WS 업그레이드를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (HTTP surface)
 * 테스트: server/tests/e2e/chat_flow_test.cpp, server/tests/e2e/admin_api_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>

#include <boost/asio/thread_pool.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include "chatbox/chat_store.hpp"
#include "chatbox/config.hpp"
#include "chatbox/connection_manager.hpp"
#include "chatbox/message_router.hpp"
#include "chatbox/observability.hpp"
#include "chatbox/rate_limiter.hpp"
#include "chatbox/session_registry.hpp"
#include "chatbox/token_verifier.hpp"

namespace chatbox {

// ServerApp이 소유하는 구성요소 묶음. HTTP 세션은 읽기만 한다.
struct ServerContext {
  AppConfig config;
  std::shared_ptr<TokenVerifier> verifier;
  std::shared_ptr<ConnectionManager> connections;
  std::shared_ptr<SessionRegistry> registry;
  std::shared_ptr<ChatStore> store;
  std::shared_ptr<MessageRouter> router;
  std::shared_ptr<SlidingWindowLimiter> public_limiter;
  std::shared_ptr<SlidingWindowLimiter> admin_limiter;
  std::shared_ptr<Observability> observability;
  boost::asio::thread_pool* dispatch_pool{nullptr};
};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
 public:
  HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const ServerContext> context);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void HandleAdminRequest(const std::string& route, std::shared_ptr<Response> res);
  void SendResponse(std::shared_ptr<Response> res);
  void SendJson(std::shared_ptr<Response> res, boost::beast::http::status status, const nlohmann::json& body);
  void HandleWebSocket();
  std::optional<UserClaims> Authenticate(bool allow_query_token, std::string& error_code, std::string& error_message);
  bool OriginAllowed() const;
  std::string RemoteIp();
  std::string ParseBearer(const std::string& header_value);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::shared_ptr<const ServerContext> context_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
  std::optional<std::string> user_id_;
};

}  // namespace chatbox
