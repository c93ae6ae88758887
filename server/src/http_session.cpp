/*
 * 설명: HTTP 요청을 경로별로 분기하고 인증/권한/요청 한도 검사 후 WS 업그레이드를 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (HTTP surface)
 * 테스트: server/tests/e2e/chat_flow_test.cpp, server/tests/e2e/admin_api_test.cpp
 */
#include "chatbox/http_session.hpp"

#include <algorithm>
#include <cctype>
#include <unordered_map>

#include <boost/beast/version.hpp>

#include "chatbox/api_response.hpp"
#include "chatbox/websocket_connection.hpp"

namespace chatbox {

namespace {
constexpr const char* kServerName = "chatbox";

std::unordered_map<std::string, std::string> ParseQueryParams(const std::string& query) {
  std::unordered_map<std::string, std::string> params;
  std::size_t pos = 0;
  while (pos < query.size()) {
    auto amp = query.find('&', pos);
    std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
    auto eq = pair.find('=');
    if (eq != std::string::npos) {
      params.emplace(pair.substr(0, eq), pair.substr(eq + 1));
    }
    if (amp == std::string::npos) {
      break;
    }
    pos = amp + 1;
  }
  return params;
}

std::optional<std::size_t> ParsePositiveInt(const std::string& value) {
  if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
    return std::nullopt;
  }
  if (value.size() > 9) {
    return std::nullopt;
  }
  return static_cast<std::size_t>(std::stoul(value));
}

nlohmann::json SessionToJson(const SessionSnapshot& session) {
  nlohmann::json json{{"sessionID", session.id},
                      {"userID", session.user_id},
                      {"name", session.name},
                      {"modelID", session.model_id},
                      {"startTime", ToIsoString(session.start_time)},
                      {"lastActivity", ToIsoString(session.last_activity)},
                      {"active", session.active},
                      {"helpRequested", session.help_requested},
                      {"adminAssisted", session.admin_assisted},
                      {"attachedConnections", session.attached_connections},
                      {"messageCount", session.message_count},
                      {"totalTokens", session.total_tokens},
                      {"averageResponseMs", session.average_response_time.count()}};
  if (session.end_time) {
    json["endTime"] = ToIsoString(*session.end_time);
  }
  if (session.admin_assisted) {
    json["assistingAdmin"] = {{"id", session.assisting_admin_id}, {"name", session.assisting_admin_name}};
  }
  return json;
}

bool ParseFlag(const std::unordered_map<std::string, std::string>& params, const std::string& key) {
  auto it = params.find(key);
  return it != params.end() && (it->second == "true" || it->second == "1");
}
}  // namespace

HttpSession::HttpSession(boost::asio::ip::tcp::socket socket, std::shared_ptr<const ServerContext> context)
    : stream_(std::move(socket)), context_(std::move(context)) {}

void HttpSession::Run() { DoRead(); }

void HttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(stream_, buffer_, req_,
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

  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = context_->observability ? context_->observability->NextTraceId() : std::string{};
  user_id_.reset();
  if (context_->observability) {
    context_->observability->IncrementRequest();
  }

  if (boost::beast::websocket::is_upgrade(req_)) {
    return HandleWebSocket();
  }
  HandleRequest();
}

void HttpSession::HandleRequest() {
  using namespace boost::beast;
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  std::string path = target_str;
  auto qpos = target_str.find('?');
  if (qpos != std::string::npos) {
    path = target_str.substr(0, qpos);
  }
  const auto& prefix = context_->config.path_prefix;
  if (path.compare(0, prefix.size(), prefix) != 0) {
    return SendJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
  }
  auto route = path.substr(prefix.size());

  if (req_.method() == http::verb::get && (route == "/healthz" || route == "/readyz" || route == "/metrics")) {
    auto ip = RemoteIp();
    if (context_->public_limiter && !context_->public_limiter->Allow(ip)) {
      auto retry_after = std::max<long>(1, static_cast<long>(context_->public_limiter->RetryAfter(ip).count()));
      if (context_->observability) {
        context_->observability->IncrementRateLimited();
      }
      res->set(http::field::retry_after, std::to_string(retry_after));
      return SendJson(res, http::status::too_many_requests,
                      MakeErrorEnvelope("rate_limited", "요청 한도를 초과했습니다"));
    }
  }

  if (req_.method() == http::verb::get && route == "/healthz") {
    return SendJson(res, http::status::ok, MakeSuccessEnvelope({{"status", "ok"}, {"version", "v1.0.0"}}));
  }

  if (req_.method() == http::verb::get && route == "/readyz") {
    bool ready = !context_->connections->ShuttingDown();
    std::string store_status = "disabled";
    if (ready && context_->store) {
      try {
        ready = context_->store->Ping(std::chrono::milliseconds(context_->config.db_timeout_ms));
        store_status = ready ? "ok" : "unreachable";
      } catch (const StorageError& ex) {
        ready = false;
        store_status = "unreachable";
        if (context_->observability) {
          context_->observability->Log(LogLevel::kWarn, "readiness_store_failed",
                                       {{"traceId", trace_id_}, {"error", ex.what()}});
        }
      }
    }
    if (!ready) {
      return SendJson(res, http::status::service_unavailable,
                      MakeErrorEnvelope("not_ready", "서비스가 준비되지 않았습니다"));
    }
    return SendJson(res, http::status::ok, MakeSuccessEnvelope({{"status", "ready"}, {"store", store_status}}));
  }

  if (req_.method() == http::verb::get && route == "/metrics") {
    auto stats = context_->registry->Stats();
    auto snapshot = context_->observability->Snapshot(stats.active);
    nlohmann::json data{{"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
                        {"connections", {{"websocket", snapshot.websocket_active}}},
                        {"sessions",
                         {{"active", snapshot.active_sessions},
                          {"total", stats.total},
                          {"adminAssisted", stats.admin_assisted}}},
                        {"messages",
                         {{"received", snapshot.messages_received},
                          {"sent", snapshot.messages_sent},
                          {"errors", snapshot.message_errors}}},
                        {"adminTakeovers", snapshot.admin_takeovers},
                        {"llmErrors", snapshot.llm_errors},
                        {"rateLimited", snapshot.rate_limited}};
    return SendJson(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::get && route == "/sessions") {
    std::string error_code;
    std::string error_message;
    auto user = Authenticate(false, error_code, error_message);
    if (!user) {
      return SendJson(res, http::status::unauthorized, MakeErrorEnvelope("unauthorized", "인증이 필요합니다"));
    }
    auto params = ParseQueryParams(target_str.substr(qpos == std::string::npos ? target_str.size() : qpos + 1));
    SessionFilter filter;
    filter.user_id = user->user_id;
    filter.active_only = ParseFlag(params, "active");
    filter.limit = 50;
    if (auto it = params.find("limit"); it != params.end()) {
      auto parsed = ParsePositiveInt(it->second);
      if (!parsed || *parsed == 0 || *parsed > 100) {
        return SendJson(res, http::status::bad_request,
                        MakeErrorEnvelope("invalid_format", "limit 값이 허용 범위를 벗어났습니다"));
      }
      filter.limit = *parsed;
    }
    nlohmann::json sessions = nlohmann::json::array();
    for (const auto& session : context_->registry->ListSessions(filter)) {
      sessions.push_back(SessionToJson(session));
    }
    return SendJson(res, http::status::ok, MakeSuccessEnvelope({{"sessions", sessions}}));
  }

  if (route.rfind("/admin/", 0) == 0) {
    return HandleAdminRequest(route, res);
  }

  SendJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::HandleAdminRequest(const std::string& route, std::shared_ptr<Response> res) {
  using namespace boost::beast;
  std::string error_code;
  std::string error_message;
  auto admin = Authenticate(false, error_code, error_message);
  if (!admin) {
    return SendJson(res, http::status::unauthorized, MakeErrorEnvelope("unauthorized", "인증이 필요합니다"));
  }
  if (!admin->IsAdmin()) {
    if (context_->observability) {
      context_->observability->Log(LogLevel::kWarn, "admin_forbidden",
                                   {{"traceId", trace_id_}, {"userId", admin->user_id}, {"route", route}});
    }
    return SendJson(res, http::status::forbidden, MakeErrorEnvelope("forbidden", "관리자 권한이 필요합니다"));
  }
  if (context_->admin_limiter && !context_->admin_limiter->Allow(admin->user_id)) {
    auto retry_after =
        std::max<long>(1, static_cast<long>(context_->admin_limiter->RetryAfter(admin->user_id).count()));
    if (context_->observability) {
      context_->observability->IncrementRateLimited();
    }
    res->set(http::field::retry_after, std::to_string(retry_after));
    return SendJson(res, http::status::too_many_requests,
                    MakeErrorEnvelope("rate_limited", "관리자 요청 한도를 초과했습니다"));
  }

  const std::string takeover_prefix = "/admin/takeover/";
  const std::string leave_prefix = "/admin/leave/";

  if (req_.method() == http::verb::get && route == "/admin/sessions") {
    std::string target_str = std::string(req_.target());
    auto qpos = target_str.find('?');
    auto params = ParseQueryParams(qpos == std::string::npos ? std::string() : target_str.substr(qpos + 1));
    SessionFilter filter;
    filter.active_only = ParseFlag(params, "active");
    filter.admin_assisted_only = ParseFlag(params, "assisted");
    if (auto it = params.find("user"); it != params.end() && !it->second.empty()) {
      filter.user_id = it->second;
    }
    nlohmann::json sessions = nlohmann::json::array();
    for (const auto& session : context_->registry->ListSessions(filter)) {
      sessions.push_back(SessionToJson(session));
    }
    auto stats = context_->registry->Stats();
    return SendJson(res, http::status::ok,
                    MakeSuccessEnvelope({{"sessions", sessions},
                                         {"stats",
                                          {{"active", stats.active},
                                           {"inactive", stats.inactive},
                                           {"adminAssisted", stats.admin_assisted}}}}));
  }

  bool takeover = route.rfind(takeover_prefix, 0) == 0;
  bool leave = route.rfind(leave_prefix, 0) == 0;
  if (req_.method() == http::verb::post && (takeover || leave)) {
    auto session_id = route.substr(takeover ? takeover_prefix.size() : leave_prefix.size());
    if (session_id.empty() || session_id.size() > kMaxSessionIdLength || session_id.find('/') != std::string::npos) {
      return SendJson(res, http::status::bad_request,
                      MakeErrorEnvelope("invalid_format", "sessionID가 올바르지 않습니다"));
    }
    bool ok = takeover ? context_->router->AdminTakeover(*admin, session_id, error_code, error_message)
                       : context_->router->AdminLeave(*admin, session_id, error_code, error_message);
    if (!ok) {
      auto status = error_code == "conflict" ? http::status::conflict : http::status::not_found;
      return SendJson(res, status, MakeErrorEnvelope(error_code, error_message));
    }
    auto session = context_->registry->GetSession(session_id);
    nlohmann::json data{{"sessionID", session_id}, {"adminAssisted", takeover}};
    if (session) {
      data["session"] = SessionToJson(*session);
    }
    return SendJson(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  SendJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
}

void HttpSession::SendJson(std::shared_ptr<Response> res, boost::beast::http::status status,
                           const nlohmann::json& body) {
  res->result(status);
  res->body() = body.dump();
  res->content_length(res->body().size());
  SendResponse(std::move(res));
}

void HttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (context_->observability) {
    if (static_cast<unsigned>(res->result_int()) >= 400) {
      context_->observability->IncrementError();
    }
    auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                                         request_start_)
                       .count();
    context_->observability->Log(LogContext{trace_id_, user_id_, std::nullopt, std::string(req_.target()), latency,
                                            static_cast<int>(res->result_int())});
  }
  boost::beast::http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t /*bytes*/) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

void HttpSession::HandleWebSocket() {
  using namespace boost::beast;
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, kServerName);
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string target_str = std::string(req_.target());
  auto path = target_str.substr(0, target_str.find('?'));
  if (path != context_->config.path_prefix + "/ws") {
    return SendJson(res, http::status::not_found, MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다"));
  }
  if (!OriginAllowed()) {
    if (context_->observability) {
      context_->observability->Log(LogLevel::kWarn, "origin_rejected",
                                   {{"traceId", trace_id_}, {"origin", std::string(req_[http::field::origin])}});
    }
    return SendJson(res, http::status::forbidden, MakeErrorEnvelope("forbidden", "허용되지 않은 Origin입니다"));
  }
  std::string error_code;
  std::string error_message;
  auto user = Authenticate(true, error_code, error_message);
  if (!user) {
    return SendJson(res, http::status::unauthorized,
                    MakeErrorEnvelope("unauthorized", "WS 업그레이드에는 인증이 필요합니다"));
  }
  if (!context_->connections->CanAccept(user->user_id, error_code, error_message)) {
    if (error_code == "shutting_down") {
      return SendJson(res, http::status::service_unavailable, MakeErrorEnvelope(error_code, error_message));
    }
    if (context_->observability) {
      context_->observability->IncrementRateLimited();
    }
    res->set(http::field::retry_after, "1");
    return SendJson(res, http::status::too_many_requests, MakeErrorEnvelope(error_code, error_message));
  }

  if (context_->observability) {
    context_->observability->Log(LogContext{trace_id_, user_id_, std::nullopt, path,
                                            std::chrono::duration_cast<std::chrono::milliseconds>(
                                                std::chrono::steady_clock::now() - request_start_)
                                                .count(),
                                            101});
  }
  stream_.expires_never();
  websocket::stream<tcp_stream> ws{std::move(stream_)};
  ws.set_option(websocket::stream_base::timeout::suggested(role_type::server));
  ws.set_option(websocket::stream_base::decorator(
      [](websocket::response_type& response) { response.set(http::field::server, kServerName); }));
  try {
    ws.accept(req_);
  } catch (const std::exception& ex) {
    if (context_->observability) {
      context_->observability->Log(LogLevel::kWarn, "websocket_accept_failed",
                                   {{"traceId", trace_id_}, {"userId", user->user_id}, {"error", ex.what()}});
    }
    return;
  }

  WebSocketLimits limits;
  limits.max_message_size = context_->config.max_message_size;
  limits.queue_messages = context_->config.ws_queue_limit_messages;
  limits.queue_bytes = context_->config.ws_queue_limit_bytes;
  limits.write_timeout = std::chrono::milliseconds(context_->config.ws_write_timeout_ms);
  std::weak_ptr<const ServerContext> weak_context = context_;
  auto connection = std::make_shared<WebSocketConnection>(
      std::move(ws), GenerateConnectionId(user->user_id), *user, limits, context_->router, *context_->dispatch_pool,
      context_->observability, [weak_context](const std::shared_ptr<WebSocketConnection>& closed) {
        auto context = weak_context.lock();
        if (!context) {
          return;
        }
        context->router->OnConnectionClosed(closed);
        context->connections->Unregister(closed->Id());
      });
  if (!context_->connections->Register(connection, error_code, error_message)) {
    connection->Close(CloseReason::kShutdown);
    return;
  }
  connection->Run();
}

std::optional<UserClaims> HttpSession::Authenticate(bool allow_query_token, std::string& error_code,
                                                    std::string& error_message) {
  std::string token;
  auto auth_it = req_.find(boost::beast::http::field::authorization);
  if (auth_it != req_.end()) {
    token = ParseBearer(std::string(auth_it->value()));
  }
  if (token.empty() && allow_query_token) {
    std::string target_str = std::string(req_.target());
    auto qpos = target_str.find('?');
    if (qpos != std::string::npos) {
      auto params = ParseQueryParams(target_str.substr(qpos + 1));
      if (auto it = params.find("token"); it != params.end()) {
        token = it->second;
        if (!token.empty() && context_->observability) {
          context_->observability->Log(LogLevel::kWarn, "query_token_deprecated", {{"traceId", trace_id_}});
        }
      }
    }
  }
  if (token.empty()) {
    error_code = "unauthorized";
    error_message = "인증 토큰이 없습니다";
    return std::nullopt;
  }
  auto user = context_->verifier->Verify(token, error_code, error_message);
  if (!user) {
    if (context_->observability) {
      context_->observability->Log(LogLevel::kWarn, "auth_failed", {{"traceId", trace_id_}, {"reason", error_message}});
    }
    return std::nullopt;
  }
  user_id_ = user->user_id;
  return user;
}

bool HttpSession::OriginAllowed() const {
  const auto& allowed = context_->config.allowed_origins;
  auto origin_it = req_.find(boost::beast::http::field::origin);
  if (allowed.empty() || origin_it == req_.end()) {
    return true;
  }
  auto origin = std::string(origin_it->value());
  return std::any_of(allowed.begin(), allowed.end(),
                     [&](const std::string& candidate) { return candidate == "*" || candidate == origin; });
}

std::string HttpSession::RemoteIp() {
  boost::beast::error_code ec;
  auto endpoint = stream_.socket().remote_endpoint(ec);
  if (ec) {
    return "unknown";
  }
  return endpoint.address().to_string();
}

std::string HttpSession::ParseBearer(const std::string& header_value) {
  const std::string prefix = "Bearer ";
  if (header_value.size() <= prefix.size()) {
    return "";
  }
  if (header_value.compare(0, prefix.size(), prefix) != 0) {
    return "";
  }
  return header_value.substr(prefix.size());
}

}  // namespace chatbox
