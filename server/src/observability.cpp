/*
 * 설명: 레벨 기반 구조화 로그와 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Observability)
 * 테스트: server/tests/unit/observability_test.cpp
 */
#include "chatbox/observability.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace chatbox {
namespace {
std::string NowIsoMillis() {
  auto now = std::chrono::system_clock::now();
  auto tt = std::chrono::system_clock::to_time_t(now);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%T") << '.' << std::setw(3) << std::setfill('0') << millis << 'Z';
  return oss.str();
}
}  // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "info") {
    return LogLevel::kInfo;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

std::string_view LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel threshold, std::ostream& out) : threshold_(threshold), out_(out) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::IncrementRequest() { request_total_.fetch_add(1); }

void Observability::IncrementError() { request_errors_.fetch_add(1); }

void Observability::SetWebsocketActive(std::uint64_t count) { websocket_active_.store(count); }

void Observability::IncrementMessageReceived() { messages_received_.fetch_add(1); }

void Observability::IncrementMessageSent() { messages_sent_.fetch_add(1); }

void Observability::IncrementMessageError() { message_errors_.fetch_add(1); }

void Observability::IncrementAdminTakeover() { admin_takeovers_.fetch_add(1); }

void Observability::IncrementLlmError() { llm_errors_.fetch_add(1); }

void Observability::IncrementRateLimited() { rate_limited_.fetch_add(1); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_sessions) const {
  MetricsSnapshot snapshot;
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.websocket_active = websocket_active_.load();
  snapshot.messages_received = messages_received_.load();
  snapshot.messages_sent = messages_sent_.load();
  snapshot.message_errors = message_errors_.load();
  snapshot.admin_takeovers = admin_takeovers_.load();
  snapshot.llm_errors = llm_errors_.load();
  snapshot.rate_limited = rate_limited_.load();
  snapshot.active_sessions = active_sessions;
  return snapshot;
}

void Observability::Log(const LogContext& ctx) const {
  nlohmann::json fields;
  fields["traceId"] = ctx.trace_id;
  fields["path"] = ctx.name;
  fields["latencyMs"] = ctx.latency_ms;
  if (ctx.status != 0) {
    fields["status"] = ctx.status;
  }
  if (ctx.user_id) {
    fields["userId"] = *ctx.user_id;
  }
  if (ctx.session_id) {
    fields["sessionId"] = *ctx.session_id;
  }
  Log(LogLevel::kInfo, "http_request", fields);
}

void Observability::Log(LogLevel level, std::string_view event, const nlohmann::json& fields) const {
  if (!Enabled(level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["ts"] = NowIsoMillis();
  log_json["level"] = LogLevelName(level);
  log_json["event"] = event;
  if (fields.is_object()) {
    for (const auto& [key, value] : fields.items()) {
      log_json[key] = value;
    }
  }
  auto line = log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << line << std::endl;
}

}  // namespace chatbox
