/*
 * 설명: 레벨 기반 구조화 로그와 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Observability)
 * 테스트: server/tests/unit/observability_test.cpp
 */
#pragma once

#include <atomic>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chatbox {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

std::optional<LogLevel> ParseLogLevel(std::string_view text);
std::string_view LogLevelName(LogLevel level);

// HTTP 요청 단위 로그 컨텍스트
struct LogContext {
  std::string trace_id;
  std::optional<std::string> user_id;
  std::optional<std::string> session_id;
  std::string name;
  long latency_ms{0};
  int status{0};
};

struct MetricsSnapshot {
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t websocket_active{0};
  std::uint64_t messages_received{0};
  std::uint64_t messages_sent{0};
  std::uint64_t message_errors{0};
  std::uint64_t admin_takeovers{0};
  std::uint64_t llm_errors{0};
  std::uint64_t rate_limited{0};
  std::uint64_t active_sessions{0};
};

class Observability {
 public:
  explicit Observability(LogLevel threshold = LogLevel::kInfo, std::ostream& out = std::cout);

  std::string NextTraceId();
  void IncrementRequest();
  void IncrementError();
  void SetWebsocketActive(std::uint64_t count);
  void IncrementMessageReceived();
  void IncrementMessageSent();
  void IncrementMessageError();
  void IncrementAdminTakeover();
  void IncrementLlmError();
  void IncrementRateLimited();
  MetricsSnapshot Snapshot(std::uint64_t active_sessions) const;

  bool Enabled(LogLevel level) const { return level >= threshold_; }
  void Log(const LogContext& ctx) const;
  void Log(LogLevel level, std::string_view event, const nlohmann::json& fields = nlohmann::json::object()) const;

 private:
  LogLevel threshold_;
  std::ostream& out_;
  mutable std::mutex out_mutex_;
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> websocket_active_{0};
  std::atomic<std::uint64_t> messages_received_{0};
  std::atomic<std::uint64_t> messages_sent_{0};
  std::atomic<std::uint64_t> message_errors_{0};
  std::atomic<std::uint64_t> admin_takeovers_{0};
  std::atomic<std::uint64_t> llm_errors_{0};
  std::atomic<std::uint64_t> rate_limited_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace chatbox
