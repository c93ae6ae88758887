/*
 * 설명: 서버 환경설정 로딩과 기본값, 검증 규칙을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Configuration)
 * 테스트: server/tests/unit/config_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace chatbox {

struct AppConfig {
  unsigned short port{8080};
  std::string path_prefix{"/chatbox"};
  std::string log_level{"info"};
  std::string jwt_secret;
  std::vector<std::string> allowed_origins;
  std::size_t max_message_size{1048576};
  std::size_t max_connections_per_user{10};
  std::size_t ws_queue_limit_messages{64};
  std::size_t ws_queue_limit_bytes{1048576};
  std::size_t ws_write_timeout_ms{10000};
  std::size_t reconnect_timeout_seconds{900};
  std::size_t session_ttl_seconds{900};
  std::size_t session_cleanup_interval_seconds{300};
  std::size_t rate_limit_window_seconds{60};
  std::size_t message_rate_limit{100};
  std::size_t admin_rate_limit{20};
  std::size_t public_rate_limit{60};
  std::size_t rate_limit_cleanup_interval_seconds{300};
  std::string llm_endpoint;
  std::string llm_api_key;
  std::vector<std::string> llm_models{"gpt-4"};
  std::string default_model{"gpt-4"};
  std::size_t llm_timeout_seconds{120};
  std::size_t llm_history_limit{20};
  bool db_enabled{false};
  std::string db_host{"mariadb"};
  unsigned short db_port{3306};
  std::string db_user{"app"};
  std::string db_password{"app_pass"};
  std::string db_name{"chatbox"};
  std::size_t db_timeout_ms{5000};
  std::string notify_webhook_url;
  std::size_t notify_rate_limit{10};
  std::size_t dispatch_threads{4};
  std::size_t shutdown_timeout_seconds{10};
};

AppConfig LoadConfigFromEnv();

// 기동 전에 설정 값을 검사한다. 실패하면 error_message에 사유를 남긴다.
bool ValidateConfig(const AppConfig& config, std::string& error_message);

std::vector<std::string> SplitCommaList(const std::string& value);

}  // namespace chatbox
