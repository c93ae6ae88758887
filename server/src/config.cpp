/*
 * 설명: 환경변수에서 서버 설정을 읽고 기본값과 검증을 적용한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Configuration)
 * 테스트: server/tests/unit/config_test.cpp
 */
#include "chatbox/config.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

#include "chatbox/observability.hpp"

namespace chatbox {
namespace {
std::string Trim(const std::string& value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

bool ParseBool(const std::string& value) {
  std::string lowered = value;
  std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) { return std::tolower(c); });
  return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}
}  // namespace

std::vector<std::string> SplitCommaList(const std::string& value) {
  std::vector<std::string> items;
  std::size_t pos = 0;
  while (pos <= value.size()) {
    auto comma = value.find(',', pos);
    auto item = Trim(value.substr(pos, comma == std::string::npos ? std::string::npos : comma - pos));
    if (!item.empty()) {
      items.push_back(item);
    }
    if (comma == std::string::npos) {
      break;
    }
    pos = comma + 1;
  }
  return items;
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };
  auto get_size = [&](const char* key, const char* def) -> std::size_t {
    return static_cast<std::size_t>(std::stoul(get_env(key, def)));
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.path_prefix = get_env("PATH_PREFIX", "/chatbox");
  if (!cfg.path_prefix.empty() && cfg.path_prefix.back() == '/') {
    cfg.path_prefix.pop_back();
  }
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.jwt_secret = get_env("JWT_SECRET", "");
  cfg.allowed_origins = SplitCommaList(get_env("ALLOWED_ORIGINS", ""));
  cfg.max_message_size = get_size("MAX_MESSAGE_SIZE", "1048576");
  cfg.max_connections_per_user = get_size("MAX_CONNECTIONS_PER_USER", "10");
  cfg.ws_queue_limit_messages = get_size("WS_QUEUE_LIMIT_MESSAGES", "64");
  cfg.ws_queue_limit_bytes = get_size("WS_QUEUE_LIMIT_BYTES", "1048576");
  cfg.ws_write_timeout_ms = get_size("WS_WRITE_TIMEOUT_MS", "10000");
  cfg.reconnect_timeout_seconds = get_size("RECONNECT_TIMEOUT_SECONDS", "900");
  cfg.session_ttl_seconds = get_size("SESSION_TTL_SECONDS", "900");
  cfg.session_cleanup_interval_seconds = get_size("SESSION_CLEANUP_INTERVAL_SECONDS", "300");
  cfg.rate_limit_window_seconds = get_size("RATE_LIMIT_WINDOW_SECONDS", "60");
  cfg.message_rate_limit = get_size("MESSAGE_RATE_LIMIT", "100");
  cfg.admin_rate_limit = get_size("ADMIN_RATE_LIMIT", "20");
  cfg.public_rate_limit = get_size("PUBLIC_RATE_LIMIT", "60");
  cfg.rate_limit_cleanup_interval_seconds = get_size("RATE_LIMIT_CLEANUP_INTERVAL_SECONDS", "300");
  cfg.llm_endpoint = get_env("LLM_ENDPOINT", "");
  cfg.llm_api_key = get_env("LLM_API_KEY", "");
  cfg.llm_models = SplitCommaList(get_env("LLM_MODELS", "gpt-4"));
  cfg.default_model = get_env("DEFAULT_MODEL", cfg.llm_models.empty() ? "gpt-4" : cfg.llm_models.front().c_str());
  cfg.llm_timeout_seconds = get_size("LLM_TIMEOUT_SECONDS", "120");
  cfg.llm_history_limit = get_size("LLM_HISTORY_LIMIT", "20");
  cfg.db_enabled = ParseBool(get_env("DB_ENABLED", "false"));
  cfg.db_host = get_env("DB_HOST", "mariadb");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "app");
  cfg.db_password = get_env("DB_PASSWORD", "app_pass");
  cfg.db_name = get_env("DB_NAME", "chatbox");
  cfg.db_timeout_ms = get_size("DB_TIMEOUT_MS", "5000");
  cfg.notify_webhook_url = get_env("NOTIFY_WEBHOOK_URL", "");
  cfg.notify_rate_limit = get_size("NOTIFY_RATE_LIMIT", "10");
  cfg.dispatch_threads = get_size("DISPATCH_THREADS", "4");
  cfg.shutdown_timeout_seconds = get_size("SHUTDOWN_TIMEOUT_SECONDS", "10");
  return cfg;
}

bool ValidateConfig(const AppConfig& config, std::string& error_message) {
  if (!ParseLogLevel(config.log_level)) {
    error_message = "LOG_LEVEL은 debug, info, warn, error 중 하나여야 합니다";
    return false;
  }
  if (!config.path_prefix.empty() && config.path_prefix.front() != '/') {
    error_message = "PATH_PREFIX는 '/'로 시작해야 합니다";
    return false;
  }
  if (config.max_message_size == 0 || config.max_connections_per_user == 0 || config.ws_queue_limit_messages == 0 ||
      config.ws_queue_limit_bytes == 0) {
    error_message = "연결 관련 한도는 0보다 커야 합니다";
    return false;
  }
  if (config.ws_write_timeout_ms == 0 || config.reconnect_timeout_seconds == 0 || config.session_ttl_seconds == 0 ||
      config.session_cleanup_interval_seconds == 0 || config.llm_timeout_seconds == 0 || config.db_timeout_ms == 0 ||
      config.shutdown_timeout_seconds == 0) {
    error_message = "타임아웃과 주기 값은 0보다 커야 합니다";
    return false;
  }
  if (config.rate_limit_window_seconds == 0 || config.message_rate_limit == 0 || config.admin_rate_limit == 0 ||
      config.public_rate_limit == 0 || config.rate_limit_cleanup_interval_seconds == 0 ||
      config.notify_rate_limit == 0) {
    error_message = "레이트리밋 설정은 0보다 커야 합니다";
    return false;
  }
  if (config.llm_models.empty()) {
    error_message = "LLM_MODELS에 최소 하나의 모델이 필요합니다";
    return false;
  }
  if (std::find(config.llm_models.begin(), config.llm_models.end(), config.default_model) == config.llm_models.end()) {
    error_message = "DEFAULT_MODEL이 LLM_MODELS에 없습니다";
    return false;
  }
  if (config.dispatch_threads == 0) {
    error_message = "DISPATCH_THREADS는 0보다 커야 합니다";
    return false;
  }
  return true;
}

}  // namespace chatbox
