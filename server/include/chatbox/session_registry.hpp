/*
 * 설명: 메모리 내 대화 세션의 생성/재접속/종료/만료와 관리자 개입 상태를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Session Registry)
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <boost/asio/io_context.hpp>

#include "chatbox/periodic_task.hpp"

namespace chatbox {

inline constexpr const char* kSenderUser = "user";
inline constexpr const char* kSenderAi = "ai";
inline constexpr const char* kSenderAdmin = "admin";

struct ChatMessage {
  std::string content;
  std::string sender;
  std::chrono::system_clock::time_point timestamp;
  std::string file_id;
  std::string file_url;
  std::map<std::string, std::string> metadata;
};

struct SessionSnapshot {
  std::string id;
  std::string user_id;
  std::string name;
  std::string model_id;
  std::chrono::system_clock::time_point start_time;
  std::chrono::system_clock::time_point last_activity;
  std::optional<std::chrono::system_clock::time_point> end_time;
  bool active{true};
  bool help_requested{false};
  bool admin_assisted{false};
  std::string assisting_admin_id;
  std::string assisting_admin_name;
  std::size_t attached_connections{0};
  std::size_t message_count{0};
  std::uint64_t total_tokens{0};
  std::chrono::milliseconds average_response_time{0};
};

struct ResolveResult {
  SessionSnapshot session;
  bool created{false};
  // 유예 안에서 종료된 세션을 다시 활성화했다.
  bool restored{false};
  // 재접속 유예를 넘겨 새 세션으로 대체되면서 종료된 이전 세션
  std::optional<SessionSnapshot> replaced;
};

struct SessionFilter {
  std::optional<std::string> user_id;
  bool active_only{false};
  bool admin_assisted_only{false};
  std::size_t limit{0};
};

struct RegistryStats {
  std::size_t active{0};
  std::size_t inactive{0};
  std::size_t total{0};
  std::size_t admin_assisted{0};
};

struct SessionRegistryOptions {
  std::chrono::seconds reconnect_grace{900};
  std::chrono::seconds ttl{900};
  std::string default_model{"gpt-4"};
  std::size_t max_response_samples{100};
};

// 첫 사용자 메시지의 첫 문장 또는 첫 줄을 세션 이름으로 만든다.
std::string GenerateSessionName(const std::string& first_message, std::size_t max_length = 50);

struct Session;

class SessionRegistry {
 public:
  using Clock = std::function<std::chrono::system_clock::time_point()>;
  using ExpiryCallback = std::function<void(const SessionSnapshot&)>;

  explicit SessionRegistry(SessionRegistryOptions options, Clock clock = nullptr);
  ~SessionRegistry();

  std::optional<SessionSnapshot> CreateSession(const std::string& user_id, const std::string& name,
                                               std::string& error_code, std::string& error_message);
  std::optional<ResolveResult> GetOrCreateSession(const std::string& session_id, const std::string& user_id,
                                                  std::string& error_code, std::string& error_message);
  std::optional<SessionSnapshot> GetSession(const std::string& session_id) const;
  std::vector<SessionSnapshot> ListSessions(const SessionFilter& filter) const;
  std::vector<ChatMessage> History(const std::string& session_id, std::size_t max_messages) const;

  // 처음으로 종료시킨 호출만 true를 반환한다.
  bool EndSession(const std::string& session_id);

  bool RecordMessage(const std::string& session_id, const ChatMessage& message, std::string& error_code,
                     std::string& error_message);
  // 이름이 아직 기본값이면 메시지로부터 이름을 정하고 새 이름을 반환한다.
  std::optional<std::string> NameFromFirstMessage(const std::string& session_id, const std::string& content);
  bool SetModel(const std::string& session_id, const std::string& model_id);
  bool MarkHelpRequested(const std::string& session_id);
  bool SetAdminAssistance(const std::string& session_id, const std::string& admin_id, const std::string& admin_name,
                          std::string& error_code, std::string& error_message);
  bool ClearAdminAssistance(const std::string& session_id, const std::string& admin_id, std::string& error_code,
                            std::string& error_message);
  void RecordResponse(const std::string& session_id, std::uint64_t tokens, std::chrono::milliseconds duration);
  bool AttachConnection(const std::string& session_id);
  void DetachConnection(const std::string& session_id);

  RegistryStats Stats() const;

  void SetExpiryCallback(ExpiryCallback callback);
  std::size_t SweepExpired(std::chrono::system_clock::time_point now);
  void StartCleanup(boost::asio::io_context& ioc, std::chrono::milliseconds interval);
  void StopCleanup();

 private:
  std::shared_ptr<Session> Find(const std::string& session_id) const;
  std::shared_ptr<Session> NewSessionLocked(const std::string& user_id, const std::string& name,
                                            std::chrono::system_clock::time_point now, std::string& error_code,
                                            std::string& error_message);
  std::chrono::system_clock::time_point Now() const;

  SessionRegistryOptions options_;
  Clock clock_;
  std::unordered_map<std::string, std::shared_ptr<Session>> sessions_;
  mutable std::mutex mutex_;
  ExpiryCallback on_expire_;
  std::mutex callback_mutex_;
  std::shared_ptr<PeriodicTask> cleanup_task_;
  std::mutex cleanup_mutex_;
};

}  // namespace chatbox
