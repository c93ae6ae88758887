/*
 * 설명: 세션과 메시지를 영속화하는 저장소 인터페이스와 메모리 구현을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Storage)
 * 테스트: server/tests/unit/chat_store_test.cpp, server/tests/it/chat_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "chatbox/session_registry.hpp"

namespace chatbox {

class StorageError : public std::runtime_error {
 public:
  StorageError(const std::string& message, bool transient) : std::runtime_error(message), transient(transient) {}
  bool transient;
};

struct StoredSession {
  std::string id;
  std::string user_id;
  std::string name;
  std::string model_id;
  std::chrono::system_clock::time_point start_time;
  std::optional<std::chrono::system_clock::time_point> end_time;
  bool help_requested{false};
  bool admin_assisted{false};
  std::string assisting_admin_id;
  std::uint64_t total_tokens{0};
  std::size_t message_count{0};
};

class ChatStore {
 public:
  virtual ~ChatStore() = default;

  // 모든 호출은 deadline 안에 끝나거나 StorageError를 던진다.
  virtual void CreateSession(const SessionSnapshot& session, std::chrono::milliseconds deadline) = 0;
  virtual void UpdateSession(const SessionSnapshot& session, std::chrono::milliseconds deadline) = 0;
  virtual void RecordMessage(const std::string& session_id, const ChatMessage& message,
                             std::chrono::milliseconds deadline) = 0;
  virtual void EndSession(const std::string& session_id, std::chrono::system_clock::time_point end_time,
                          std::chrono::milliseconds deadline) = 0;
  // 최신 시작 순으로 정렬한다.
  virtual std::vector<StoredSession> ListUserSessions(const std::string& user_id, std::size_t limit,
                                                      std::chrono::milliseconds deadline) = 0;
  virtual bool Ping(std::chrono::milliseconds deadline) = 0;
};

class InMemoryChatStore : public ChatStore {
 public:
  void CreateSession(const SessionSnapshot& session, std::chrono::milliseconds deadline) override;
  void UpdateSession(const SessionSnapshot& session, std::chrono::milliseconds deadline) override;
  void RecordMessage(const std::string& session_id, const ChatMessage& message,
                     std::chrono::milliseconds deadline) override;
  void EndSession(const std::string& session_id, std::chrono::system_clock::time_point end_time,
                  std::chrono::milliseconds deadline) override;
  std::vector<StoredSession> ListUserSessions(const std::string& user_id, std::size_t limit,
                                              std::chrono::milliseconds deadline) override;
  bool Ping(std::chrono::milliseconds deadline) override;

  // 테스트에서 저장 실패를 흉내 낸다. 주입 함수가 던진 예외가 그대로 전파된다.
  void SetFailureInjector(std::function<void(std::string_view operation)> injector);

  std::vector<ChatMessage> Messages(const std::string& session_id) const;
  std::optional<StoredSession> FindSession(const std::string& session_id) const;

 private:
  void Inject(std::string_view operation) const;

  mutable std::mutex mutex_;
  std::map<std::string, StoredSession> sessions_;
  std::map<std::string, std::vector<ChatMessage>> messages_;
  std::function<void(std::string_view)> injector_;
};

}  // namespace chatbox
