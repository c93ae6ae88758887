/*
 * 설명: 메모리 기반 ChatStore 구현(DB 비활성 모드와 테스트용)을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Storage)
 * 테스트: server/tests/unit/chat_store_test.cpp
 */
#include "chatbox/chat_store.hpp"

#include <algorithm>

namespace chatbox {
namespace {
StoredSession FromSnapshot(const SessionSnapshot& session) {
  StoredSession stored;
  stored.id = session.id;
  stored.user_id = session.user_id;
  stored.name = session.name;
  stored.model_id = session.model_id;
  stored.start_time = session.start_time;
  stored.end_time = session.end_time;
  stored.help_requested = session.help_requested;
  stored.admin_assisted = session.admin_assisted;
  stored.assisting_admin_id = session.assisting_admin_id;
  stored.total_tokens = session.total_tokens;
  return stored;
}
}  // namespace

void InMemoryChatStore::SetFailureInjector(std::function<void(std::string_view operation)> injector) {
  std::lock_guard<std::mutex> lock(mutex_);
  injector_ = std::move(injector);
}

void InMemoryChatStore::Inject(std::string_view operation) const {
  std::function<void(std::string_view)> injector;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    injector = injector_;
  }
  if (injector) {
    injector(operation);
  }
}

void InMemoryChatStore::CreateSession(const SessionSnapshot& session, std::chrono::milliseconds /*deadline*/) {
  Inject("create_session");
  std::lock_guard<std::mutex> lock(mutex_);
  auto [it, inserted] = sessions_.emplace(session.id, FromSnapshot(session));
  if (!inserted) {
    throw StorageError("이미 존재하는 세션입니다: " + session.id, false);
  }
}

void InMemoryChatStore::UpdateSession(const SessionSnapshot& session, std::chrono::milliseconds /*deadline*/) {
  Inject("update_session");
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session.id);
  if (it == sessions_.end()) {
    throw StorageError("세션이 없습니다: " + session.id, false);
  }
  auto message_count = it->second.message_count;
  auto end_time = it->second.end_time;
  it->second = FromSnapshot(session);
  it->second.message_count = message_count;
  if (end_time) {
    it->second.end_time = end_time;
  }
}

void InMemoryChatStore::RecordMessage(const std::string& session_id, const ChatMessage& message,
                                      std::chrono::milliseconds /*deadline*/) {
  Inject("record_message");
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    throw StorageError("세션이 없습니다: " + session_id, false);
  }
  ++it->second.message_count;
  messages_[session_id].push_back(message);
}

void InMemoryChatStore::EndSession(const std::string& session_id, std::chrono::system_clock::time_point end_time,
                                   std::chrono::milliseconds /*deadline*/) {
  Inject("end_session");
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    throw StorageError("세션이 없습니다: " + session_id, false);
  }
  if (!it->second.end_time) {
    it->second.end_time = end_time;
  }
}

std::vector<StoredSession> InMemoryChatStore::ListUserSessions(const std::string& user_id, std::size_t limit,
                                                               std::chrono::milliseconds /*deadline*/) {
  Inject("list_sessions");
  std::vector<StoredSession> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& [id, session] : sessions_) {
      if (session.user_id == user_id) {
        result.push_back(session);
      }
    }
  }
  std::sort(result.begin(), result.end(),
            [](const StoredSession& lhs, const StoredSession& rhs) { return lhs.start_time > rhs.start_time; });
  if (limit > 0 && result.size() > limit) {
    result.resize(limit);
  }
  return result;
}

bool InMemoryChatStore::Ping(std::chrono::milliseconds /*deadline*/) {
  Inject("ping");
  return true;
}

std::vector<ChatMessage> InMemoryChatStore::Messages(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = messages_.find(session_id);
  if (it == messages_.end()) {
    return {};
  }
  return it->second;
}

std::optional<StoredSession> InMemoryChatStore::FindSession(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return std::nullopt;
  }
  return it->second;
}

}  // namespace chatbox
