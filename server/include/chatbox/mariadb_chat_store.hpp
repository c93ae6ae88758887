/*
 * 설명: 세션/메시지를 MariaDB에 저장하는 ChatStore 구현이다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Storage), server/sql/schema.sql
 * 테스트: server/tests/it/chat_store_it_test.cpp
 */
#pragma once

#include <memory>

#include "chatbox/chat_store.hpp"
#include "chatbox/db_client.hpp"

namespace chatbox {

class MariaDbChatStore : public ChatStore {
 public:
  explicit MariaDbChatStore(std::shared_ptr<MariaDbClient> db_client);

  void CreateSession(const SessionSnapshot& session, std::chrono::milliseconds deadline) override;
  void UpdateSession(const SessionSnapshot& session, std::chrono::milliseconds deadline) override;
  void RecordMessage(const std::string& session_id, const ChatMessage& message,
                     std::chrono::milliseconds deadline) override;
  void EndSession(const std::string& session_id, std::chrono::system_clock::time_point end_time,
                  std::chrono::milliseconds deadline) override;
  std::vector<StoredSession> ListUserSessions(const std::string& user_id, std::size_t limit,
                                              std::chrono::milliseconds deadline) override;
  bool Ping(std::chrono::milliseconds deadline) override;

  std::vector<ChatMessage> LoadMessages(const std::string& session_id, std::chrono::milliseconds deadline) const;
  void ClearAll(std::chrono::milliseconds deadline) const;

 private:
  std::shared_ptr<MariaDbClient> db_client_;
};

}  // namespace chatbox
