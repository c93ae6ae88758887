/*
 * 설명: chat_sessions/chat_messages 테이블에 대한 SQL 저장/조회를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Storage), server/sql/schema.sql
 * 테스트: server/tests/it/chat_store_it_test.cpp
 */
#include "chatbox/mariadb_chat_store.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>

namespace chatbox {
namespace {
constexpr unsigned int kDuplicateEntry = 1062;

std::string ToTimestamp(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count() % 1000;
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis;
  return oss.str();
}

std::chrono::system_clock::time_point ParseTimestamp(const char* text) {
  if (!text) {
    return std::chrono::system_clock::time_point{};
  }
  std::tm tm{};
  std::istringstream iss(text);
  iss >> std::get_time(&tm, "%Y-%m-%d %H:%M:%S");
  auto tp = std::chrono::system_clock::from_time_t(timegm(&tm));
  std::string rest;
  std::getline(iss, rest);
  if (rest.size() > 1 && rest[0] == '.') {
    auto digits = rest.substr(1, 3);
    while (digits.size() < 3) {
      digits.push_back('0');
    }
    tp += std::chrono::milliseconds(std::stoi(digits));
  }
  return tp;
}

std::uint64_t ToUint(const char* value) { return value ? std::stoull(value) : 0; }

std::string MetadataJson(const ChatMessage& message) {
  nlohmann::json metadata = nlohmann::json::object();
  for (const auto& [key, value] : message.metadata) {
    metadata[key] = value;
  }
  return metadata.dump();
}

StoredSession BuildSession(MYSQL_ROW row) {
  StoredSession session;
  session.id = row[0] ? row[0] : "";
  session.user_id = row[1] ? row[1] : "";
  session.name = row[2] ? row[2] : "";
  session.model_id = row[3] ? row[3] : "";
  session.start_time = ParseTimestamp(row[4]);
  if (row[5]) {
    session.end_time = ParseTimestamp(row[5]);
  }
  session.help_requested = ToUint(row[6]) != 0;
  session.admin_assisted = ToUint(row[7]) != 0;
  session.assisting_admin_id = row[8] ? row[8] : "";
  session.total_tokens = ToUint(row[9]);
  session.message_count = static_cast<std::size_t>(ToUint(row[10]));
  return session;
}
}  // namespace

MariaDbChatStore::MariaDbChatStore(std::shared_ptr<MariaDbClient> db_client) : db_client_(std::move(db_client)) {}

void MariaDbChatStore::CreateSession(const SessionSnapshot& session, std::chrono::milliseconds deadline) {
  db_client_->WithConnectionRetry(
      [&](MYSQL* conn) {
        std::ostringstream oss;
        oss << "INSERT INTO chat_sessions(id, user_id, name, model_id, started_at, help_requested, admin_assisted, "
               "assisting_admin_id, total_tokens, message_count) VALUES('"
            << db_client_->Escape(conn, session.id) << "', '" << db_client_->Escape(conn, session.user_id) << "', '"
            << db_client_->Escape(conn, session.name) << "', '" << db_client_->Escape(conn, session.model_id)
            << "', '" << ToTimestamp(session.start_time) << "', " << (session.help_requested ? 1 : 0) << ", "
            << (session.admin_assisted ? 1 : 0) << ", '" << db_client_->Escape(conn, session.assisting_admin_id)
            << "', " << session.total_tokens << ", 0);";
        if (mysql_query(conn, oss.str().c_str()) != 0) {
          if (mysql_errno(conn) == kDuplicateEntry) {
            throw DbException("이미 존재하는 세션입니다: " + session.id, kDuplicateEntry, false);
          }
          db_client_->RaiseError(conn, "세션 저장 실패");
        }
      },
      deadline);
}

void MariaDbChatStore::UpdateSession(const SessionSnapshot& session, std::chrono::milliseconds deadline) {
  db_client_->WithConnectionRetry(
      [&](MYSQL* conn) {
        std::ostringstream oss;
        oss << "UPDATE chat_sessions SET name='" << db_client_->Escape(conn, session.name) << "', model_id='"
            << db_client_->Escape(conn, session.model_id) << "', help_requested=" << (session.help_requested ? 1 : 0)
            << ", admin_assisted=" << (session.admin_assisted ? 1 : 0) << ", assisting_admin_id='"
            << db_client_->Escape(conn, session.assisting_admin_id) << "', total_tokens=" << session.total_tokens
            << " WHERE id='" << db_client_->Escape(conn, session.id) << "';";
        if (mysql_query(conn, oss.str().c_str()) != 0) {
          db_client_->RaiseError(conn, "세션 갱신 실패");
        }
      },
      deadline);
}

void MariaDbChatStore::RecordMessage(const std::string& session_id, const ChatMessage& message,
                                     std::chrono::milliseconds deadline) {
  db_client_->ExecuteTransactionWithRetry(
      [&](MYSQL* conn) {
        std::ostringstream insert;
        insert << "INSERT INTO chat_messages(session_id, sender, content, file_id, file_url, metadata, created_at) "
                  "VALUES('"
               << db_client_->Escape(conn, session_id) << "', '" << db_client_->Escape(conn, message.sender) << "', '"
               << db_client_->Escape(conn, message.content) << "', '" << db_client_->Escape(conn, message.file_id)
               << "', '" << db_client_->Escape(conn, message.file_url) << "', '"
               << db_client_->Escape(conn, MetadataJson(message)) << "', '" << ToTimestamp(message.timestamp)
               << "');";
        if (mysql_query(conn, insert.str().c_str()) != 0) {
          db_client_->RaiseError(conn, "메시지 저장 실패");
        }
        std::ostringstream update;
        update << "UPDATE chat_sessions SET message_count = message_count + 1 WHERE id='"
               << db_client_->Escape(conn, session_id) << "';";
        if (mysql_query(conn, update.str().c_str()) != 0) {
          db_client_->RaiseError(conn, "메시지 수 갱신 실패");
        }
        return true;
      },
      deadline);
}

void MariaDbChatStore::EndSession(const std::string& session_id, std::chrono::system_clock::time_point end_time,
                                  std::chrono::milliseconds deadline) {
  db_client_->WithConnectionRetry(
      [&](MYSQL* conn) {
        std::ostringstream oss;
        oss << "UPDATE chat_sessions SET ended_at='" << ToTimestamp(end_time) << "' WHERE id='"
            << db_client_->Escape(conn, session_id) << "' AND ended_at IS NULL;";
        if (mysql_query(conn, oss.str().c_str()) != 0) {
          db_client_->RaiseError(conn, "세션 종료 저장 실패");
        }
      },
      deadline);
}

std::vector<StoredSession> MariaDbChatStore::ListUserSessions(const std::string& user_id, std::size_t limit,
                                                              std::chrono::milliseconds deadline) {
  std::vector<StoredSession> sessions;
  db_client_->WithConnectionRetry(
      [&](MYSQL* conn) {
        sessions.clear();
        std::ostringstream oss;
        oss << "SELECT id, user_id, name, model_id, started_at, ended_at, help_requested, admin_assisted, "
               "assisting_admin_id, total_tokens, message_count FROM chat_sessions WHERE user_id='"
            << db_client_->Escape(conn, user_id) << "' ORDER BY started_at DESC, id ASC";
        if (limit > 0) {
          oss << " LIMIT " << limit;
        }
        oss << ";";
        if (mysql_query(conn, oss.str().c_str()) != 0) {
          db_client_->RaiseError(conn, "세션 목록 조회 실패");
        }
        MYSQL_RES* res = mysql_store_result(conn);
        if (!res) {
          db_client_->RaiseError(conn, "세션 목록 결과 없음");
        }
        while (MYSQL_ROW row = mysql_fetch_row(res)) {
          sessions.push_back(BuildSession(row));
        }
        mysql_free_result(res);
      },
      deadline);
  return sessions;
}

bool MariaDbChatStore::Ping(std::chrono::milliseconds deadline) {
  bool alive = false;
  db_client_->WithConnectionRetry([&](MYSQL* conn) { alive = mysql_ping(conn) == 0; }, deadline);
  return alive;
}

std::vector<ChatMessage> MariaDbChatStore::LoadMessages(const std::string& session_id,
                                                        std::chrono::milliseconds deadline) const {
  std::vector<ChatMessage> messages;
  db_client_->WithConnectionRetry(
      [&](MYSQL* conn) {
        messages.clear();
        std::ostringstream oss;
        oss << "SELECT sender, content, file_id, file_url, metadata, created_at FROM chat_messages WHERE session_id='"
            << db_client_->Escape(conn, session_id) << "' ORDER BY id ASC;";
        if (mysql_query(conn, oss.str().c_str()) != 0) {
          db_client_->RaiseError(conn, "메시지 조회 실패");
        }
        MYSQL_RES* res = mysql_store_result(conn);
        if (!res) {
          db_client_->RaiseError(conn, "메시지 결과 없음");
        }
        while (MYSQL_ROW row = mysql_fetch_row(res)) {
          ChatMessage message;
          message.sender = row[0] ? row[0] : "";
          message.content = row[1] ? row[1] : "";
          message.file_id = row[2] ? row[2] : "";
          message.file_url = row[3] ? row[3] : "";
          auto metadata = nlohmann::json::parse(row[4] ? row[4] : "{}", nullptr, false);
          if (metadata.is_object()) {
            for (const auto& [key, value] : metadata.items()) {
              message.metadata[key] = value.is_string() ? value.get<std::string>() : value.dump();
            }
          }
          message.timestamp = ParseTimestamp(row[5]);
          messages.push_back(std::move(message));
        }
        mysql_free_result(res);
      },
      deadline);
  return messages;
}

void MariaDbChatStore::ClearAll(std::chrono::milliseconds deadline) const {
  db_client_->WithConnectionRetry(
      [&](MYSQL* conn) {
        if (mysql_query(conn, "DELETE FROM chat_messages;") != 0) {
          db_client_->RaiseError(conn, "메시지 삭제 실패");
        }
        if (mysql_query(conn, "DELETE FROM chat_sessions;") != 0) {
          db_client_->RaiseError(conn, "세션 삭제 실패");
        }
      },
      deadline);
}

}  // namespace chatbox
