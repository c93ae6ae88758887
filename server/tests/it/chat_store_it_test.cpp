#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>

#include <gtest/gtest.h>

#include "chatbox/db_client.hpp"
#include "chatbox/mariadb_chat_store.hpp"

namespace {
using namespace std::chrono_literals;

chatbox::DbConfig TestDbConfig() {
  chatbox::DbConfig cfg;
  const char* host = std::getenv("DB_HOST");
  const char* port = std::getenv("DB_PORT");
  const char* user = std::getenv("DB_USER");
  const char* pass = std::getenv("DB_PASSWORD");
  const char* name = std::getenv("DB_NAME");
  cfg.host = host ? host : "127.0.0.1";
  cfg.port = port ? static_cast<unsigned short>(std::stoi(port)) : 3306;
  cfg.user = user ? user : "app";
  cfg.password = pass ? pass : "app_pass";
  cfg.database = name ? name : "chatbox";
  return cfg;
}

chatbox::SessionSnapshot MakeSnapshot(const std::string& id, const std::string& user,
                                      std::chrono::system_clock::time_point start) {
  chatbox::SessionSnapshot session;
  session.id = id;
  session.user_id = user;
  session.name = "새 대화";
  session.model_id = "gpt-4";
  session.start_time = start;
  session.last_activity = start;
  return session;
}

class ChatStoreItTest : public ::testing::Test {
 protected:
  void SetUp() override {
    db_client_ = std::make_shared<chatbox::MariaDbClient>(TestDbConfig());
    store_ = std::make_shared<chatbox::MariaDbChatStore>(db_client_);
    try {
      store_->ClearAll(3s);
    } catch (const chatbox::StorageError& ex) {
      GTEST_SKIP() << "MariaDB unavailable: " << ex.what();
    }
  }

  std::shared_ptr<chatbox::MariaDbClient> db_client_;
  std::shared_ptr<chatbox::MariaDbChatStore> store_;
};
}  // namespace

TEST_F(ChatStoreItTest, PersistsSessionAndMessages) {
  auto now = std::chrono::system_clock::now();
  auto session = MakeSnapshot("s-it-1", "u1", now);
  store_->CreateSession(session, 3s);

  chatbox::ChatMessage question;
  question.content = "it's a 'quoted' question";
  question.sender = chatbox::kSenderUser;
  question.timestamp = now;
  store_->RecordMessage(session.id, question, 3s);

  chatbox::ChatMessage answer;
  answer.content = "답변";
  answer.sender = chatbox::kSenderAi;
  answer.timestamp = now + 1s;
  answer.metadata["modelID"] = "gpt-4";
  store_->RecordMessage(session.id, answer, 3s);

  session.name = "it's a 'quoted' question";
  session.total_tokens = 30;
  store_->UpdateSession(session, 3s);

  auto messages = store_->LoadMessages(session.id, 3s);
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[0].content, "it's a 'quoted' question");
  EXPECT_EQ(messages[1].sender, "ai");
  EXPECT_EQ(messages[1].metadata.at("modelID"), "gpt-4");

  auto sessions = store_->ListUserSessions("u1", 10, 3s);
  ASSERT_EQ(sessions.size(), 1u);
  EXPECT_EQ(sessions[0].name, "it's a 'quoted' question");
  EXPECT_EQ(sessions[0].message_count, 2u);
  EXPECT_EQ(sessions[0].total_tokens, 30u);
  EXPECT_FALSE(sessions[0].end_time.has_value());
}

TEST_F(ChatStoreItTest, ListsNewestFirst) {
  auto now = std::chrono::system_clock::now();
  store_->CreateSession(MakeSnapshot("s-old", "u1", now - 2h), 3s);
  store_->CreateSession(MakeSnapshot("s-new", "u1", now), 3s);
  store_->CreateSession(MakeSnapshot("s-other", "u2", now), 3s);

  auto sessions = store_->ListUserSessions("u1", 0, 3s);
  ASSERT_EQ(sessions.size(), 2u);
  EXPECT_EQ(sessions[0].id, "s-new");
  EXPECT_EQ(sessions[1].id, "s-old");
}

TEST_F(ChatStoreItTest, EndSessionKeepsFirstEndTime) {
  auto now = std::chrono::system_clock::now();
  store_->CreateSession(MakeSnapshot("s-end", "u1", now), 3s);
  store_->EndSession("s-end", now + 5s, 3s);
  store_->EndSession("s-end", now + 60s, 3s);

  auto sessions = store_->ListUserSessions("u1", 0, 3s);
  ASSERT_EQ(sessions.size(), 1u);
  ASSERT_TRUE(sessions[0].end_time.has_value());
  auto stored = std::chrono::duration_cast<std::chrono::seconds>(*sessions[0].end_time - now);
  EXPECT_LE(stored.count(), 6);
}

TEST_F(ChatStoreItTest, DuplicateSessionIsPermanentError) {
  auto now = std::chrono::system_clock::now();
  store_->CreateSession(MakeSnapshot("s-dup", "u1", now), 3s);
  try {
    store_->CreateSession(MakeSnapshot("s-dup", "u1", now), 3s);
    FAIL() << "expected StorageError";
  } catch (const chatbox::StorageError& ex) {
    EXPECT_FALSE(ex.transient);
  }
}

TEST_F(ChatStoreItTest, TransientFailureIsRetried) {
  auto now = std::chrono::system_clock::now();
  store_->CreateSession(MakeSnapshot("s-retry", "u1", now), 3s);
  db_client_->SetTransientInjector([](std::size_t attempt) { return attempt == 1; });

  chatbox::ChatMessage message;
  message.content = "retry me";
  message.sender = chatbox::kSenderUser;
  message.timestamp = now;
  store_->RecordMessage("s-retry", message, 3s);
  db_client_->SetTransientInjector(nullptr);

  EXPECT_EQ(store_->LoadMessages("s-retry", 3s).size(), 1u);
}

TEST_F(ChatStoreItTest, PersistentTransientFailureSurfaces) {
  auto now = std::chrono::system_clock::now();
  store_->CreateSession(MakeSnapshot("s-fail", "u1", now), 3s);
  db_client_->SetTransientInjector([](std::size_t) { return true; });
  chatbox::ChatMessage message;
  message.content = "lost";
  message.sender = chatbox::kSenderUser;
  message.timestamp = now;
  try {
    store_->RecordMessage("s-fail", message, 3s);
    ADD_FAILURE() << "expected StorageError";
  } catch (const chatbox::StorageError& ex) {
    EXPECT_TRUE(ex.transient);
  }
  db_client_->SetTransientInjector(nullptr);
  EXPECT_TRUE(store_->LoadMessages("s-fail", 3s).empty());
}
