#include <chrono>
#include <string>

#include <gtest/gtest.h>

#include "chatbox/chat_store.hpp"

namespace {
using namespace std::chrono_literals;

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

chatbox::ChatMessage MakeMessage(const std::string& content) {
  chatbox::ChatMessage message;
  message.content = content;
  message.sender = chatbox::kSenderUser;
  message.timestamp = std::chrono::system_clock::now();
  return message;
}
}  // namespace

TEST(InMemoryChatStoreTest, RecordsMessagesAndCounts) {
  chatbox::InMemoryChatStore store;
  auto now = std::chrono::system_clock::now();
  store.CreateSession(MakeSnapshot("s1", "u1", now), 1s);
  store.RecordMessage("s1", MakeMessage("hi"), 1s);
  store.RecordMessage("s1", MakeMessage("again"), 1s);

  auto messages = store.Messages("s1");
  ASSERT_EQ(messages.size(), 2u);
  EXPECT_EQ(messages[1].content, "again");
  EXPECT_EQ(store.FindSession("s1")->message_count, 2u);
}

TEST(InMemoryChatStoreTest, MissingOrDuplicateSessionThrowsPermanentError) {
  chatbox::InMemoryChatStore store;
  auto now = std::chrono::system_clock::now();
  try {
    store.RecordMessage("nope", MakeMessage("hi"), 1s);
    FAIL() << "expected StorageError";
  } catch (const chatbox::StorageError& ex) {
    EXPECT_FALSE(ex.transient);
  }
  store.CreateSession(MakeSnapshot("s1", "u1", now), 1s);
  EXPECT_THROW(store.CreateSession(MakeSnapshot("s1", "u1", now), 1s), chatbox::StorageError);
}

TEST(InMemoryChatStoreTest, EndSessionKeepsFirstEndTime) {
  chatbox::InMemoryChatStore store;
  auto now = std::chrono::system_clock::now();
  store.CreateSession(MakeSnapshot("s1", "u1", now), 1s);
  store.EndSession("s1", now + 5s, 1s);
  store.EndSession("s1", now + 10s, 1s);
  auto snapshot = MakeSnapshot("s1", "u1", now);
  snapshot.name = "renamed";
  store.UpdateSession(snapshot, 1s);

  auto stored = store.FindSession("s1");
  ASSERT_TRUE(stored->end_time.has_value());
  EXPECT_EQ(*stored->end_time, now + 5s);
  EXPECT_EQ(stored->name, "renamed");
}

TEST(InMemoryChatStoreTest, UpdateKeepsMessageCount) {
  chatbox::InMemoryChatStore store;
  auto now = std::chrono::system_clock::now();
  auto snapshot = MakeSnapshot("s1", "u1", now);
  store.CreateSession(snapshot, 1s);
  store.RecordMessage("s1", MakeMessage("hi"), 1s);
  snapshot.admin_assisted = true;
  snapshot.assisting_admin_id = "admin1";
  store.UpdateSession(snapshot, 1s);

  auto stored = store.FindSession("s1");
  EXPECT_TRUE(stored->admin_assisted);
  EXPECT_EQ(stored->assisting_admin_id, "admin1");
  EXPECT_EQ(stored->message_count, 1u);
}

TEST(InMemoryChatStoreTest, ListsNewestFirstPerUser) {
  chatbox::InMemoryChatStore store;
  auto now = std::chrono::system_clock::now();
  store.CreateSession(MakeSnapshot("old", "u1", now - 2h), 1s);
  store.CreateSession(MakeSnapshot("new", "u1", now), 1s);
  store.CreateSession(MakeSnapshot("mid", "u1", now - 1h), 1s);
  store.CreateSession(MakeSnapshot("other", "u2", now), 1s);

  auto sessions = store.ListUserSessions("u1", 0, 1s);
  ASSERT_EQ(sessions.size(), 3u);
  EXPECT_EQ(sessions[0].id, "new");
  EXPECT_EQ(sessions[1].id, "mid");
  EXPECT_EQ(sessions[2].id, "old");
  EXPECT_EQ(store.ListUserSessions("u1", 2, 1s).size(), 2u);
}

TEST(InMemoryChatStoreTest, InjectedFailurePropagates) {
  chatbox::InMemoryChatStore store;
  store.SetFailureInjector([](std::string_view operation) {
    if (operation == "ping") {
      throw chatbox::StorageError("timeout", true);
    }
  });
  try {
    store.Ping(1s);
    FAIL() << "expected StorageError";
  } catch (const chatbox::StorageError& ex) {
    EXPECT_TRUE(ex.transient);
  }
  store.SetFailureInjector(nullptr);
  EXPECT_TRUE(store.Ping(1s));
}
