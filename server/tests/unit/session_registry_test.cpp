#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <vector>

#include <gtest/gtest.h>

#include "chatbox/session_registry.hpp"

namespace {
using namespace std::chrono_literals;
using chatbox::ChatMessage;
using chatbox::SessionRegistry;
using chatbox::SessionRegistryOptions;
using chatbox::SessionSnapshot;

class SessionRegistryTest : public ::testing::Test {
 protected:
  SessionRegistryTest()
      : now_(std::chrono::system_clock::now()),
        registry_(MakeOptions(), [this]() { return now_; }) {}

  static SessionRegistryOptions MakeOptions() {
    SessionRegistryOptions options;
    options.reconnect_grace = 15min;
    options.ttl = 15min;
    options.default_model = "gpt-4";
    return options;
  }

  SessionSnapshot Create(const std::string& user) {
    std::string ec;
    std::string em;
    auto created = registry_.CreateSession(user, "", ec, em);
    EXPECT_TRUE(created.has_value()) << ec;
    return *created;
  }

  ChatMessage UserMessage(const std::string& content) {
    ChatMessage message;
    message.content = content;
    message.sender = chatbox::kSenderUser;
    message.timestamp = now_;
    return message;
  }

  std::chrono::system_clock::time_point now_;
  SessionRegistry registry_;
};
}  // namespace

TEST_F(SessionRegistryTest, CreateAssignsUniqueHexIdsAndDefaults) {
  std::set<std::string> ids;
  for (int i = 0; i < 50; ++i) {
    auto session = Create("u1");
    EXPECT_EQ(session.id.size(), 32u);
    EXPECT_EQ(session.user_id, "u1");
    EXPECT_EQ(session.name, "New Chat");
    EXPECT_EQ(session.model_id, "gpt-4");
    EXPECT_TRUE(session.active);
    ids.insert(session.id);
  }
  EXPECT_EQ(ids.size(), 50u);
}

TEST_F(SessionRegistryTest, CreateRejectsEmptyUser) {
  std::string ec;
  std::string em;
  EXPECT_FALSE(registry_.CreateSession("", "", ec, em).has_value());
  EXPECT_EQ(ec, "invalid_user");
}

TEST_F(SessionRegistryTest, ResumeWithinGraceReturnsSameSession) {
  auto session = Create("u1");
  now_ += 10min;
  std::string ec;
  std::string em;
  auto resolved = registry_.GetOrCreateSession(session.id, "u1", ec, em);
  ASSERT_TRUE(resolved.has_value());
  EXPECT_FALSE(resolved->created);
  EXPECT_EQ(resolved->session.id, session.id);
  EXPECT_FALSE(resolved->replaced.has_value());
  EXPECT_EQ(resolved->session.last_activity, now_);
}

TEST_F(SessionRegistryTest, ResumeAfterGraceEndsOldAndCreatesNew) {
  auto session = Create("u1");
  now_ += 16min;
  std::string ec;
  std::string em;
  auto resolved = registry_.GetOrCreateSession(session.id, "u1", ec, em);
  ASSERT_TRUE(resolved.has_value());
  EXPECT_TRUE(resolved->created);
  EXPECT_NE(resolved->session.id, session.id);
  ASSERT_TRUE(resolved->replaced.has_value());
  EXPECT_EQ(resolved->replaced->id, session.id);
  EXPECT_FALSE(resolved->replaced->active);
  auto old = registry_.GetSession(session.id);
  ASSERT_TRUE(old.has_value());
  EXPECT_FALSE(old->active);
  EXPECT_TRUE(old->end_time.has_value());
}

TEST_F(SessionRegistryTest, UnknownIdCreatesFreshSessionWithGeneratedId) {
  std::string ec;
  std::string em;
  auto resolved = registry_.GetOrCreateSession("client-chosen-id", "u1", ec, em);
  ASSERT_TRUE(resolved.has_value());
  EXPECT_TRUE(resolved->created);
  EXPECT_NE(resolved->session.id, "client-chosen-id");
}

TEST_F(SessionRegistryTest, OwnershipMismatchLeavesSessionUntouched) {
  auto session = Create("u1");
  now_ += 1min;
  std::string ec;
  std::string em;
  EXPECT_FALSE(registry_.GetOrCreateSession(session.id, "intruder", ec, em).has_value());
  EXPECT_EQ(ec, "ownership");
  auto after = registry_.GetSession(session.id);
  ASSERT_TRUE(after.has_value());
  EXPECT_EQ(after->last_activity, session.last_activity);
  EXPECT_TRUE(after->active);
}

TEST_F(SessionRegistryTest, EndSessionTransitionsOnce) {
  auto session = Create("u1");
  EXPECT_TRUE(registry_.EndSession(session.id));
  EXPECT_FALSE(registry_.EndSession(session.id));
  EXPECT_FALSE(registry_.EndSession("missing"));
  std::string ec;
  std::string em;
  EXPECT_FALSE(registry_.RecordMessage(session.id, UserMessage("hi"), ec, em));
  EXPECT_EQ(ec, "session_inactive");
}

TEST_F(SessionRegistryTest, HistoryReturnsMostRecentMessagesInOrder) {
  auto session = Create("u1");
  std::string ec;
  std::string em;
  for (int i = 0; i < 5; ++i) {
    ASSERT_TRUE(registry_.RecordMessage(session.id, UserMessage("m" + std::to_string(i)), ec, em));
  }
  auto history = registry_.History(session.id, 3);
  ASSERT_EQ(history.size(), 3u);
  EXPECT_EQ(history[0].content, "m2");
  EXPECT_EQ(history[2].content, "m4");
  EXPECT_EQ(registry_.History(session.id, 0).size(), 5u);
  EXPECT_TRUE(registry_.History("missing", 3).empty());
}

TEST_F(SessionRegistryTest, NameComesFromFirstMessageOnly) {
  auto session = Create("u1");
  auto name = registry_.NameFromFirstMessage(session.id, "How do I reset my password? It expired.");
  ASSERT_TRUE(name.has_value());
  EXPECT_EQ(*name, "How do I reset my password?");
  EXPECT_FALSE(registry_.NameFromFirstMessage(session.id, "second").has_value());
  EXPECT_EQ(registry_.GetSession(session.id)->name, "How do I reset my password?");
}

TEST(GenerateSessionNameTest, TruncatesAtWordBoundary) {
  std::string long_line(30, 'a');
  long_line += " bbbbbbbbbb cccccccccc dddddddddd";
  auto name = chatbox::GenerateSessionName(long_line, 50);
  EXPECT_LE(name.size(), 50u);
  EXPECT_EQ(name, std::string(30, 'a') + " bbbbbbbbbb...");
  EXPECT_EQ(chatbox::GenerateSessionName("   "), "New Chat");
  EXPECT_EQ(chatbox::GenerateSessionName("first line\nsecond line"), "first line");
}

TEST_F(SessionRegistryTest, ListSessionsNewestFirstWithFilters) {
  auto first = Create("u1");
  now_ += 1s;
  auto second = Create("u1");
  now_ += 1s;
  auto other = Create("u2");
  registry_.EndSession(first.id);

  chatbox::SessionFilter filter;
  filter.user_id = "u1";
  auto sessions = registry_.ListSessions(filter);
  ASSERT_EQ(sessions.size(), 2u);
  EXPECT_EQ(sessions[0].id, second.id);
  EXPECT_EQ(sessions[1].id, first.id);

  filter.active_only = true;
  sessions = registry_.ListSessions(filter);
  ASSERT_EQ(sessions.size(), 1u);
  EXPECT_EQ(sessions[0].id, second.id);

  chatbox::SessionFilter all;
  all.limit = 1;
  sessions = registry_.ListSessions(all);
  ASSERT_EQ(sessions.size(), 1u);
  EXPECT_EQ(sessions[0].id, other.id);
}

TEST_F(SessionRegistryTest, AdminAssistanceTransitions) {
  auto session = Create("u1");
  std::string ec;
  std::string em;
  EXPECT_TRUE(registry_.SetAdminAssistance(session.id, "admin1", "Kim", ec, em));
  EXPECT_FALSE(registry_.SetAdminAssistance(session.id, "admin2", "Lee", ec, em));
  EXPECT_EQ(ec, "conflict");
  auto snapshot = registry_.GetSession(session.id);
  EXPECT_TRUE(snapshot->admin_assisted);
  EXPECT_EQ(snapshot->assisting_admin_id, "admin1");
  EXPECT_EQ(snapshot->assisting_admin_name, "Kim");

  EXPECT_FALSE(registry_.ClearAdminAssistance(session.id, "admin2", ec, em));
  EXPECT_EQ(ec, "conflict");
  EXPECT_TRUE(registry_.ClearAdminAssistance(session.id, "admin1", ec, em));
  EXPECT_FALSE(registry_.GetSession(session.id)->admin_assisted);

  EXPECT_FALSE(registry_.SetAdminAssistance("missing", "admin1", "Kim", ec, em));
  EXPECT_EQ(ec, "not_found");
  registry_.EndSession(session.id);
  EXPECT_FALSE(registry_.SetAdminAssistance(session.id, "admin1", "Kim", ec, em));
  EXPECT_EQ(ec, "not_found");
}

TEST_F(SessionRegistryTest, ConcurrentTakeoverHasExactlyOneWinner) {
  auto session = Create("u1");
  std::atomic<int> winners{0};
  std::atomic<int> conflicts{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < 8; ++i) {
    threads.emplace_back([&, i]() {
      std::string ec;
      std::string em;
      if (registry_.SetAdminAssistance(session.id, "admin" + std::to_string(i), "", ec, em)) {
        ++winners;
      } else if (ec == "conflict") {
        ++conflicts;
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }
  EXPECT_EQ(winners.load(), 1);
  EXPECT_EQ(conflicts.load(), 7);
}

TEST_F(SessionRegistryTest, ResponseMetricsKeepRollingWindow) {
  auto session = Create("u1");
  for (int i = 0; i < 150; ++i) {
    registry_.RecordResponse(session.id, 2, i < 50 ? 1000ms : 100ms);
  }
  auto snapshot = registry_.GetSession(session.id);
  EXPECT_EQ(snapshot->total_tokens, 300u);
  EXPECT_EQ(snapshot->average_response_time, 100ms);
}

TEST_F(SessionRegistryTest, SweepEndsIdleSessionsAndReportsThem) {
  auto idle = Create("u1");
  auto attached = Create("u2");
  registry_.AttachConnection(attached.id);
  auto ended = Create("u3");
  registry_.EndSession(ended.id);

  std::vector<std::string> expired;
  registry_.SetExpiryCallback([&](const SessionSnapshot& snapshot) { expired.push_back(snapshot.id); });

  EXPECT_EQ(registry_.SweepExpired(now_ + 10min), 0u);
  auto removed = registry_.SweepExpired(now_ + 16min);
  EXPECT_EQ(removed, 2u);
  ASSERT_EQ(expired.size(), 1u);
  EXPECT_EQ(expired[0], idle.id);
  EXPECT_FALSE(registry_.GetSession(idle.id).has_value());
  EXPECT_FALSE(registry_.GetSession(ended.id).has_value());
  EXPECT_TRUE(registry_.GetSession(attached.id).has_value());
}

TEST_F(SessionRegistryTest, StatsCountActiveAndAssisted) {
  auto a = Create("u1");
  auto b = Create("u2");
  Create("u3");
  registry_.EndSession(b.id);
  std::string ec;
  std::string em;
  registry_.SetAdminAssistance(a.id, "admin", "", ec, em);
  auto stats = registry_.Stats();
  EXPECT_EQ(stats.active, 2u);
  EXPECT_EQ(stats.inactive, 1u);
  EXPECT_EQ(stats.total, 3u);
  EXPECT_EQ(stats.admin_assisted, 1u);
}

TEST_F(SessionRegistryTest, AttachedSessionResumesAfterLongIdle) {
  auto session = Create("u1");
  ASSERT_TRUE(registry_.AttachConnection(session.id));
  now_ += 16min;
  EXPECT_EQ(registry_.SweepExpired(now_), 0u);

  std::string ec;
  std::string em;
  auto resolved = registry_.GetOrCreateSession(session.id, "u1", ec, em);
  ASSERT_TRUE(resolved.has_value());
  EXPECT_FALSE(resolved->created);
  EXPECT_EQ(resolved->session.id, session.id);
  EXPECT_TRUE(resolved->session.active);
  EXPECT_FALSE(resolved->replaced.has_value());
}

TEST_F(SessionRegistryTest, GraceIsMeasuredFromLastDetach) {
  auto session = Create("u1");
  registry_.AttachConnection(session.id);
  now_ += 30min;
  registry_.DetachConnection(session.id);
  now_ += 14min;

  std::string ec;
  std::string em;
  auto resolved = registry_.GetOrCreateSession(session.id, "u1", ec, em);
  ASSERT_TRUE(resolved.has_value());
  EXPECT_EQ(resolved->session.id, session.id);
  EXPECT_FALSE(resolved->created);
}

TEST_F(SessionRegistryTest, EndSessionAdvancesLastActivityAndSurvivesNextSweep) {
  auto session = Create("u1");
  now_ += 14min;
  ASSERT_TRUE(registry_.EndSession(session.id));
  auto ended = registry_.GetSession(session.id);
  ASSERT_TRUE(ended.has_value());
  EXPECT_EQ(ended->last_activity, now_);

  EXPECT_EQ(registry_.SweepExpired(now_ + 2min), 0u);
  EXPECT_TRUE(registry_.GetSession(session.id).has_value());
  EXPECT_EQ(registry_.SweepExpired(now_ + 16min), 1u);
}

TEST_F(SessionRegistryTest, EndedSessionRestoredWithinGrace) {
  auto session = Create("u1");
  std::string ec;
  std::string em;
  ASSERT_TRUE(registry_.RecordMessage(session.id, UserMessage("hi"), ec, em));
  ASSERT_TRUE(registry_.EndSession(session.id));
  now_ += 5min;

  auto resolved = registry_.GetOrCreateSession(session.id, "u1", ec, em);
  ASSERT_TRUE(resolved.has_value());
  EXPECT_FALSE(resolved->created);
  EXPECT_TRUE(resolved->restored);
  EXPECT_EQ(resolved->session.id, session.id);
  EXPECT_TRUE(resolved->session.active);
  EXPECT_FALSE(resolved->session.end_time.has_value());
  EXPECT_EQ(resolved->session.message_count, 1u);
  EXPECT_TRUE(registry_.RecordMessage(session.id, UserMessage("again"), ec, em));
}

TEST_F(SessionRegistryTest, EndedSessionBeyondGraceYieldsFreshSession) {
  auto session = Create("u1");
  ASSERT_TRUE(registry_.EndSession(session.id));
  now_ += 16min;

  std::string ec;
  std::string em;
  auto resolved = registry_.GetOrCreateSession(session.id, "u1", ec, em);
  ASSERT_TRUE(resolved.has_value());
  EXPECT_TRUE(resolved->created);
  EXPECT_NE(resolved->session.id, session.id);
  EXPECT_FALSE(resolved->replaced.has_value());
  EXPECT_FALSE(registry_.GetSession(session.id)->active);
}
