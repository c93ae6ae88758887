/*
 * 설명: 세션 생성/재접속/종료/만료 처리와 관리자 개입 상태 전이를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Session Registry)
 * 테스트: server/tests/unit/session_registry_test.cpp
 */
#include "chatbox/session_registry.hpp"

#include <algorithm>
#include <deque>
#include <iomanip>
#include <sstream>

#include <openssl/rand.h>

namespace chatbox {

// 잠금 순서: SessionRegistry::mutex_ -> Session::mutex
struct Session {
  mutable std::mutex mutex;
  std::string id;
  std::string user_id;
  std::string name;
  std::string model_id;
  std::vector<ChatMessage> messages;
  std::chrono::system_clock::time_point start_time;
  std::chrono::system_clock::time_point last_activity;
  std::optional<std::chrono::system_clock::time_point> end_time;
  // 마지막 연결이 떨어진 시각. 연결이 붙어 있으면 비어 있다.
  std::optional<std::chrono::system_clock::time_point> detached_at;
  bool active{true};
  bool named{false};
  bool help_requested{false};
  bool admin_assisted{false};
  std::string admin_id;
  std::string admin_name;
  std::size_t attached{0};
  std::uint64_t total_tokens{0};
  std::deque<std::chrono::milliseconds> response_times;
};

namespace {
constexpr std::size_t kSessionIdBytes = 16;
constexpr std::size_t kMaxIdAttempts = 5;
constexpr const char* kDefaultSessionName = "New Chat";

std::optional<std::string> RandomSessionId() {
  unsigned char buffer[kSessionIdBytes];
  if (RAND_bytes(buffer, static_cast<int>(sizeof(buffer))) != 1) {
    return std::nullopt;
  }
  std::ostringstream oss;
  for (unsigned char byte : buffer) {
    oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return oss.str();
}

std::string TrimSpace(const std::string& value) {
  auto begin = value.find_first_not_of(" \t\r\n");
  if (begin == std::string::npos) {
    return "";
  }
  auto end = value.find_last_not_of(" \t\r\n");
  return value.substr(begin, end - begin + 1);
}

std::string FirstSentenceOrLine(const std::string& text) {
  auto newline = text.find_first_of("\r\n");
  if (newline != std::string::npos) {
    return TrimSpace(text.substr(0, newline));
  }
  auto punct = text.find_first_of(".?!");
  if (punct != std::string::npos) {
    return TrimSpace(text.substr(0, punct + 1));
  }
  return text;
}

std::string TruncateAtWordBoundary(const std::string& text, std::size_t max_length) {
  if (text.size() <= max_length) {
    return text;
  }
  std::string truncated = text.substr(0, max_length);
  auto last_space = truncated.rfind(' ');
  if (last_space != std::string::npos && last_space > 0) {
    return TrimSpace(truncated.substr(0, last_space));
  }
  return truncated;
}

SessionSnapshot SnapshotLocked(const Session& session) {
  SessionSnapshot snapshot;
  snapshot.id = session.id;
  snapshot.user_id = session.user_id;
  snapshot.name = session.name;
  snapshot.model_id = session.model_id;
  snapshot.start_time = session.start_time;
  snapshot.last_activity = session.last_activity;
  snapshot.end_time = session.end_time;
  snapshot.active = session.active;
  snapshot.help_requested = session.help_requested;
  snapshot.admin_assisted = session.admin_assisted;
  snapshot.assisting_admin_id = session.admin_id;
  snapshot.assisting_admin_name = session.admin_name;
  snapshot.attached_connections = session.attached;
  snapshot.message_count = session.messages.size();
  snapshot.total_tokens = session.total_tokens;
  if (!session.response_times.empty()) {
    std::chrono::milliseconds total{0};
    for (const auto& sample : session.response_times) {
      total += sample;
    }
    snapshot.average_response_time = total / static_cast<long>(session.response_times.size());
  }
  return snapshot;
}

void EndLocked(Session& session, std::chrono::system_clock::time_point now) {
  session.active = false;
  session.end_time = now;
  session.last_activity = now;
}

// 재접속 유예는 종료 시각, 마지막 연결 해제 시각, 마지막 활동 순으로 기준을 잡는다.
std::chrono::system_clock::time_point GraceStartLocked(const Session& session) {
  if (!session.active && session.end_time) {
    return *session.end_time;
  }
  if (session.detached_at) {
    return *session.detached_at;
  }
  return session.last_activity;
}
}  // namespace

std::string GenerateSessionName(const std::string& first_message, std::size_t max_length) {
  const std::string ellipsis = "...";
  auto message = TrimSpace(first_message);
  if (message.empty()) {
    return kDefaultSessionName;
  }
  auto name = FirstSentenceOrLine(message);
  if (name.size() > max_length) {
    if (max_length <= ellipsis.size()) {
      return ellipsis;
    }
    name = TruncateAtWordBoundary(name, max_length - ellipsis.size()) + ellipsis;
  }
  return name;
}

SessionRegistry::SessionRegistry(SessionRegistryOptions options, Clock clock)
    : options_(std::move(options)), clock_(std::move(clock)) {}

SessionRegistry::~SessionRegistry() { StopCleanup(); }

std::chrono::system_clock::time_point SessionRegistry::Now() const {
  return clock_ ? clock_() : std::chrono::system_clock::now();
}

std::shared_ptr<Session> SessionRegistry::Find(const std::string& session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<Session> SessionRegistry::NewSessionLocked(const std::string& user_id, const std::string& name,
                                                           std::chrono::system_clock::time_point now,
                                                           std::string& error_code, std::string& error_message) {
  for (std::size_t attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
    auto id = RandomSessionId();
    if (!id || sessions_.count(*id) > 0) {
      continue;
    }
    auto session = std::make_shared<Session>();
    session->id = *id;
    session->user_id = user_id;
    session->name = name.empty() ? kDefaultSessionName : name;
    session->named = !name.empty();
    session->model_id = options_.default_model;
    session->start_time = now;
    session->last_activity = now;
    sessions_[session->id] = session;
    return session;
  }
  error_code = "id_exhausted";
  error_message = "세션 ID를 생성하지 못했습니다";
  return nullptr;
}

std::optional<SessionSnapshot> SessionRegistry::CreateSession(const std::string& user_id, const std::string& name,
                                                              std::string& error_code, std::string& error_message) {
  if (user_id.empty()) {
    error_code = "invalid_user";
    error_message = "사용자 ID가 필요합니다";
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  auto session = NewSessionLocked(user_id, name, Now(), error_code, error_message);
  if (!session) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> session_lock(session->mutex);
  return SnapshotLocked(*session);
}

std::optional<ResolveResult> SessionRegistry::GetOrCreateSession(const std::string& session_id,
                                                                 const std::string& user_id, std::string& error_code,
                                                                 std::string& error_message) {
  if (user_id.empty()) {
    error_code = "invalid_user";
    error_message = "사용자 ID가 필요합니다";
    return std::nullopt;
  }
  auto now = Now();
  ResolveResult result;
  std::lock_guard<std::mutex> lock(mutex_);
  if (!session_id.empty()) {
    auto it = sessions_.find(session_id);
    if (it != sessions_.end()) {
      auto& existing = *it->second;
      std::lock_guard<std::mutex> session_lock(existing.mutex);
      if (existing.user_id != user_id) {
        error_code = "ownership";
        error_message = "다른 사용자의 세션입니다";
        return std::nullopt;
      }
      bool in_use = existing.active && existing.attached > 0;
      if (in_use || now - GraceStartLocked(existing) <= options_.reconnect_grace) {
        if (!existing.active) {
          existing.active = true;
          existing.end_time.reset();
          result.restored = true;
        }
        existing.last_activity = now;
        result.session = SnapshotLocked(existing);
        return result;
      }
      if (existing.active) {
        EndLocked(existing, now);
        result.replaced = SnapshotLocked(existing);
      }
    }
  }
  auto session = NewSessionLocked(user_id, "", now, error_code, error_message);
  if (!session) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> session_lock(session->mutex);
  result.session = SnapshotLocked(*session);
  result.created = true;
  return result;
}

std::optional<SessionSnapshot> SessionRegistry::GetSession(const std::string& session_id) const {
  auto session = Find(session_id);
  if (!session) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  return SnapshotLocked(*session);
}

std::vector<SessionSnapshot> SessionRegistry::ListSessions(const SessionFilter& filter) const {
  std::vector<SessionSnapshot> result;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    result.reserve(sessions_.size());
    for (const auto& [id, session] : sessions_) {
      std::lock_guard<std::mutex> session_lock(session->mutex);
      if (filter.user_id && session->user_id != *filter.user_id) {
        continue;
      }
      if (filter.active_only && !session->active) {
        continue;
      }
      if (filter.admin_assisted_only && !session->admin_assisted) {
        continue;
      }
      result.push_back(SnapshotLocked(*session));
    }
  }
  std::sort(result.begin(), result.end(), [](const SessionSnapshot& lhs, const SessionSnapshot& rhs) {
    if (lhs.start_time != rhs.start_time) {
      return lhs.start_time > rhs.start_time;
    }
    return lhs.id < rhs.id;
  });
  if (filter.limit > 0 && result.size() > filter.limit) {
    result.resize(filter.limit);
  }
  return result;
}

std::vector<ChatMessage> SessionRegistry::History(const std::string& session_id, std::size_t max_messages) const {
  auto session = Find(session_id);
  if (!session) {
    return {};
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  const auto& messages = session->messages;
  if (max_messages == 0 || messages.size() <= max_messages) {
    return messages;
  }
  return std::vector<ChatMessage>(messages.end() - static_cast<long>(max_messages), messages.end());
}

bool SessionRegistry::EndSession(const std::string& session_id) {
  auto session = Find(session_id);
  if (!session) {
    return false;
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  if (!session->active) {
    return false;
  }
  EndLocked(*session, Now());
  return true;
}

bool SessionRegistry::RecordMessage(const std::string& session_id, const ChatMessage& message,
                                    std::string& error_code, std::string& error_message) {
  auto session = Find(session_id);
  if (!session) {
    error_code = "not_found";
    error_message = "세션을 찾을 수 없습니다";
    return false;
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  if (!session->active) {
    error_code = "session_inactive";
    error_message = "종료된 세션입니다";
    return false;
  }
  session->messages.push_back(message);
  session->last_activity = Now();
  return true;
}

std::optional<std::string> SessionRegistry::NameFromFirstMessage(const std::string& session_id,
                                                                 const std::string& content) {
  auto session = Find(session_id);
  if (!session) {
    return std::nullopt;
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  if (session->named) {
    return std::nullopt;
  }
  session->name = GenerateSessionName(content);
  session->named = true;
  return session->name;
}

bool SessionRegistry::SetModel(const std::string& session_id, const std::string& model_id) {
  auto session = Find(session_id);
  if (!session) {
    return false;
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  session->model_id = model_id;
  session->last_activity = Now();
  return true;
}

bool SessionRegistry::MarkHelpRequested(const std::string& session_id) {
  auto session = Find(session_id);
  if (!session) {
    return false;
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  session->help_requested = true;
  session->last_activity = Now();
  return true;
}

bool SessionRegistry::SetAdminAssistance(const std::string& session_id, const std::string& admin_id,
                                         const std::string& admin_name, std::string& error_code,
                                         std::string& error_message) {
  if (admin_id.empty()) {
    error_code = "invalid_user";
    error_message = "관리자 ID가 필요합니다";
    return false;
  }
  auto session = Find(session_id);
  if (!session) {
    error_code = "not_found";
    error_message = "세션을 찾을 수 없습니다";
    return false;
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  if (!session->active) {
    error_code = "not_found";
    error_message = "종료된 세션입니다";
    return false;
  }
  if (session->admin_assisted) {
    error_code = "conflict";
    error_message = "이미 다른 관리자가 응대 중입니다";
    return false;
  }
  session->admin_assisted = true;
  session->admin_id = admin_id;
  session->admin_name = admin_name.empty() ? admin_id : admin_name;
  session->last_activity = Now();
  return true;
}

bool SessionRegistry::ClearAdminAssistance(const std::string& session_id, const std::string& admin_id,
                                           std::string& error_code, std::string& error_message) {
  auto session = Find(session_id);
  if (!session) {
    error_code = "not_found";
    error_message = "세션을 찾을 수 없습니다";
    return false;
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  if (!session->admin_assisted || session->admin_id != admin_id) {
    error_code = "conflict";
    error_message = "해당 관리자가 응대 중인 세션이 아닙니다";
    return false;
  }
  session->admin_assisted = false;
  session->admin_id.clear();
  session->admin_name.clear();
  session->last_activity = Now();
  return true;
}

void SessionRegistry::RecordResponse(const std::string& session_id, std::uint64_t tokens,
                                     std::chrono::milliseconds duration) {
  auto session = Find(session_id);
  if (!session) {
    return;
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  session->total_tokens += tokens;
  session->response_times.push_back(duration);
  while (session->response_times.size() > options_.max_response_samples) {
    session->response_times.pop_front();
  }
}

bool SessionRegistry::AttachConnection(const std::string& session_id) {
  auto session = Find(session_id);
  if (!session) {
    return false;
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  ++session->attached;
  session->detached_at.reset();
  session->last_activity = Now();
  return true;
}

void SessionRegistry::DetachConnection(const std::string& session_id) {
  auto session = Find(session_id);
  if (!session) {
    return;
  }
  std::lock_guard<std::mutex> lock(session->mutex);
  auto now = Now();
  if (session->attached > 0) {
    --session->attached;
  }
  if (session->attached == 0) {
    session->detached_at = now;
  }
  session->last_activity = now;
}

RegistryStats SessionRegistry::Stats() const {
  RegistryStats stats;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& [id, session] : sessions_) {
    std::lock_guard<std::mutex> session_lock(session->mutex);
    if (session->active) {
      ++stats.active;
    } else {
      ++stats.inactive;
    }
    if (session->admin_assisted) {
      ++stats.admin_assisted;
    }
  }
  stats.total = sessions_.size();
  return stats;
}

void SessionRegistry::SetExpiryCallback(ExpiryCallback callback) {
  std::lock_guard<std::mutex> lock(callback_mutex_);
  on_expire_ = std::move(callback);
}

std::size_t SessionRegistry::SweepExpired(std::chrono::system_clock::time_point now) {
  std::vector<SessionSnapshot> ended;
  std::size_t removed = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end();) {
      auto& session = *it->second;
      std::lock_guard<std::mutex> session_lock(session.mutex);
      bool idle_expired = now - session.last_activity > options_.ttl;
      bool in_use = session.active && session.attached > 0;
      if (!idle_expired || in_use) {
        ++it;
        continue;
      }
      if (session.active) {
        EndLocked(session, now);
        ended.push_back(SnapshotLocked(session));
      }
      it = sessions_.erase(it);
      ++removed;
    }
  }
  ExpiryCallback callback;
  {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callback = on_expire_;
  }
  if (callback) {
    for (const auto& snapshot : ended) {
      callback(snapshot);
    }
  }
  return removed;
}

void SessionRegistry::StartCleanup(boost::asio::io_context& ioc, std::chrono::milliseconds interval) {
  std::lock_guard<std::mutex> lock(cleanup_mutex_);
  if (cleanup_task_) {
    return;
  }
  cleanup_task_ = std::make_shared<PeriodicTask>(ioc, interval, [this]() { SweepExpired(Now()); });
  cleanup_task_->Start();
}

void SessionRegistry::StopCleanup() {
  std::lock_guard<std::mutex> lock(cleanup_mutex_);
  if (!cleanup_task_) {
    return;
  }
  cleanup_task_->Stop();
  cleanup_task_.reset();
}

}  // namespace chatbox
