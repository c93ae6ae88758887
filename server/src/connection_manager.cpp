/*
 * 설명: 사용자별 연결 색인, 팬아웃 전송, 기한 내 전체 종료를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Connection Manager)
 * 테스트: server/tests/unit/connection_manager_test.cpp
 */
#include "chatbox/connection_manager.hpp"

namespace chatbox {

ConnectionManager::ConnectionManager(std::shared_ptr<Observability> observability,
                                     std::size_t max_connections_per_user)
    : observability_(std::move(observability)), max_connections_per_user_(max_connections_per_user) {}

bool ConnectionManager::CanAccept(const std::string& user_id, std::string& error_code,
                                  std::string& error_message) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (shutting_down_) {
    error_code = "shutting_down";
    error_message = "서버가 종료 중입니다";
    return false;
  }
  auto it = by_user_.find(user_id);
  if (it != by_user_.end() && it->second.size() >= max_connections_per_user_) {
    error_code = "rate_limited";
    error_message = "사용자별 동시 연결 수를 초과했습니다";
    return false;
  }
  return true;
}

bool ConnectionManager::Register(const std::shared_ptr<ClientConnection>& connection, std::string& error_code,
                                 std::string& error_message) {
  std::size_t active = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shutting_down_) {
      error_code = "shutting_down";
      error_message = "서버가 종료 중입니다";
      return false;
    }
    auto& user_connections = by_user_[connection->UserId()];
    if (user_connections.size() >= max_connections_per_user_) {
      error_code = "rate_limited";
      error_message = "사용자별 동시 연결 수를 초과했습니다";
      return false;
    }
    user_connections.insert(connection->Id());
    connections_[connection->Id()] = connection;
    active = connections_.size();
  }
  if (observability_) {
    observability_->SetWebsocketActive(active);
    observability_->Log(LogLevel::kInfo, "connection_registered",
                        {{"connectionId", connection->Id()}, {"userId", connection->UserId()}});
  }
  return true;
}

void ConnectionManager::Unregister(const std::string& connection_id) {
  std::size_t active = 0;
  std::string user_id;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(connection_id);
    if (it == connections_.end()) {
      return;
    }
    user_id = it->second->UserId();
    connections_.erase(it);
    auto user_it = by_user_.find(user_id);
    if (user_it != by_user_.end()) {
      user_it->second.erase(connection_id);
      if (user_it->second.empty()) {
        by_user_.erase(user_it);
      }
    }
    active = connections_.size();
  }
  drained_cv_.notify_all();
  if (observability_) {
    observability_->SetWebsocketActive(active);
    observability_->Log(LogLevel::kInfo, "connection_unregistered",
                        {{"connectionId", connection_id}, {"userId", user_id}});
  }
}

bool ConnectionManager::Deliver(const std::shared_ptr<ClientConnection>& connection, const std::string& frame) {
  try {
    if (connection->Send(frame)) {
      if (observability_) {
        observability_->IncrementMessageSent();
      }
      return true;
    }
  } catch (const std::exception& ex) {
    if (observability_) {
      observability_->Log(LogLevel::kWarn, "send_failed",
                          {{"connectionId", connection->Id()}, {"error", ex.what()}});
    }
  }
  return false;
}

std::size_t ConnectionManager::BroadcastToUser(const std::string& user_id, const std::string& frame,
                                               const std::string& except_connection_id) {
  auto targets = ConnectionsForUser(user_id);
  std::size_t delivered = 0;
  for (const auto& connection : targets) {
    if (!except_connection_id.empty() && connection->Id() == except_connection_id) {
      continue;
    }
    if (Deliver(connection, frame)) {
      ++delivered;
    }
  }
  return delivered;
}

bool ConnectionManager::SendToConnection(const std::string& connection_id, const std::string& frame) {
  auto connection = Find(connection_id);
  if (!connection) {
    return false;
  }
  return Deliver(connection, frame);
}

std::vector<std::shared_ptr<ClientConnection>> ConnectionManager::ConnectionsForUser(
    const std::string& user_id) const {
  std::vector<std::shared_ptr<ClientConnection>> result;
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_user_.find(user_id);
  if (it == by_user_.end()) {
    return result;
  }
  result.reserve(it->second.size());
  for (const auto& connection_id : it->second) {
    auto conn_it = connections_.find(connection_id);
    if (conn_it != connections_.end()) {
      result.push_back(conn_it->second);
    }
  }
  return result;
}

std::shared_ptr<ClientConnection> ConnectionManager::Find(const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = connections_.find(connection_id);
  if (it == connections_.end()) {
    return nullptr;
  }
  return it->second;
}

std::size_t ConnectionManager::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

std::size_t ConnectionManager::ConnectionCount(const std::string& user_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = by_user_.find(user_id);
  return it == by_user_.end() ? 0 : it->second.size();
}

bool ConnectionManager::ShuttingDown() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return shutting_down_;
}

ShutdownReport ConnectionManager::ShutdownWithDeadline(std::chrono::milliseconds deadline) {
  auto until = std::chrono::steady_clock::now() + deadline;
  ShutdownReport report;
  std::vector<std::shared_ptr<ClientConnection>> targets;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    shutting_down_ = true;
    targets.reserve(connections_.size());
    for (const auto& [id, connection] : connections_) {
      targets.push_back(connection);
    }
  }
  if (observability_) {
    observability_->Log(LogLevel::kInfo, "shutdown_started",
                        {{"connections", targets.size()}, {"deadlineMs", deadline.count()}});
  }
  for (const auto& connection : targets) {
    try {
      connection->Close(CloseReason::kShutdown);
      ++report.initiated;
    } catch (const std::exception& ex) {
      if (observability_) {
        observability_->Log(LogLevel::kWarn, "close_failed",
                            {{"connectionId", connection->Id()}, {"error", ex.what()}});
      }
    }
  }

  std::unique_lock<std::mutex> lock(mutex_);
  bool drained = drained_cv_.wait_until(lock, until, [this]() { return connections_.empty(); });
  if (!drained) {
    report.deadline_exceeded = true;
    for (const auto& [id, connection] : connections_) {
      report.remaining.push_back(id);
    }
  }
  lock.unlock();
  if (observability_) {
    auto level = report.deadline_exceeded ? LogLevel::kWarn : LogLevel::kInfo;
    observability_->Log(level, "shutdown_finished",
                        {{"deadlineExceeded", report.deadline_exceeded}, {"remaining", report.remaining}});
  }
  return report;
}

}  // namespace chatbox
