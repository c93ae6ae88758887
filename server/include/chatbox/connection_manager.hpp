/*
 * 설명: 활성 연결을 사용자별로 색인하고 팬아웃 전송과 기한 기반 종료를 담당한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Connection Manager)
 * 테스트: server/tests/unit/connection_manager_test.cpp
 */
#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "chatbox/client_connection.hpp"
#include "chatbox/observability.hpp"

namespace chatbox {

struct ShutdownReport {
  std::size_t initiated{0};
  bool deadline_exceeded{false};
  std::vector<std::string> remaining;
};

class ConnectionManager {
 public:
  ConnectionManager(std::shared_ptr<Observability> observability, std::size_t max_connections_per_user);

  // 업그레이드 전에 사용자별 연결 상한과 종료 여부를 확인한다.
  bool CanAccept(const std::string& user_id, std::string& error_code, std::string& error_message) const;
  bool Register(const std::shared_ptr<ClientConnection>& connection, std::string& error_code,
                std::string& error_message);
  void Unregister(const std::string& connection_id);

  // 개별 소켓 실패는 다른 소켓 전송에 영향을 주지 않는다. 전달된 연결 수를 반환한다.
  std::size_t BroadcastToUser(const std::string& user_id, const std::string& frame,
                              const std::string& except_connection_id = "");
  bool SendToConnection(const std::string& connection_id, const std::string& frame);

  std::vector<std::shared_ptr<ClientConnection>> ConnectionsForUser(const std::string& user_id) const;
  std::shared_ptr<ClientConnection> Find(const std::string& connection_id) const;
  std::size_t ActiveConnections() const;
  std::size_t ConnectionCount(const std::string& user_id) const;

  ShutdownReport ShutdownWithDeadline(std::chrono::milliseconds deadline);
  bool ShuttingDown() const;

 private:
  bool Deliver(const std::shared_ptr<ClientConnection>& connection, const std::string& frame);

  std::shared_ptr<Observability> observability_;
  std::size_t max_connections_per_user_;
  std::unordered_map<std::string, std::shared_ptr<ClientConnection>> connections_;
  std::unordered_map<std::string, std::unordered_set<std::string>> by_user_;
  bool shutting_down_{false};
  mutable std::mutex mutex_;
  std::condition_variable drained_cv_;
};

}  // namespace chatbox
