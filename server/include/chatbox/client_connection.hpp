/*
 * 설명: 라우터와 연결 관리자가 사용하는 클라이언트 연결 추상화를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Connection Manager)
 * 테스트: server/tests/unit/connection_manager_test.cpp, server/tests/unit/message_router_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include "chatbox/token_verifier.hpp"

namespace chatbox {

enum class ConnectionState { kConnecting, kAuthenticated, kActive, kClosing, kClosed };

std::string_view ConnectionStateName(ConnectionState state);

enum class CloseReason { kNormal, kShutdown, kMessageTooBig, kBackpressure, kWriteTimeout };

class CancelToken {
 public:
  void Cancel() { cancelled_.store(true); }
  bool Cancelled() const { return cancelled_.load(); }

 private:
  std::atomic<bool> cancelled_{false};
};

std::string GenerateConnectionId(const std::string& user_id);

class ClientConnection {
 public:
  ClientConnection(std::string id, UserClaims user);
  virtual ~ClientConnection() = default;

  ClientConnection(const ClientConnection&) = delete;
  ClientConnection& operator=(const ClientConnection&) = delete;

  const std::string& Id() const { return id_; }
  const UserClaims& User() const { return user_; }
  const std::string& UserId() const { return user_.user_id; }

  std::string SessionId() const;
  void SetSessionId(const std::string& session_id);

  ConnectionState State() const { return state_.load(); }
  std::chrono::steady_clock::time_point LastActivity() const;
  void Touch();

  const std::shared_ptr<CancelToken>& Cancellation() const { return cancel_token_; }

  // 블로킹하지 않는다. 연결이 닫히는 중이거나 큐가 넘치면 false를 반환한다.
  virtual bool Send(const std::string& frame) = 0;
  // 닫기를 시작만 하고 즉시 반환한다.
  virtual void Close(CloseReason reason) = 0;

 protected:
  void SetState(ConnectionState state);

 private:
  std::string id_;
  UserClaims user_;
  std::atomic<ConnectionState> state_{ConnectionState::kConnecting};
  std::shared_ptr<CancelToken> cancel_token_ = std::make_shared<CancelToken>();
  mutable std::mutex mutex_;
  std::string session_id_;
  std::chrono::steady_clock::time_point last_activity_;
};

}  // namespace chatbox
