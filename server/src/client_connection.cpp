/*
 * 설명: 클라이언트 연결 공통 상태(세션 연결, 활동 시각, 취소 토큰)를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Connection Manager)
 * 테스트: server/tests/unit/connection_manager_test.cpp
 */
#include "chatbox/client_connection.hpp"

#include <iomanip>
#include <sstream>

#include <openssl/rand.h>

namespace chatbox {

std::string_view ConnectionStateName(ConnectionState state) {
  switch (state) {
    case ConnectionState::kConnecting:
      return "connecting";
    case ConnectionState::kAuthenticated:
      return "authenticated";
    case ConnectionState::kActive:
      return "active";
    case ConnectionState::kClosing:
      return "closing";
    case ConnectionState::kClosed:
      return "closed";
  }
  return "unknown";
}

std::string GenerateConnectionId(const std::string& user_id) {
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
  unsigned char buffer[4] = {0, 0, 0, 0};
  std::ostringstream oss;
  oss << user_id << "-" << nanos;
  if (RAND_bytes(buffer, sizeof(buffer)) == 1) {
    oss << "-";
    for (unsigned char byte : buffer) {
      oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
  }
  return oss.str();
}

ClientConnection::ClientConnection(std::string id, UserClaims user)
    : id_(std::move(id)), user_(std::move(user)), last_activity_(std::chrono::steady_clock::now()) {}

std::string ClientConnection::SessionId() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return session_id_;
}

void ClientConnection::SetSessionId(const std::string& session_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  session_id_ = session_id;
}

std::chrono::steady_clock::time_point ClientConnection::LastActivity() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_activity_;
}

void ClientConnection::Touch() {
  std::lock_guard<std::mutex> lock(mutex_);
  last_activity_ = std::chrono::steady_clock::now();
}

void ClientConnection::SetState(ConnectionState state) {
  state_.store(state);
  if (state == ConnectionState::kClosing || state == ConnectionState::kClosed) {
    cancel_token_->Cancel();
  }
}

}  // namespace chatbox
