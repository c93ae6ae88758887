#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <jwt-cpp/jwt.h>
#include <jwt-cpp/traits/nlohmann-json/traits.h>
#include <nlohmann/json.hpp>

#include "chatbox/client_connection.hpp"
#include "chatbox/llm_provider.hpp"
#include "chatbox/notifier.hpp"

namespace chatbox::testing {

inline const std::string kJwtKey = "Zq8vL3nW0pR6tY1uX4kC7mB9dF2gH5jKr7Vw";

inline std::string MakeToken(const std::string& user_id, const std::string& name,
                             const std::vector<std::string>& roles,
                             std::chrono::seconds expires_in = std::chrono::hours(1),
                             const std::string& key = kJwtKey) {
  using traits = jwt::traits::nlohmann_json;
  auto now = std::chrono::system_clock::now();
  auto builder = jwt::create<traits>()
                     .set_type("JWT")
                     .set_issued_at(now)
                     .set_expires_at(now + expires_in)
                     .set_payload_claim("user_id", jwt::basic_claim<traits>(user_id))
                     .set_payload_claim("roles", jwt::basic_claim<traits>(nlohmann::json(roles)));
  if (!name.empty()) {
    builder.set_payload_claim("name", jwt::basic_claim<traits>(name));
  }
  return builder.sign(jwt::algorithm::hs256{key});
}

inline UserClaims MakeUser(const std::string& user_id, std::vector<std::string> roles = {"user"}) {
  UserClaims user;
  user.user_id = user_id;
  user.name = user_id;
  user.roles = std::move(roles);
  return user;
}

// 전송된 프레임을 기록하는 연결
class FakeConnection : public ClientConnection {
 public:
  FakeConnection(std::string id, UserClaims user) : ClientConnection(std::move(id), std::move(user)) {
    SetState(ConnectionState::kActive);
  }

  bool Send(const std::string& frame) override {
    if (throw_on_send) {
      throw std::runtime_error("socket broken");
    }
    if (State() != ConnectionState::kActive) {
      return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.push_back(nlohmann::json::parse(frame));
    return true;
  }

  void Close(CloseReason reason) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      close_reason_ = reason;
    }
    SetState(ConnectionState::kClosed);
    if (on_close) {
      on_close(Id());
    }
  }

  std::vector<nlohmann::json> Frames() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return frames_;
  }

  std::vector<nlohmann::json> FramesOfType(const std::string& type) const {
    std::vector<nlohmann::json> result;
    for (const auto& frame : Frames()) {
      if (frame.value("type", "") == type) {
        result.push_back(frame);
      }
    }
    return result;
  }

  std::optional<nlohmann::json> LastOfType(const std::string& type) const {
    auto frames = FramesOfType(type);
    if (frames.empty()) {
      return std::nullopt;
    }
    return frames.back();
  }

  void Clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    frames_.clear();
  }

  std::optional<CloseReason> ClosedWith() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return close_reason_;
  }

  void SimulateClose() { SetState(ConnectionState::kClosing); }

  bool throw_on_send{false};
  std::function<void(const std::string&)> on_close;

 private:
  mutable std::mutex mutex_;
  std::vector<nlohmann::json> frames_;
  std::optional<CloseReason> close_reason_;
};

// 미리 정한 조각을 돌려주거나 지정한 오류를 던지는 LLM 제공자
class FakeLlmProvider : public LlmProvider {
 public:
  LlmResult Stream(const LlmRequest& request, std::chrono::milliseconds /*deadline*/,
                   const std::shared_ptr<CancelToken>& cancel, const ChunkHandler& on_chunk) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      requests_.push_back(request);
    }
    ++calls;
    if (block_until_cancelled) {
      while (!cancel || !cancel->Cancelled()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
      throw LlmError("cancelled", LlmError::Kind::kCancelled);
    }
    if (failure) {
      throw LlmError("scripted failure", *failure);
    }
    std::string content;
    for (const auto& chunk : chunks) {
      content += chunk;
      on_chunk(chunk);
    }
    return LlmResult{content, tokens};
  }

  std::vector<LlmRequest> Requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

  std::vector<std::string> chunks{"안녕", "하세요"};
  std::uint64_t tokens{12};
  std::optional<LlmError::Kind> failure;
  std::atomic<bool> block_until_cancelled{false};
  std::atomic<int> calls{0};

 private:
  mutable std::mutex mutex_;
  std::vector<LlmRequest> requests_;
};

class RecordingNotifier : public Notifier {
 public:
  void Notify(const NotificationEvent& event) override {
    std::lock_guard<std::mutex> lock(mutex_);
    events_.push_back(event);
  }

  std::vector<NotificationEvent> Events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
  }

 private:
  mutable std::mutex mutex_;
  std::vector<NotificationEvent> events_;
};

}  // namespace chatbox::testing
