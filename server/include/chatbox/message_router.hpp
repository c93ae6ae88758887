/*
 * 설명: 수신 메시지를 유형별로 분기하고 세션/LLM/저장/알림 부수효과와 관리자 개입을 조율한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Message Router)
 * 테스트: server/tests/unit/message_router_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <string_view>

#include "chatbox/chat_store.hpp"
#include "chatbox/client_connection.hpp"
#include "chatbox/connection_manager.hpp"
#include "chatbox/llm_provider.hpp"
#include "chatbox/message.hpp"
#include "chatbox/notifier.hpp"
#include "chatbox/observability.hpp"
#include "chatbox/rate_limiter.hpp"
#include "chatbox/session_registry.hpp"

namespace chatbox {

struct RouterOptions {
  std::chrono::milliseconds llm_timeout{std::chrono::seconds(120)};
  std::size_t history_limit{20};
  std::chrono::milliseconds storage_timeout{std::chrono::seconds(5)};
};

struct RouterDependencies {
  std::shared_ptr<SessionRegistry> registry;
  std::shared_ptr<ConnectionManager> connections;
  std::shared_ptr<LlmService> llm;
  std::shared_ptr<ChatStore> store;
  std::shared_ptr<Notifier> notifier;
  std::shared_ptr<SlidingWindowLimiter> message_limiter;
  std::shared_ptr<SlidingWindowLimiter> admin_limiter;
  std::shared_ptr<Observability> observability;
};

class MessageRouter {
 public:
  MessageRouter(RouterDependencies deps, RouterOptions options);

  // 한 연결의 메시지는 호출자가 순서대로 전달해야 한다. 예외를 밖으로 던지지 않는다.
  void Dispatch(WireMessage message, const std::shared_ptr<ClientConnection>& connection);
  // 디코딩 단계에서 거부된 프레임을 보낸 연결에만 알린다.
  void RejectFrame(const std::shared_ptr<ClientConnection>& connection, const std::string& error_code,
                   const std::string& error_message);

  // 실패 시 error_code는 not_found 또는 conflict다.
  bool AdminTakeover(const UserClaims& admin, const std::string& session_id, std::string& error_code,
                     std::string& error_message);
  bool AdminLeave(const UserClaims& admin, const std::string& session_id, std::string& error_code,
                  std::string& error_message);

  void OnConnectionClosed(const std::shared_ptr<ClientConnection>& connection);
  void PersistSessionEnd(const SessionSnapshot& session);

 private:
  void HandleUserMessage(const WireMessage& message, const std::shared_ptr<ClientConnection>& connection);
  void HandleUpload(const WireMessage& message, const std::shared_ptr<ClientConnection>& connection);
  void HandleHelpRequest(const WireMessage& message, const std::shared_ptr<ClientConnection>& connection);
  void HandleModelSelect(const WireMessage& message, const std::shared_ptr<ClientConnection>& connection);
  void HandleAdminTakeover(const WireMessage& message, const std::shared_ptr<ClientConnection>& connection);
  bool HandleAdminRelay(const WireMessage& message, const std::shared_ptr<ClientConnection>& connection);

  std::optional<SessionSnapshot> ResolveSession(const WireMessage& message,
                                                const std::shared_ptr<ClientConnection>& connection,
                                                bool& storage_ok);
  bool CheckMessageRate(const WireMessage& message, const std::shared_ptr<ClientConnection>& connection);
  void RunAiTurn(const SessionSnapshot& session, const std::shared_ptr<ClientConnection>& connection,
                 bool& storage_ok);

  void SendTo(const std::shared_ptr<ClientConnection>& connection, const WireMessage& message);
  void SendError(const std::shared_ptr<ClientConnection>& connection, const std::string& session_id,
                 const std::string& code, const std::string& message, std::optional<long> retry_after = std::nullopt);
  void BroadcastSession(const SessionSnapshot& session, const WireMessage& message,
                        const std::string& except_connection_id = "");
  bool Persist(std::string_view operation, const std::string& session_id, const std::function<void()>& work);
  bool PersistSessionState(const std::string& session_id);

  RouterDependencies deps_;
  RouterOptions options_;
};

}  // namespace chatbox
