/*
 * 설명: 메시지 유형별 처리, LLM 턴 실행, 관리자 개입 전이, 저장 실패 보고를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Message Router)
 * 테스트: server/tests/unit/message_router_test.cpp, server/tests/e2e/chat_flow_test.cpp
 */
#include "chatbox/message_router.hpp"

#include <algorithm>

namespace chatbox {
namespace {
ChatMessage ToChatMessage(const WireMessage& message, const std::string& sender) {
  ChatMessage chat;
  chat.content = message.content;
  chat.sender = sender;
  chat.timestamp = message.timestamp;
  chat.file_id = message.file_id;
  chat.file_url = message.file_url;
  for (const auto& [key, value] : message.metadata.items()) {
    chat.metadata[key] = value.is_string() ? value.get<std::string>() : value.dump();
  }
  return chat;
}

std::string LlmRole(const ChatMessage& message) {
  return message.sender == kSenderUser ? "user" : "assistant";
}

std::string LlmContent(const ChatMessage& message) {
  if (message.file_url.empty()) {
    return message.content;
  }
  if (message.content.empty()) {
    return "[첨부 파일] " + message.file_url;
  }
  return message.content + "\n[첨부 파일] " + message.file_url;
}
}  // namespace

MessageRouter::MessageRouter(RouterDependencies deps, RouterOptions options)
    : deps_(std::move(deps)), options_(options) {}

void MessageRouter::Dispatch(WireMessage message, const std::shared_ptr<ClientConnection>& connection) {
  if (!connection) {
    return;
  }
  connection->Touch();
  if (deps_.observability) {
    deps_.observability->IncrementMessageReceived();
  }
  std::string error_code;
  std::string error_message;
  if (!ValidateInbound(message, error_code, error_message)) {
    if (deps_.observability) {
      deps_.observability->IncrementMessageError();
      deps_.observability->Log(LogLevel::kWarn, "message_rejected",
                               {{"connectionId", connection->Id()},
                                {"userId", connection->UserId()},
                                {"type", message.raw_type},
                                {"code", error_code},
                                {"reason", error_message}});
    }
    SendError(connection, message.session_id, error_code, error_message);
    return;
  }

  try {
    switch (message.type) {
      case MessageType::kUserMessage:
        HandleUserMessage(message, connection);
        break;
      case MessageType::kFileUpload:
      case MessageType::kVoiceMessage:
        HandleUpload(message, connection);
        break;
      case MessageType::kHelpRequest:
        HandleHelpRequest(message, connection);
        break;
      case MessageType::kModelSelect:
        HandleModelSelect(message, connection);
        break;
      case MessageType::kAdminTakeover:
        HandleAdminTakeover(message, connection);
        break;
      default:
        SendError(connection, message.session_id, "invalid_format", "알 수 없는 메시지 유형");
        break;
    }
  } catch (const std::exception& ex) {
    if (deps_.observability) {
      deps_.observability->IncrementMessageError();
      deps_.observability->Log(LogLevel::kError, "dispatch_failed",
                               {{"connectionId", connection->Id()},
                                {"userId", connection->UserId()},
                                {"type", message.raw_type},
                                {"error", ex.what()}});
    }
    SendError(connection, connection->SessionId(), "internal_error", "요청을 처리하지 못했습니다");
  }
}

void MessageRouter::RejectFrame(const std::shared_ptr<ClientConnection>& connection, const std::string& error_code,
                                const std::string& error_message) {
  if (deps_.observability) {
    deps_.observability->IncrementMessageError();
    deps_.observability->Log(LogLevel::kWarn, "frame_rejected",
                             {{"connectionId", connection->Id()}, {"code", error_code}, {"reason", error_message}});
  }
  SendError(connection, connection->SessionId(), error_code, error_message);
}

bool MessageRouter::CheckMessageRate(const WireMessage& message, const std::shared_ptr<ClientConnection>& connection) {
  if (!deps_.message_limiter || deps_.message_limiter->Allow(connection->UserId())) {
    return true;
  }
  auto retry_after = std::max<long>(1, static_cast<long>(deps_.message_limiter->RetryAfter(connection->UserId()).count()));
  if (deps_.observability) {
    deps_.observability->IncrementRateLimited();
    deps_.observability->Log(LogLevel::kInfo, "message_rate_limited",
                             {{"userId", connection->UserId()}, {"retryAfter", retry_after}});
  }
  SendError(connection, message.session_id, "rate_limited", "메시지 전송 한도를 초과했습니다", retry_after);
  return false;
}

std::optional<SessionSnapshot> MessageRouter::ResolveSession(const WireMessage& message,
                                                             const std::shared_ptr<ClientConnection>& connection,
                                                             bool& storage_ok) {
  auto requested = message.session_id.empty() ? connection->SessionId() : message.session_id;
  std::string error_code;
  std::string error_message;
  auto resolved = deps_.registry->GetOrCreateSession(requested, connection->UserId(), error_code, error_message);
  if (!resolved) {
    if (error_code == "ownership") {
      if (deps_.observability) {
        deps_.observability->Log(LogLevel::kWarn, "session_ownership_violation",
                                 {{"userId", connection->UserId()}, {"sessionId", requested}});
      }
      SendError(connection, "", "forbidden", "해당 세션에 접근할 수 없습니다");
    } else {
      if (deps_.observability) {
        deps_.observability->Log(LogLevel::kError, "session_resolve_failed",
                                 {{"userId", connection->UserId()}, {"code", error_code}, {"reason", error_message}});
      }
      SendError(connection, "", "internal_error", "세션을 준비하지 못했습니다");
    }
    return std::nullopt;
  }

  if (resolved->replaced) {
    PersistSessionEnd(*resolved->replaced);
  }
  const auto& session = resolved->session;
  if (resolved->created) {
    storage_ok &= Persist("create_session", session.id,
                          [&]() { deps_.store->CreateSession(session, options_.storage_timeout); });
    if (deps_.observability) {
      deps_.observability->Log(LogLevel::kInfo, "session_created",
                               {{"sessionId", session.id}, {"userId", session.user_id}});
    }
  } else if (resolved->restored) {
    storage_ok &= PersistSessionState(session.id);
    if (deps_.observability) {
      deps_.observability->Log(LogLevel::kInfo, "session_restored",
                               {{"sessionId", session.id}, {"userId", session.user_id}});
    }
  }

  auto previous = connection->SessionId();
  if (previous != session.id) {
    if (!previous.empty()) {
      deps_.registry->DetachConnection(previous);
    }
    deps_.registry->AttachConnection(session.id);
    connection->SetSessionId(session.id);
    auto status = MakeServerMessage(MessageType::kConnectionStatus, session.id,
                                    resolved->created ? "새 대화가 시작되었습니다" : "대화에 다시 연결되었습니다");
    status.metadata = {{"status", resolved->created ? "session_created" : "session_resumed"}};
    SendTo(connection, status);
  }
  auto current = deps_.registry->GetSession(session.id);
  return current ? current : std::optional<SessionSnapshot>(session);
}

void MessageRouter::HandleUserMessage(const WireMessage& message, const std::shared_ptr<ClientConnection>& connection) {
  if (!CheckMessageRate(message, connection)) {
    return;
  }
  if (HandleAdminRelay(message, connection)) {
    return;
  }
  bool storage_ok = true;
  auto session = ResolveSession(message, connection, storage_ok);
  if (!session) {
    return;
  }

  auto chat = ToChatMessage(message, kSenderUser);
  std::string error_code;
  std::string error_message;
  if (!deps_.registry->RecordMessage(session->id, chat, error_code, error_message)) {
    SendError(connection, session->id, "not_found", "세션이 종료되었습니다");
    return;
  }
  storage_ok &= Persist("record_message", session->id,
                        [&]() { deps_.store->RecordMessage(session->id, chat, options_.storage_timeout); });
  if (deps_.registry->NameFromFirstMessage(session->id, chat.content)) {
    storage_ok &= PersistSessionState(session->id);
  }

  auto echo = message;
  echo.session_id = session->id;
  echo.sender = kSenderUser;
  BroadcastSession(*session, echo, connection->Id());

  if (session->admin_assisted) {
    if (deps_.observability) {
      deps_.observability->Log(LogLevel::kDebug, "message_relayed_to_admin",
                               {{"sessionId", session->id}, {"adminId", session->assisting_admin_id}});
    }
  } else {
    RunAiTurn(*session, connection, storage_ok);
  }
  if (!storage_ok) {
    SendError(connection, session->id, "internal_error", "메시지를 저장하지 못했습니다");
  }
}

bool MessageRouter::HandleAdminRelay(const WireMessage& message, const std::shared_ptr<ClientConnection>& connection) {
  if (message.session_id.empty() || !connection->User().IsAdmin()) {
    return false;
  }
  auto session = deps_.registry->GetSession(message.session_id);
  if (!session || !session->admin_assisted || session->assisting_admin_id != connection->UserId() ||
      session->user_id == connection->UserId()) {
    return false;
  }
  auto chat = ToChatMessage(message, kSenderAdmin);
  std::string error_code;
  std::string error_message;
  if (!deps_.registry->RecordMessage(session->id, chat, error_code, error_message)) {
    SendError(connection, session->id, "not_found", "세션이 종료되었습니다");
    return true;
  }
  bool storage_ok = Persist("record_message", session->id,
                            [&]() { deps_.store->RecordMessage(session->id, chat, options_.storage_timeout); });
  auto relay = message;
  relay.sender = kSenderAdmin;
  relay.metadata["adminID"] = session->assisting_admin_id;
  relay.metadata["adminName"] = session->assisting_admin_name;
  BroadcastSession(*session, relay, connection->Id());
  if (!storage_ok) {
    SendError(connection, session->id, "internal_error", "메시지를 저장하지 못했습니다");
  }
  return true;
}

void MessageRouter::HandleUpload(const WireMessage& message, const std::shared_ptr<ClientConnection>& connection) {
  if (!CheckMessageRate(message, connection)) {
    return;
  }
  bool storage_ok = true;
  auto session = ResolveSession(message, connection, storage_ok);
  if (!session) {
    return;
  }
  auto chat = ToChatMessage(message, kSenderUser);
  chat.metadata["type"] = std::string(MessageTypeName(message.type));
  std::string error_code;
  std::string error_message;
  if (!deps_.registry->RecordMessage(session->id, chat, error_code, error_message)) {
    SendError(connection, session->id, "not_found", "세션이 종료되었습니다");
    return;
  }
  storage_ok &= Persist("record_message", session->id,
                        [&]() { deps_.store->RecordMessage(session->id, chat, options_.storage_timeout); });
  if (deps_.observability) {
    deps_.observability->Log(LogLevel::kInfo, "file_received",
                             {{"sessionId", session->id},
                              {"userId", session->user_id},
                              {"type", std::string(MessageTypeName(message.type))},
                              {"fileId", message.file_id}});
  }

  auto broadcast = message;
  broadcast.session_id = session->id;
  broadcast.sender = kSenderUser;
  BroadcastSession(*session, broadcast, connection->Id());

  if (message.type == MessageType::kVoiceMessage && !session->admin_assisted) {
    RunAiTurn(*session, connection, storage_ok);
  }
  if (!storage_ok) {
    SendError(connection, session->id, "internal_error", "메시지를 저장하지 못했습니다");
  }
}

void MessageRouter::HandleHelpRequest(const WireMessage& message,
                                      const std::shared_ptr<ClientConnection>& connection) {
  bool storage_ok = true;
  auto session = ResolveSession(message, connection, storage_ok);
  if (!session) {
    return;
  }
  deps_.registry->MarkHelpRequested(session->id);
  storage_ok &= PersistSessionState(session->id);
  if (deps_.observability) {
    deps_.observability->Log(LogLevel::kInfo, "help_requested",
                             {{"sessionId", session->id}, {"userId", session->user_id}});
  }
  if (deps_.notifier) {
    NotificationEvent event;
    event.type = "help_request";
    event.session_id = session->id;
    event.user_id = connection->UserId();
    event.user_name = connection->User().name;
    event.message = message.content;
    event.timestamp = std::chrono::system_clock::now();
    deps_.notifier->Notify(event);
  }
  auto ack = MakeServerMessage(MessageType::kConnectionStatus, session->id,
                               "상담 요청이 접수되었습니다. 곧 관리자가 참여합니다.");
  ack.metadata = {{"status", "help_requested"}};
  SendTo(connection, ack);
  if (!storage_ok) {
    SendError(connection, session->id, "internal_error", "요청 상태를 저장하지 못했습니다");
  }
}

void MessageRouter::HandleModelSelect(const WireMessage& message,
                                      const std::shared_ptr<ClientConnection>& connection) {
  if (!deps_.llm->HasModel(message.model_id)) {
    SendError(connection, message.session_id, "invalid_format", "지원하지 않는 모델입니다");
    return;
  }
  bool storage_ok = true;
  auto session = ResolveSession(message, connection, storage_ok);
  if (!session) {
    return;
  }
  deps_.registry->SetModel(session->id, message.model_id);
  storage_ok &= PersistSessionState(session->id);
  auto ack = MakeServerMessage(MessageType::kConnectionStatus, session->id,
                               "모델이 " + message.model_id + "(으)로 변경되었습니다");
  ack.model_id = message.model_id;
  ack.metadata = {{"status", "model_changed"}};
  SendTo(connection, ack);
  if (!storage_ok) {
    SendError(connection, session->id, "internal_error", "모델 설정을 저장하지 못했습니다");
  }
}

void MessageRouter::HandleAdminTakeover(const WireMessage& message,
                                        const std::shared_ptr<ClientConnection>& connection) {
  if (!connection->User().IsAdmin()) {
    if (deps_.observability) {
      deps_.observability->Log(LogLevel::kWarn, "admin_takeover_forbidden",
                               {{"userId", connection->UserId()}, {"sessionId", message.session_id}});
    }
    SendError(connection, message.session_id, "forbidden", "관리자 권한이 필요합니다");
    return;
  }
  if (deps_.admin_limiter && !deps_.admin_limiter->Allow(connection->UserId())) {
    auto retry_after =
        std::max<long>(1, static_cast<long>(deps_.admin_limiter->RetryAfter(connection->UserId()).count()));
    if (deps_.observability) {
      deps_.observability->IncrementRateLimited();
    }
    SendError(connection, message.session_id, "rate_limited", "관리자 요청 한도를 초과했습니다", retry_after);
    return;
  }
  std::string error_code;
  std::string error_message;
  if (!AdminTakeover(connection->User(), message.session_id, error_code, error_message)) {
    SendError(connection, message.session_id, error_code, error_message);
  }
}

bool MessageRouter::AdminTakeover(const UserClaims& admin, const std::string& session_id, std::string& error_code,
                                  std::string& error_message) {
  if (!deps_.registry->SetAdminAssistance(session_id, admin.user_id, admin.name, error_code, error_message)) {
    if (error_code != "conflict") {
      error_code = "not_found";
    }
    if (deps_.observability) {
      deps_.observability->Log(LogLevel::kInfo, "admin_takeover_rejected",
                               {{"adminId", admin.user_id}, {"sessionId", session_id}, {"code", error_code}});
    }
    return false;
  }
  auto session = deps_.registry->GetSession(session_id);
  if (!session) {
    error_code = "not_found";
    error_message = "세션을 찾을 수 없습니다";
    return false;
  }
  if (deps_.observability) {
    deps_.observability->IncrementAdminTakeover();
    deps_.observability->Log(LogLevel::kInfo, "admin_takeover",
                             {{"adminId", admin.user_id}, {"sessionId", session_id}, {"userId", session->user_id}});
  }
  PersistSessionState(session_id);

  auto frame = MakeServerMessage(MessageType::kAdminTakeover, session_id,
                                 "관리자 " + session->assisting_admin_name + "님이 대화에 참여했습니다", kSenderAdmin);
  frame.metadata = {{"adminID", session->assisting_admin_id}, {"adminName", session->assisting_admin_name}};
  BroadcastSession(*session, frame);
  return true;
}

bool MessageRouter::AdminLeave(const UserClaims& admin, const std::string& session_id, std::string& error_code,
                               std::string& error_message) {
  auto before = deps_.registry->GetSession(session_id);
  if (!deps_.registry->ClearAdminAssistance(session_id, admin.user_id, error_code, error_message)) {
    return false;
  }
  if (deps_.observability) {
    deps_.observability->Log(LogLevel::kInfo, "admin_left", {{"adminId", admin.user_id}, {"sessionId", session_id}});
  }
  PersistSessionState(session_id);
  auto frame = MakeServerMessage(MessageType::kConnectionStatus, session_id, "관리자가 대화를 떠났습니다", kSenderAdmin);
  frame.metadata = {{"status", "admin_left"},
                    {"adminID", admin.user_id},
                    {"adminName", before ? before->assisting_admin_name : admin.name}};
  if (before) {
    deps_.connections->BroadcastToUser(before->user_id, EncodeMessage(frame));
  }
  if (!before || before->user_id != admin.user_id) {
    deps_.connections->BroadcastToUser(admin.user_id, EncodeMessage(frame));
  }
  return true;
}

void MessageRouter::RunAiTurn(const SessionSnapshot& session, const std::shared_ptr<ClientConnection>& connection,
                              bool& storage_ok) {
  auto model_id = session.model_id.empty() ? deps_.llm->DefaultModel() : session.model_id;
  BroadcastSession(session, MakeServerMessage(MessageType::kLoading, session.id, "", kSenderAi));

  LlmRequest request;
  request.model_id = model_id;
  request.session_id = session.id;
  request.user_id = session.user_id;
  for (const auto& past : deps_.registry->History(session.id, options_.history_limit)) {
    request.messages.push_back({LlmRole(past), LlmContent(past)});
  }

  auto started = std::chrono::steady_clock::now();
  LlmResult result;
  try {
    result = deps_.llm->Stream(request, options_.llm_timeout, connection->Cancellation(),
                               [&](const std::string& chunk) {
                                 auto frame = MakeServerMessage(MessageType::kAiResponse, session.id, chunk, kSenderAi);
                                 frame.model_id = model_id;
                                 frame.metadata = {{"streaming", true}, {"done", false}};
                                 BroadcastSession(session, frame);
                               });
  } catch (const LlmError& ex) {
    if (ex.kind == LlmError::Kind::kCancelled) {
      if (deps_.observability) {
        deps_.observability->Log(LogLevel::kInfo, "llm_cancelled",
                                 {{"sessionId", session.id}, {"connectionId", connection->Id()}});
      }
      // 요청한 연결은 닫히는 중이다. 형제 연결의 로딩 표시만 끝낸다.
      BroadcastSession(session, MakeErrorMessage(session.id, "llm_cancelled", "AI 응답이 취소되었습니다"),
                       connection->Id());
      return;
    }
    if (deps_.observability) {
      deps_.observability->IncrementLlmError();
      deps_.observability->Log(LogLevel::kError, "llm_failed",
                               {{"sessionId", session.id},
                                {"modelId", model_id},
                                {"kind", ex.kind == LlmError::Kind::kTimeout ? "timeout" : "unavailable"},
                                {"error", ex.what()}});
    }
    if (ex.kind == LlmError::Kind::kTimeout) {
      BroadcastSession(session, MakeErrorMessage(session.id, "llm_timeout", "AI 응답 시간이 초과되었습니다"));
    } else {
      BroadcastSession(session,
                       MakeErrorMessage(session.id, "llm_unavailable", "AI 서비스를 일시적으로 사용할 수 없습니다"));
    }
    return;
  }
  auto elapsed =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

  ChatMessage reply;
  reply.content = result.content;
  reply.sender = kSenderAi;
  reply.timestamp = std::chrono::system_clock::now();
  reply.metadata["modelID"] = model_id;
  std::string error_code;
  std::string error_message;
  if (deps_.registry->RecordMessage(session.id, reply, error_code, error_message)) {
    storage_ok &= Persist("record_message", session.id,
                          [&]() { deps_.store->RecordMessage(session.id, reply, options_.storage_timeout); });
  }
  deps_.registry->RecordResponse(session.id, result.tokens, elapsed);
  storage_ok &= PersistSessionState(session.id);

  auto final_frame = MakeServerMessage(MessageType::kAiResponse, session.id, result.content, kSenderAi);
  final_frame.model_id = model_id;
  final_frame.metadata = {{"streaming", true}, {"done", true}};
  BroadcastSession(session, final_frame);
  if (deps_.observability) {
    deps_.observability->Log(LogLevel::kInfo, "ai_response",
                             {{"sessionId", session.id},
                              {"modelId", model_id},
                              {"tokens", result.tokens},
                              {"latencyMs", elapsed.count()}});
  }
}

void MessageRouter::OnConnectionClosed(const std::shared_ptr<ClientConnection>& connection) {
  auto session_id = connection->SessionId();
  if (!session_id.empty()) {
    deps_.registry->DetachConnection(session_id);
  }
}

void MessageRouter::PersistSessionEnd(const SessionSnapshot& session) {
  auto end_time = session.end_time ? *session.end_time : std::chrono::system_clock::now();
  Persist("end_session", session.id, [&]() { deps_.store->EndSession(session.id, end_time, options_.storage_timeout); });
  if (deps_.observability) {
    deps_.observability->Log(LogLevel::kInfo, "session_ended", {{"sessionId", session.id}, {"userId", session.user_id}});
  }
}

bool MessageRouter::PersistSessionState(const std::string& session_id) {
  auto session = deps_.registry->GetSession(session_id);
  if (!session) {
    return true;
  }
  return Persist("update_session", session_id,
                 [&]() { deps_.store->UpdateSession(*session, options_.storage_timeout); });
}

bool MessageRouter::Persist(std::string_view operation, const std::string& session_id,
                            const std::function<void()>& work) {
  if (!deps_.store) {
    return true;
  }
  try {
    work();
    return true;
  } catch (const StorageError& ex) {
    if (deps_.observability) {
      deps_.observability->Log(ex.transient ? LogLevel::kWarn : LogLevel::kError, "storage_failed",
                               {{"operation", std::string(operation)},
                                {"sessionId", session_id},
                                {"transient", ex.transient},
                                {"error", ex.what()}});
    }
    return false;
  }
}

void MessageRouter::SendTo(const std::shared_ptr<ClientConnection>& connection, const WireMessage& message) {
  try {
    if (connection->Send(EncodeMessage(message)) && deps_.observability) {
      deps_.observability->IncrementMessageSent();
    }
  } catch (const std::exception& ex) {
    if (deps_.observability) {
      deps_.observability->Log(LogLevel::kWarn, "send_failed",
                               {{"connectionId", connection->Id()}, {"error", ex.what()}});
    }
  }
}

void MessageRouter::SendError(const std::shared_ptr<ClientConnection>& connection, const std::string& session_id,
                              const std::string& code, const std::string& message, std::optional<long> retry_after) {
  SendTo(connection, MakeErrorMessage(session_id, code, message, true, retry_after));
}

void MessageRouter::BroadcastSession(const SessionSnapshot& session, const WireMessage& message,
                                     const std::string& except_connection_id) {
  auto frame = EncodeMessage(message);
  deps_.connections->BroadcastToUser(session.user_id, frame, except_connection_id);
  auto current = deps_.registry->GetSession(session.id);
  if (current && current->admin_assisted && current->assisting_admin_id != session.user_id) {
    deps_.connections->BroadcastToUser(current->assisting_admin_id, frame, except_connection_id);
  }
}

}  // namespace chatbox
