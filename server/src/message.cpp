/*
 * 설명: WebSocket JSON 메시지의 직렬화/역직렬화와 입력 검증을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Wire schema)
 * 테스트: server/tests/unit/message_codec_test.cpp
 */
#include "chatbox/message.hpp"

#include <array>
#include <utility>

#include "chatbox/api_response.hpp"

namespace chatbox {
namespace {
constexpr std::array<std::pair<MessageType, std::string_view>, 10> kTypeNames{{
    {MessageType::kUserMessage, "user_message"},
    {MessageType::kAiResponse, "ai_response"},
    {MessageType::kFileUpload, "file_upload"},
    {MessageType::kVoiceMessage, "voice_message"},
    {MessageType::kHelpRequest, "help_request"},
    {MessageType::kModelSelect, "model_select"},
    {MessageType::kAdminTakeover, "admin_takeover"},
    {MessageType::kLoading, "loading"},
    {MessageType::kConnectionStatus, "connection_status"},
    {MessageType::kError, "error"},
}};

bool ReadOptionalString(const nlohmann::json& object, const char* key, std::string& out) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return true;
  }
  if (!it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool Fail(std::string& error_code, std::string& error_message, const char* code, const std::string& message) {
  error_code = code;
  error_message = message;
  return false;
}
}  // namespace

std::string_view MessageTypeName(MessageType type) {
  for (const auto& [value, name] : kTypeNames) {
    if (value == type) {
      return name;
    }
  }
  return "unknown";
}

MessageType ParseMessageType(std::string_view name) {
  for (const auto& [value, type_name] : kTypeNames) {
    if (type_name == name) {
      return value;
    }
  }
  return MessageType::kUnknown;
}

std::size_t Utf8Length(std::string_view text) {
  std::size_t count = 0;
  for (unsigned char c : text) {
    if ((c & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

nlohmann::json ToJson(const WireMessage& message) {
  nlohmann::json j;
  j["type"] = message.type == MessageType::kUnknown ? message.raw_type : std::string(MessageTypeName(message.type));
  if (!message.session_id.empty()) {
    j["sessionID"] = message.session_id;
  }
  if (!message.content.empty()) {
    j["content"] = message.content;
  }
  if (!message.sender.empty()) {
    j["sender"] = message.sender;
  }
  if (!message.model_id.empty()) {
    j["modelID"] = message.model_id;
  }
  if (!message.file_id.empty()) {
    j["fileID"] = message.file_id;
  }
  if (!message.file_url.empty()) {
    j["fileURL"] = message.file_url;
  }
  if (message.metadata.is_object() && !message.metadata.empty()) {
    j["metadata"] = message.metadata;
  }
  if (message.error) {
    nlohmann::json error{{"code", message.error->code},
                         {"message", message.error->message},
                         {"recoverable", message.error->recoverable}};
    if (message.error->retry_after_seconds) {
      error["retryAfter"] = *message.error->retry_after_seconds;
    }
    j["error"] = error;
  }
  j["timestamp"] = ToIsoString(message.timestamp);
  return j;
}

std::string EncodeMessage(const WireMessage& message) {
  return ToJson(message).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::optional<WireMessage> DecodeMessage(std::string_view text, std::string& error_code, std::string& error_message) {
  auto parsed = nlohmann::json::parse(text.begin(), text.end(), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    Fail(error_code, error_message, "invalid_format", "JSON 파싱 오류");
    return std::nullopt;
  }
  WireMessage message;
  auto type_it = parsed.find("type");
  if (type_it == parsed.end() || !type_it->is_string()) {
    Fail(error_code, error_message, "invalid_format", "type 필드가 필요합니다");
    return std::nullopt;
  }
  message.raw_type = type_it->get<std::string>();
  message.type = ParseMessageType(message.raw_type);
  if (!ReadOptionalString(parsed, "sessionID", message.session_id) ||
      !ReadOptionalString(parsed, "content", message.content) ||
      !ReadOptionalString(parsed, "sender", message.sender) ||
      !ReadOptionalString(parsed, "modelID", message.model_id) ||
      !ReadOptionalString(parsed, "fileID", message.file_id) ||
      !ReadOptionalString(parsed, "fileURL", message.file_url)) {
    Fail(error_code, error_message, "invalid_format", "필드 형식이 올바르지 않습니다");
    return std::nullopt;
  }
  auto metadata_it = parsed.find("metadata");
  if (metadata_it != parsed.end() && !metadata_it->is_null()) {
    if (!metadata_it->is_object()) {
      Fail(error_code, error_message, "invalid_format", "metadata는 객체여야 합니다");
      return std::nullopt;
    }
    message.metadata = *metadata_it;
  }
  message.timestamp = std::chrono::system_clock::now();
  return message;
}

bool ValidateInbound(WireMessage& message, std::string& error_code, std::string& error_message) {
  if (message.type == MessageType::kUnknown) {
    return Fail(error_code, error_message, "invalid_format", "알 수 없는 메시지 유형");
  }
  switch (message.type) {
    case MessageType::kAiResponse:
    case MessageType::kLoading:
    case MessageType::kConnectionStatus:
    case MessageType::kError:
      return Fail(error_code, error_message, "invalid_format", "클라이언트가 보낼 수 없는 메시지 유형");
    default:
      break;
  }
  if (message.sender.empty()) {
    message.sender = "user";
  } else if (message.sender != "user") {
    return Fail(error_code, error_message, "invalid_format", "허용되지 않는 sender 값");
  }
  if (message.session_id.size() > kMaxSessionIdLength) {
    return Fail(error_code, error_message, "invalid_format", "sessionID가 너무 깁니다");
  }
  if (Utf8Length(message.content) > kMaxContentLength) {
    return Fail(error_code, error_message, "invalid_format", "content가 너무 깁니다");
  }
  if (message.file_id.size() > kMaxFileIdLength || message.file_url.size() > kMaxFileUrlLength) {
    return Fail(error_code, error_message, "invalid_format", "파일 정보가 너무 깁니다");
  }
  if (message.model_id.size() > kMaxModelIdLength) {
    return Fail(error_code, error_message, "invalid_format", "modelID가 너무 깁니다");
  }
  for (const auto& [key, value] : message.metadata.items()) {
    if (value.is_string() && Utf8Length(value.get_ref<const std::string&>()) > kMaxMetadataValueLength) {
      return Fail(error_code, error_message, "invalid_format", "metadata 값이 너무 깁니다: " + key);
    }
    if (value.is_object() || value.is_array()) {
      return Fail(error_code, error_message, "invalid_format", "metadata 값은 스칼라여야 합니다: " + key);
    }
  }
  switch (message.type) {
    case MessageType::kUserMessage:
      if (message.content.empty()) {
        return Fail(error_code, error_message, "missing_field", "content가 필요합니다");
      }
      break;
    case MessageType::kFileUpload:
    case MessageType::kVoiceMessage:
      if (message.file_id.empty() || message.file_url.empty()) {
        return Fail(error_code, error_message, "missing_field", "fileID와 fileURL이 필요합니다");
      }
      break;
    case MessageType::kModelSelect:
      if (message.model_id.empty()) {
        return Fail(error_code, error_message, "missing_field", "modelID가 필요합니다");
      }
      break;
    case MessageType::kAdminTakeover:
      if (message.session_id.empty()) {
        return Fail(error_code, error_message, "missing_field", "sessionID가 필요합니다");
      }
      break;
    default:
      break;
  }
  return true;
}

WireMessage MakeServerMessage(MessageType type, const std::string& session_id, const std::string& content,
                              const std::string& sender) {
  WireMessage message;
  message.type = type;
  message.raw_type = std::string(MessageTypeName(type));
  message.session_id = session_id;
  message.content = content;
  message.sender = sender;
  message.timestamp = std::chrono::system_clock::now();
  return message;
}

WireMessage MakeErrorMessage(const std::string& session_id, const std::string& code, const std::string& message,
                             bool recoverable, std::optional<long> retry_after_seconds) {
  auto wire = MakeServerMessage(MessageType::kError, session_id, "");
  wire.error = ErrorInfo{code, message, recoverable, retry_after_seconds};
  return wire;
}

}  // namespace chatbox
