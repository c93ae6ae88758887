/*
 * 설명: WebSocket 텍스트 프레임의 JSON 메시지 스키마와 입력 검증을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Wire schema)
 * 테스트: server/tests/unit/message_codec_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace chatbox {

enum class MessageType {
  kUserMessage,
  kAiResponse,
  kFileUpload,
  kVoiceMessage,
  kHelpRequest,
  kModelSelect,
  kAdminTakeover,
  kLoading,
  kConnectionStatus,
  kError,
  kUnknown,
};

std::string_view MessageTypeName(MessageType type);
MessageType ParseMessageType(std::string_view name);

inline constexpr std::size_t kMaxContentLength = 10000;
inline constexpr std::size_t kMaxMetadataValueLength = 1000;
inline constexpr std::size_t kMaxFileIdLength = 255;
inline constexpr std::size_t kMaxFileUrlLength = 2048;
inline constexpr std::size_t kMaxModelIdLength = 100;
inline constexpr std::size_t kMaxSessionIdLength = 128;

struct ErrorInfo {
  std::string code;
  std::string message;
  bool recoverable{true};
  std::optional<long> retry_after_seconds;
};

struct WireMessage {
  MessageType type{MessageType::kUnknown};
  std::string raw_type;
  std::string session_id;
  std::string content;
  std::string sender;
  std::string model_id;
  std::string file_id;
  std::string file_url;
  nlohmann::json metadata = nlohmann::json::object();
  std::optional<ErrorInfo> error;
  std::chrono::system_clock::time_point timestamp{};
};

nlohmann::json ToJson(const WireMessage& message);
std::string EncodeMessage(const WireMessage& message);

// JSON 파싱과 필드 타입 검사만 수행한다. 알 수 없는 type은 kUnknown으로 남긴다.
std::optional<WireMessage> DecodeMessage(std::string_view text, std::string& error_code, std::string& error_message);

// 클라이언트 입력의 길이/필수 필드 규칙을 검사하고 sender 기본값을 채운다.
bool ValidateInbound(WireMessage& message, std::string& error_code, std::string& error_message);

WireMessage MakeServerMessage(MessageType type, const std::string& session_id, const std::string& content,
                              const std::string& sender = "");
WireMessage MakeErrorMessage(const std::string& session_id, const std::string& code, const std::string& message,
                             bool recoverable = true, std::optional<long> retry_after_seconds = std::nullopt);

std::size_t Utf8Length(std::string_view text);

}  // namespace chatbox
