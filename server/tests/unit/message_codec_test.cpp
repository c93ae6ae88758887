#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "chatbox/message.hpp"

namespace {
using chatbox::DecodeMessage;
using chatbox::MessageType;
using chatbox::ValidateInbound;
using chatbox::WireMessage;

WireMessage DecodeOk(const std::string& text) {
  std::string ec;
  std::string em;
  auto message = DecodeMessage(text, ec, em);
  EXPECT_TRUE(message.has_value()) << ec << ": " << em;
  return message.value_or(WireMessage{});
}

std::string Validate(WireMessage message) {
  std::string ec;
  std::string em;
  if (ValidateInbound(message, ec, em)) {
    return "ok";
  }
  return ec;
}
}  // namespace

TEST(MessageCodecTest, DecodesAllWireFields) {
  auto message = DecodeOk(R"({"type":"file_upload","sessionID":"s1","content":"보고서","fileID":"f-1",
                              "fileURL":"https://cdn/x.pdf","modelID":"gpt-4","metadata":{"size":120}})");
  EXPECT_EQ(message.type, MessageType::kFileUpload);
  EXPECT_EQ(message.session_id, "s1");
  EXPECT_EQ(message.content, "보고서");
  EXPECT_EQ(message.file_id, "f-1");
  EXPECT_EQ(message.file_url, "https://cdn/x.pdf");
  EXPECT_EQ(message.model_id, "gpt-4");
  EXPECT_EQ(message.metadata["size"], 120);
}

TEST(MessageCodecTest, RejectsMalformedJsonAndMissingType) {
  std::string ec;
  std::string em;
  EXPECT_FALSE(DecodeMessage("{not json", ec, em).has_value());
  EXPECT_EQ(ec, "invalid_format");
  EXPECT_FALSE(DecodeMessage("[1,2]", ec, em).has_value());
  EXPECT_FALSE(DecodeMessage(R"({"content":"hi"})", ec, em).has_value());
  EXPECT_FALSE(DecodeMessage(R"({"type":"user_message","content":5})", ec, em).has_value());
  EXPECT_FALSE(DecodeMessage(R"({"type":"user_message","metadata":"x"})", ec, em).has_value());
}

TEST(MessageCodecTest, UnknownTypeDecodesButFailsValidation) {
  auto message = DecodeOk(R"({"type":"dance","content":"x"})");
  EXPECT_EQ(message.type, MessageType::kUnknown);
  EXPECT_EQ(message.raw_type, "dance");
  EXPECT_EQ(Validate(message), "invalid_format");
}

TEST(MessageCodecTest, ServerOnlyTypesAreRejectedFromClients) {
  EXPECT_EQ(Validate(DecodeOk(R"({"type":"ai_response","content":"x"})")), "invalid_format");
  EXPECT_EQ(Validate(DecodeOk(R"({"type":"error"})")), "invalid_format");
  EXPECT_EQ(Validate(DecodeOk(R"({"type":"loading"})")), "invalid_format");
}

TEST(MessageCodecTest, SenderDefaultsToUserAndCannotBeElevated) {
  auto message = DecodeOk(R"({"type":"user_message","content":"hi"})");
  std::string ec;
  std::string em;
  ASSERT_TRUE(ValidateInbound(message, ec, em));
  EXPECT_EQ(message.sender, "user");
  EXPECT_EQ(Validate(DecodeOk(R"({"type":"user_message","content":"hi","sender":"ai"})")), "invalid_format");
  EXPECT_EQ(Validate(DecodeOk(R"({"type":"user_message","content":"hi","sender":"admin"})")), "invalid_format");
}

TEST(MessageCodecTest, RequiredFieldsPerType) {
  EXPECT_EQ(Validate(DecodeOk(R"({"type":"user_message"})")), "missing_field");
  EXPECT_EQ(Validate(DecodeOk(R"({"type":"file_upload","fileID":"f"})")), "missing_field");
  EXPECT_EQ(Validate(DecodeOk(R"({"type":"voice_message","fileURL":"u"})")), "missing_field");
  EXPECT_EQ(Validate(DecodeOk(R"({"type":"model_select"})")), "missing_field");
  EXPECT_EQ(Validate(DecodeOk(R"({"type":"admin_takeover"})")), "missing_field");
  EXPECT_EQ(Validate(DecodeOk(R"({"type":"help_request"})")), "ok");
}

TEST(MessageCodecTest, ContentLimitCountsCharactersNotBytes) {
  WireMessage message;
  message.type = MessageType::kUserMessage;
  std::string korean;
  for (int i = 0; i < 10000; ++i) {
    korean += "가";
  }
  message.content = korean;
  EXPECT_EQ(Validate(message), "ok");
  message.content += "나";
  EXPECT_EQ(Validate(message), "invalid_format");
}

TEST(MessageCodecTest, FieldLengthLimits) {
  WireMessage base;
  base.type = MessageType::kFileUpload;
  base.file_id = "f";
  base.file_url = "u";

  auto message = base;
  message.file_id = std::string(256, 'f');
  EXPECT_EQ(Validate(message), "invalid_format");

  message = base;
  message.file_url = std::string(2049, 'u');
  EXPECT_EQ(Validate(message), "invalid_format");

  message = base;
  message.session_id = std::string(129, 's');
  EXPECT_EQ(Validate(message), "invalid_format");

  message = base;
  message.model_id = std::string(101, 'm');
  EXPECT_EQ(Validate(message), "invalid_format");

  message = base;
  message.metadata = {{"note", std::string(1001, 'n')}};
  EXPECT_EQ(Validate(message), "invalid_format");

  message = base;
  message.metadata = {{"nested", {{"a", 1}}}};
  EXPECT_EQ(Validate(message), "invalid_format");

  message = base;
  message.metadata = {{"note", std::string(1000, 'n')}, {"count", 3}, {"flag", true}};
  EXPECT_EQ(Validate(message), "ok");
}

TEST(MessageCodecTest, EncodeOmitsEmptyFieldsAndCarriesTimestamp) {
  auto message = chatbox::MakeServerMessage(MessageType::kLoading, "s1", "", "ai");
  auto json = nlohmann::json::parse(chatbox::EncodeMessage(message));
  EXPECT_EQ(json["type"], "loading");
  EXPECT_EQ(json["sessionID"], "s1");
  EXPECT_EQ(json["sender"], "ai");
  EXPECT_FALSE(json.contains("content"));
  EXPECT_FALSE(json.contains("error"));
  ASSERT_TRUE(json.contains("timestamp"));
  auto timestamp = json["timestamp"].get<std::string>();
  EXPECT_EQ(timestamp.back(), 'Z');
  EXPECT_NE(timestamp.find('T'), std::string::npos);
}

TEST(MessageCodecTest, ErrorFrameShape) {
  auto message = chatbox::MakeErrorMessage("s1", "rate_limited", "too fast", true, 7);
  auto json = nlohmann::json::parse(chatbox::EncodeMessage(message));
  EXPECT_EQ(json["type"], "error");
  EXPECT_EQ(json["error"]["code"], "rate_limited");
  EXPECT_EQ(json["error"]["message"], "too fast");
  EXPECT_TRUE(json["error"]["recoverable"].get<bool>());
  EXPECT_EQ(json["error"]["retryAfter"], 7);

  auto without_retry = nlohmann::json::parse(
      chatbox::EncodeMessage(chatbox::MakeErrorMessage("", "invalid_format", "bad")));
  EXPECT_FALSE(without_retry["error"].contains("retryAfter"));
  EXPECT_FALSE(without_retry.contains("sessionID"));
}

TEST(MessageCodecTest, TypeNamesAreStable) {
  EXPECT_EQ(chatbox::MessageTypeName(MessageType::kConnectionStatus), "connection_status");
  EXPECT_EQ(chatbox::ParseMessageType("voice_message"), MessageType::kVoiceMessage);
  EXPECT_EQ(chatbox::ParseMessageType("VOICE_MESSAGE"), MessageType::kUnknown);
}
