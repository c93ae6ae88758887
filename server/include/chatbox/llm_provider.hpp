/*
 * 설명: LLM 스트리밍 호출 인터페이스와 모델별 제공자 레지스트리를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (LLM)
 * 테스트: server/tests/unit/llm_provider_test.cpp
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "chatbox/client_connection.hpp"

namespace chatbox {

struct LlmMessage {
  std::string role;
  std::string content;
};

struct LlmRequest {
  std::string model_id;
  std::string session_id;
  std::string user_id;
  std::vector<LlmMessage> messages;
};

struct LlmResult {
  std::string content;
  std::uint64_t tokens{0};
};

class LlmError : public std::runtime_error {
 public:
  enum class Kind { kUnavailable, kTimeout, kCancelled };
  LlmError(const std::string& message, Kind kind) : std::runtime_error(message), kind(kind) {}
  Kind kind;
};

using ChunkHandler = std::function<void(const std::string& chunk)>;

class LlmProvider {
 public:
  virtual ~LlmProvider() = default;
  // 호출 스레드에서 블로킹하며 deadline 또는 cancel 시 LlmError를 던진다.
  virtual LlmResult Stream(const LlmRequest& request, std::chrono::milliseconds deadline,
                           const std::shared_ptr<CancelToken>& cancel, const ChunkHandler& on_chunk) = 0;
};

// OpenAI 호환 chat/completions SSE 스트리밍 제공자
class OpenAiCompatibleProvider : public LlmProvider {
 public:
  OpenAiCompatibleProvider(std::string endpoint, std::string api_key);

  LlmResult Stream(const LlmRequest& request, std::chrono::milliseconds deadline,
                   const std::shared_ptr<CancelToken>& cancel, const ChunkHandler& on_chunk) override;

 private:
  std::string endpoint_;
  std::string api_key_;
};

class LlmService {
 public:
  LlmService(std::vector<std::string> models, std::string default_model);

  void Register(const std::string& model_id, std::shared_ptr<LlmProvider> provider);
  bool HasModel(const std::string& model_id) const;
  const std::vector<std::string>& Models() const { return models_; }
  const std::string& DefaultModel() const { return default_model_; }

  LlmResult Stream(const LlmRequest& request, std::chrono::milliseconds deadline,
                   const std::shared_ptr<CancelToken>& cancel, const ChunkHandler& on_chunk) const;

 private:
  std::vector<std::string> models_;
  std::string default_model_;
  std::map<std::string, std::shared_ptr<LlmProvider>> providers_;
};

// 사용량 정보가 없을 때 문자 수 기반으로 토큰을 추정한다.
std::uint64_t EstimateTokens(const std::string& text);

}  // namespace chatbox
