/*
 * 설명: OpenAI 호환 SSE 스트리밍 호출과 모델별 제공자 선택을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (LLM)
 * 테스트: server/tests/unit/llm_provider_test.cpp
 */
#include "chatbox/llm_provider.hpp"

#include <algorithm>

#include <nlohmann/json.hpp>

#include "chatbox/http_client.hpp"

namespace chatbox {
namespace {
class SseAccumulator {
 public:
  explicit SseAccumulator(const ChunkHandler& on_chunk) : on_chunk_(on_chunk) {}

  void Feed(std::string_view data) {
    pending_.append(data.data(), data.size());
    std::size_t newline = 0;
    while ((newline = pending_.find('\n')) != std::string::npos) {
      std::string line = pending_.substr(0, newline);
      pending_.erase(0, newline + 1);
      if (!line.empty() && line.back() == '\r') {
        line.pop_back();
      }
      HandleLine(line);
    }
  }

  void Finish() {
    if (!pending_.empty()) {
      HandleLine(pending_);
      pending_.clear();
    }
  }

  const std::string& Content() const { return content_; }
  std::uint64_t UsageTokens() const { return usage_tokens_; }
  bool SawEvents() const { return saw_events_; }
  const std::string& Raw() const { return raw_; }

 private:
  void HandleLine(const std::string& line) {
    if (line.rfind("data:", 0) != 0) {
      if (!saw_events_) {
        raw_ += line;
      }
      return;
    }
    saw_events_ = true;
    auto payload = line.substr(5);
    payload.erase(0, payload.find_first_not_of(' '));
    if (payload == "[DONE]" || payload.empty()) {
      return;
    }
    auto event = nlohmann::json::parse(payload, nullptr, false);
    if (event.is_discarded() || !event.is_object()) {
      return;
    }
    auto usage_it = event.find("usage");
    if (usage_it != event.end() && usage_it->is_object() && usage_it->contains("total_tokens") &&
        (*usage_it)["total_tokens"].is_number_unsigned()) {
      usage_tokens_ = (*usage_it)["total_tokens"].get<std::uint64_t>();
    }
    auto choices = event.find("choices");
    if (choices == event.end() || !choices->is_array() || choices->empty()) {
      return;
    }
    const auto& delta = (*choices)[0].value("delta", nlohmann::json::object());
    auto content_it = delta.find("content");
    if (content_it == delta.end() || !content_it->is_string()) {
      return;
    }
    auto chunk = content_it->get<std::string>();
    if (chunk.empty()) {
      return;
    }
    content_ += chunk;
    if (on_chunk_) {
      on_chunk_(chunk);
    }
  }

  const ChunkHandler& on_chunk_;
  std::string pending_;
  std::string content_;
  std::string raw_;
  std::uint64_t usage_tokens_{0};
  bool saw_events_{false};
};
}  // namespace

std::uint64_t EstimateTokens(const std::string& text) { return static_cast<std::uint64_t>(text.size() / 4); }

OpenAiCompatibleProvider::OpenAiCompatibleProvider(std::string endpoint, std::string api_key)
    : endpoint_(std::move(endpoint)), api_key_(std::move(api_key)) {}

LlmResult OpenAiCompatibleProvider::Stream(const LlmRequest& request, std::chrono::milliseconds deadline,
                                           const std::shared_ptr<CancelToken>& cancel,
                                           const ChunkHandler& on_chunk) {
  nlohmann::json messages = nlohmann::json::array();
  std::string prompt_text;
  for (const auto& message : request.messages) {
    messages.push_back({{"role", message.role}, {"content", message.content}});
    prompt_text += message.content;
  }
  nlohmann::json body{{"model", request.model_id}, {"stream", true}, {"messages", messages}};
  if (!request.user_id.empty()) {
    body["user"] = request.user_id;
  }

  HttpClientRequest http_request;
  http_request.method = boost::beast::http::verb::post;
  http_request.url = endpoint_;
  http_request.headers = {{"Content-Type", "application/json"}, {"Accept", "text/event-stream"}};
  if (!api_key_.empty()) {
    http_request.headers.emplace_back("Authorization", "Bearer " + api_key_);
  }
  http_request.body = body.dump();
  http_request.timeout = deadline;
  http_request.cancel = cancel;

  SseAccumulator accumulator(on_chunk);
  HttpClientResponse response;
  try {
    response = PerformRequest(http_request, [&accumulator](std::string_view data) { accumulator.Feed(data); });
  } catch (const HttpClientError& ex) {
    switch (ex.kind) {
      case HttpClientError::Kind::kTimeout:
        throw LlmError(ex.what(), LlmError::Kind::kTimeout);
      case HttpClientError::Kind::kCancelled:
        throw LlmError(ex.what(), LlmError::Kind::kCancelled);
      default:
        throw LlmError(ex.what(), LlmError::Kind::kUnavailable);
    }
  }
  if (response.status < 200 || response.status >= 300) {
    throw LlmError("LLM 응답 상태 " + std::to_string(response.status) + ": " + response.body.substr(0, 512),
                   LlmError::Kind::kUnavailable);
  }
  accumulator.Finish();

  LlmResult result;
  result.content = accumulator.Content();
  if (!accumulator.SawEvents()) {
    // 스트리밍을 지원하지 않는 서버는 일반 JSON 응답을 돌려준다.
    auto parsed = nlohmann::json::parse(accumulator.Raw(), nullptr, false);
    if (parsed.is_object() && parsed.contains("choices") && parsed["choices"].is_array() &&
        !parsed["choices"].empty()) {
      const auto& message = parsed["choices"][0].value("message", nlohmann::json::object());
      if (message.contains("content") && message["content"].is_string()) {
        result.content = message["content"].get<std::string>();
        if (on_chunk && !result.content.empty()) {
          on_chunk(result.content);
        }
      }
    }
  }
  if (result.content.empty()) {
    throw LlmError("LLM 응답이 비어 있습니다", LlmError::Kind::kUnavailable);
  }
  result.tokens = accumulator.UsageTokens() > 0 ? accumulator.UsageTokens() : EstimateTokens(prompt_text + result.content);
  return result;
}

LlmService::LlmService(std::vector<std::string> models, std::string default_model)
    : models_(std::move(models)), default_model_(std::move(default_model)) {}

void LlmService::Register(const std::string& model_id, std::shared_ptr<LlmProvider> provider) {
  if (!HasModel(model_id)) {
    models_.push_back(model_id);
  }
  providers_[model_id] = std::move(provider);
}

bool LlmService::HasModel(const std::string& model_id) const {
  return std::find(models_.begin(), models_.end(), model_id) != models_.end();
}

LlmResult LlmService::Stream(const LlmRequest& request, std::chrono::milliseconds deadline,
                             const std::shared_ptr<CancelToken>& cancel, const ChunkHandler& on_chunk) const {
  const auto& model_id = request.model_id.empty() ? default_model_ : request.model_id;
  auto it = providers_.find(model_id);
  if (it == providers_.end()) {
    throw LlmError("모델 제공자가 설정되지 않았습니다: " + model_id, LlmError::Kind::kUnavailable);
  }
  if (cancel && cancel->Cancelled()) {
    throw LlmError("요청이 이미 취소되었습니다", LlmError::Kind::kCancelled);
  }
  LlmRequest routed = request;
  routed.model_id = model_id;
  return it->second->Stream(routed, deadline, cancel, on_chunk);
}

}  // namespace chatbox
