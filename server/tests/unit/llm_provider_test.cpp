#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "chatbox/http_client.hpp"
#include "chatbox/llm_provider.hpp"
#include "support/test_support.hpp"

namespace {
namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;
using namespace std::chrono_literals;

// 요청 하나를 받아 지정한 원시 응답을 돌려주는 로컬 서버
class ScriptedServer {
 public:
  using Script = std::function<void(tcp::socket&, ScriptedServer&)>;

  explicit ScriptedServer(Script script)
      : acceptor_(ioc_, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)),
        released_(release_.get_future().share()) {
    port_ = acceptor_.local_endpoint().port();
    thread_ = std::thread([this, script = std::move(script)]() {
      boost::system::error_code ec;
      tcp::socket socket(ioc_);
      acceptor_.accept(socket, ec);
      accepted_ = true;
      if (!ec) {
        script(socket, *this);
      }
    });
  }

  ~ScriptedServer() {
    Release();
    if (!accepted_) {
      boost::asio::io_context ioc;
      tcp::socket wake(ioc);
      boost::system::error_code ignored;
      wake.connect(tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), port_), ignored);
    }
    thread_.join();
  }

  std::string Url(const std::string& path = "/v1/chat/completions") const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  void ReadRequest(tcp::socket& socket) {
    boost::beast::flat_buffer buffer;
    http::request<http::string_body> request;
    boost::system::error_code ec;
    http::read(socket, buffer, request, ec);
    if (!ec) {
      request_body_ = request.body();
      authorization_ = std::string(request[http::field::authorization]);
    }
  }

  void Reply(tcp::socket& socket, const std::string& raw) {
    boost::system::error_code ec;
    boost::asio::write(socket, boost::asio::buffer(raw), ec);
    socket.shutdown(tcp::socket::shutdown_both, ec);
    socket.close(ec);
  }

  void Release() {
    bool expected = false;
    if (release_done_.compare_exchange_strong(expected, true)) {
      release_.set_value();
    }
  }

  void WaitForRelease() { released_.wait(); }

  const std::string& RequestBody() const { return request_body_; }
  const std::string& Authorization() const { return authorization_; }

 private:
  boost::asio::io_context ioc_;
  tcp::acceptor acceptor_;
  unsigned short port_{0};
  std::promise<void> release_;
  std::shared_future<void> released_;
  std::atomic<bool> release_done_{false};
  std::atomic<bool> accepted_{false};
  std::string request_body_;
  std::string authorization_;
  std::thread thread_;
};

std::string SseEvent(const nlohmann::json& event) { return "data: " + event.dump() + "\n\n"; }

std::string SseResponse() {
  std::string raw = "HTTP/1.1 200 OK\r\nContent-Type: text/event-stream\r\nConnection: close\r\n\r\n";
  raw += SseEvent({{"choices", {{{"delta", {{"role", "assistant"}}}}}}});
  raw += SseEvent({{"choices", {{{"delta", {{"content", "안녕"}}}}}}});
  raw += SseEvent({{"choices", {{{"delta", {{"content", "하세요"}}}}}}});
  raw += SseEvent({{"choices", nlohmann::json::array()}, {"usage", {{"total_tokens", 42}}}});
  raw += "data: [DONE]\n\n";
  return raw;
}

chatbox::LlmRequest MakeRequest() {
  chatbox::LlmRequest request;
  request.model_id = "gpt-4";
  request.session_id = "s1";
  request.user_id = "u1";
  request.messages = {{"user", "hi"}};
  return request;
}
}  // namespace

TEST(ParseUrlTest, SplitsSchemeHostPortAndTarget) {
  auto plain = chatbox::ParseUrl("http://llm.local:8000/v1/chat/completions");
  ASSERT_TRUE(plain.has_value());
  EXPECT_FALSE(plain->tls);
  EXPECT_EQ(plain->host, "llm.local");
  EXPECT_EQ(plain->port, "8000");
  EXPECT_EQ(plain->target, "/v1/chat/completions");

  auto tls = chatbox::ParseUrl("https://api.example.com");
  ASSERT_TRUE(tls.has_value());
  EXPECT_TRUE(tls->tls);
  EXPECT_EQ(tls->port, "443");
  EXPECT_EQ(tls->target, "/");

  EXPECT_FALSE(chatbox::ParseUrl("ftp://example.com").has_value());
  EXPECT_FALSE(chatbox::ParseUrl("http://:80/").has_value());
}

TEST(OpenAiProviderTest, StreamsDeltasAndReadsUsage) {
  ScriptedServer server([](tcp::socket& socket, ScriptedServer& self) {
    self.ReadRequest(socket);
    self.Reply(socket, SseResponse());
  });
  chatbox::OpenAiCompatibleProvider provider(server.Url(), "sk-test");
  std::vector<std::string> chunks;
  auto result = provider.Stream(MakeRequest(), 5s, std::make_shared<chatbox::CancelToken>(),
                                [&chunks](const std::string& chunk) { chunks.push_back(chunk); });

  ASSERT_EQ(chunks.size(), 2u);
  EXPECT_EQ(chunks[0], "안녕");
  EXPECT_EQ(result.content, "안녕하세요");
  EXPECT_EQ(result.tokens, 42u);

  auto body = nlohmann::json::parse(server.RequestBody());
  EXPECT_EQ(body["model"], "gpt-4");
  EXPECT_TRUE(body["stream"].get<bool>());
  EXPECT_EQ(body["messages"][0]["content"], "hi");
  EXPECT_EQ(server.Authorization(), "Bearer sk-test");
}

TEST(OpenAiProviderTest, AcceptsNonStreamingJson) {
  ScriptedServer server([](tcp::socket& socket, ScriptedServer& self) {
    self.ReadRequest(socket);
    std::string body = R"({"choices":[{"message":{"role":"assistant","content":"전체 응답"}}]})";
    self.Reply(socket, "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: " +
                           std::to_string(body.size()) + "\r\nConnection: close\r\n\r\n" + body);
  });
  chatbox::OpenAiCompatibleProvider provider(server.Url(), "");
  std::vector<std::string> chunks;
  auto result = provider.Stream(MakeRequest(), 5s, nullptr,
                                [&chunks](const std::string& chunk) { chunks.push_back(chunk); });
  EXPECT_EQ(result.content, "전체 응답");
  ASSERT_EQ(chunks.size(), 1u);
  EXPECT_GT(result.tokens, 0u);
}

TEST(OpenAiProviderTest, ErrorStatusIsUnavailable) {
  ScriptedServer server([](tcp::socket& socket, ScriptedServer& self) {
    self.ReadRequest(socket);
    std::string body = R"({"error":"overloaded"})";
    self.Reply(socket, "HTTP/1.1 503 Service Unavailable\r\nContent-Length: " + std::to_string(body.size()) +
                           "\r\nConnection: close\r\n\r\n" + body);
  });
  chatbox::OpenAiCompatibleProvider provider(server.Url(), "");
  try {
    provider.Stream(MakeRequest(), 5s, nullptr, nullptr);
    FAIL() << "expected LlmError";
  } catch (const chatbox::LlmError& ex) {
    EXPECT_EQ(ex.kind, chatbox::LlmError::Kind::kUnavailable);
    EXPECT_NE(std::string(ex.what()).find("503"), std::string::npos);
  }
}

TEST(OpenAiProviderTest, SlowServerTimesOut) {
  ScriptedServer server([](tcp::socket& socket, ScriptedServer& self) {
    self.ReadRequest(socket);
    self.WaitForRelease();
  });
  chatbox::OpenAiCompatibleProvider provider(server.Url(), "");
  auto started = std::chrono::steady_clock::now();
  try {
    provider.Stream(MakeRequest(), 200ms, nullptr, nullptr);
    FAIL() << "expected LlmError";
  } catch (const chatbox::LlmError& ex) {
    EXPECT_EQ(ex.kind, chatbox::LlmError::Kind::kTimeout);
  }
  EXPECT_LT(std::chrono::steady_clock::now() - started, 2s);
}

TEST(OpenAiProviderTest, CancelTokenAbortsStream) {
  ScriptedServer server([](tcp::socket& socket, ScriptedServer& self) {
    self.ReadRequest(socket);
    self.WaitForRelease();
  });
  chatbox::OpenAiCompatibleProvider provider(server.Url(), "");
  auto cancel = std::make_shared<chatbox::CancelToken>();
  std::thread canceller([cancel]() {
    std::this_thread::sleep_for(100ms);
    cancel->Cancel();
  });
  try {
    provider.Stream(MakeRequest(), 10s, cancel, nullptr);
    ADD_FAILURE() << "expected LlmError";
  } catch (const chatbox::LlmError& ex) {
    EXPECT_EQ(ex.kind, chatbox::LlmError::Kind::kCancelled);
  }
  canceller.join();
}

TEST(OpenAiProviderTest, UnreachableEndpointIsUnavailable) {
  unsigned short port = 0;
  {
    boost::asio::io_context ioc;
    tcp::acceptor reserve(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
    port = reserve.local_endpoint().port();
  }
  chatbox::OpenAiCompatibleProvider provider("http://127.0.0.1:" + std::to_string(port) + "/v1", "");
  try {
    provider.Stream(MakeRequest(), 2s, nullptr, nullptr);
    FAIL() << "expected LlmError";
  } catch (const chatbox::LlmError& ex) {
    EXPECT_EQ(ex.kind, chatbox::LlmError::Kind::kUnavailable);
  }
}

TEST(LlmServiceTest, RoutesByModelAndRejectsUnconfigured) {
  chatbox::LlmService service({"gpt-4", "claude"}, "gpt-4");
  auto provider = std::make_shared<chatbox::testing::FakeLlmProvider>();
  service.Register("gpt-4", provider);
  EXPECT_TRUE(service.HasModel("claude"));
  EXPECT_FALSE(service.HasModel("llama"));

  auto request = MakeRequest();
  request.model_id.clear();
  auto result = service.Stream(request, 1s, nullptr, [](const std::string&) {});
  EXPECT_EQ(result.content, "안녕하세요");
  EXPECT_EQ(provider->Requests().front().model_id, "gpt-4");

  request.model_id = "claude";
  try {
    service.Stream(request, 1s, nullptr, [](const std::string&) {});
    FAIL() << "expected LlmError";
  } catch (const chatbox::LlmError& ex) {
    EXPECT_EQ(ex.kind, chatbox::LlmError::Kind::kUnavailable);
  }

  auto cancelled = std::make_shared<chatbox::CancelToken>();
  cancelled->Cancel();
  request.model_id = "gpt-4";
  EXPECT_THROW(service.Stream(request, 1s, cancelled, [](const std::string&) {}), chatbox::LlmError);
  EXPECT_EQ(provider->calls.load(), 1);
}

TEST(LlmServiceTest, RegisterAddsUnknownModel) {
  chatbox::LlmService service({"gpt-4"}, "gpt-4");
  service.Register("local-model", std::make_shared<chatbox::testing::FakeLlmProvider>());
  EXPECT_TRUE(service.HasModel("local-model"));
  EXPECT_EQ(service.Models().size(), 2u);
}

TEST(LlmTokenTest, EstimatesFromLength) {
  EXPECT_EQ(chatbox::EstimateTokens(""), 0u);
  EXPECT_EQ(chatbox::EstimateTokens(std::string(40, 'a')), 10u);
}
