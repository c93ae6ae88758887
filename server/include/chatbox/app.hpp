/*
 * 설명: 서버 전체 수명주기를 관리한다. 구성요소를 생성/주입하고 기한 내 종료를 수행한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (ServerApp)
 * 테스트: server/tests/e2e/chat_flow_test.cpp, server/tests/e2e/admin_api_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>

#include "chatbox/chat_store.hpp"
#include "chatbox/config.hpp"
#include "chatbox/connection_manager.hpp"
#include "chatbox/http_session.hpp"
#include "chatbox/llm_provider.hpp"
#include "chatbox/message_router.hpp"
#include "chatbox/notifier.hpp"
#include "chatbox/observability.hpp"
#include "chatbox/rate_limiter.hpp"
#include "chatbox/session_registry.hpp"
#include "chatbox/token_verifier.hpp"

namespace chatbox {

class Listener;

// 비어 있는 항목은 설정에 따라 기본 구현으로 채운다.
struct AppOverrides {
  std::shared_ptr<ChatStore> store;
  std::shared_ptr<LlmProvider> llm_provider;
  std::shared_ptr<Notifier> notifier;
  std::ostream* log_stream{nullptr};
};

class ServerApp {
 public:
  // 잘못된 설정이나 약한 JWT 비밀키는 예외로 기동을 중단한다.
  explicit ServerApp(const AppConfig& config, AppOverrides overrides = {});
  ~ServerApp();

  ServerApp(const ServerApp&) = delete;
  ServerApp& operator=(const ServerApp&) = delete;

  // 리스너와 백그라운드 작업을 시작하고 즉시 반환한다.
  void Start();
  // 여러 번 호출해도 안전하다.
  ShutdownReport Stop();

  unsigned short GetPort() const;
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<SessionRegistry> GetRegistry() { return registry_; }
  std::shared_ptr<ConnectionManager> GetConnections() { return connections_; }
  std::shared_ptr<ChatStore> GetStore() { return store_; }
  std::shared_ptr<MessageRouter> GetRouter() { return router_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  void RunWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::thread_pool dispatch_pool_;
  std::shared_ptr<Listener> listener_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<TokenVerifier> verifier_;
  std::shared_ptr<SessionRegistry> registry_;
  std::shared_ptr<ConnectionManager> connections_;
  std::shared_ptr<ChatStore> store_;
  std::shared_ptr<LlmService> llm_;
  std::shared_ptr<Notifier> notifier_;
  std::shared_ptr<SlidingWindowLimiter> message_limiter_;
  std::shared_ptr<SlidingWindowLimiter> admin_limiter_;
  std::shared_ptr<SlidingWindowLimiter> public_limiter_;
  std::shared_ptr<MessageRouter> router_;
  std::shared_ptr<ServerContext> context_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};
};

}  // namespace chatbox
