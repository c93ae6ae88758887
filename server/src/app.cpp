/*
 * 설명: 구성요소 생성/주입, 리스너와 I/O 스레드, 주기 정리 작업, 기한 내 종료를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (ServerApp)
 * 테스트: server/tests/e2e/chat_flow_test.cpp, server/tests/e2e/admin_api_test.cpp
 */
#include "chatbox/app.hpp"

#include <algorithm>
#include <chrono>
#include <stdexcept>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "chatbox/db_client.hpp"
#include "chatbox/mariadb_chat_store.hpp"

namespace chatbox {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint,
           std::shared_ptr<const ServerContext> context)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), context_(std::move(context)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
    port_ = acceptor_.local_endpoint().port();
  }

  void Run() { DoAccept(); }

  void Stop() {
    auto self = shared_from_this();
    boost::asio::post(acceptor_.get_executor(), [self]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

  unsigned short Port() const { return port_; }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->context_)->Run();
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  std::shared_ptr<const ServerContext> context_;
  unsigned short port_{0};
};

ServerApp::ServerApp(const AppConfig& config, AppOverrides overrides)
    : config_(config), work_guard_(boost::asio::make_work_guard(ioc_)),
      dispatch_pool_(std::max<std::size_t>(1, config.dispatch_threads)) {
  std::string config_error;
  if (!ValidateConfig(config_, config_error)) {
    throw std::invalid_argument("설정 오류: " + config_error);
  }
  auto level = ParseLogLevel(config_.log_level).value_or(LogLevel::kInfo);
  observability_ = overrides.log_stream ? std::make_shared<Observability>(level, *overrides.log_stream)
                                        : std::make_shared<Observability>(level);
  if (config_.allowed_origins.empty()) {
    observability_->Log(LogLevel::kWarn, "allowed_origins_empty", {{"effect", "all origins accepted"}});
  }
  verifier_ = std::make_shared<TokenVerifier>(config_.jwt_secret);

  SessionRegistryOptions registry_options;
  registry_options.reconnect_grace = std::chrono::seconds(config_.reconnect_timeout_seconds);
  registry_options.ttl = std::chrono::seconds(config_.session_ttl_seconds);
  registry_options.default_model = config_.default_model;
  registry_ = std::make_shared<SessionRegistry>(registry_options);
  connections_ = std::make_shared<ConnectionManager>(observability_, config_.max_connections_per_user);

  if (overrides.store) {
    store_ = overrides.store;
  } else if (config_.db_enabled) {
    DbConfig db_config{config_.db_host, config_.db_port, config_.db_user, config_.db_password, config_.db_name};
    store_ = std::make_shared<MariaDbChatStore>(std::make_shared<MariaDbClient>(db_config));
  } else {
    store_ = std::make_shared<InMemoryChatStore>();
  }

  llm_ = std::make_shared<LlmService>(config_.llm_models, config_.default_model);
  std::shared_ptr<LlmProvider> provider = overrides.llm_provider;
  if (!provider && !config_.llm_endpoint.empty()) {
    provider = std::make_shared<OpenAiCompatibleProvider>(config_.llm_endpoint, config_.llm_api_key);
  }
  if (provider) {
    for (const auto& model : config_.llm_models) {
      llm_->Register(model, provider);
    }
  } else {
    observability_->Log(LogLevel::kWarn, "llm_not_configured", {{"models", config_.llm_models}});
  }

  if (overrides.notifier) {
    notifier_ = overrides.notifier;
  } else if (!config_.notify_webhook_url.empty()) {
    notifier_ = std::make_shared<WebhookNotifier>(config_.notify_webhook_url, observability_,
                                                  config_.notify_rate_limit);
  } else {
    notifier_ = std::make_shared<LogNotifier>(observability_);
  }

  std::chrono::milliseconds window = std::chrono::seconds(config_.rate_limit_window_seconds);
  message_limiter_ = std::make_shared<SlidingWindowLimiter>(config_.message_rate_limit, window);
  admin_limiter_ = std::make_shared<SlidingWindowLimiter>(config_.admin_rate_limit, window);
  public_limiter_ = std::make_shared<SlidingWindowLimiter>(config_.public_rate_limit, window);

  RouterOptions router_options;
  router_options.llm_timeout = std::chrono::seconds(config_.llm_timeout_seconds);
  router_options.history_limit = config_.llm_history_limit;
  router_options.storage_timeout = std::chrono::milliseconds(config_.db_timeout_ms);
  router_ = std::make_shared<MessageRouter>(RouterDependencies{registry_, connections_, llm_, store_, notifier_,
                                                               message_limiter_, admin_limiter_, observability_},
                                            router_options);
  std::weak_ptr<MessageRouter> weak_router = router_;
  registry_->SetExpiryCallback([weak_router](const SessionSnapshot& session) {
    if (auto router = weak_router.lock()) {
      router->PersistSessionEnd(session);
    }
  });

  context_ = std::make_shared<ServerContext>();
  context_->config = config_;
  context_->verifier = verifier_;
  context_->connections = connections_;
  context_->registry = registry_;
  context_->store = store_;
  context_->router = router_;
  context_->public_limiter = public_limiter_;
  context_->admin_limiter = admin_limiter_;
  context_->observability = observability_;
  context_->dispatch_pool = &dispatch_pool_;
}

ServerApp::~ServerApp() { Stop(); }

void ServerApp::Start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return;
  }
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, context_);
  listener_->Run();

  auto cleanup_interval = std::chrono::seconds(config_.rate_limit_cleanup_interval_seconds);
  message_limiter_->StartCleanup(ioc_, cleanup_interval);
  admin_limiter_->StartCleanup(ioc_, cleanup_interval);
  public_limiter_->StartCleanup(ioc_, cleanup_interval);
  registry_->StartCleanup(ioc_, std::chrono::seconds(config_.session_cleanup_interval_seconds));

  RunWorkers();
  observability_->Log(LogLevel::kInfo, "server_started",
                      {{"port", listener_->Port()},
                       {"pathPrefix", config_.path_prefix},
                       {"dispatchThreads", config_.dispatch_threads},
                       {"storage", config_.db_enabled ? "mariadb" : "memory"}});
}

void ServerApp::RunWorkers() {
  const unsigned int thread_count = std::max(2u, std::thread::hardware_concurrency());
  for (unsigned int i = 0; i < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

unsigned short ServerApp::GetPort() const { return listener_ ? listener_->Port() : config_.port; }

ShutdownReport ServerApp::Stop() {
  ShutdownReport report;
  if (!running_ || stopped_.exchange(true)) {
    return report;
  }
  observability_->Log(LogLevel::kInfo, "server_stopping", {{"connections", connections_->ActiveConnections()}});
  if (listener_) {
    listener_->Stop();
  }
  registry_->StopCleanup();
  message_limiter_->StopCleanup();
  admin_limiter_->StopCleanup();
  public_limiter_->StopCleanup();

  report = connections_->ShutdownWithDeadline(std::chrono::seconds(config_.shutdown_timeout_seconds));
  if (report.deadline_exceeded) {
    observability_->Log(LogLevel::kWarn, "shutdown_deadline_exceeded", {{"remaining", report.remaining}});
  }
  dispatch_pool_.join();
  if (auto webhook = std::dynamic_pointer_cast<WebhookNotifier>(notifier_)) {
    webhook->Drain();
  }

  work_guard_.reset();
  ioc_.stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  observability_->Log(LogLevel::kInfo, "server_stopped", {{"closedConnections", report.initiated}});
  return report;
}

}  // namespace chatbox
