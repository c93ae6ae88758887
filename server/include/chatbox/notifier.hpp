/*
 * 설명: 상담 요청 등 운영자 알림을 비동기로 전달하는 알림기를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Notification)
 * 테스트: server/tests/unit/notifier_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/asio/thread_pool.hpp>

#include "chatbox/observability.hpp"
#include "chatbox/rate_limiter.hpp"

namespace chatbox {

struct NotificationEvent {
  std::string type;
  std::string session_id;
  std::string user_id;
  std::string user_name;
  std::string message;
  std::chrono::system_clock::time_point timestamp;
};

class Notifier {
 public:
  virtual ~Notifier() = default;
  // 호출자를 블로킹하지 않으며 실패는 로그로만 남긴다.
  virtual void Notify(const NotificationEvent& event) = 0;
};

class LogNotifier : public Notifier {
 public:
  explicit LogNotifier(std::shared_ptr<Observability> observability);
  void Notify(const NotificationEvent& event) override;

 private:
  std::shared_ptr<Observability> observability_;
};

class WebhookNotifier : public Notifier {
 public:
  WebhookNotifier(std::string url, std::shared_ptr<Observability> observability, std::size_t events_per_minute,
                  std::chrono::milliseconds timeout = std::chrono::seconds(5));
  ~WebhookNotifier() override;

  void Notify(const NotificationEvent& event) override;
  // 대기 중인 전송이 끝날 때까지 기다린다.
  void Drain();

 private:
  std::string url_;
  std::shared_ptr<Observability> observability_;
  SlidingWindowLimiter limiter_;
  std::chrono::milliseconds timeout_;
  boost::asio::thread_pool pool_{1};
};

nlohmann::json NotificationToJson(const NotificationEvent& event);

}  // namespace chatbox
