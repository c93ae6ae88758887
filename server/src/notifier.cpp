/*
 * 설명: 로그 알림과 웹훅(HTTP POST) 알림의 비동기 전달을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Notification)
 * 테스트: server/tests/unit/notifier_test.cpp
 */
#include "chatbox/notifier.hpp"

#include <boost/asio/post.hpp>

#include "chatbox/api_response.hpp"
#include "chatbox/http_client.hpp"

namespace chatbox {

nlohmann::json NotificationToJson(const NotificationEvent& event) {
  return {{"type", event.type},
          {"sessionID", event.session_id},
          {"userID", event.user_id},
          {"userName", event.user_name},
          {"message", event.message},
          {"timestamp", ToIsoString(event.timestamp)}};
}

LogNotifier::LogNotifier(std::shared_ptr<Observability> observability) : observability_(std::move(observability)) {}

void LogNotifier::Notify(const NotificationEvent& event) {
  if (observability_) {
    observability_->Log(LogLevel::kInfo, "notification", NotificationToJson(event));
  }
}

WebhookNotifier::WebhookNotifier(std::string url, std::shared_ptr<Observability> observability,
                                 std::size_t events_per_minute, std::chrono::milliseconds timeout)
    : url_(std::move(url)), observability_(std::move(observability)),
      limiter_(events_per_minute, std::chrono::minutes(1)), timeout_(timeout) {}

WebhookNotifier::~WebhookNotifier() { Drain(); }

void WebhookNotifier::Notify(const NotificationEvent& event) {
  auto key = event.type + ":" + event.session_id;
  if (!limiter_.Allow(key)) {
    if (observability_) {
      observability_->Log(LogLevel::kInfo, "notification_throttled",
                          {{"type", event.type}, {"sessionId", event.session_id}});
    }
    return;
  }
  auto payload = NotificationToJson(event).dump();
  boost::asio::post(pool_, [this, payload = std::move(payload), type = event.type, session_id = event.session_id]() {
    HttpClientRequest request;
    request.method = boost::beast::http::verb::post;
    request.url = url_;
    request.headers = {{"Content-Type", "application/json"}};
    request.body = payload;
    request.timeout = timeout_;
    try {
      auto response = PerformRequest(request);
      if (response.status >= 300) {
        if (observability_) {
          observability_->Log(LogLevel::kWarn, "notification_rejected",
                              {{"type", type}, {"sessionId", session_id}, {"status", response.status}});
        }
        return;
      }
      if (observability_) {
        observability_->Log(LogLevel::kDebug, "notification_sent", {{"type", type}, {"sessionId", session_id}});
      }
    } catch (const HttpClientError& ex) {
      if (observability_) {
        observability_->Log(LogLevel::kWarn, "notification_failed",
                            {{"type", type}, {"sessionId", session_id}, {"error", ex.what()}});
      }
    }
  });
}

void WebhookNotifier::Drain() { pool_.join(); }

}  // namespace chatbox
