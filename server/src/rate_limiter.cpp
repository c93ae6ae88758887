/*
 * 설명: 슬라이딩 윈도우 방식으로 키별 요청 수를 제한하고 만료 버킷을 정리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Rate Limiter)
 * 테스트: server/tests/unit/rate_limiter_test.cpp
 */
#include "chatbox/rate_limiter.hpp"

namespace chatbox {

SlidingWindowLimiter::SlidingWindowLimiter(std::size_t limit, std::chrono::milliseconds window)
    : limit_(limit), window_(window) {}

SlidingWindowLimiter::~SlidingWindowLimiter() { StopCleanup(); }

bool SlidingWindowLimiter::Allow(const std::string& key) { return Allow(key, Clock::now()); }

bool SlidingWindowLimiter::Allow(const std::string& key, Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto& bucket = buckets_[key];
  Prune(bucket, now);
  if (bucket.size() >= limit_) {
    return false;
  }
  bucket.push_back(now);
  return true;
}

std::chrono::seconds SlidingWindowLimiter::RetryAfter(const std::string& key) { return RetryAfter(key, Clock::now()); }

std::chrono::seconds SlidingWindowLimiter::RetryAfter(const std::string& key, Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (limit_ == 0) {
    // 한도가 0이면 창이 지나도 허용되지 않는다. 창 길이를 그대로 알려 준다.
    auto seconds = (window_.count() + 999) / 1000;
    return std::chrono::seconds(seconds < 1 ? 1 : seconds);
  }
  auto it = buckets_.find(key);
  if (it == buckets_.end()) {
    return std::chrono::seconds(0);
  }
  Prune(it->second, now);
  if (it->second.size() < limit_) {
    return std::chrono::seconds(0);
  }
  auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(it->second.front() + window_ - now);
  auto seconds = (remaining.count() + 999) / 1000;
  return std::chrono::seconds(seconds < 1 ? 1 : seconds);
}

void SlidingWindowLimiter::Reset(const std::string& key) {
  std::lock_guard<std::mutex> lock(mutex_);
  buckets_.erase(key);
}

std::size_t SlidingWindowLimiter::Cleanup() { return Cleanup(Clock::now()); }

std::size_t SlidingWindowLimiter::Cleanup(Clock::time_point now) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = 0;
  for (auto it = buckets_.begin(); it != buckets_.end();) {
    Prune(it->second, now);
    if (it->second.empty()) {
      it = buckets_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t SlidingWindowLimiter::BucketCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return buckets_.size();
}

void SlidingWindowLimiter::StartCleanup(boost::asio::io_context& ioc, std::chrono::milliseconds interval) {
  std::lock_guard<std::mutex> lock(cleanup_mutex_);
  if (cleanup_task_) {
    return;
  }
  cleanup_task_ = std::make_shared<PeriodicTask>(ioc, interval, [this]() { Cleanup(); });
  cleanup_task_->Start();
}

void SlidingWindowLimiter::StopCleanup() {
  std::lock_guard<std::mutex> lock(cleanup_mutex_);
  if (!cleanup_task_) {
    return;
  }
  cleanup_task_->Stop();
  cleanup_task_.reset();
}

void SlidingWindowLimiter::Prune(std::deque<Clock::time_point>& bucket, Clock::time_point now) const {
  while (!bucket.empty() && now - bucket.front() >= window_) {
    bucket.pop_front();
  }
}

}  // namespace chatbox
