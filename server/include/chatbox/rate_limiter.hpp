/*
 * 설명: 키별 슬라이딩 윈도우 레이트리미터를 제공한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Rate Limiter)
 * 테스트: server/tests/unit/rate_limiter_test.cpp
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/io_context.hpp>

#include "chatbox/periodic_task.hpp"

namespace chatbox {

class SlidingWindowLimiter {
 public:
  using Clock = std::chrono::steady_clock;

  SlidingWindowLimiter(std::size_t limit, std::chrono::milliseconds window);
  ~SlidingWindowLimiter();

  SlidingWindowLimiter(const SlidingWindowLimiter&) = delete;
  SlidingWindowLimiter& operator=(const SlidingWindowLimiter&) = delete;

  bool Allow(const std::string& key);
  // 거부된 호출은 버킷에 기록하지 않는다.
  bool Allow(const std::string& key, Clock::time_point now);

  // 다음 요청이 허용될 때까지 남은 초(올림, 최소 1). 지금 허용 가능한 키는 0을 반환한다.
  std::chrono::seconds RetryAfter(const std::string& key);
  std::chrono::seconds RetryAfter(const std::string& key, Clock::time_point now);

  void Reset(const std::string& key);

  std::size_t Cleanup();
  std::size_t Cleanup(Clock::time_point now);
  std::size_t BucketCount() const;

  void StartCleanup(boost::asio::io_context& ioc, std::chrono::milliseconds interval);
  void StopCleanup();

  std::size_t Limit() const { return limit_; }
  std::chrono::milliseconds Window() const { return window_; }

 private:
  void Prune(std::deque<Clock::time_point>& bucket, Clock::time_point now) const;

  std::size_t limit_;
  std::chrono::milliseconds window_;
  std::unordered_map<std::string, std::deque<Clock::time_point>> buckets_;
  mutable std::mutex mutex_;
  std::shared_ptr<PeriodicTask> cleanup_task_;
  std::mutex cleanup_mutex_;
};

}  // namespace chatbox
