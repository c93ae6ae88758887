/*
 * 설명: steady_timer 기반 주기 작업의 시작/중지를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Background tasks)
 * 테스트: server/tests/unit/rate_limiter_test.cpp, server/tests/unit/session_registry_test.cpp
 */
#include "chatbox/periodic_task.hpp"

#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>

namespace chatbox {

PeriodicTask::PeriodicTask(boost::asio::io_context& ioc, std::chrono::milliseconds interval, std::function<void()> task)
    : strand_(boost::asio::make_strand(ioc)), timer_(strand_), interval_(interval), task_(std::move(task)) {}

void PeriodicTask::Start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) {
    return;
  }
  boost::asio::post(strand_, [self = shared_from_this()]() { self->Schedule(); });
}

void PeriodicTask::Stop() {
  {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (!running_.exchange(false)) {
      return;
    }
  }
  boost::asio::post(strand_, [self = shared_from_this()]() { self->timer_.cancel(); });
}

void PeriodicTask::Schedule() {
  if (!running_) {
    return;
  }
  timer_.expires_after(interval_);
  auto self = shared_from_this();
  timer_.async_wait(
      boost::asio::bind_executor(strand_, [self](const boost::system::error_code& ec) { self->OnTick(ec); }));
}

void PeriodicTask::OnTick(const boost::system::error_code& ec) {
  if (ec) {
    return;
  }
  {
    std::lock_guard<std::mutex> lock(run_mutex_);
    if (!running_) {
      return;
    }
    task_();
  }
  Schedule();
}

}  // namespace chatbox
