/*
 * 설명: io_context 위에서 주기적으로 실행되는 백그라운드 작업을 관리한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Background tasks)
 * 테스트: server/tests/unit/rate_limiter_test.cpp, server/tests/unit/session_registry_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>

namespace chatbox {

class PeriodicTask : public std::enable_shared_from_this<PeriodicTask> {
 public:
  PeriodicTask(boost::asio::io_context& ioc, std::chrono::milliseconds interval, std::function<void()> task);

  void Start();
  // 반환 이후에는 작업이 다시 실행되지 않는다. 여러 번 호출해도 안전하다.
  void Stop();
  bool Running() const { return running_.load(); }

 private:
  void Schedule();
  void OnTick(const boost::system::error_code& ec);

  boost::asio::strand<boost::asio::io_context::executor_type> strand_;
  boost::asio::steady_timer timer_;
  std::chrono::milliseconds interval_;
  std::function<void()> task_;
  std::atomic<bool> running_{false};
  std::mutex run_mutex_;
};

}  // namespace chatbox
