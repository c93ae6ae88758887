/*
 * 설명: MariaDB 연결과 호출별 기한, 일시 오류 재시도 정책을 캡슐화한다.
 * 버전: v1.0.0
 * 관련 문서: DESIGN.md (Storage)
 * 테스트: server/tests/it/chat_store_it_test.cpp
 */
#pragma once

#include <chrono>
#include <functional>
#include <string>

#include <mariadb/mysql.h>

#include "chatbox/chat_store.hpp"

namespace chatbox {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public StorageError {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : StorageError(message, retryable), code(code) {}
  unsigned int code;
};

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  // deadline은 연결/읽기/쓰기 타임아웃과 재시도 총 시간의 상한으로 쓰인다.
  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work, std::chrono::milliseconds deadline) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work, std::chrono::milliseconds deadline) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;

  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

  std::string Escape(MYSQL* conn, const std::string& value) const;

 private:
  MYSQL* Connect(std::chrono::milliseconds remaining) const;
  bool IsRetryable(unsigned int code) const;
  bool Backoff(std::size_t attempt, std::chrono::steady_clock::time_point until) const;

  DbConfig config_;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace chatbox
