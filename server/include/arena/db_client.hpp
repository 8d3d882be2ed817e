/*
 * 설명: MariaDB 연결과 재시도 정책을 캡슐화한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/result_repository_it_test.cpp
 */
#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>

#include <mariadb/mysql.h>

namespace arena {

struct DbConfig {
  std::string host;
  unsigned short port;
  std::string user;
  std::string password;
  std::string database;
};

class DbException : public std::runtime_error {
 public:
  DbException(const std::string& message, unsigned int code, bool retryable)
      : std::runtime_error(message), code(code), retryable(retryable) {}
  unsigned int code;
  bool retryable;
};

class MariaDbClient {
 public:
  explicit MariaDbClient(const DbConfig& config);

  // work 가 false 를 반환하면 롤백한다. 재시도 가능한 오류는 지수 백오프 후 다시 시도한다.
  bool ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const;
  void WithConnectionRetry(const std::function<void(MYSQL*)>& work) const;

  [[noreturn]] void RaiseError(MYSQL* conn, const std::string& ctx) const;
  std::string Escape(MYSQL* conn, const std::string& value) const;

  // 테스트에서 시도 번호별 일시 오류를 주입한다.
  void SetTransientInjector(const std::function<bool(std::size_t)>& injector);

 private:
  struct ConnectionCloser {
    void operator()(MYSQL* conn) const { mysql_close(conn); }
  };
  using ConnectionHandle = std::unique_ptr<MYSQL, ConnectionCloser>;

  ConnectionHandle Connect() const;
  bool IsRetryable(unsigned int code) const;
  void Backoff(std::size_t attempt) const;

  DbConfig config_;
  unsigned int connect_timeout_seconds_ = 2;
  unsigned int query_timeout_seconds_ = 2;
  std::function<bool(std::size_t)> transient_injector_;
};

}  // namespace arena
