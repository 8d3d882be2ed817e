/*
 * 설명: MariaDB 연결, 트랜잭션, 재시도 로직을 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/it/result_repository_it_test.cpp
 */
#include "arena/db_client.hpp"

#include <chrono>
#include <random>
#include <thread>

#include <mariadb/errmsg.h>

namespace arena {
namespace {
constexpr std::size_t kMaxAttempts = 3;
constexpr unsigned int kDeadlock = 1213;
constexpr unsigned int kLockWaitTimeout = 1205;
}  // namespace

MariaDbClient::MariaDbClient(const DbConfig& config) : config_(config) {}

MariaDbClient::ConnectionHandle MariaDbClient::Connect() const {
  ConnectionHandle conn(mysql_init(nullptr));
  if (!conn) {
    throw DbException("MariaDB 초기화 실패", 0, true);
  }
  mysql_options(conn.get(), MYSQL_OPT_CONNECT_TIMEOUT, &connect_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_OPT_READ_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_OPT_WRITE_TIMEOUT, &query_timeout_seconds_);
  mysql_options(conn.get(), MYSQL_SET_CHARSET_NAME, "utf8mb4");
  if (!mysql_real_connect(conn.get(), config_.host.c_str(), config_.user.c_str(), config_.password.c_str(),
                          config_.database.c_str(), config_.port, nullptr, 0)) {
    RaiseError(conn.get(), "연결 실패");
  }
  if (mysql_query(conn.get(), "SET SESSION innodb_lock_wait_timeout=2;") != 0) {
    RaiseError(conn.get(), "락 대기 타임아웃 설정 실패");
  }
  return conn;
}

bool MariaDbClient::ExecuteTransactionWithRetry(const std::function<bool(MYSQL*)>& work) const {
  for (std::size_t attempt = 1;; ++attempt) {
    ConnectionHandle conn;
    try {
      conn = Connect();
      mysql_autocommit(conn.get(), 0);
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      bool commit = work(conn.get());
      if (!commit) {
        mysql_rollback(conn.get());
        return false;
      }
      if (mysql_commit(conn.get()) != 0) {
        RaiseError(conn.get(), "커밋 실패");
      }
      return true;
    } catch (const DbException& ex) {
      if (conn) {
        mysql_rollback(conn.get());
      }
      if (!ex.retryable || attempt >= kMaxAttempts) {
        throw;
      }
    }
    // 연결은 백오프 전에 닫는다.
    conn.reset();
    Backoff(attempt);
  }
}

void MariaDbClient::WithConnectionRetry(const std::function<void(MYSQL*)>& work) const {
  for (std::size_t attempt = 1;; ++attempt) {
    try {
      auto conn = Connect();
      if (transient_injector_ && transient_injector_(attempt)) {
        throw DbException("주입된 일시 오류", kDeadlock, true);
      }
      work(conn.get());
      return;
    } catch (const DbException& ex) {
      if (!ex.retryable || attempt >= kMaxAttempts) {
        throw;
      }
    }
    Backoff(attempt);
  }
}

std::string MariaDbClient::Escape(MYSQL* conn, const std::string& value) const {
  std::string escaped;
  escaped.resize(value.size() * 2 + 1);
  auto len = mysql_real_escape_string(conn, escaped.data(), value.c_str(), value.size());
  escaped.resize(len);
  return escaped;
}

void MariaDbClient::RaiseError(MYSQL* conn, const std::string& ctx) const {
  unsigned int code = mysql_errno(conn);
  std::string message = ctx + ": " + mysql_error(conn);
  throw DbException(message, code, IsRetryable(code));
}

bool MariaDbClient::IsRetryable(unsigned int code) const {
  return code == kDeadlock || code == kLockWaitTimeout || code == CR_SERVER_LOST || code == CR_SERVER_GONE_ERROR ||
         code == CR_CONN_HOST_ERROR || code == CR_SERVER_LOST_EXTENDED;
}

void MariaDbClient::Backoff(std::size_t attempt) const {
  std::size_t base_ms = 50 * (std::size_t{1} << (attempt - 1));
  thread_local std::mt19937 gen(std::random_device{}());
  std::uniform_int_distribution<int> dist(0, 25);
  std::this_thread::sleep_for(std::chrono::milliseconds(base_ms + static_cast<std::size_t>(dist(gen))));
}

void MariaDbClient::SetTransientInjector(const std::function<bool(std::size_t)>& injector) {
  transient_injector_ = injector;
}

}  // namespace arena
