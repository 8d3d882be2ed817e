/*
 * 설명: 서버 전체 수명주기(리스너, 워커 스레드, 결과 저장소, 코어)를 관리한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include "arena/arena_core.hpp"
#include "arena/auth.hpp"
#include "arena/config.hpp"
#include "arena/observability.hpp"
#include "arena/result_service.hpp"
#include "arena/result_sink.hpp"

namespace arena {

class Listener;

GameSessionConfig MakeGameSessionConfig(const AppConfig& config);

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config);
  ~ServerApp();

  ServerApp(const ServerApp&) = delete;
  ServerApp& operator=(const ServerApp&) = delete;

  // 리스너와 워커를 띄우고 바로 반환한다. 포트 0 이면 임의 포트에 바인드한다.
  unsigned short Start();
  // Start 후 SIGINT/SIGTERM 까지 블록한다.
  void Run();
  void Stop();

  unsigned short BoundPort() const { return bound_port_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<ArenaCore> GetCore() const { return core_; }
  std::shared_ptr<HmacTokenVerifier> GetVerifier() const { return verifier_; }
  std::shared_ptr<Observability> GetObservability() const { return observability_; }

 private:
  void StartWorkers();
  void JoinWorkers();

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<ResultService> result_service_;
  std::shared_ptr<ResultSink> result_sink_;
  std::shared_ptr<HmacTokenVerifier> verifier_;
  std::shared_ptr<ArenaCore> core_;
  std::shared_ptr<Listener> listener_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  unsigned short bound_port_{0};
};

}  // namespace arena
