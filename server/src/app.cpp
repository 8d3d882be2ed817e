/*
 * 설명: 서버 수명주기, 리스너, 워커 스레드, 환경설정 로딩을 구현한다.
 * 버전: v2.0.0
 * 관련 문서: DESIGN.md
 * 테스트: server/tests/e2e/session_flow_test.cpp
 */
#include "arena/app.hpp"

#include <algorithm>
#include <chrono>
#include <cstdlib>
#include <stdexcept>

#include <boost/asio/signal_set.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "arena/db_client.hpp"
#include "arena/http_session.hpp"
#include "arena/result_repository.hpp"

namespace arena {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, const AppConfig& config,
           std::shared_ptr<const CredentialVerifier> verifier, std::shared_ptr<ArenaCore> core,
           std::shared_ptr<Observability> observability)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), config_(config), verifier_(std::move(verifier)),
        core_(std::move(core)), observability_(std::move(observability)) {
    boost::beast::error_code ec;

    acceptor_.open(endpoint.protocol(), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.bind(endpoint, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }

    acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
    if (ec) {
      throw boost::beast::system_error{ec};
    }
  }

  void Run() { DoAccept(); }

  void Stop() {
    boost::asio::post(acceptor_.get_executor(), [self = shared_from_this()]() {
      boost::beast::error_code ec;
      self->acceptor_.close(ec);
    });
  }

  unsigned short Port() const {
    boost::beast::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    return ec ? 0 : endpoint.port();
  }

 private:
  void DoAccept() {
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            std::make_shared<HttpSession>(std::move(socket), self->config_, self->verifier_, self->core_,
                                          self->observability_)
                ->Run();
          } else if (ec != boost::asio::error::operation_aborted) {
            self->observability_->Log(
                LogContext{.name = "http.accept_failed", .level = LogLevel::kWarn, .message = ec.message()});
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AppConfig config_;
  std::shared_ptr<const CredentialVerifier> verifier_;
  std::shared_ptr<ArenaCore> core_;
  std::shared_ptr<Observability> observability_;
};

GameSessionConfig MakeGameSessionConfig(const AppConfig& config) {
  GameSessionConfig game_config;
  game_config.tick_rate = config.game_tick_rate;
  game_config.win_score = config.game_win_score;
  game_config.countdown_seconds = config.game_countdown_seconds;
  game_config.reconnect_grace = std::chrono::seconds(config.game_reconnect_grace_seconds);
  game_config.seed = config.game_random_seed;
  return game_config;
}

ServerApp::ServerApp(const AppConfig& config)
    : config_(config), work_guard_(boost::asio::make_work_guard(ioc_)) {
  ValidateConfig(config);
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level));
  if (!config.db_host.empty()) {
    DbConfig db_config{config.db_host, config.db_port, config.db_user, config.db_password, config.db_name};
    auto db_client = std::make_shared<MariaDbClient>(db_config);
    auto repository = std::make_shared<ResultRepository>(db_client);
    result_service_ = std::make_shared<ResultService>(db_client, repository, observability_);
    result_sink_ = result_service_;
  } else {
    result_sink_ = std::make_shared<LoggingResultSink>(observability_);
  }
  verifier_ = std::make_shared<HmacTokenVerifier>(config.auth_token_secret);
  core_ = std::make_shared<ArenaCore>(ioc_, MakeGameSessionConfig(config), result_sink_, observability_);
}

ServerApp::~ServerApp() { Stop(); }

unsigned short ServerApp::Start() {
  if (running_.exchange(true)) {
    return bound_port_;
  }
  if (result_service_) {
    try {
      result_service_->GetRepository()->EnsureSchema();
    } catch (const DbException& ex) {
      observability_->Log(LogContext{.name = "db.schema_failed", .level = LogLevel::kError, .message = ex.what()});
    }
  }
  boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), config_.port};
  listener_ = std::make_shared<Listener>(ioc_, endpoint, config_, verifier_, core_, observability_);
  bound_port_ = listener_->Port();
  listener_->Run();
  StartWorkers();
  observability_->Log(LogContext{.name = "server.started", .message = "port " + std::to_string(bound_port_)});
  return bound_port_;
}

void ServerApp::Run() {
  boost::asio::signal_set signals(ioc_, SIGINT, SIGTERM);
  signals.async_wait([this](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    observability_->Log(
        LogContext{.name = "server.signal", .message = "signal " + std::to_string(signal_number)});
    core_->Shutdown();
    if (listener_) {
      listener_->Stop();
    }
    ioc_.stop();
  });
  try {
    Start();
  } catch (const boost::beast::system_error& ex) {
    observability_->Log(LogContext{.name = "server.start_failed", .level = LogLevel::kError, .message = ex.what()});
    signals.cancel();
    running_ = false;
    throw;
  }
  JoinWorkers();
  Stop();
}

void ServerApp::StartWorkers() {
  unsigned int thread_count = config_.worker_threads;
  if (thread_count == 0) {
    thread_count = std::max(1u, std::thread::hardware_concurrency());
  }
  for (unsigned int i = 0; i < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::JoinWorkers() {
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  workers_.clear();
}

void ServerApp::Stop() {
  if (!running_.exchange(false)) {
    return;
  }
  core_->Shutdown();
  if (listener_) {
    listener_->Stop();
  }
  work_guard_.reset();
  ioc_.stop();
  JoinWorkers();
  if (result_service_) {
    result_service_->Shutdown();
  }
  observability_->Log(LogContext{.name = "server.stopped"});
}

AppConfig LoadConfigFromEnv() {
  auto get_env = [](const char* key, const char* def) -> std::string {
    const char* val = std::getenv(key);
    return val ? std::string{val} : std::string{def};
  };

  AppConfig cfg;
  cfg.port = static_cast<unsigned short>(std::stoi(get_env("SERVER_PORT", "8080")));
  cfg.log_level = get_env("LOG_LEVEL", "info");
  cfg.auth_token_secret = get_env("AUTH_TOKEN_SECRET", "arena-dev-secret");
  cfg.ws_queue_limit_messages = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_MESSAGES", "256")));
  cfg.ws_queue_limit_bytes = static_cast<std::size_t>(std::stoul(get_env("WS_QUEUE_LIMIT_BYTES", "1048576")));
  cfg.game_tick_rate = std::stoi(get_env("GAME_TICK_RATE", "60"));
  cfg.game_win_score = std::stoi(get_env("GAME_WIN_SCORE", "11"));
  cfg.game_countdown_seconds = std::stoi(get_env("GAME_COUNTDOWN_SECONDS", "3"));
  cfg.game_reconnect_grace_seconds =
      static_cast<std::size_t>(std::stoul(get_env("GAME_RECONNECT_GRACE_SECONDS", "30")));
  cfg.game_random_seed = static_cast<std::uint32_t>(std::stoul(get_env("GAME_RANDOM_SEED", "0")));
  cfg.db_host = get_env("DB_HOST", "");
  cfg.db_port = static_cast<unsigned short>(std::stoi(get_env("DB_PORT", "3306")));
  cfg.db_user = get_env("DB_USER", "arena");
  cfg.db_password = get_env("DB_PASSWORD", "arena_pass");
  cfg.db_name = get_env("DB_NAME", "arena");
  cfg.worker_threads = static_cast<unsigned int>(std::stoul(get_env("WORKER_THREADS", "0")));
  ValidateConfig(cfg);
  return cfg;
}

void ValidateConfig(const AppConfig& config) {
  if (config.ws_queue_limit_messages == 0 || config.ws_queue_limit_bytes == 0) {
    throw std::invalid_argument("WS 송신 큐 한도는 0 보다 커야 합니다");
  }
  ValidateGameSessionConfig(MakeGameSessionConfig(config));
}

}  // namespace arena
