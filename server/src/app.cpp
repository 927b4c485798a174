/*
 * 설명: 서버 수명주기, 리스너, 환경설정 로딩을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/session_flow_test.cpp,
 *         server/tests/e2e/metrics_ops_test.cpp
 */
#include "salvo/app.hpp"

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <functional>
#include <limits>
#include <optional>
#include <stdexcept>

#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core.hpp>

#include "salvo/ops_http_session.hpp"

namespace salvo {

class Listener : public std::enable_shared_from_this<Listener> {
 public:
  using AcceptHandler = std::function<void(boost::asio::ip::tcp::socket)>;

  Listener(boost::asio::io_context& ioc, const boost::asio::ip::tcp::endpoint& endpoint, AcceptHandler on_accept)
      : ioc_(ioc), acceptor_(boost::asio::make_strand(ioc)), on_accept_(std::move(on_accept)) {
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

 private:
  void DoAccept() {
    // 각 연결은 자기 strand를 가진다.
    acceptor_.async_accept(
        boost::asio::make_strand(ioc_),
        [self = shared_from_this()](boost::beast::error_code ec, boost::asio::ip::tcp::socket socket) {
          if (!ec) {
            self->on_accept_(std::move(socket));
          }
          if (self->acceptor_.is_open()) {
            self->DoAccept();
          }
        });
  }

  boost::asio::io_context& ioc_;
  boost::asio::ip::tcp::acceptor acceptor_;
  AcceptHandler on_accept_;
};

ServerApp::ServerApp(const AppConfig& config, LegacyRoom::OutcomeFn legacy_outcome)
    : config_(config),
      work_guard_(boost::asio::make_work_guard(ioc_)),
      signals_(ioc_, SIGINT, SIGTERM),
      drain_timer_(ioc_) {
  observability_ = std::make_shared<Observability>(ParseLogLevel(config.log_level).value_or(LogLevel::kInfo));
  game_server_ = std::make_shared<GameServer>(config_, observability_);
  if (config_.legacy_port != 0) {
    legacy_server_ = std::make_shared<LegacyServer>(config_, observability_, std::move(legacy_outcome));
  }
}

ServerApp::~ServerApp() {
  Stop();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
}

bool ServerApp::Run() {
  if (stopped_) {
    return false;
  }
  try {
    auto open = [this](unsigned short port, Listener::AcceptHandler handler) {
      boost::asio::ip::tcp::endpoint endpoint{boost::asio::ip::tcp::v4(), port};
      auto listener = std::make_shared<Listener>(ioc_, endpoint, std::move(handler));
      listener->Run();
      listeners_.push_back(listener);
    };

    auto game_server = game_server_;
    open(config_.port, [game_server](boost::asio::ip::tcp::socket socket) { game_server->Accept(std::move(socket)); });

    if (legacy_server_) {
      auto legacy_server = legacy_server_;
      open(config_.legacy_port,
           [legacy_server](boost::asio::ip::tcp::socket socket) { legacy_server->Accept(std::move(socket)); });
    }

    if (config_.ops_port != 0) {
      auto config = config_;
      auto legacy_server = legacy_server_;
      auto observability = observability_;
      open(config_.ops_port, [config, game_server, legacy_server, observability](boost::asio::ip::tcp::socket socket) {
        std::make_shared<OpsHttpSession>(std::move(socket), config, game_server, legacy_server, observability)->Run();
      });
    }
  } catch (const std::exception& ex) {
    observability_->Log(LogLevel::kError, LogContext{.event = "listen_failed", .detail = ex.what()});
    ShutdownServices();
    return false;
  }

  signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
    if (ec) {
      return;
    }
    observability_->Log(LogLevel::kInfo, LogContext{.event = "signal_received", .detail = std::to_string(signal_number)});
    Stop();
  });

  running_ = true;
  observability_->Log(LogLevel::kInfo,
                      LogContext{.event = "server_started",
                                 .detail = "game=" + std::to_string(config_.port) +
                                           " legacy=" + std::to_string(config_.legacy_port) +
                                           " ops=" + std::to_string(config_.ops_port)});
  // Run 이전에 Stop이 호출된 경우 io 루프를 돌리지 않는다.
  if (stopped_) {
    ShutdownServices();
    return true;
  }
  RunWorkers();
  ioc_.run();
  for (auto& worker : workers_) {
    if (worker.joinable()) {
      worker.join();
    }
  }
  observability_->Log(LogLevel::kInfo, LogContext{.event = "server_stopped"});
  return true;
}

void ServerApp::RunWorkers() {
  std::size_t thread_count = config_.worker_threads;
  if (thread_count == 0) {
    thread_count = std::max(1u, std::thread::hardware_concurrency());
  }
  // 현재 스레드도 run()을 호출하므로 워커는 thread_count - 1개만 생성한다.
  for (std::size_t i = 0; i + 1 < thread_count; ++i) {
    workers_.emplace_back([this]() { ioc_.run(); });
  }
}

void ServerApp::ShutdownServices() {
  for (const auto& listener : listeners_) {
    listener->Stop();
  }
  game_server_->Shutdown();
  if (legacy_server_) {
    legacy_server_->Shutdown();
  }
}

std::size_t ServerApp::OpenConnections() const {
  return game_server_->ActiveConnections() + (legacy_server_ ? legacy_server_->ActiveConnections() : 0);
}

void ServerApp::Stop() {
  if (stopped_.exchange(true)) {
    return;
  }
  if (!running_) {
    return;
  }
  boost::system::error_code ignored;
  signals_.cancel(ignored);

  if (ioc_.get_executor().running_in_this_thread()) {
    // io 스레드에서는 블록할 수 없으므로 타이머로 연결 종료를 기다린다.
    ShutdownServices();
    work_guard_.reset();
    StopWhenDrained(std::chrono::steady_clock::now() + kShutdownDrainTimeout);
    return;
  }

  boost::asio::post(ioc_, [this]() { ShutdownServices(); });
  // 연결 종료 콜백이 돌 시간을 준다.
  auto deadline = std::chrono::steady_clock::now() + kShutdownDrainTimeout;
  while (OpenConnections() > 0 && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  work_guard_.reset();
  ioc_.stop();
}

void ServerApp::StopWhenDrained(std::chrono::steady_clock::time_point deadline) {
  if (OpenConnections() == 0 || std::chrono::steady_clock::now() >= deadline) {
    ioc_.stop();
    return;
  }
  drain_timer_.expires_after(std::chrono::milliseconds(10));
  drain_timer_.async_wait([this, deadline](const boost::system::error_code& ec) {
    if (ec) {
      ioc_.stop();
      return;
    }
    StopWhenDrained(deadline);
  });
}

namespace {

class EnvReader {
 public:
  explicit EnvReader(Observability& log) : log_(log) {}

  std::string String(const char* key, const std::string& def) const {
    const char* val = std::getenv(key);
    return val ? std::string{val} : def;
  }

  unsigned short Port(const char* key, unsigned short def) const {
    auto value = Unsigned(key, def);
    if (value > std::numeric_limits<unsigned short>::max()) {
      Fallback(key, std::to_string(value), std::to_string(def));
      return def;
    }
    return static_cast<unsigned short>(value);
  }

  std::size_t Size(const char* key, std::size_t def) const { return static_cast<std::size_t>(Unsigned(key, def)); }

 private:
  unsigned long long Unsigned(const char* key, unsigned long long def) const {
    const char* val = std::getenv(key);
    if (!val) {
      return def;
    }
    std::string text{val};
    try {
      std::size_t idx = 0;
      if (text.empty() || text.front() == '-') {
        throw std::invalid_argument("negative");
      }
      auto parsed = std::stoull(text, &idx);
      if (idx != text.size()) {
        throw std::invalid_argument("trailing");
      }
      return parsed;
    } catch (const std::exception&) {
      Fallback(key, text, std::to_string(def));
      return def;
    }
  }

  void Fallback(const char* key, const std::string& raw, const std::string& def) const {
    log_.Log(LogLevel::kWarn,
             LogContext{.event = "config_fallback", .detail = std::string(key) + "=" + raw + " -> " + def});
  }

  Observability& log_;
};

}  // namespace

AppConfig LoadConfigFromEnv() {
  Observability log(LogLevel::kWarn);
  EnvReader env(log);
  AppConfig defaults;

  AppConfig cfg;
  cfg.port = env.Port("SERVER_PORT", defaults.port);
  cfg.legacy_port = env.Port("LEGACY_PORT", defaults.legacy_port);
  cfg.ops_port = env.Port("OPS_PORT", defaults.ops_port);
  cfg.ops_token = env.String("OPS_TOKEN", defaults.ops_token);
  cfg.log_level = env.String("LOG_LEVEL", defaults.log_level);
  if (!ParseLogLevel(cfg.log_level)) {
    log.Log(LogLevel::kWarn, LogContext{.event = "config_fallback",
                                        .detail = "LOG_LEVEL=" + cfg.log_level + " -> " + defaults.log_level});
    cfg.log_level = defaults.log_level;
  }
  cfg.send_queue_limit_messages = env.Size("SEND_QUEUE_LIMIT_MESSAGES", defaults.send_queue_limit_messages);
  cfg.send_queue_limit_bytes = env.Size("SEND_QUEUE_LIMIT_BYTES", defaults.send_queue_limit_bytes);
  cfg.max_frame_bytes = env.Size("MAX_FRAME_BYTES", defaults.max_frame_bytes);
  cfg.heartbeat_interval_ms = env.Size("HEARTBEAT_INTERVAL_MS", defaults.heartbeat_interval_ms);
  cfg.heartbeat_timeout_ms = env.Size("HEARTBEAT_TIMEOUT_MS", defaults.heartbeat_timeout_ms);
  cfg.worker_threads = env.Size("WORKER_THREADS", defaults.worker_threads);
  return cfg;
}

}  // namespace salvo
