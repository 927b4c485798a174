/*
 * 설명: 게임/레거시/운영 리스너와 워커 스레드, 종료 신호 처리를 포함한 서버 전체 수명주기를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/session_flow_test.cpp, server/tests/e2e/connection_limits_test.cpp,
 *         server/tests/e2e/legacy_protocol_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <thread>
#include <vector>

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>

#include "salvo/config.hpp"
#include "salvo/game_server.hpp"
#include "salvo/legacy_room.hpp"
#include "salvo/observability.hpp"

namespace salvo {

class Listener;

class ServerApp {
 public:
  explicit ServerApp(const AppConfig& config, LegacyRoom::OutcomeFn legacy_outcome = LegacyRoom::RandomOutcome());
  ~ServerApp();

  // 모든 io 스레드가 끝날 때까지 블록한다. 리스너를 열지 못하면 false.
  bool Run();
  // 여러 번, 어느 스레드에서 호출해도 안전하다.
  void Stop();

  boost::asio::io_context& GetContext() { return ioc_; }
  const AppConfig& GetConfig() const { return config_; }
  std::shared_ptr<GameServer> GetGameServer() { return game_server_; }
  std::shared_ptr<LegacyServer> GetLegacyServer() { return legacy_server_; }
  std::shared_ptr<Observability> GetObservability() { return observability_; }

 private:
  static constexpr std::chrono::milliseconds kShutdownDrainTimeout{1000};

  void RunWorkers();
  void ShutdownServices();
  // 열린 연결이 모두 닫히거나 기한이 지나면 io 루프를 멈춘다.
  void StopWhenDrained(std::chrono::steady_clock::time_point deadline);
  std::size_t OpenConnections() const;

  AppConfig config_;
  boost::asio::io_context ioc_;
  boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
  boost::asio::signal_set signals_;
  boost::asio::steady_timer drain_timer_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<GameServer> game_server_;
  std::shared_ptr<LegacyServer> legacy_server_;
  std::vector<std::shared_ptr<Listener>> listeners_;
  std::vector<std::thread> workers_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};
};

}  // namespace salvo
