/*
 * 설명: 게임 포트의 연결마다 핸드셰이크, 매칭, 세션 메시지 분배와 연결 종료 정리를 조율한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/session_flow_test.cpp, server/tests/e2e/connection_limits_test.cpp
 */
#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include <boost/asio/ip/tcp.hpp>

#include "salvo/config.hpp"
#include "salvo/connection.hpp"
#include "salvo/match_queue.hpp"
#include "salvo/observability.hpp"
#include "salvo/player_registry.hpp"
#include "salvo/session_manager.hpp"

namespace salvo {

ConnectionLimits LimitsFromConfig(const AppConfig& config);

class GameServer : public std::enable_shared_from_this<GameServer> {
 public:
  GameServer(const AppConfig& config, std::shared_ptr<Observability> observability);

  void Accept(boost::asio::ip::tcp::socket socket);
  // 모든 세션을 GAME_OVER로 만들고 대기열을 비운 뒤 모든 연결을 닫는다.
  void Shutdown();

  std::shared_ptr<PlayerRegistry> GetPlayerRegistry() { return player_registry_; }
  std::shared_ptr<MatchQueueService> GetMatchQueue() { return match_queue_; }
  std::shared_ptr<SessionManager> GetSessionManager() { return session_manager_; }
  std::size_t ActiveConnections() const;

 private:
  struct ClientContext {
    std::weak_ptr<Connection> connection;
    std::shared_ptr<Peer> peer;
    std::shared_ptr<Player> player;
    std::string remote_address;
    bool rejected{false};
  };

  void OnFrame(const std::shared_ptr<ClientContext>& ctx, const std::string& frame);
  void HandleHandshake(const std::shared_ptr<ClientContext>& ctx, const std::string& frame);
  void HandlePlayerMessage(const std::shared_ptr<ClientContext>& ctx, const Message& message);
  void OnClosed(const Connection* connection, const std::shared_ptr<ClientContext>& ctx, const std::string& reason);
  void SendError(const std::shared_ptr<ClientContext>& ctx, const std::string& code, const std::string& message);
  void Reject(const std::shared_ptr<ClientContext>& ctx, const std::string& code, const std::string& message);

  ConnectionLimits limits_;
  std::shared_ptr<Observability> observability_;
  std::shared_ptr<SessionManager> session_manager_;
  std::shared_ptr<MatchQueueService> match_queue_;
  std::shared_ptr<PlayerRegistry> player_registry_;
  std::unordered_map<const Connection*, std::weak_ptr<Connection>> connections_;
  std::atomic<bool> stopping_{false};
  mutable std::mutex mutex_;
};

}  // namespace salvo
