/*
 * 설명: 레거시 파이프 프로토콜용 단일 2인 방의 배치 순서, 턴, 사격 판정, 퇴장 처리를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/legacy_room_test.cpp, server/tests/e2e/legacy_protocol_test.cpp
 */
#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

#include <boost/asio/ip/tcp.hpp>

#include "salvo/config.hpp"
#include "salvo/connection.hpp"
#include "salvo/legacy_protocol.hpp"
#include "salvo/observability.hpp"

namespace salvo {

class LegacyClient {
 public:
  virtual ~LegacyClient() = default;
  // 줄 끝 개행은 구현체가 붙인다.
  virtual void SendLine(const std::string& line) = 0;
  virtual void Close() = 0;
};

class LegacyRoom {
 public:
  enum class Phase { kWaiting, kPlacement, kBattle };
  using OutcomeFn = std::function<ShotOutcome(int row, int col)>;

  static constexpr int kBoardSize = 10;

  LegacyRoom(OutcomeFn outcome, std::shared_ptr<Observability> observability);

  // 30% 확률의 hit, 나머지는 miss를 돌려주는 기본 판정기.
  static OutcomeFn RandomOutcome();

  // 배정된 플레이어 번호(1 또는 2)를 돌려준다. 방이 가득 찼으면 ERROR|room_full을 보내고 닫은 뒤 0.
  int Join(std::shared_ptr<LegacyClient> client);
  // 처리 후에도 해당 번호가 자리에 남아 있으면 true. QUIT 이후에는 false.
  bool HandleLine(int player_id, std::string_view line);
  // 이미 떠난 번호에 대한 호출은 무시된다.
  void Leave(int player_id);

  Phase CurrentPhase() const;
  int CurrentTurn() const;
  int Occupants() const;

 private:
  void LeaveLocked(int player_id);
  void PromptPlacementLocked();
  void SendLocked(int player_id, const std::string& line);
  void BroadcastLocked(const std::string& line);
  std::shared_ptr<LegacyClient>& Seat(int player_id) { return seats_[static_cast<std::size_t>(player_id - 1)]; }

  OutcomeFn outcome_;
  std::shared_ptr<Observability> observability_;
  std::array<std::shared_ptr<LegacyClient>, 2> seats_;
  Phase phase_{Phase::kWaiting};
  int placing_{0};
  int turn_{1};
  mutable std::mutex mutex_;
};

// 레거시 포트의 소켓을 Connection으로 감싸 LegacyRoom에 연결한다.
class LegacyServer : public std::enable_shared_from_this<LegacyServer> {
 public:
  LegacyServer(const AppConfig& config, std::shared_ptr<Observability> observability,
               LegacyRoom::OutcomeFn outcome = LegacyRoom::RandomOutcome());

  void Accept(boost::asio::ip::tcp::socket socket);
  void Shutdown();

  LegacyRoom& Room() { return room_; }
  std::size_t ActiveConnections() const;

 private:
  ConnectionLimits limits_;
  std::shared_ptr<Observability> observability_;
  LegacyRoom room_;
  std::unordered_map<const Connection*, std::weak_ptr<Connection>> connections_;
  std::atomic<bool> stopping_{false};
  mutable std::mutex mutex_;
};

}  // namespace salvo
