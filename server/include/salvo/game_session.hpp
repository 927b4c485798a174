/*
 * 설명: 두 플레이어의 배치/턴 진행 상태 기계를 관리하고 도메인 메시지를 중계한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/game_session_test.cpp, server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

#include "salvo/message.hpp"
#include "salvo/observability.hpp"
#include "salvo/player.hpp"

namespace salvo {

enum class SessionState { kSetup, kGameplay, kGameOver };

std::string_view ToString(SessionState state);

// 슬롯 번호는 프로토콜과 동일하게 1, 2를 사용한다. 모든 공개 메서드는 세션 뮤텍스 아래에서 실행된다.
class GameSession {
 public:
  GameSession(int id, std::shared_ptr<Player> first, std::shared_ptr<Player> second,
              std::shared_ptr<Observability> observability);

  GameSession(const GameSession&) = delete;
  GameSession& operator=(const GameSession&) = delete;

  int Id() const { return id_; }

  void Start();
  // 거부된 메시지는 false와 함께 오류 코드를 돌려준다. 상태는 바뀌지 않는다.
  bool HandleMessage(std::uint64_t player_id, const Message& message, std::string& error_code,
                     std::string& error_message);
  // 남은 플레이어에게 opponent_disconnected를 보냈으면 true.
  bool HandleDisconnect(std::uint64_t player_id);
  bool Shutdown();

  SessionState State() const;
  int CurrentTurn() const;
  bool IsSetupComplete(int player_num) const;
  bool IsOver() const;
  int SlotOf(std::uint64_t player_id) const;
  std::shared_ptr<Player> PlayerAt(int player_num) const;

 private:
  struct PendingShot {
    int shooter;
    int row;
    int col;
  };

  bool HandleShipPlacement(int slot, const ShipPlacementMessage& message, std::string& error_code,
                           std::string& error_message);
  bool HandleSetupComplete(int slot, const SetupCompleteMessage& message, std::string& error_code,
                           std::string& error_message);
  bool HandleShot(int slot, const ShotMessage& message, std::string& error_code, std::string& error_message);
  bool HandleShotResult(int slot, const ShotResultMessage& message, std::string& error_code,
                        std::string& error_message);
  bool HandleGameOver(int slot, const GameOverMessage& message, std::string& error_code, std::string& error_message);
  void HandleChat(int slot, const ChatMessage& message);

  int FindSlot(std::uint64_t player_id) const;
  void SendTo(int slot, const Message& message);
  void Broadcast(const Message& message);
  void LogEvent(LogLevel level, const std::string& event, const std::string& detail) const;

  static int Opponent(int slot) { return slot == 1 ? 2 : 1; }

  const int id_;
  std::array<std::shared_ptr<Player>, 2> players_;
  std::shared_ptr<Observability> observability_;
  SessionState state_{SessionState::kSetup};
  std::array<bool, 2> setup_complete_{false, false};
  int current_turn_{1};
  std::optional<PendingShot> pending_shot_;
  mutable std::mutex mutex_;
};

}  // namespace salvo
