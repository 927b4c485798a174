/*
 * 설명: 배치 단계, 턴 소유권, 사격 결과 중계와 종료 전이를 처리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/game_session_test.cpp, server/tests/e2e/session_flow_test.cpp
 */
#include "salvo/game_session.hpp"

#include <sstream>

namespace salvo {

std::string_view ToString(SessionState state) {
  switch (state) {
    case SessionState::kSetup:
      return "setup";
    case SessionState::kGameplay:
      return "gameplay";
    case SessionState::kGameOver:
      return "game_over";
  }
  return "setup";
}

GameSession::GameSession(int id, std::shared_ptr<Player> first, std::shared_ptr<Player> second,
                         std::shared_ptr<Observability> observability)
    : id_(id), players_{std::move(first), std::move(second)}, observability_(std::move(observability)) {}

void GameSession::Start() {
  std::lock_guard<std::mutex> lock(mutex_);
  SendTo(1, SessionStartMessage{.session_id = id_, .player_num = 1, .opponent = players_[1]->name});
  SendTo(2, SessionStartMessage{.session_id = id_, .player_num = 2, .opponent = players_[0]->name});
}

bool GameSession::HandleMessage(std::uint64_t player_id, const Message& message, std::string& error_code,
                                std::string& error_message) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int slot = FindSlot(player_id);
  if (slot == 0) {
    error_code = "session_not_found";
    error_message = "세션 참가자가 아닙니다";
    return false;
  }

  if (const auto* chat = std::get_if<ChatMessage>(&message)) {
    HandleChat(slot, *chat);
    return true;
  }
  // 종료된 세션에 늦게 도착한 게임 메시지는 오류 없이 버린다.
  if (state_ == SessionState::kGameOver) {
    return true;
  }

  if (const auto* placement = std::get_if<ShipPlacementMessage>(&message)) {
    return HandleShipPlacement(slot, *placement, error_code, error_message);
  }
  if (const auto* setup = std::get_if<SetupCompleteMessage>(&message)) {
    return HandleSetupComplete(slot, *setup, error_code, error_message);
  }
  if (const auto* shot = std::get_if<ShotMessage>(&message)) {
    return HandleShot(slot, *shot, error_code, error_message);
  }
  if (const auto* result = std::get_if<ShotResultMessage>(&message)) {
    return HandleShotResult(slot, *result, error_code, error_message);
  }
  if (const auto* game_over = std::get_if<GameOverMessage>(&message)) {
    return HandleGameOver(slot, *game_over, error_code, error_message);
  }

  error_code = "unknown_message_type";
  error_message = "세션에서 처리하지 않는 메시지입니다: " + std::string(MessageType(message));
  return false;
}

bool GameSession::HandleShipPlacement(int slot, const ShipPlacementMessage& message, std::string& error_code,
                                      std::string& error_message) {
  if (state_ != SessionState::kSetup) {
    error_code = "invalid_state";
    error_message = "배치 단계가 아닙니다";
    return false;
  }
  if (message.player_num != slot) {
    error_code = "player_mismatch";
    error_message = "player_num이 연결된 슬롯과 다릅니다";
    return false;
  }
  SendTo(Opponent(slot), OpponentShipPlacementMessage{.ship = message.ship});
  return true;
}

bool GameSession::HandleSetupComplete(int slot, const SetupCompleteMessage& message, std::string& error_code,
                                      std::string& error_message) {
  if (message.player_num != slot) {
    error_code = "player_mismatch";
    error_message = "player_num이 연결된 슬롯과 다릅니다";
    return false;
  }
  setup_complete_[slot - 1] = true;
  Broadcast(SetupUpdateMessage{.player = slot, .ready = true});
  LogEvent(LogLevel::kDebug, "setup_complete", "player=" + std::to_string(slot));

  // 이미 GAMEPLAY라면 setup_update만 다시 알리고 gameplay_start는 한 번만 보낸다.
  if (state_ == SessionState::kSetup && setup_complete_[0] && setup_complete_[1]) {
    state_ = SessionState::kGameplay;
    current_turn_ = 1;
    Broadcast(GameplayStartMessage{.current_player = current_turn_});
    LogEvent(LogLevel::kInfo, "gameplay_start", "current_player=1");
  }
  return true;
}

bool GameSession::HandleShot(int slot, const ShotMessage& message, std::string& error_code,
                             std::string& error_message) {
  if (state_ != SessionState::kGameplay) {
    error_code = "invalid_state";
    error_message = "아직 게임이 시작되지 않았습니다";
    return false;
  }
  if (message.player_num != slot) {
    error_code = "player_mismatch";
    error_message = "player_num이 연결된 슬롯과 다릅니다";
    return false;
  }
  if (slot != current_turn_) {
    error_code = "out_of_turn";
    error_message = "상대의 차례입니다";
    return false;
  }
  if (pending_shot_) {
    error_code = "shot_pending";
    error_message = "이전 사격 결과를 기다리는 중입니다";
    return false;
  }
  pending_shot_ = PendingShot{slot, message.row, message.col};
  SendTo(Opponent(slot), ReceiveShotMessage{.row = message.row, .col = message.col, .player = slot});
  return true;
}

bool GameSession::HandleShotResult(int slot, const ShotResultMessage& message, std::string& error_code,
                                   std::string& error_message) {
  if (state_ != SessionState::kGameplay) {
    error_code = "invalid_state";
    error_message = "아직 게임이 시작되지 않았습니다";
    return false;
  }
  // 결과는 사격을 받은 쪽만 보고할 수 있으며 대기 중인 사격과 좌표가 일치해야 한다.
  if (!pending_shot_ || slot == pending_shot_->shooter || message.player != pending_shot_->shooter ||
      message.row != pending_shot_->row || message.col != pending_shot_->col) {
    error_code = "unexpected_shot_result";
    error_message = "대기 중인 사격과 일치하지 않는 결과입니다";
    return false;
  }
  pending_shot_.reset();
  Broadcast(message);

  if (message.result == ShotOutcome::kMiss) {
    current_turn_ = Opponent(current_turn_);
    Broadcast(TurnChangeMessage{.current_player = current_turn_});
  }
  return true;
}

bool GameSession::HandleGameOver(int slot, const GameOverMessage& message, std::string& error_code,
                                 std::string& error_message) {
  if (state_ != SessionState::kGameplay) {
    error_code = "invalid_state";
    error_message = "진행 중인 게임이 아닙니다";
    return false;
  }
  if (message.winner != 1 && message.winner != 2) {
    error_code = "malformed_message";
    error_message = "winner는 1 또는 2여야 합니다";
    return false;
  }
  state_ = SessionState::kGameOver;
  pending_shot_.reset();
  Broadcast(message);
  std::ostringstream oss;
  oss << "winner=" << message.winner << " reported_by=" << slot;
  LogEvent(LogLevel::kInfo, "game_over", oss.str());
  return true;
}

void GameSession::HandleChat(int slot, const ChatMessage& message) {
  Broadcast(ChatMessage{.player = players_[slot - 1]->name, .text = message.text});
}

bool GameSession::HandleDisconnect(std::uint64_t player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const int slot = FindSlot(player_id);
  if (slot == 0 || state_ == SessionState::kGameOver) {
    return false;
  }
  state_ = SessionState::kGameOver;
  pending_shot_.reset();
  SendTo(Opponent(slot), OpponentDisconnectedMessage{});
  LogEvent(LogLevel::kInfo, "opponent_disconnected", "left=" + players_[slot - 1]->name);
  return true;
}

bool GameSession::Shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_ == SessionState::kGameOver) {
    return false;
  }
  state_ = SessionState::kGameOver;
  pending_shot_.reset();
  return true;
}

SessionState GameSession::State() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

int GameSession::CurrentTurn() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_turn_;
}

bool GameSession::IsSetupComplete(int player_num) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (player_num != 1 && player_num != 2) {
    return false;
  }
  return setup_complete_[player_num - 1];
}

bool GameSession::IsOver() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_ == SessionState::kGameOver;
}

int GameSession::SlotOf(std::uint64_t player_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return FindSlot(player_id);
}

std::shared_ptr<Player> GameSession::PlayerAt(int player_num) const {
  if (player_num != 1 && player_num != 2) {
    return nullptr;
  }
  return players_[player_num - 1];
}

int GameSession::FindSlot(std::uint64_t player_id) const {
  for (int i = 0; i < 2; ++i) {
    if (players_[i] && players_[i]->id == player_id) {
      return i + 1;
    }
  }
  return 0;
}

void GameSession::SendTo(int slot, const Message& message) {
  const auto& player = players_[slot - 1];
  if (player && player->peer) {
    player->peer->Send(message);
  }
}

void GameSession::Broadcast(const Message& message) {
  SendTo(1, message);
  SendTo(2, message);
}

void GameSession::LogEvent(LogLevel level, const std::string& event, const std::string& detail) const {
  if (!observability_) {
    return;
  }
  observability_->Log(level, LogContext{.event = event, .session_id = id_, .detail = detail});
}

}  // namespace salvo
