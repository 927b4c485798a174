/*
 * 설명: 메시지 타입 이름과 사격 결과 문자열 변환을 제공한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/line_codec_test.cpp
 */
#include "salvo/message.hpp"

#include <type_traits>

namespace salvo {

std::string_view ToString(ShotOutcome outcome) {
  switch (outcome) {
    case ShotOutcome::kHit:
      return "hit";
    case ShotOutcome::kMiss:
      return "miss";
    case ShotOutcome::kSunk:
      return "sunk";
  }
  return "miss";
}

std::optional<ShotOutcome> ParseShotOutcome(std::string_view text) {
  if (text == "hit") {
    return ShotOutcome::kHit;
  }
  if (text == "miss") {
    return ShotOutcome::kMiss;
  }
  if (text == "sunk") {
    return ShotOutcome::kSunk;
  }
  return std::nullopt;
}

std::string_view MessageType(const Message& message) {
  return std::visit(
      [](const auto& msg) -> std::string_view {
        using T = std::decay_t<decltype(msg)>;
        if constexpr (std::is_same_v<T, NameMessage>) {
          return "name";
        } else if constexpr (std::is_same_v<T, SessionStartMessage>) {
          return "session_start";
        } else if constexpr (std::is_same_v<T, WaitingForOpponentMessage>) {
          return "waiting_for_opponent";
        } else if constexpr (std::is_same_v<T, ErrorMessage>) {
          return "error";
        } else if constexpr (std::is_same_v<T, SetupCompleteMessage>) {
          return "setup_complete";
        } else if constexpr (std::is_same_v<T, SetupUpdateMessage>) {
          return "setup_update";
        } else if constexpr (std::is_same_v<T, GameplayStartMessage>) {
          return "gameplay_start";
        } else if constexpr (std::is_same_v<T, ShipPlacementMessage>) {
          return "ship_placement";
        } else if constexpr (std::is_same_v<T, OpponentShipPlacementMessage>) {
          return "opponent_ship_placement";
        } else if constexpr (std::is_same_v<T, ShotMessage>) {
          return "shot";
        } else if constexpr (std::is_same_v<T, ReceiveShotMessage>) {
          return "receive_shot";
        } else if constexpr (std::is_same_v<T, ShotResultMessage>) {
          return "shot_result";
        } else if constexpr (std::is_same_v<T, TurnChangeMessage>) {
          return "turn_change";
        } else if constexpr (std::is_same_v<T, OpponentDisconnectedMessage>) {
          return "opponent_disconnected";
        } else if constexpr (std::is_same_v<T, ChatMessage>) {
          return "chat";
        } else if constexpr (std::is_same_v<T, GameOverMessage>) {
          return "game_over";
        } else if constexpr (std::is_same_v<T, PingMessage>) {
          return "ping";
        } else {
          static_assert(std::is_same_v<T, PongMessage>);
          return "pong";
        }
      },
      message);
}

}  // namespace salvo
