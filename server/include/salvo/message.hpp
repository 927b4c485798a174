/*
 * 설명: 게임 프로토콜 메시지를 타입별 구조체와 닫힌 variant로 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/line_codec_test.cpp, server/tests/unit/game_session_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace salvo {

enum class ShotOutcome { kHit, kMiss, kSunk };

std::string_view ToString(ShotOutcome outcome);
std::optional<ShotOutcome> ParseShotOutcome(std::string_view text);

struct NameMessage {
  std::string name;
};

struct SessionStartMessage {
  int session_id{0};
  int player_num{0};
  std::string opponent;
};

struct WaitingForOpponentMessage {};

struct ErrorMessage {
  std::string code;
  std::string message;
};

struct SetupCompleteMessage {
  int player_num{0};
};

struct SetupUpdateMessage {
  int player{0};
  bool ready{false};
};

struct GameplayStartMessage {
  int current_player{0};
};

// ship은 클라이언트 보드 로직이 정의하는 불투명 JSON이며 그대로 중계된다.
struct ShipPlacementMessage {
  int player_num{0};
  nlohmann::json ship;
};

struct OpponentShipPlacementMessage {
  nlohmann::json ship;
};

struct ShotMessage {
  int player_num{0};
  int row{0};
  int col{0};
};

struct ReceiveShotMessage {
  int row{0};
  int col{0};
  int player{0};
};

struct ShotResultMessage {
  int player{0};
  int row{0};
  int col{0};
  ShotOutcome result{ShotOutcome::kMiss};
};

struct TurnChangeMessage {
  int current_player{0};
};

struct OpponentDisconnectedMessage {};

struct ChatMessage {
  std::string player;
  std::string text;
};

struct GameOverMessage {
  int winner{0};
};

struct PingMessage {};

struct PongMessage {};

using Message = std::variant<NameMessage, SessionStartMessage, WaitingForOpponentMessage, ErrorMessage,
                             SetupCompleteMessage, SetupUpdateMessage, GameplayStartMessage, ShipPlacementMessage,
                             OpponentShipPlacementMessage, ShotMessage, ReceiveShotMessage, ShotResultMessage,
                             TurnChangeMessage, OpponentDisconnectedMessage, ChatMessage, GameOverMessage,
                             PingMessage, PongMessage>;

std::string_view MessageType(const Message& message);

}  // namespace salvo
