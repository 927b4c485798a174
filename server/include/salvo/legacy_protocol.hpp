/*
 * 설명: 파이프(|) 구분 ASCII 레거시 프로토콜 명령의 해석과 서버 응답 문자열 생성을 담당한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/legacy_room_test.cpp
 */
#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "salvo/message.hpp"

namespace salvo {

enum class LegacyCommandType { kShips, kFire, kPing, kPong, kQuit };

struct LegacyCommand {
  LegacyCommandType type{LegacyCommandType::kPing};
  int row{0};
  int col{0};
  int player_id{0};
};

// "FIRE 3 4|", "SHIPS|", "PING|", "PONG|", "QUIT|2" 형식을 받는다.
std::optional<LegacyCommand> ParseLegacyCommand(std::string_view line);

std::string FormatPlayer(int player_id);
std::string FormatStart(int turn);
std::string FormatShips();
std::string FormatWait();
std::string FormatYourPlacement();
std::string FormatShot(int player_id, int row, int col, ShotOutcome result);
std::string FormatError(std::string_view reason);
std::string FormatPing();
std::string FormatPong();
std::string FormatQuit(int player_id);

}  // namespace salvo
