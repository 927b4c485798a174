/*
 * 설명: 레거시 파이프 프로토콜의 명령 파싱과 응답 포맷을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/legacy_room_test.cpp
 */
#include "salvo/legacy_protocol.hpp"

#include <sstream>
#include <vector>

namespace salvo {
namespace {

std::vector<std::string> Split(std::string_view text, char delimiter) {
  std::vector<std::string> parts;
  std::size_t pos = 0;
  while (pos <= text.size()) {
    auto next = text.find(delimiter, pos);
    if (next == std::string_view::npos) {
      parts.emplace_back(text.substr(pos));
      break;
    }
    parts.emplace_back(text.substr(pos, next - pos));
    pos = next + 1;
  }
  return parts;
}

std::vector<std::string> Words(const std::string& text) {
  std::vector<std::string> words;
  std::istringstream iss(text);
  std::string word;
  while (iss >> word) {
    words.push_back(word);
  }
  return words;
}

std::optional<int> ParseInt(const std::string& text) {
  if (text.empty()) {
    return std::nullopt;
  }
  try {
    std::size_t idx = 0;
    int value = std::stoi(text, &idx);
    if (idx != text.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception&) {
    return std::nullopt;
  }
}

}  // namespace

std::optional<LegacyCommand> ParseLegacyCommand(std::string_view line) {
  auto fields = Split(line, '|');
  auto words = Words(fields.front());
  if (words.empty()) {
    return std::nullopt;
  }

  LegacyCommand command;
  const auto& head = words.front();
  if (head == "SHIPS" && words.size() == 1) {
    command.type = LegacyCommandType::kShips;
    return command;
  }
  if (head == "PING" && words.size() == 1) {
    command.type = LegacyCommandType::kPing;
    return command;
  }
  if (head == "PONG" && words.size() == 1) {
    command.type = LegacyCommandType::kPong;
    return command;
  }
  if (head == "QUIT" && words.size() == 1) {
    command.type = LegacyCommandType::kQuit;
    if (fields.size() > 1 && !fields[1].empty()) {
      auto id = ParseInt(fields[1]);
      if (!id) {
        return std::nullopt;
      }
      command.player_id = *id;
    }
    return command;
  }
  if (head == "FIRE") {
    // 좌표는 "FIRE r c|" 형식이 기본이고 "FIRE|r|c"도 받아들인다.
    std::optional<int> row;
    std::optional<int> col;
    if (words.size() == 3) {
      row = ParseInt(words[1]);
      col = ParseInt(words[2]);
    } else if (words.size() == 1 && fields.size() >= 3) {
      row = ParseInt(fields[1]);
      col = ParseInt(fields[2]);
    }
    if (!row || !col) {
      return std::nullopt;
    }
    command.type = LegacyCommandType::kFire;
    command.row = *row;
    command.col = *col;
    return command;
  }
  return std::nullopt;
}

std::string FormatPlayer(int player_id) { return "PLAYER|" + std::to_string(player_id); }

std::string FormatStart(int turn) { return "START|" + std::to_string(turn); }

std::string FormatShips() { return "SHIPS"; }

std::string FormatWait() { return "WAIT|"; }

std::string FormatYourPlacement() { return "YOURPLACEMENT|"; }

std::string FormatShot(int player_id, int row, int col, ShotOutcome result) {
  std::ostringstream oss;
  oss << "SHOT|" << player_id << "|" << row << "|" << col << "|" << ToString(result);
  return oss.str();
}

std::string FormatError(std::string_view reason) { return "ERROR|" + std::string(reason); }

std::string FormatPing() { return "PING|"; }

std::string FormatPong() { return "PONG|"; }

std::string FormatQuit(int player_id) { return "QUIT|" + std::to_string(player_id); }

}  // namespace salvo
