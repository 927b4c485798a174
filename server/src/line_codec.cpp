/*
 * 설명: Message와 개행 구분 JSON 레코드 사이의 변환, 스트림 프레이밍을 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/line_codec_test.cpp
 */
#include "salvo/line_codec.hpp"

#include <cstdint>
#include <functional>
#include <limits>
#include <unordered_map>

namespace salvo {
namespace {

struct PayloadVisitor {
  nlohmann::json operator()(const NameMessage& m) const { return {{"name", m.name}}; }
  nlohmann::json operator()(const SessionStartMessage& m) const {
    return {{"session_id", m.session_id}, {"player_num", m.player_num}, {"opponent", m.opponent}};
  }
  nlohmann::json operator()(const WaitingForOpponentMessage&) const { return nlohmann::json::object(); }
  nlohmann::json operator()(const ErrorMessage& m) const { return {{"code", m.code}, {"message", m.message}}; }
  nlohmann::json operator()(const SetupCompleteMessage& m) const { return {{"player_num", m.player_num}}; }
  nlohmann::json operator()(const SetupUpdateMessage& m) const { return {{"player", m.player}, {"ready", m.ready}}; }
  nlohmann::json operator()(const GameplayStartMessage& m) const { return {{"current_player", m.current_player}}; }
  nlohmann::json operator()(const ShipPlacementMessage& m) const {
    return {{"player_num", m.player_num}, {"ship", m.ship}};
  }
  nlohmann::json operator()(const OpponentShipPlacementMessage& m) const { return {{"ship", m.ship}}; }
  nlohmann::json operator()(const ShotMessage& m) const {
    return {{"player_num", m.player_num}, {"row", m.row}, {"col", m.col}};
  }
  nlohmann::json operator()(const ReceiveShotMessage& m) const {
    return {{"row", m.row}, {"col", m.col}, {"player", m.player}};
  }
  nlohmann::json operator()(const ShotResultMessage& m) const {
    return {{"player", m.player}, {"row", m.row}, {"col", m.col}, {"result", std::string(ToString(m.result))}};
  }
  nlohmann::json operator()(const TurnChangeMessage& m) const { return {{"current_player", m.current_player}}; }
  nlohmann::json operator()(const OpponentDisconnectedMessage&) const { return nlohmann::json::object(); }
  nlohmann::json operator()(const ChatMessage& m) const { return {{"player", m.player}, {"text", m.text}}; }
  nlohmann::json operator()(const GameOverMessage& m) const { return {{"winner", m.winner}}; }
  nlohmann::json operator()(const PingMessage&) const { return nlohmann::json::object(); }
  nlohmann::json operator()(const PongMessage&) const { return nlohmann::json::object(); }
};

bool ReadInt(const nlohmann::json& j, const char* key, int& out) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_number_integer()) {
    return false;
  }
  if (it->is_number_unsigned()) {
    auto value = it->get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<int>::max())) {
      return false;
    }
    out = static_cast<int>(value);
    return true;
  }
  auto value = it->get<std::int64_t>();
  if (value < std::numeric_limits<int>::min() || value > std::numeric_limits<int>::max()) {
    return false;
  }
  out = static_cast<int>(value);
  return true;
}

bool ReadString(const nlohmann::json& j, const char* key, std::string& out) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) {
    return false;
  }
  out = it->get<std::string>();
  return true;
}

bool ReadBool(const nlohmann::json& j, const char* key, bool& out) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_boolean()) {
    return false;
  }
  out = it->get<bool>();
  return true;
}

bool ReadOutcome(const nlohmann::json& j, const char* key, ShotOutcome& out) {
  std::string text;
  if (!ReadString(j, key, text)) {
    return false;
  }
  auto outcome = ParseShotOutcome(text);
  if (!outcome) {
    return false;
  }
  out = *outcome;
  return true;
}

using Decoder = std::function<bool(const nlohmann::json&, Message&)>;

const std::unordered_map<std::string, Decoder>& Decoders() {
  static const std::unordered_map<std::string, Decoder> decoders{
      {"name",
       [](const nlohmann::json& j, Message& out) {
         NameMessage m;
         if (!ReadString(j, "name", m.name)) {
           return false;
         }
         out = std::move(m);
         return true;
       }},
      {"session_start",
       [](const nlohmann::json& j, Message& out) {
         SessionStartMessage m;
         if (!ReadInt(j, "session_id", m.session_id) || !ReadInt(j, "player_num", m.player_num) ||
             !ReadString(j, "opponent", m.opponent)) {
           return false;
         }
         out = std::move(m);
         return true;
       }},
      {"waiting_for_opponent",
       [](const nlohmann::json&, Message& out) {
         out = WaitingForOpponentMessage{};
         return true;
       }},
      {"error",
       [](const nlohmann::json& j, Message& out) {
         ErrorMessage m;
         if (!ReadString(j, "message", m.message)) {
           return false;
         }
         // code는 확장 필드이므로 없으면 비워 둔다.
         if (j.contains("code") && !ReadString(j, "code", m.code)) {
           return false;
         }
         out = std::move(m);
         return true;
       }},
      {"setup_complete",
       [](const nlohmann::json& j, Message& out) {
         SetupCompleteMessage m;
         if (!ReadInt(j, "player_num", m.player_num)) {
           return false;
         }
         out = m;
         return true;
       }},
      {"setup_update",
       [](const nlohmann::json& j, Message& out) {
         SetupUpdateMessage m;
         if (!ReadInt(j, "player", m.player) || !ReadBool(j, "ready", m.ready)) {
           return false;
         }
         out = m;
         return true;
       }},
      {"gameplay_start",
       [](const nlohmann::json& j, Message& out) {
         GameplayStartMessage m;
         if (!ReadInt(j, "current_player", m.current_player)) {
           return false;
         }
         out = m;
         return true;
       }},
      {"ship_placement",
       [](const nlohmann::json& j, Message& out) {
         ShipPlacementMessage m;
         auto ship_it = j.find("ship");
         if (!ReadInt(j, "player_num", m.player_num) || ship_it == j.end() || ship_it->is_null()) {
           return false;
         }
         m.ship = *ship_it;
         out = std::move(m);
         return true;
       }},
      {"opponent_ship_placement",
       [](const nlohmann::json& j, Message& out) {
         auto ship_it = j.find("ship");
         if (ship_it == j.end() || ship_it->is_null()) {
           return false;
         }
         out = OpponentShipPlacementMessage{*ship_it};
         return true;
       }},
      {"shot",
       [](const nlohmann::json& j, Message& out) {
         ShotMessage m;
         if (!ReadInt(j, "player_num", m.player_num) || !ReadInt(j, "row", m.row) || !ReadInt(j, "col", m.col)) {
           return false;
         }
         out = m;
         return true;
       }},
      {"receive_shot",
       [](const nlohmann::json& j, Message& out) {
         ReceiveShotMessage m;
         if (!ReadInt(j, "row", m.row) || !ReadInt(j, "col", m.col) || !ReadInt(j, "player", m.player)) {
           return false;
         }
         out = m;
         return true;
       }},
      {"shot_result",
       [](const nlohmann::json& j, Message& out) {
         ShotResultMessage m;
         if (!ReadInt(j, "player", m.player) || !ReadInt(j, "row", m.row) || !ReadInt(j, "col", m.col) ||
             !ReadOutcome(j, "result", m.result)) {
           return false;
         }
         out = m;
         return true;
       }},
      {"turn_change",
       [](const nlohmann::json& j, Message& out) {
         TurnChangeMessage m;
         if (!ReadInt(j, "current_player", m.current_player)) {
           return false;
         }
         out = m;
         return true;
       }},
      {"opponent_disconnected",
       [](const nlohmann::json&, Message& out) {
         out = OpponentDisconnectedMessage{};
         return true;
       }},
      {"chat",
       [](const nlohmann::json& j, Message& out) {
         ChatMessage m;
         if (!ReadString(j, "text", m.text)) {
           return false;
         }
         // 클라이언트가 보낸 player는 서버가 등록된 이름으로 덮어쓴다.
         if (j.contains("player") && !ReadString(j, "player", m.player)) {
           return false;
         }
         out = std::move(m);
         return true;
       }},
      {"game_over",
       [](const nlohmann::json& j, Message& out) {
         GameOverMessage m;
         if (!ReadInt(j, "winner", m.winner)) {
           return false;
         }
         out = m;
         return true;
       }},
      {"ping",
       [](const nlohmann::json&, Message& out) {
         out = PingMessage{};
         return true;
       }},
      {"pong",
       [](const nlohmann::json&, Message& out) {
         out = PongMessage{};
         return true;
       }},
  };
  return decoders;
}

}  // namespace

nlohmann::json ToJson(const Message& message) {
  nlohmann::json j = std::visit(PayloadVisitor{}, message);
  j["type"] = std::string(MessageType(message));
  return j;
}

std::string EncodeFrame(const Message& message) {
  std::string frame = ToJson(message).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  frame.push_back('\n');
  return frame;
}

bool DecodeFrame(std::string_view frame, Message& out, std::string& error_code, std::string& error_message) {
  auto parsed = nlohmann::json::parse(frame.begin(), frame.end(), nullptr, false);
  if (parsed.is_discarded() || !parsed.is_object()) {
    error_code = "malformed_message";
    error_message = "JSON 객체로 해석할 수 없는 프레임입니다";
    return false;
  }

  auto type_it = parsed.find("type");
  if (type_it == parsed.end()) {
    // 핸드셰이크 첫 메시지는 type 없이 {"name": ...} 형태로 올 수 있다.
    NameMessage name;
    if (ReadString(parsed, "name", name.name)) {
      out = std::move(name);
      return true;
    }
    error_code = "malformed_message";
    error_message = "type 필드가 없습니다";
    return false;
  }
  if (!type_it->is_string()) {
    error_code = "malformed_message";
    error_message = "type 필드는 문자열이어야 합니다";
    return false;
  }

  const auto type = type_it->get<std::string>();
  const auto& decoders = Decoders();
  auto decoder_it = decoders.find(type);
  if (decoder_it == decoders.end()) {
    error_code = "unknown_message_type";
    error_message = "알 수 없는 메시지 유형: " + type;
    return false;
  }
  if (!decoder_it->second(parsed, out)) {
    error_code = "malformed_message";
    error_message = "필드 형식이 올바르지 않습니다: " + type;
    return false;
  }
  return true;
}

LineFramer::LineFramer(std::size_t max_frame_bytes) : max_frame_bytes_(max_frame_bytes) {}

void LineFramer::Append(std::string_view bytes) { buffer_.append(bytes.data(), bytes.size()); }

std::optional<std::string> LineFramer::NextFrame() {
  while (!overflowed_) {
    auto newline = buffer_.find('\n');
    if (newline == std::string::npos) {
      if (buffer_.size() > max_frame_bytes_) {
        overflowed_ = true;
      }
      return std::nullopt;
    }
    std::string frame = buffer_.substr(0, newline);
    buffer_.erase(0, newline + 1);
    if (!frame.empty() && frame.back() == '\r') {
      frame.pop_back();
    }
    if (frame.size() > max_frame_bytes_) {
      overflowed_ = true;
      return std::nullopt;
    }
    if (frame.find_first_not_of(" \t") == std::string::npos) {
      continue;
    }
    return frame;
  }
  return std::nullopt;
}

}  // namespace salvo
