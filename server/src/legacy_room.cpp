/*
 * 설명: 레거시 파이프 프로토콜 방의 상태 전이와 레거시 포트 연결 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/legacy_room_test.cpp, server/tests/e2e/legacy_protocol_test.cpp
 */
#include "salvo/legacy_room.hpp"

#include <random>
#include <vector>

#include "salvo/game_server.hpp"

namespace salvo {
namespace {

class LegacyConnectionClient : public LegacyClient {
 public:
  explicit LegacyConnectionClient(std::weak_ptr<Connection> connection) : connection_(std::move(connection)) {}

  void SendLine(const std::string& line) override {
    if (auto connection = connection_.lock()) {
      connection->SendFrame(line + "\n");
    }
  }

  void Close() override {
    if (auto connection = connection_.lock()) {
      connection->Close("legacy_close");
    }
  }

 private:
  std::weak_ptr<Connection> connection_;
};

int Opponent(int player_id) { return player_id == 1 ? 2 : 1; }

}  // namespace

LegacyRoom::LegacyRoom(OutcomeFn outcome, std::shared_ptr<Observability> observability)
    : outcome_(std::move(outcome)), observability_(std::move(observability)) {}

LegacyRoom::OutcomeFn LegacyRoom::RandomOutcome() {
  auto engine = std::make_shared<std::mt19937>(std::random_device{}());
  // 방 잠금 안에서만 호출되므로 엔진 공유가 안전하다.
  return [engine](int, int) {
    std::bernoulli_distribution hit(0.3);
    return hit(*engine) ? ShotOutcome::kHit : ShotOutcome::kMiss;
  };
}

int LegacyRoom::Join(std::shared_ptr<LegacyClient> client) {
  std::lock_guard<std::mutex> lock(mutex_);
  int player_id = 0;
  for (int candidate = 1; candidate <= 2; ++candidate) {
    if (!Seat(candidate)) {
      player_id = candidate;
      break;
    }
  }
  if (player_id == 0) {
    client->SendLine(FormatError("room_full"));
    client->Close();
    observability_->Log(LogLevel::kWarn, LogContext{.event = "legacy_room_full"});
    return 0;
  }

  Seat(player_id) = std::move(client);
  SendLocked(player_id, FormatPlayer(player_id));
  observability_->Log(LogLevel::kInfo, LogContext{.event = "legacy_joined", .detail = std::to_string(player_id)});
  if (!Seat(Opponent(player_id))) {
    SendLocked(player_id, FormatWait());
    return player_id;
  }

  phase_ = Phase::kPlacement;
  placing_ = 1;
  BroadcastLocked(FormatShips());
  PromptPlacementLocked();
  return player_id;
}

bool LegacyRoom::HandleLine(int player_id, std::string_view line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (player_id < 1 || player_id > 2 || !Seat(player_id)) {
    return false;
  }
  auto command = ParseLegacyCommand(line);
  if (!command) {
    SendLocked(player_id, FormatError("bad_command"));
    return true;
  }

  switch (command->type) {
    case LegacyCommandType::kPing:
      SendLocked(player_id, FormatPong());
      return true;
    case LegacyCommandType::kPong:
      return true;
    case LegacyCommandType::kQuit: {
      auto client = Seat(player_id);
      LeaveLocked(player_id);
      client->Close();
      return false;
    }
    case LegacyCommandType::kShips:
      if (phase_ != Phase::kPlacement || placing_ != player_id) {
        SendLocked(player_id, FormatError("not_your_placement"));
        return true;
      }
      if (placing_ == 1) {
        placing_ = 2;
        PromptPlacementLocked();
        return true;
      }
      placing_ = 0;
      phase_ = Phase::kBattle;
      turn_ = 1;
      BroadcastLocked(FormatStart(turn_));
      observability_->Log(LogLevel::kInfo, LogContext{.event = "legacy_battle_started"});
      return true;
    case LegacyCommandType::kFire: {
      if (phase_ != Phase::kBattle) {
        SendLocked(player_id, FormatError("not_started"));
        return true;
      }
      if (turn_ != player_id) {
        SendLocked(player_id, FormatError("not_your_turn"));
        return true;
      }
      if (command->row < 0 || command->row >= kBoardSize || command->col < 0 || command->col >= kBoardSize) {
        SendLocked(player_id, FormatError("bad_cell"));
        return true;
      }
      auto result = outcome_(command->row, command->col);
      BroadcastLocked(FormatShot(player_id, command->row, command->col, result));
      if (result == ShotOutcome::kMiss) {
        turn_ = Opponent(turn_);
        BroadcastLocked(FormatStart(turn_));
      }
      return true;
    }
  }
  return true;
}

void LegacyRoom::Leave(int player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  LeaveLocked(player_id);
}

void LegacyRoom::LeaveLocked(int player_id) {
  if (player_id < 1 || player_id > 2 || !Seat(player_id)) {
    return;
  }
  Seat(player_id).reset();
  phase_ = Phase::kWaiting;
  placing_ = 0;
  turn_ = 1;
  observability_->Log(LogLevel::kInfo, LogContext{.event = "legacy_left", .detail = std::to_string(player_id)});

  int other = Opponent(player_id);
  if (Seat(other)) {
    SendLocked(other, FormatQuit(player_id));
    SendLocked(other, FormatWait());
  }
}

void LegacyRoom::PromptPlacementLocked() {
  SendLocked(placing_, FormatYourPlacement());
  SendLocked(Opponent(placing_), FormatWait());
}

void LegacyRoom::SendLocked(int player_id, const std::string& line) {
  if (auto& client = Seat(player_id)) {
    client->SendLine(line);
  }
}

void LegacyRoom::BroadcastLocked(const std::string& line) {
  SendLocked(1, line);
  SendLocked(2, line);
}

LegacyRoom::Phase LegacyRoom::CurrentPhase() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return phase_;
}

int LegacyRoom::CurrentTurn() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return turn_;
}

int LegacyRoom::Occupants() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return (seats_[0] ? 1 : 0) + (seats_[1] ? 1 : 0);
}

LegacyServer::LegacyServer(const AppConfig& config, std::shared_ptr<Observability> observability,
                           LegacyRoom::OutcomeFn outcome)
    : limits_(LimitsFromConfig(config)),
      observability_(observability),
      room_(std::move(outcome), std::move(observability)) {}

void LegacyServer::Accept(boost::asio::ip::tcp::socket socket) {
  if (stopping_) {
    boost::system::error_code ec;
    socket.close(ec);
    return;
  }
  auto connection = std::make_shared<Connection>(std::move(socket), limits_, observability_);
  auto client = std::make_shared<LegacyConnectionClient>(connection);
  const Connection* key = connection.get();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_[key] = connection;
  }
  observability_->Log(LogLevel::kInfo,
                      LogContext{.event = "legacy_connection_accepted", .detail = connection->RemoteAddress()});

  // 플레이어 번호는 연결 strand 안에서만 읽고 쓴다.
  auto player_id = std::make_shared<int>(0);
  auto self = shared_from_this();
  Connection::Callbacks callbacks;
  callbacks.on_open = [self, client, player_id]() { *player_id = self->room_.Join(client); };
  callbacks.on_frame = [self, player_id](const std::string& frame) {
    if (*player_id != 0 && !self->room_.HandleLine(*player_id, frame)) {
      *player_id = 0;
    }
  };
  callbacks.on_idle = [client]() { client->SendLine(FormatPing()); };
  callbacks.on_closed = [self, player_id, key](const std::string& reason) {
    {
      std::lock_guard<std::mutex> lock(self->mutex_);
      self->connections_.erase(key);
    }
    if (*player_id != 0) {
      self->room_.Leave(*player_id);
      self->observability_->Log(LogLevel::kInfo,
                                LogContext{.event = "legacy_disconnected", .detail = reason});
      *player_id = 0;
    }
  };
  connection->Start(std::move(callbacks));
}

void LegacyServer::Shutdown() {
  if (stopping_.exchange(true)) {
    return;
  }
  std::vector<std::shared_ptr<Connection>> connections;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : connections_) {
      if (auto connection = entry.second.lock()) {
        connections.push_back(connection);
      }
    }
  }
  for (const auto& connection : connections) {
    connection->Abort("shutdown");
  }
}

std::size_t LegacyServer::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

}  // namespace salvo
