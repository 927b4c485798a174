/*
 * 설명: 연결 수락, 이름 핸드셰이크, 매칭 요청, 세션 메시지 분배와 연결 종료 연쇄 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/session_flow_test.cpp, server/tests/e2e/connection_limits_test.cpp
 */
#include "salvo/game_server.hpp"

#include <variant>
#include <vector>

namespace salvo {
namespace {

class ConnectionPeer : public Peer {
 public:
  explicit ConnectionPeer(std::weak_ptr<Connection> connection) : connection_(std::move(connection)) {}

  void Send(const Message& message) override {
    if (auto connection = connection_.lock()) {
      connection->SendFrame(EncodeFrame(message));
    }
  }

  void Close(const std::string& reason) override {
    if (auto connection = connection_.lock()) {
      connection->Close(reason);
    }
  }

 private:
  std::weak_ptr<Connection> connection_;
};

bool IsSessionMessage(const Message& message) {
  return std::holds_alternative<ShipPlacementMessage>(message) ||
         std::holds_alternative<SetupCompleteMessage>(message) || std::holds_alternative<ShotMessage>(message) ||
         std::holds_alternative<ShotResultMessage>(message) || std::holds_alternative<ChatMessage>(message) ||
         std::holds_alternative<GameOverMessage>(message);
}

}  // namespace

ConnectionLimits LimitsFromConfig(const AppConfig& config) {
  ConnectionLimits limits;
  limits.max_frame_bytes = config.max_frame_bytes;
  limits.max_queue_messages = config.send_queue_limit_messages;
  limits.max_queue_bytes = config.send_queue_limit_bytes;
  limits.heartbeat_interval = std::chrono::milliseconds(config.heartbeat_interval_ms);
  limits.heartbeat_timeout = std::chrono::milliseconds(config.heartbeat_timeout_ms);
  return limits;
}

GameServer::GameServer(const AppConfig& config, std::shared_ptr<Observability> observability)
    : limits_(LimitsFromConfig(config)), observability_(std::move(observability)) {
  session_manager_ = std::make_shared<SessionManager>(observability_);
  match_queue_ = std::make_shared<MatchQueueService>(session_manager_);
  player_registry_ = std::make_shared<PlayerRegistry>(match_queue_, session_manager_, observability_);
}

void GameServer::Accept(boost::asio::ip::tcp::socket socket) {
  if (stopping_) {
    boost::system::error_code ec;
    socket.close(ec);
    return;
  }
  auto connection = std::make_shared<Connection>(std::move(socket), limits_, observability_);
  auto ctx = std::make_shared<ClientContext>();
  ctx->connection = connection;
  ctx->peer = std::make_shared<ConnectionPeer>(connection);
  ctx->remote_address = connection->RemoteAddress();
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_[connection.get()] = connection;
  }
  observability_->Log(LogLevel::kInfo, LogContext{.event = "connection_accepted", .detail = ctx->remote_address});

  const Connection* key = connection.get();
  auto self = shared_from_this();
  Connection::Callbacks callbacks;
  callbacks.on_frame = [self, ctx](const std::string& frame) { self->OnFrame(ctx, frame); };
  callbacks.on_idle = [ctx]() { ctx->peer->Send(PingMessage{}); };
  callbacks.on_closed = [self, ctx, key](const std::string& reason) { self->OnClosed(key, ctx, reason); };
  connection->Start(std::move(callbacks));
}

void GameServer::OnFrame(const std::shared_ptr<ClientContext>& ctx, const std::string& frame) {
  if (ctx->rejected) {
    return;
  }
  if (!ctx->player) {
    HandleHandshake(ctx, frame);
    return;
  }

  Message message;
  std::string error_code;
  std::string error_message;
  if (!DecodeFrame(frame, message, error_code, error_message)) {
    observability_->Log(LogLevel::kWarn,
                        LogContext{.event = error_code, .player = ctx->player->name, .detail = error_message});
    // 줄 단위 프레이밍은 깨지지 않았으므로 해당 프레임만 버리고 연결은 유지한다.
    if (error_code == "malformed_message") {
      observability_->MalformedFrame();
      SendError(ctx, error_code, error_message);
    }
    return;
  }
  HandlePlayerMessage(ctx, message);
}

void GameServer::HandleHandshake(const std::shared_ptr<ClientContext>& ctx, const std::string& frame) {
  Message message;
  std::string error_code;
  std::string error_message;
  if (!DecodeFrame(frame, message, error_code, error_message) || !std::holds_alternative<NameMessage>(message)) {
    Reject(ctx, "bad_handshake", "첫 메시지는 name이어야 합니다");
    return;
  }

  const auto& name = std::get<NameMessage>(message).name;
  auto player = player_registry_->Register(name, ctx->peer, error_code, error_message);
  if (!player) {
    Reject(ctx, error_code, error_message);
    return;
  }
  ctx->player = player;
  observability_->Log(LogLevel::kInfo,
                      LogContext{.event = "handshake_accepted", .player = player->name, .detail = ctx->remote_address});

  std::shared_ptr<GameSession> session;
  if (!match_queue_->EnqueueOrPair(player, session, error_code, error_message)) {
    observability_->Log(LogLevel::kError,
                        LogContext{.event = error_code, .player = player->name, .detail = error_message});
    SendError(ctx, error_code, error_message);
    return;
  }
  if (!session) {
    observability_->Log(LogLevel::kInfo, LogContext{.event = "queued", .player = player->name});
  }
}

void GameServer::HandlePlayerMessage(const std::shared_ptr<ClientContext>& ctx, const Message& message) {
  if (std::holds_alternative<PongMessage>(message)) {
    return;
  }
  if (std::holds_alternative<PingMessage>(message)) {
    ctx->peer->Send(PongMessage{});
    return;
  }
  if (std::holds_alternative<NameMessage>(message)) {
    SendError(ctx, "invalid_state", "이미 이름이 등록된 연결입니다");
    return;
  }
  if (!IsSessionMessage(message)) {
    observability_->Log(LogLevel::kWarn, LogContext{.event = "unknown_message_type",
                                                    .player = ctx->player->name,
                                                    .detail = std::string(MessageType(message))});
    return;
  }

  std::string error_code;
  std::string error_message;
  if (session_manager_->Dispatch(ctx->player->id, message, error_code, error_message)) {
    return;
  }
  if (error_code == "session_not_found") {
    observability_->Log(LogLevel::kWarn, LogContext{.event = "session_not_found",
                                                    .player = ctx->player->name,
                                                    .detail = std::string(MessageType(message))});
    return;
  }
  observability_->MessageRejected();
  observability_->Log(LogLevel::kWarn,
                      LogContext{.event = error_code, .player = ctx->player->name, .detail = error_message});
  SendError(ctx, error_code, error_message);
}

void GameServer::OnClosed(const Connection* connection, const std::shared_ptr<ClientContext>& ctx,
                          const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    connections_.erase(connection);
  }
  if (!ctx->player) {
    observability_->Log(LogLevel::kInfo, LogContext{.event = "connection_closed",
                                                    .detail = ctx->remote_address + " " + reason});
    return;
  }
  player_registry_->Unregister(ctx->player);
  observability_->Log(LogLevel::kInfo,
                      LogContext{.event = "player_disconnected", .player = ctx->player->name, .detail = reason});
  ctx->player.reset();
}

void GameServer::SendError(const std::shared_ptr<ClientContext>& ctx, const std::string& code,
                           const std::string& message) {
  ctx->peer->Send(ErrorMessage{.code = code, .message = message});
}

void GameServer::Reject(const std::shared_ptr<ClientContext>& ctx, const std::string& code,
                        const std::string& message) {
  observability_->Log(LogLevel::kWarn,
                      LogContext{.event = "handshake_rejected", .detail = code + " " + ctx->remote_address});
  ctx->rejected = true;
  SendError(ctx, code, message);
  ctx->peer->Close(code);
}

void GameServer::Shutdown() {
  if (stopping_.exchange(true)) {
    return;
  }
  session_manager_->ShutdownAll();
  match_queue_->Clear();

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
  observability_->Log(LogLevel::kInfo,
                      LogContext{.event = "game_server_shutdown", .detail = std::to_string(connections.size())});
}

std::size_t GameServer::ActiveConnections() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return connections_.size();
}

}  // namespace salvo
