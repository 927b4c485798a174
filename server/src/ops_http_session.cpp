/*
 * 설명: 운영 HTTP 엔드포인트(/api/health, /metrics, /ops/status)를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/metrics_ops_test.cpp
 */
#include "salvo/ops_http_session.hpp"

#include <boost/beast/version.hpp>

namespace salvo {

OpsHttpSession::OpsHttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                               std::shared_ptr<GameServer> game_server, std::shared_ptr<LegacyServer> legacy_server,
                               std::shared_ptr<Observability> observability)
    : stream_(std::move(socket)), ops_token_(config.ops_token), game_server_(std::move(game_server)),
      legacy_server_(std::move(legacy_server)), observability_(std::move(observability)) {}

void OpsHttpSession::Run() { DoRead(); }

void OpsHttpSession::DoRead() {
  auto self = shared_from_this();
  req_ = {};
  stream_.expires_after(std::chrono::seconds(30));
  boost::beast::http::async_read(stream_, buffer_, req_,
                                 [self](boost::beast::error_code ec, std::size_t bytes_transferred) {
                                   self->OnRead(ec, bytes_transferred);
                                 });
}

void OpsHttpSession::OnRead(boost::beast::error_code ec, std::size_t /*bytes_transferred*/) {
  if (ec == boost::beast::http::error::end_of_stream) {
    boost::beast::error_code ignored;
    stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored);
    return;
  }
  if (ec) {
    return;
  }
  HandleRequest();
}

void OpsHttpSession::HandleRequest() {
  using namespace boost::beast;
  request_start_ = std::chrono::steady_clock::now();
  trace_id_ = observability_->NextTraceId();
  observability_->IncrementRequest();
  auto res = std::make_shared<Response>();
  res->version(req_.version());
  res->set(http::field::server, "salvo-ops");
  res->set(http::field::content_type, "application/json; charset=utf-8");

  std::string path{req_.target()};
  auto qpos = path.find('?');
  if (qpos != std::string::npos) {
    path.resize(qpos);
  }

  if (req_.method() == http::verb::get && path == "/api/health") {
    return Respond(res, http::status::ok, MakeSuccessEnvelope({{"status", "ok"}, {"version", "v1.0.0"}}));
  }

  auto session_manager = game_server_->GetSessionManager();
  auto match_queue = game_server_->GetMatchQueue();
  if (req_.method() == http::verb::get && path == "/metrics") {
    auto snapshot = observability_->Snapshot(session_manager->ActiveSessionCount(), match_queue->QueueLength());
    nlohmann::json data{
        {"requests", {{"total", snapshot.request_total}, {"errors", snapshot.request_errors}}},
        {"connections", {{"accepted", snapshot.connections_accepted}, {"active", snapshot.connections_active}}},
        {"frames",
         {{"received", snapshot.frames_received},
          {"sent", snapshot.frames_sent},
          {"malformed", snapshot.malformed_frames},
          {"rejected", snapshot.rejected_messages}}},
        {"closes", {{"backpressure", snapshot.backpressure_closes}, {"heartbeatTimeout", snapshot.heartbeat_timeouts}}},
        {"sessions", {{"created", snapshot.sessions_created}, {"active", snapshot.active_sessions}}},
        {"queue", {{"length", snapshot.queue_length}}}};
    return Respond(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  if (req_.method() == http::verb::get && path == "/ops/status") {
    auto header_it = req_.base().find("X-Ops-Token");
    std::string header_token = header_it == req_.base().end() ? std::string() : std::string(header_it->value());
    if (ops_token_.empty() || header_token != ops_token_) {
      return Respond(res, http::status::unauthorized,
                     MakeErrorEnvelope("unauthorized", "운영 토큰이 올바르지 않습니다"));
    }
    auto snapshot = observability_->Snapshot(session_manager->ActiveSessionCount(), match_queue->QueueLength());
    auto players = game_server_->GetPlayerRegistry()->Snapshot();
    nlohmann::json player_list = nlohmann::json::array();
    for (const auto& player : players) {
      player_list.push_back(nlohmann::json{{"id", player->id},
                                            {"name", player->name},
                                            {"queued", match_queue->Contains(player->id)},
                                            {"inSession", session_manager->IsPlayerInSession(player->id)}});
    }
    nlohmann::json data{{"activeSessions", snapshot.active_sessions},
                        {"queueLength", snapshot.queue_length},
                        {"registeredPlayers", players.size()},
                        {"players", player_list},
                        {"gameConnections", game_server_->ActiveConnections()},
                        {"legacyConnections", legacy_server_ ? legacy_server_->ActiveConnections() : 0},
                        {"errorCount", snapshot.request_errors}};
    return Respond(res, http::status::ok, MakeSuccessEnvelope(data));
  }

  Respond(res, http::status::not_found,
          MakeErrorEnvelope("not_found", "지원되지 않는 경로입니다", {{"path", path}}));
}

void OpsHttpSession::Respond(const std::shared_ptr<Response>& res, boost::beast::http::status status,
                             const nlohmann::json& body) {
  res->result(status);
  // 요청 경로가 본문에 실리므로 잘못된 UTF-8 바이트는 치환한다.
  res->body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
  res->content_length(res->body().size());
  SendResponse(res);
}

void OpsHttpSession::SendResponse(std::shared_ptr<Response> res) {
  auto self = shared_from_this();
  if (static_cast<unsigned>(res->result_int()) >= 400) {
    observability_->IncrementError();
  }
  auto latency =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - request_start_).count();
  observability_->Log(LogLevel::kInfo, LogContext{.event = "http_request",
                                                  .detail = std::string(req_.target()) + " " +
                                                            std::to_string(res->result_int()) + " " +
                                                            std::to_string(latency) + "ms",
                                                  .trace_id = trace_id_});
  boost::beast::http::async_write(stream_, *res, [self, res](boost::beast::error_code ec, std::size_t) {
    if (ec) {
      return;
    }
    self->stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  });
}

}  // namespace salvo
