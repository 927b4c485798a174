/*
 * 설명: 운영 포트의 HTTP 요청(헬스, 메트릭, 운영 상태)을 처리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/metrics_ops_test.cpp
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "salvo/api_response.hpp"
#include "salvo/config.hpp"
#include "salvo/game_server.hpp"
#include "salvo/legacy_room.hpp"
#include "salvo/observability.hpp"

namespace salvo {

class OpsHttpSession : public std::enable_shared_from_this<OpsHttpSession> {
 public:
  // legacy_server는 레거시 포트가 꺼져 있으면 nullptr이다.
  OpsHttpSession(boost::asio::ip::tcp::socket socket, const AppConfig& config,
                 std::shared_ptr<GameServer> game_server, std::shared_ptr<LegacyServer> legacy_server,
                 std::shared_ptr<Observability> observability);
  void Run();

 private:
  using Response = boost::beast::http::response<boost::beast::http::string_body>;

  void DoRead();
  void OnRead(boost::beast::error_code ec, std::size_t bytes_transferred);
  void HandleRequest();
  void Respond(const std::shared_ptr<Response>& res, boost::beast::http::status status, const nlohmann::json& body);
  void SendResponse(std::shared_ptr<Response> res);

  boost::beast::tcp_stream stream_;
  boost::beast::flat_buffer buffer_;
  boost::beast::http::request<boost::beast::http::string_body> req_;
  std::string ops_token_;
  std::shared_ptr<GameServer> game_server_;
  std::shared_ptr<LegacyServer> legacy_server_;
  std::shared_ptr<Observability> observability_;
  std::chrono::steady_clock::time_point request_start_;
  std::string trace_id_;
};

}  // namespace salvo
