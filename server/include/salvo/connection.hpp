/*
 * 설명: TCP 소켓 하나의 줄 단위 수신, 유한 송신 큐와 백프레셔, 하트비트, 중복 안전한 종료를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/session_flow_test.cpp, server/tests/e2e/connection_limits_test.cpp
 */
#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <deque>
#include <functional>
#include <memory>
#include <string>

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/steady_timer.hpp>

#include "salvo/line_codec.hpp"
#include "salvo/observability.hpp"

namespace salvo {

struct ConnectionLimits {
  std::size_t max_frame_bytes{8192};
  std::size_t max_queue_messages{64};
  std::size_t max_queue_bytes{262144};
  std::chrono::milliseconds heartbeat_interval{5000};
  std::chrono::milliseconds heartbeat_timeout{15000};
};

// 소켓은 strand 실행기에서 생성되어야 한다. 모든 콜백은 그 strand에서 순서대로 호출된다.
class Connection : public std::enable_shared_from_this<Connection> {
 public:
  struct Callbacks {
    std::function<void()> on_open;
    std::function<void(const std::string& frame)> on_frame;
    std::function<void()> on_idle;
    std::function<void(const std::string& reason)> on_closed;
  };

  Connection(boost::asio::ip::tcp::socket socket, const ConnectionLimits& limits,
             std::shared_ptr<Observability> observability);
  ~Connection();

  void Start(Callbacks callbacks);
  void SendFrame(std::string frame);
  // 이미 큐에 있는 프레임을 보낸 뒤 닫는다.
  void Close(const std::string& reason);
  // 큐를 버리고 즉시 닫는다.
  void Abort(const std::string& reason);
  bool IsClosed() const { return closed_.load(); }
  const std::string& RemoteAddress() const { return remote_address_; }

 private:
  static constexpr std::size_t kReadChunkBytes = 4096;
  static constexpr std::chrono::seconds kCloseFlushTimeout{2};

  void DoRead();
  void OnRead(const boost::system::error_code& ec, std::size_t bytes_transferred);
  void EnqueueFrame(std::string frame);
  void WriteNext();
  void OnWrite(const boost::system::error_code& ec);
  void BeginGracefulClose(const std::string& reason);
  void ScheduleHeartbeat(std::chrono::milliseconds delay);
  void OnHeartbeat(const boost::system::error_code& ec);
  void DoClose(const std::string& reason);

  boost::asio::ip::tcp::socket socket_;
  boost::asio::steady_timer heartbeat_timer_;
  ConnectionLimits limits_;
  std::shared_ptr<Observability> observability_;
  Callbacks callbacks_;
  LineFramer framer_;
  std::array<char, kReadChunkBytes> read_chunk_{};
  std::deque<std::string> send_queue_;
  std::size_t queued_bytes_{0};
  bool writing_{false};
  bool close_pending_{false};
  std::string close_reason_;
  std::chrono::steady_clock::time_point last_inbound_;
  std::string remote_address_;
  std::atomic<bool> closed_{false};
};

}  // namespace salvo
