/*
 * 설명: 소켓 읽기/쓰기 루프, 송신 큐 백프레셔, 하트비트 감시와 종료 처리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/session_flow_test.cpp, server/tests/e2e/connection_limits_test.cpp
 */
#include "salvo/connection.hpp"

#include <string_view>

#include <boost/asio/buffer.hpp>
#include <boost/asio/error.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

namespace salvo {

Connection::Connection(boost::asio::ip::tcp::socket socket, const ConnectionLimits& limits,
                       std::shared_ptr<Observability> observability)
    : socket_(std::move(socket)), heartbeat_timer_(socket_.get_executor()), limits_(limits),
      observability_(std::move(observability)), framer_(limits.max_frame_bytes) {
  boost::system::error_code ec;
  auto endpoint = socket_.remote_endpoint(ec);
  remote_address_ = ec ? std::string{"unknown"} : endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
}

Connection::~Connection() {
  boost::system::error_code ec;
  socket_.close(ec);
}

void Connection::Start(Callbacks callbacks) {
  boost::asio::post(socket_.get_executor(), [self = shared_from_this(), callbacks = std::move(callbacks)]() mutable {
    self->callbacks_ = std::move(callbacks);
    self->last_inbound_ = std::chrono::steady_clock::now();
    self->observability_->ConnectionOpened();
    if (self->callbacks_.on_open) {
      self->callbacks_.on_open();
    }
    self->DoRead();
    if (self->limits_.heartbeat_interval.count() > 0) {
      self->ScheduleHeartbeat(self->limits_.heartbeat_interval);
    }
  });
}

void Connection::SendFrame(std::string frame) {
  boost::asio::post(socket_.get_executor(), [self = shared_from_this(), frame = std::move(frame)]() mutable {
    self->EnqueueFrame(std::move(frame));
  });
}

void Connection::Close(const std::string& reason) {
  boost::asio::post(socket_.get_executor(),
                    [self = shared_from_this(), reason]() { self->BeginGracefulClose(reason); });
}

void Connection::Abort(const std::string& reason) {
  boost::asio::post(socket_.get_executor(), [self = shared_from_this(), reason]() { self->DoClose(reason); });
}

void Connection::DoRead() {
  if (closed_) {
    return;
  }
  socket_.async_read_some(boost::asio::buffer(read_chunk_),
                          [self = shared_from_this()](const boost::system::error_code& ec,
                                                      std::size_t bytes_transferred) {
                            self->OnRead(ec, bytes_transferred);
                          });
}

void Connection::OnRead(const boost::system::error_code& ec, std::size_t bytes_transferred) {
  if (closed_) {
    return;
  }
  if (ec) {
    DoClose(ec == boost::asio::error::eof ? "eof" : "connection_lost");
    return;
  }

  last_inbound_ = std::chrono::steady_clock::now();
  framer_.Append(std::string_view(read_chunk_.data(), bytes_transferred));
  // 종료 요청 이후 도착한 프레임은 처리하지 않는다.
  while (!closed_ && !close_pending_) {
    auto frame = framer_.NextFrame();
    if (!frame) {
      break;
    }
    observability_->FrameReceived();
    if (callbacks_.on_frame) {
      callbacks_.on_frame(*frame);
    }
  }
  if (closed_) {
    return;
  }
  if (framer_.Overflowed()) {
    observability_->Log(LogLevel::kWarn, LogContext{.event = "frame_too_long", .detail = remote_address_});
    DoClose("frame_too_long");
    return;
  }
  DoRead();
}

void Connection::EnqueueFrame(std::string frame) {
  if (closed_ || close_pending_) {
    return;
  }
  const auto frame_size = frame.size();
  if (send_queue_.size() >= limits_.max_queue_messages || queued_bytes_ + frame_size > limits_.max_queue_bytes) {
    observability_->BackpressureClose();
    observability_->Log(LogLevel::kWarn, LogContext{.event = "backpressure_exceeded", .detail = remote_address_});
    DoClose("backpressure_exceeded");
    return;
  }
  send_queue_.push_back(std::move(frame));
  queued_bytes_ += frame_size;
  if (!writing_) {
    WriteNext();
  }
}

void Connection::WriteNext() {
  if (send_queue_.empty() || closed_) {
    return;
  }
  writing_ = true;
  boost::asio::async_write(socket_, boost::asio::buffer(send_queue_.front()),
                           [self = shared_from_this()](const boost::system::error_code& ec,
                                                       std::size_t /*bytes_transferred*/) { self->OnWrite(ec); });
}

void Connection::OnWrite(const boost::system::error_code& ec) {
  writing_ = false;
  if (closed_) {
    return;
  }
  queued_bytes_ -= send_queue_.front().size();
  send_queue_.pop_front();
  if (ec) {
    DoClose("connection_lost");
    return;
  }
  observability_->FrameSent();
  if (!send_queue_.empty()) {
    WriteNext();
    return;
  }
  if (close_pending_) {
    DoClose(close_reason_);
  }
}

void Connection::BeginGracefulClose(const std::string& reason) {
  if (closed_ || close_pending_) {
    return;
  }
  if (!writing_ && send_queue_.empty()) {
    DoClose(reason);
    return;
  }
  close_pending_ = true;
  close_reason_ = reason;
  // 상대가 읽지 않아 쓰기가 끝나지 않더라도 일정 시간 뒤에는 닫는다.
  ScheduleHeartbeat(kCloseFlushTimeout);
}

void Connection::ScheduleHeartbeat(std::chrono::milliseconds delay) {
  heartbeat_timer_.expires_after(delay);
  heartbeat_timer_.async_wait(
      [self = shared_from_this()](const boost::system::error_code& ec) { self->OnHeartbeat(ec); });
}

void Connection::OnHeartbeat(const boost::system::error_code& ec) {
  if (ec || closed_) {
    return;
  }
  if (close_pending_) {
    DoClose(close_reason_);
    return;
  }
  const auto idle = std::chrono::steady_clock::now() - last_inbound_;
  if (idle >= limits_.heartbeat_timeout) {
    observability_->HeartbeatTimeout();
    observability_->Log(LogLevel::kWarn, LogContext{.event = "heartbeat_timeout", .detail = remote_address_});
    DoClose("heartbeat_timeout");
    return;
  }
  if (idle >= limits_.heartbeat_interval && callbacks_.on_idle) {
    callbacks_.on_idle();
  }
  ScheduleHeartbeat(limits_.heartbeat_interval);
}

void Connection::DoClose(const std::string& reason) {
  if (closed_.exchange(true)) {
    return;
  }
  close_pending_ = false;
  heartbeat_timer_.cancel();
  boost::system::error_code ec;
  socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
  socket_.close(ec);
  observability_->ConnectionClosed();

  auto on_closed = std::move(callbacks_.on_closed);
  callbacks_ = Callbacks{};
  if (on_closed) {
    on_closed(reason);
  }
}

}  // namespace salvo
