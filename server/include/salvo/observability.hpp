/*
 * 설명: 구조화 로그와 연결/프레임/세션 메트릭 카운터를 관리한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#pragma once

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

namespace salvo {

enum class LogLevel { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

std::optional<LogLevel> ParseLogLevel(std::string_view text);
std::string_view ToString(LogLevel level);

struct LogContext {
  std::string event;
  std::optional<std::string> player;
  std::optional<int> session_id;
  std::string detail;
  std::string trace_id;
};

struct MetricsSnapshot {
  std::uint64_t connections_accepted{0};
  std::uint64_t connections_active{0};
  std::uint64_t frames_received{0};
  std::uint64_t frames_sent{0};
  std::uint64_t malformed_frames{0};
  std::uint64_t rejected_messages{0};
  std::uint64_t sessions_created{0};
  std::uint64_t backpressure_closes{0};
  std::uint64_t heartbeat_timeouts{0};
  std::uint64_t request_total{0};
  std::uint64_t request_errors{0};
  std::uint64_t active_sessions{0};
  std::uint64_t queue_length{0};
};

class Observability {
 public:
  explicit Observability(LogLevel min_level = LogLevel::kInfo);
  Observability(LogLevel min_level, std::ostream& sink);

  std::string NextTraceId();
  void ConnectionOpened();
  void ConnectionClosed();
  void FrameReceived() { frames_received_.fetch_add(1); }
  void FrameSent() { frames_sent_.fetch_add(1); }
  void MalformedFrame() { malformed_frames_.fetch_add(1); }
  void MessageRejected() { rejected_messages_.fetch_add(1); }
  void SessionCreated() { sessions_created_.fetch_add(1); }
  void BackpressureClose() { backpressure_closes_.fetch_add(1); }
  void HeartbeatTimeout() { heartbeat_timeouts_.fetch_add(1); }
  void IncrementRequest() { request_total_.fetch_add(1); }
  void IncrementError() { request_errors_.fetch_add(1); }

  MetricsSnapshot Snapshot(std::uint64_t active_sessions, std::uint64_t queue_length) const;
  bool Enabled(LogLevel level) const { return level >= min_level_; }
  void Log(LogLevel level, const LogContext& ctx) const;

 private:
  LogLevel min_level_;
  std::ostream& sink_;
  mutable std::mutex sink_mutex_;
  std::atomic<std::uint64_t> connections_accepted_{0};
  std::atomic<std::uint64_t> connections_active_{0};
  std::atomic<std::uint64_t> frames_received_{0};
  std::atomic<std::uint64_t> frames_sent_{0};
  std::atomic<std::uint64_t> malformed_frames_{0};
  std::atomic<std::uint64_t> rejected_messages_{0};
  std::atomic<std::uint64_t> sessions_created_{0};
  std::atomic<std::uint64_t> backpressure_closes_{0};
  std::atomic<std::uint64_t> heartbeat_timeouts_{0};
  std::atomic<std::uint64_t> request_total_{0};
  std::atomic<std::uint64_t> request_errors_{0};
  std::atomic<std::uint64_t> trace_counter_{0};
};

}  // namespace salvo
