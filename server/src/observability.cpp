/*
 * 설명: 구조화 로그 출력과 메트릭 카운터 집계를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/observability_test.cpp, server/tests/e2e/metrics_ops_test.cpp
 */
#include "salvo/observability.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace salvo {
namespace {
std::string ToIsoString(std::chrono::system_clock::time_point tp) {
  auto tt = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&tt, &tm);
  std::ostringstream oss;
  oss << std::put_time(&tm, "%FT%TZ");
  return oss.str();
}
}  // namespace

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
  if (text == "debug") {
    return LogLevel::kDebug;
  }
  if (text == "info") {
    return LogLevel::kInfo;
  }
  if (text == "warn" || text == "warning") {
    return LogLevel::kWarn;
  }
  if (text == "error") {
    return LogLevel::kError;
  }
  return std::nullopt;
}

std::string_view ToString(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "debug";
    case LogLevel::kInfo:
      return "info";
    case LogLevel::kWarn:
      return "warn";
    case LogLevel::kError:
      return "error";
  }
  return "info";
}

Observability::Observability(LogLevel min_level) : Observability(min_level, std::cout) {}

Observability::Observability(LogLevel min_level, std::ostream& sink) : min_level_(min_level), sink_(sink) {}

std::string Observability::NextTraceId() {
  auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::ostringstream oss;
  oss << std::hex << now << "-" << trace_counter_.fetch_add(1);
  return oss.str();
}

void Observability::ConnectionOpened() {
  connections_accepted_.fetch_add(1);
  connections_active_.fetch_add(1);
}

void Observability::ConnectionClosed() { connections_active_.fetch_sub(1); }

MetricsSnapshot Observability::Snapshot(std::uint64_t active_sessions, std::uint64_t queue_length) const {
  MetricsSnapshot snapshot;
  snapshot.connections_accepted = connections_accepted_.load();
  snapshot.connections_active = connections_active_.load();
  snapshot.frames_received = frames_received_.load();
  snapshot.frames_sent = frames_sent_.load();
  snapshot.malformed_frames = malformed_frames_.load();
  snapshot.rejected_messages = rejected_messages_.load();
  snapshot.sessions_created = sessions_created_.load();
  snapshot.backpressure_closes = backpressure_closes_.load();
  snapshot.heartbeat_timeouts = heartbeat_timeouts_.load();
  snapshot.request_total = request_total_.load();
  snapshot.request_errors = request_errors_.load();
  snapshot.active_sessions = active_sessions;
  snapshot.queue_length = queue_length;
  return snapshot;
}

void Observability::Log(LogLevel level, const LogContext& ctx) const {
  if (!Enabled(level)) {
    return;
  }
  nlohmann::json log_json;
  log_json["ts"] = ToIsoString(std::chrono::system_clock::now());
  log_json["level"] = std::string(ToString(level));
  log_json["event"] = ctx.event;
  if (!ctx.trace_id.empty()) {
    log_json["traceId"] = ctx.trace_id;
  }
  if (ctx.player) {
    log_json["player"] = *ctx.player;
  }
  if (ctx.session_id) {
    log_json["sessionId"] = *ctx.session_id;
  }
  if (!ctx.detail.empty()) {
    log_json["detail"] = ctx.detail;
  }
  // 여러 워커 스레드가 같은 스트림에 쓰므로 한 줄 단위로 직렬화한다.
  std::lock_guard<std::mutex> lock(sink_mutex_);
  sink_ << log_json.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << std::endl;
}

}  // namespace salvo
