/*
 * 설명: 서버 환경설정 로딩과 기본값을 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/config_test.cpp, server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <string>

namespace salvo {

struct AppConfig {
  unsigned short port{9000};
  unsigned short legacy_port{0};
  unsigned short ops_port{8081};
  std::string ops_token;
  std::string log_level{"info"};
  std::size_t send_queue_limit_messages{64};
  std::size_t send_queue_limit_bytes{262144};
  std::size_t max_frame_bytes{8192};
  std::size_t heartbeat_interval_ms{5000};
  std::size_t heartbeat_timeout_ms{15000};
  std::size_t worker_threads{0};
};

AppConfig LoadConfigFromEnv();

}  // namespace salvo
