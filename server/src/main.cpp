/*
 * 설명: 서버 진입점으로 환경설정을 로드해 실행한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/e2e/session_flow_test.cpp
 */
#include "salvo/app.hpp"

int main() {
  using namespace salvo;
  AppConfig config = LoadConfigFromEnv();
  ServerApp app(config);
  // SIGINT/SIGTERM은 ServerApp 내부의 signal_set이 처리한다.
  return app.Run() ? 0 : 1;
}
