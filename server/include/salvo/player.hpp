/*
 * 설명: 연결된 플레이어의 식별 정보와 메시지 송신 인터페이스를 정의한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/player_registry_test.cpp, server/tests/unit/game_session_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "salvo/message.hpp"

namespace salvo {

// 연결 하나에 대한 송신 측 핸들. Send/Close는 어느 스레드에서 호출해도 안전해야 한다.
class Peer {
 public:
  virtual ~Peer() = default;

  virtual void Send(const Message& message) = 0;
  virtual void Close(const std::string& reason) = 0;
};

struct Player {
  std::uint64_t id{0};
  std::string name;
  std::shared_ptr<Peer> peer;
};

}  // namespace salvo
