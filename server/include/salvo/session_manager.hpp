/*
 * 설명: 진행 중인 게임 세션을 세션 ID와 플레이어 기준으로 보관하고 메시지/연결 종료를 세션에 전달한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/session_manager_test.cpp, server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "salvo/game_session.hpp"
#include "salvo/observability.hpp"
#include "salvo/player.hpp"

namespace salvo {

class SessionManager {
 public:
  explicit SessionManager(std::shared_ptr<Observability> observability);

  // 생성된 세션은 등록되기 전에 양쪽에 session_start를 보낸다. 같은 플레이어 두 명이나
  // 이미 세션에 속한 플레이어로는 만들지 않고 nullptr를 돌려준다.
  std::shared_ptr<GameSession> CreateSession(const std::shared_ptr<Player>& first,
                                             const std::shared_ptr<Player>& second);
  std::shared_ptr<GameSession> Find(int session_id) const;
  std::shared_ptr<GameSession> FindByPlayer(std::uint64_t player_id) const;
  bool IsPlayerInSession(std::uint64_t player_id) const;

  bool Dispatch(std::uint64_t player_id, const Message& message, std::string& error_code,
                std::string& error_message);
  void HandlePlayerDisconnect(std::uint64_t player_id);
  void ShutdownAll();
  std::size_t ActiveSessionCount() const;

 private:
  void Remove(const std::shared_ptr<GameSession>& session, const std::string& reason);

  std::shared_ptr<Observability> observability_;
  int next_session_id_{1};
  std::unordered_map<int, std::shared_ptr<GameSession>> sessions_;
  std::unordered_map<std::uint64_t, int> player_to_session_;
  mutable std::mutex mutex_;
};

}  // namespace salvo
