/*
 * 설명: 표시 이름 기준으로 접속 중인 플레이어를 관리하고 연결 종료 시 대기열/세션 정리를 일괄 수행한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/player_registry_test.cpp, server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "salvo/match_queue.hpp"
#include "salvo/observability.hpp"
#include "salvo/player.hpp"
#include "salvo/session_manager.hpp"

namespace salvo {

class PlayerRegistry {
 public:
  static constexpr std::size_t kMaxNameBytes = 64;

  PlayerRegistry(std::shared_ptr<MatchQueueService> match_queue, std::shared_ptr<SessionManager> session_manager,
                 std::shared_ptr<Observability> observability);

  // 이름 확인과 등록은 한 번의 잠금 안에서 이뤄진다. 실패 시 name_taken 또는 bad_handshake.
  std::shared_ptr<Player> Register(const std::string& name, std::shared_ptr<Peer> peer, std::string& error_code,
                                   std::string& error_message);
  std::shared_ptr<Player> Lookup(const std::string& name) const;
  // 등록 해제, 대기열 제거, 세션 종료 통지를 다른 호출자가 중간 상태를 볼 수 없도록 함께 수행한다.
  bool Unregister(const std::shared_ptr<Player>& player);
  std::size_t Count() const;
  std::vector<std::shared_ptr<Player>> Snapshot() const;

 private:
  std::shared_ptr<MatchQueueService> match_queue_;
  std::shared_ptr<SessionManager> session_manager_;
  std::shared_ptr<Observability> observability_;
  std::uint64_t next_player_id_{1};
  std::unordered_map<std::string, std::shared_ptr<Player>> players_;
  mutable std::mutex mutex_;
};

}  // namespace salvo
