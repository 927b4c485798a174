/*
 * 설명: 상대를 기다리는 플레이어의 FIFO 대기열을 관리하고 두 명이 모이면 세션을 생성한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/match_queue_test.cpp, server/tests/e2e/session_flow_test.cpp
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "salvo/player.hpp"
#include "salvo/session_manager.hpp"

namespace salvo {

class MatchQueueService {
 public:
  explicit MatchQueueService(std::shared_ptr<SessionManager> session_manager);

  // 대기열이 비어 있으면 player를 뒤에 넣고 waiting_for_opponent를 보내며 session은 nullptr로 남긴다.
  // 상대가 있으면 맨 앞을 꺼내 같은 잠금 안에서 세션을 만든다. 먼저 기다린 쪽이 슬롯 1이다.
  bool EnqueueOrPair(const std::shared_ptr<Player>& player, std::shared_ptr<GameSession>& session,
                     std::string& error_code, std::string& error_message);
  bool Remove(std::uint64_t player_id);
  bool Contains(std::uint64_t player_id) const;
  std::size_t QueueLength() const;
  void Clear();

 private:
  using Entry = std::shared_ptr<Player>;

  std::shared_ptr<SessionManager> session_manager_;
  std::list<Entry> queue_;
  std::unordered_map<std::uint64_t, std::list<Entry>::iterator> player_index_;
  mutable std::mutex mutex_;
};

}  // namespace salvo
