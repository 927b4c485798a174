/*
 * 설명: 매칭 대기열 입장/제거를 관리하고 페어링 시 세션을 원자적으로 생성한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/match_queue_test.cpp, server/tests/e2e/session_flow_test.cpp
 */
#include "salvo/match_queue.hpp"

#include <iterator>

namespace salvo {

MatchQueueService::MatchQueueService(std::shared_ptr<SessionManager> session_manager)
    : session_manager_(std::move(session_manager)) {}

bool MatchQueueService::EnqueueOrPair(const std::shared_ptr<Player>& player, std::shared_ptr<GameSession>& session,
                                      std::string& error_code, std::string& error_message) {
  session.reset();
  std::lock_guard<std::mutex> lock(mutex_);
  if (player_index_.count(player->id) > 0 || session_manager_->IsPlayerInSession(player->id)) {
    error_code = "queue_duplicate";
    error_message = "이미 대기열에 있거나 세션에 참여 중입니다";
    return false;
  }

  if (queue_.empty()) {
    queue_.push_back(player);
    player_index_[player->id] = std::prev(queue_.end());
    // 잠금 안에서 보내야 이후 페어링의 session_start보다 먼저 도착한다.
    if (player->peer) {
      player->peer->Send(WaitingForOpponentMessage{});
    }
    return true;
  }

  auto opponent = queue_.front();
  queue_.pop_front();
  player_index_.erase(opponent->id);
  session = session_manager_->CreateSession(opponent, player);
  if (!session) {
    // 세션을 만들 수 없으면 상대를 원래 자리로 되돌린다.
    queue_.push_front(opponent);
    player_index_[opponent->id] = queue_.begin();
    error_code = "session_create_failed";
    error_message = "세션을 생성할 수 없습니다";
    return false;
  }
  return true;
}

bool MatchQueueService::Remove(std::uint64_t player_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = player_index_.find(player_id);
  if (it == player_index_.end()) {
    return false;
  }
  queue_.erase(it->second);
  player_index_.erase(it);
  return true;
}

bool MatchQueueService::Contains(std::uint64_t player_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return player_index_.count(player_id) > 0;
}

std::size_t MatchQueueService::QueueLength() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

void MatchQueueService::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  queue_.clear();
  player_index_.clear();
}

}  // namespace salvo
