/*
 * 설명: 플레이어 등록/조회/해제와 해제 시 대기열 및 세션 정리를 구현한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/player_registry_test.cpp, server/tests/e2e/session_flow_test.cpp
 */
#include "salvo/player_registry.hpp"

#include <algorithm>

namespace salvo {
namespace {
bool IsValidName(const std::string& name) {
  if (name.empty() || name.size() > PlayerRegistry::kMaxNameBytes) {
    return false;
  }
  return std::none_of(name.begin(), name.end(),
                      [](char c) { return static_cast<unsigned char>(c) < 0x20 || c == 0x7f; });
}
}  // namespace

PlayerRegistry::PlayerRegistry(std::shared_ptr<MatchQueueService> match_queue,
                               std::shared_ptr<SessionManager> session_manager,
                               std::shared_ptr<Observability> observability)
    : match_queue_(std::move(match_queue)), session_manager_(std::move(session_manager)),
      observability_(std::move(observability)) {}

std::shared_ptr<Player> PlayerRegistry::Register(const std::string& name, std::shared_ptr<Peer> peer,
                                                 std::string& error_code, std::string& error_message) {
  if (!IsValidName(name)) {
    error_code = "bad_handshake";
    error_message = "이름은 1~64바이트의 제어 문자가 없는 문자열이어야 합니다";
    return nullptr;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (players_.count(name) > 0) {
    error_code = "name_taken";
    error_message = "이미 사용 중인 이름입니다: " + name;
    return nullptr;
  }
  auto player = std::make_shared<Player>();
  player->id = next_player_id_++;
  player->name = name;
  player->peer = std::move(peer);
  players_[name] = player;
  return player;
}

std::shared_ptr<Player> PlayerRegistry::Lookup(const std::string& name) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = players_.find(name);
  if (it == players_.end()) {
    return nullptr;
  }
  return it->second;
}

bool PlayerRegistry::Unregister(const std::shared_ptr<Player>& player) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = players_.find(player->name);
  if (it == players_.end() || it->second->id != player->id) {
    return false;
  }
  // 대기열과 세션에서 먼저 빼야 등록 해제된 플레이어가 매칭되지 않는다.
  // 대기열에서 빠졌다면 세션에는 없다. 페어링과 해제는 대기열 잠금으로 직렬화된다.
  if (match_queue_->Remove(player->id)) {
    observability_->Log(LogLevel::kInfo, LogContext{.event = "dequeued", .player = player->name});
  } else {
    session_manager_->HandlePlayerDisconnect(player->id);
  }
  players_.erase(it);
  return true;
}

std::size_t PlayerRegistry::Count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return players_.size();
}

std::vector<std::shared_ptr<Player>> PlayerRegistry::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::shared_ptr<Player>> players;
  players.reserve(players_.size());
  for (const auto& entry : players_) {
    players.push_back(entry.second);
  }
  return players;
}

}  // namespace salvo
