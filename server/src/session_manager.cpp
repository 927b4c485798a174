/*
 * 설명: 세션 생성/조회/제거와 플레이어 메시지 및 연결 종료의 세션 전달을 조율한다.
 * 버전: v1.0.0
 * 관련 문서: design/protocol/contract.md
 * 테스트: server/tests/unit/session_manager_test.cpp, server/tests/e2e/session_flow_test.cpp
 */
#include "salvo/session_manager.hpp"

#include <vector>

namespace salvo {

SessionManager::SessionManager(std::shared_ptr<Observability> observability)
    : observability_(std::move(observability)) {}

std::shared_ptr<GameSession> SessionManager::CreateSession(const std::shared_ptr<Player>& first,
                                                           const std::shared_ptr<Player>& second) {
  if (!first || !second || first->id == second->id) {
    return nullptr;
  }
  std::shared_ptr<GameSession> session;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (player_to_session_.count(first->id) > 0 || player_to_session_.count(second->id) > 0) {
      return nullptr;
    }
    session = std::make_shared<GameSession>(next_session_id_++, first, second, observability_);
    // 등록 전에 session_start를 큐에 넣어 어떤 게임 메시지보다 먼저 전달되게 한다.
    session->Start();
    sessions_[session->Id()] = session;
    player_to_session_[first->id] = session->Id();
    player_to_session_[second->id] = session->Id();
  }
  observability_->SessionCreated();
  observability_->Log(LogLevel::kInfo,
                      LogContext{.event = "session_created",
                                 .session_id = session->Id(),
                                 .detail = first->name + " vs " + second->name});
  return session;
}

std::shared_ptr<GameSession> SessionManager::Find(int session_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = sessions_.find(session_id);
  if (it == sessions_.end()) {
    return nullptr;
  }
  return it->second;
}

std::shared_ptr<GameSession> SessionManager::FindByPlayer(std::uint64_t player_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = player_to_session_.find(player_id);
  if (it == player_to_session_.end()) {
    return nullptr;
  }
  auto session_it = sessions_.find(it->second);
  if (session_it == sessions_.end()) {
    return nullptr;
  }
  return session_it->second;
}

bool SessionManager::IsPlayerInSession(std::uint64_t player_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return player_to_session_.count(player_id) > 0;
}

bool SessionManager::Dispatch(std::uint64_t player_id, const Message& message, std::string& error_code,
                              std::string& error_message) {
  auto session = FindByPlayer(player_id);
  if (!session) {
    error_code = "session_not_found";
    error_message = "참여 중인 세션이 없습니다";
    return false;
  }
  bool accepted = session->HandleMessage(player_id, message, error_code, error_message);
  if (session->IsOver()) {
    Remove(session, "game_over");
  }
  return accepted;
}

void SessionManager::HandlePlayerDisconnect(std::uint64_t player_id) {
  auto session = FindByPlayer(player_id);
  if (!session) {
    return;
  }
  session->HandleDisconnect(player_id);
  Remove(session, "player_disconnected");
}

void SessionManager::ShutdownAll() {
  std::vector<std::shared_ptr<GameSession>> sessions;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions.reserve(sessions_.size());
    for (const auto& entry : sessions_) {
      sessions.push_back(entry.second);
    }
  }
  for (const auto& session : sessions) {
    session->Shutdown();
    Remove(session, "shutdown");
  }
}

std::size_t SessionManager::ActiveSessionCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return sessions_.size();
}

void SessionManager::Remove(const std::shared_ptr<GameSession>& session, const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.erase(session->Id()) == 0) {
      return;
    }
    for (int slot = 1; slot <= 2; ++slot) {
      auto player = session->PlayerAt(slot);
      auto it = player_to_session_.find(player->id);
      if (it != player_to_session_.end() && it->second == session->Id()) {
        player_to_session_.erase(it);
      }
    }
  }
  observability_->Log(LogLevel::kInfo,
                      LogContext{.event = "session_removed", .session_id = session->Id(), .detail = reason});
}

}  // namespace salvo
