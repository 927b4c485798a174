#include <gtest/gtest.h>

#include "salvo/session_manager.hpp"
#include "test_peers.hpp"

namespace {

using salvo_test::MakePlayer;
using salvo_test::QuietObservability;
using salvo_test::RecordingPeer;

struct Pair {
  std::shared_ptr<RecordingPeer> first_peer = std::make_shared<RecordingPeer>();
  std::shared_ptr<RecordingPeer> second_peer = std::make_shared<RecordingPeer>();
  std::shared_ptr<salvo::Player> first;
  std::shared_ptr<salvo::Player> second;
};

Pair MakePair(std::uint64_t first_id, std::uint64_t second_id) {
  Pair pair;
  pair.first = MakePlayer(first_id, "p" + std::to_string(first_id), pair.first_peer);
  pair.second = MakePlayer(second_id, "p" + std::to_string(second_id), pair.second_peer);
  return pair;
}

}  // namespace

TEST(SessionManagerTest, AssignsIncreasingIdsAndIndexesPlayers) {
  salvo::SessionManager manager(QuietObservability());
  auto a = MakePair(1, 2);
  auto b = MakePair(3, 4);

  auto first = manager.CreateSession(a.first, a.second);
  auto second = manager.CreateSession(b.first, b.second);
  ASSERT_NE(first, nullptr);
  ASSERT_NE(second, nullptr);
  EXPECT_EQ(first->Id(), 1);
  EXPECT_EQ(second->Id(), 2);
  EXPECT_EQ(manager.ActiveSessionCount(), 2u);
  EXPECT_EQ(manager.Find(2), second);
  EXPECT_EQ(manager.FindByPlayer(3), second);
  EXPECT_TRUE(manager.IsPlayerInSession(1));
  EXPECT_FALSE(manager.IsPlayerInSession(5));
  EXPECT_EQ(a.first_peer->Types().front(), "session_start");
}

TEST(SessionManagerTest, RefusesPlayersAlreadyInSession) {
  salvo::SessionManager manager(QuietObservability());
  auto a = MakePair(1, 2);
  auto c = MakePair(3, 4);
  ASSERT_NE(manager.CreateSession(a.first, a.second), nullptr);

  EXPECT_EQ(manager.CreateSession(a.first, c.first), nullptr);
  EXPECT_EQ(manager.CreateSession(c.first, c.first), nullptr);
  EXPECT_TRUE(c.first_peer->Messages().empty());
  EXPECT_EQ(manager.ActiveSessionCount(), 1u);
}

TEST(SessionManagerTest, DispatchWithoutSessionReportsNotFound) {
  salvo::SessionManager manager(QuietObservability());
  std::string code;
  std::string message;
  EXPECT_FALSE(manager.Dispatch(42, salvo::ChatMessage{.text = "hi"}, code, message));
  EXPECT_EQ(code, "session_not_found");
}

TEST(SessionManagerTest, GameOverRemovesSessionImmediately) {
  salvo::SessionManager manager(QuietObservability());
  auto a = MakePair(1, 2);
  auto session = manager.CreateSession(a.first, a.second);
  std::string code;
  std::string message;
  ASSERT_TRUE(manager.Dispatch(1, salvo::SetupCompleteMessage{.player_num = 1}, code, message));
  ASSERT_TRUE(manager.Dispatch(2, salvo::SetupCompleteMessage{.player_num = 2}, code, message));
  ASSERT_TRUE(manager.Dispatch(2, salvo::GameOverMessage{.winner = 1}, code, message));

  EXPECT_EQ(manager.ActiveSessionCount(), 0u);
  EXPECT_EQ(manager.Find(session->Id()), nullptr);
  EXPECT_FALSE(manager.IsPlayerInSession(1));
  EXPECT_FALSE(manager.Dispatch(1, salvo::ShotMessage{.player_num = 1}, code, message));
  EXPECT_EQ(code, "session_not_found");
}

TEST(SessionManagerTest, DisconnectNotifiesOpponentAndRemovesSession) {
  salvo::SessionManager manager(QuietObservability());
  auto a = MakePair(1, 2);
  manager.CreateSession(a.first, a.second);

  manager.HandlePlayerDisconnect(2);
  manager.HandlePlayerDisconnect(2);

  EXPECT_EQ(a.first_peer->OfType<salvo::OpponentDisconnectedMessage>().size(), 1u);
  EXPECT_EQ(manager.ActiveSessionCount(), 0u);
  EXPECT_FALSE(manager.IsPlayerInSession(1));
}

TEST(SessionManagerTest, ShutdownAllEndsEverySession) {
  salvo::SessionManager manager(QuietObservability());
  auto a = MakePair(1, 2);
  auto b = MakePair(3, 4);
  auto first = manager.CreateSession(a.first, a.second);
  auto second = manager.CreateSession(b.first, b.second);

  manager.ShutdownAll();

  EXPECT_EQ(manager.ActiveSessionCount(), 0u);
  EXPECT_TRUE(first->IsOver());
  EXPECT_TRUE(second->IsOver());
}
