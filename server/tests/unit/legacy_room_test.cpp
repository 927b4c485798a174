#include <deque>

#include <gtest/gtest.h>

#include "salvo/legacy_room.hpp"
#include "test_peers.hpp"

namespace {

class RecordingLegacyClient : public salvo::LegacyClient {
 public:
  void SendLine(const std::string& line) override { lines.push_back(line); }
  void Close() override { closed = true; }

  std::vector<std::string> Take() {
    auto out = lines;
    lines.clear();
    return out;
  }

  std::vector<std::string> lines;
  bool closed{false};
};

class LegacyRoomFixture : public ::testing::Test {
 protected:
  LegacyRoomFixture()
      : room_(
            [this](int, int) {
              if (outcomes_.empty()) {
                return salvo::ShotOutcome::kMiss;
              }
              auto next = outcomes_.front();
              outcomes_.pop_front();
              return next;
            },
            salvo_test::QuietObservability()) {}

  void SeatBoth() {
    ASSERT_EQ(room_.Join(first_), 1);
    ASSERT_EQ(room_.Join(second_), 2);
  }

  void StartBattle() {
    SeatBoth();
    ASSERT_TRUE(room_.HandleLine(1, "SHIPS|"));
    ASSERT_TRUE(room_.HandleLine(2, "SHIPS|"));
    ASSERT_EQ(room_.CurrentPhase(), salvo::LegacyRoom::Phase::kBattle);
    first_->Take();
    second_->Take();
  }

  std::deque<salvo::ShotOutcome> outcomes_;
  salvo::LegacyRoom room_;
  std::shared_ptr<RecordingLegacyClient> first_ = std::make_shared<RecordingLegacyClient>();
  std::shared_ptr<RecordingLegacyClient> second_ = std::make_shared<RecordingLegacyClient>();
};

}  // namespace

TEST(LegacyProtocolTest, ParsesCommands) {
  auto fire = salvo::ParseLegacyCommand("FIRE 3 4|");
  ASSERT_TRUE(fire.has_value());
  EXPECT_EQ(fire->type, salvo::LegacyCommandType::kFire);
  EXPECT_EQ(fire->row, 3);
  EXPECT_EQ(fire->col, 4);

  auto piped = salvo::ParseLegacyCommand("FIRE|7|8");
  ASSERT_TRUE(piped.has_value());
  EXPECT_EQ(piped->row, 7);
  EXPECT_EQ(piped->col, 8);

  auto quit = salvo::ParseLegacyCommand("QUIT|2");
  ASSERT_TRUE(quit.has_value());
  EXPECT_EQ(quit->type, salvo::LegacyCommandType::kQuit);
  EXPECT_EQ(quit->player_id, 2);

  EXPECT_EQ(salvo::ParseLegacyCommand("SHIPS")->type, salvo::LegacyCommandType::kShips);
  EXPECT_EQ(salvo::ParseLegacyCommand("PING|")->type, salvo::LegacyCommandType::kPing);
  EXPECT_FALSE(salvo::ParseLegacyCommand("FIRE x 4|").has_value());
  EXPECT_FALSE(salvo::ParseLegacyCommand("FIRE 3|").has_value());
  EXPECT_FALSE(salvo::ParseLegacyCommand("DANCE|").has_value());
  EXPECT_FALSE(salvo::ParseLegacyCommand("").has_value());
}

TEST(LegacyProtocolTest, FormatsServerLines) {
  EXPECT_EQ(salvo::FormatPlayer(1), "PLAYER|1");
  EXPECT_EQ(salvo::FormatStart(2), "START|2");
  EXPECT_EQ(salvo::FormatShot(1, 3, 4, salvo::ShotOutcome::kHit), "SHOT|1|3|4|hit");
  EXPECT_EQ(salvo::FormatError("room_full"), "ERROR|room_full");
  EXPECT_EQ(salvo::FormatQuit(2), "QUIT|2");
}

TEST_F(LegacyRoomFixture, FirstJoinerWaits) {
  EXPECT_EQ(room_.Join(first_), 1);
  EXPECT_EQ(first_->Take(), (std::vector<std::string>{"PLAYER|1", "WAIT|"}));
  EXPECT_EQ(room_.CurrentPhase(), salvo::LegacyRoom::Phase::kWaiting);
}

TEST_F(LegacyRoomFixture, PlacementRunsInSeatOrder) {
  SeatBoth();
  EXPECT_EQ(first_->Take(), (std::vector<std::string>{"PLAYER|1", "WAIT|", "SHIPS", "YOURPLACEMENT|"}));
  EXPECT_EQ(second_->Take(), (std::vector<std::string>{"PLAYER|2", "SHIPS", "WAIT|"}));

  EXPECT_TRUE(room_.HandleLine(2, "SHIPS|"));
  EXPECT_EQ(second_->Take(), (std::vector<std::string>{"ERROR|not_your_placement"}));

  EXPECT_TRUE(room_.HandleLine(1, "SHIPS|"));
  EXPECT_EQ(first_->Take(), (std::vector<std::string>{"WAIT|"}));
  EXPECT_EQ(second_->Take(), (std::vector<std::string>{"YOURPLACEMENT|"}));

  EXPECT_TRUE(room_.HandleLine(2, "SHIPS|"));
  EXPECT_EQ(first_->Take(), (std::vector<std::string>{"START|1"}));
  EXPECT_EQ(second_->Take(), (std::vector<std::string>{"START|1"}));
  EXPECT_EQ(room_.CurrentTurn(), 1);
}

TEST_F(LegacyRoomFixture, ThirdConnectionIsRefused) {
  SeatBoth();
  auto third = std::make_shared<RecordingLegacyClient>();
  EXPECT_EQ(room_.Join(third), 0);
  EXPECT_EQ(third->Take(), (std::vector<std::string>{"ERROR|room_full"}));
  EXPECT_TRUE(third->closed);
  EXPECT_EQ(room_.Occupants(), 2);
}

TEST_F(LegacyRoomFixture, FireBeforeStartIsRejected) {
  SeatBoth();
  first_->Take();
  room_.HandleLine(1, "FIRE 0 0|");
  EXPECT_EQ(first_->Take(), (std::vector<std::string>{"ERROR|not_started"}));
}

TEST_F(LegacyRoomFixture, HitKeepsTurnAndMissPassesIt) {
  StartBattle();
  outcomes_ = {salvo::ShotOutcome::kHit, salvo::ShotOutcome::kMiss};

  room_.HandleLine(1, "FIRE 3 4|");
  EXPECT_EQ(second_->Take(), (std::vector<std::string>{"SHOT|1|3|4|hit"}));
  EXPECT_EQ(room_.CurrentTurn(), 1);

  room_.HandleLine(1, "FIRE 3 5|");
  EXPECT_EQ(second_->Take(), (std::vector<std::string>{"SHOT|1|3|5|miss", "START|2"}));
  EXPECT_EQ(first_->Take(), (std::vector<std::string>{"SHOT|1|3|4|hit", "SHOT|1|3|5|miss", "START|2"}));
  EXPECT_EQ(room_.CurrentTurn(), 2);
}

TEST_F(LegacyRoomFixture, RejectsOutOfTurnAndOffBoardShots) {
  StartBattle();
  room_.HandleLine(2, "FIRE 1 1|");
  EXPECT_EQ(second_->Take(), (std::vector<std::string>{"ERROR|not_your_turn"}));
  room_.HandleLine(1, "FIRE 10 0|");
  room_.HandleLine(1, "FIRE 0 -1|");
  EXPECT_EQ(first_->Take(), (std::vector<std::string>{"ERROR|bad_cell", "ERROR|bad_cell"}));
  room_.HandleLine(1, "LAUNCH|");
  EXPECT_EQ(first_->Take(), (std::vector<std::string>{"ERROR|bad_command"}));
}

TEST_F(LegacyRoomFixture, PingIsAnswered) {
  room_.Join(first_);
  first_->Take();
  room_.HandleLine(1, "PING|");
  EXPECT_EQ(first_->Take(), (std::vector<std::string>{"PONG|"}));
}

TEST_F(LegacyRoomFixture, QuitNotifiesOpponentAndResetsRoom) {
  StartBattle();
  EXPECT_FALSE(room_.HandleLine(2, "QUIT|2"));
  EXPECT_TRUE(second_->closed);
  EXPECT_EQ(first_->Take(), (std::vector<std::string>{"QUIT|2", "WAIT|"}));
  EXPECT_EQ(room_.CurrentPhase(), salvo::LegacyRoom::Phase::kWaiting);
  EXPECT_EQ(room_.Occupants(), 1);

  room_.Leave(2);
  EXPECT_TRUE(first_->Take().empty());

  auto replacement = std::make_shared<RecordingLegacyClient>();
  EXPECT_EQ(room_.Join(replacement), 2);
  EXPECT_EQ(room_.CurrentPhase(), salvo::LegacyRoom::Phase::kPlacement);
}
