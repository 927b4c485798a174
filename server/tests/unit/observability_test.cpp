#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "salvo/observability.hpp"

TEST(ObservabilityTest, WritesOneJsonObjectPerLine) {
  std::ostringstream sink;
  salvo::Observability observability(salvo::LogLevel::kInfo, sink);
  observability.Log(salvo::LogLevel::kInfo,
                    salvo::LogContext{.event = "session_created", .player = "alice", .session_id = 3,
                                      .detail = "alice vs bob"});

  auto line = sink.str();
  ASSERT_FALSE(line.empty());
  EXPECT_EQ(line.back(), '\n');
  auto json = nlohmann::json::parse(line);
  EXPECT_EQ(json["level"], "info");
  EXPECT_EQ(json["event"], "session_created");
  EXPECT_EQ(json["player"], "alice");
  EXPECT_EQ(json["sessionId"], 3);
  EXPECT_EQ(json["detail"], "alice vs bob");
  EXPECT_TRUE(json.contains("ts"));
}

TEST(ObservabilityTest, DropsRecordsBelowMinimumLevel) {
  std::ostringstream sink;
  salvo::Observability observability(salvo::LogLevel::kWarn, sink);
  observability.Log(salvo::LogLevel::kInfo, salvo::LogContext{.event = "ignored"});
  EXPECT_TRUE(sink.str().empty());
  observability.Log(salvo::LogLevel::kError, salvo::LogContext{.event = "kept"});
  EXPECT_FALSE(sink.str().empty());
}

TEST(ObservabilityTest, ReplacesInvalidUtf8InsteadOfThrowing) {
  std::ostringstream sink;
  salvo::Observability observability(salvo::LogLevel::kDebug, sink);
  EXPECT_NO_THROW(observability.Log(salvo::LogLevel::kWarn,
                                    salvo::LogContext{.event = "bad_handshake", .detail = std::string("\xff\xfe")}));
  EXPECT_FALSE(sink.str().empty());
}

TEST(ObservabilityTest, CountersFeedSnapshot) {
  std::ostringstream sink;
  salvo::Observability observability(salvo::LogLevel::kError, sink);
  observability.ConnectionOpened();
  observability.ConnectionOpened();
  observability.ConnectionClosed();
  observability.FrameReceived();
  observability.MalformedFrame();
  observability.BackpressureClose();
  observability.SessionCreated();

  auto snapshot = observability.Snapshot(4, 1);
  EXPECT_EQ(snapshot.connections_accepted, 2u);
  EXPECT_EQ(snapshot.connections_active, 1u);
  EXPECT_EQ(snapshot.frames_received, 1u);
  EXPECT_EQ(snapshot.malformed_frames, 1u);
  EXPECT_EQ(snapshot.backpressure_closes, 1u);
  EXPECT_EQ(snapshot.sessions_created, 1u);
  EXPECT_EQ(snapshot.active_sessions, 4u);
  EXPECT_EQ(snapshot.queue_length, 1u);
}

TEST(ObservabilityTest, ParsesLogLevels) {
  EXPECT_EQ(salvo::ParseLogLevel("debug"), salvo::LogLevel::kDebug);
  EXPECT_EQ(salvo::ParseLogLevel("warn"), salvo::LogLevel::kWarn);
  EXPECT_FALSE(salvo::ParseLogLevel("loud").has_value());
}

TEST(ObservabilityTest, ConcurrentLoggingKeepsTimestampsIntact) {
  std::ostringstream sink;
  salvo::Observability observability(salvo::LogLevel::kInfo, sink);
  constexpr int kThreads = 4;
  constexpr int kRecordsPerThread = 200;
  std::vector<std::thread> threads;
  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&observability, t]() {
      for (int i = 0; i < kRecordsPerThread; ++i) {
        observability.Log(salvo::LogLevel::kInfo,
                          salvo::LogContext{.event = "tick", .detail = std::to_string(t) + ":" + std::to_string(i)});
      }
    });
  }
  for (auto& thread : threads) {
    thread.join();
  }

  std::istringstream lines(sink.str());
  std::string line;
  int count = 0;
  while (std::getline(lines, line)) {
    auto json = nlohmann::json::parse(line);
    auto ts = json["ts"].get<std::string>();
    ASSERT_EQ(ts.size(), 20u) << ts;
    EXPECT_EQ(ts[4], '-');
    EXPECT_EQ(ts[10], 'T');
    EXPECT_EQ(ts.back(), 'Z');
    ++count;
  }
  EXPECT_EQ(count, kThreads * kRecordsPerThread);
}
