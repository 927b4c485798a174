#include <chrono>
#include <memory>
#include <sstream>
#include <thread>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/read.hpp>
#include <gtest/gtest.h>

#include "line_client.hpp"
#include "salvo/app.hpp"
#include "salvo/connection.hpp"

namespace {

using salvo_test::LineClient;

class ConnectionLimitsFixture : public ::testing::Test {
 protected:
  void StartServer(salvo::AppConfig config) {
    config_ = config;
    app_ = std::make_unique<salvo::ServerApp>(config_);
    server_thread_ = std::thread([this]() { app_->Run(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
  }

  void TearDown() override {
    if (app_) {
      app_->Stop();
    }
    if (server_thread_.joinable()) {
      server_thread_.join();
    }
  }

  std::unique_ptr<LineClient> Handshake(const std::string& name) {
    auto client = std::make_unique<LineClient>(config_.port);
    client->Send({{"name", name}});
    client->Expect("waiting_for_opponent");
    return client;
  }

  salvo::AppConfig config_;
  std::unique_ptr<salvo::ServerApp> app_;
  std::thread server_thread_;
};

struct LocalPair {
  boost::asio::io_context ioc;
  boost::asio::ip::tcp::socket client{ioc};
  boost::asio::ip::tcp::socket server{ioc};

  LocalPair() {
    boost::asio::ip::tcp::acceptor acceptor{ioc,
                                            boost::asio::ip::tcp::endpoint{boost::asio::ip::make_address("127.0.0.1"), 0}};
    client.connect(acceptor.local_endpoint());
    acceptor.accept(server);
  }
};

}  // namespace

TEST_F(ConnectionLimitsFixture, MalformedFrameIsAnsweredAndConnectionSurvives) {
  StartServer(salvo_test::TestConfig(19210));
  auto client = Handshake("alice");

  client->SendLine("this is not json");
  EXPECT_EQ(client->Expect("error")["code"], "malformed_message");

  client->Send({{"type", "teleport"}});
  client->Send({{"type", "ping"}});
  client->Expect("pong");

  auto snapshot = app_->GetObservability()->Snapshot(0, 0);
  EXPECT_EQ(snapshot.malformed_frames, 1u);
}

TEST_F(ConnectionLimitsFixture, SecondNameMessageIsInvalidState) {
  StartServer(salvo_test::TestConfig(19211));
  auto client = Handshake("alice");
  client->Send({{"name", "alice2"}});
  EXPECT_EQ(client->Expect("error")["code"], "invalid_state");
}

TEST_F(ConnectionLimitsFixture, OversizedFrameClosesConnection) {
  auto config = salvo_test::TestConfig(19212);
  config.max_frame_bytes = 256;
  StartServer(config);
  auto client = Handshake("alice");

  client->SendRaw(std::string(1024, 'x'));
  EXPECT_TRUE(client->WaitClosed());

  auto queue = app_->GetGameServer()->GetMatchQueue();
  EXPECT_TRUE(salvo_test::WaitUntil([&]() { return queue->QueueLength() == 0; }));
}

TEST_F(ConnectionLimitsFixture, IdleClientIsPingedThenTimedOut) {
  auto config = salvo_test::TestConfig(19213);
  config.heartbeat_interval_ms = 100;
  config.heartbeat_timeout_ms = 500;
  StartServer(config);
  auto client = Handshake("alice");

  client->Expect("ping");
  EXPECT_TRUE(client->WaitClosed(std::chrono::milliseconds(3000)));
  EXPECT_GE(app_->GetObservability()->Snapshot(0, 0).heartbeat_timeouts, 1u);
}

TEST_F(ConnectionLimitsFixture, AnsweringPingsKeepsConnectionAlive) {
  auto config = salvo_test::TestConfig(19214);
  config.heartbeat_interval_ms = 100;
  config.heartbeat_timeout_ms = 500;
  StartServer(config);
  auto client = Handshake("alice");

  auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(1200);
  while (std::chrono::steady_clock::now() < until) {
    auto message = client->Read(std::chrono::milliseconds(300));
    if (message && (*message)["type"] == "ping") {
      client->Send({{"type", "pong"}});
    }
    ASSERT_FALSE(client->Closed());
  }
}

TEST(ConnectionTest, SlowConsumerIsClosedForBackpressure) {
  LocalPair pair;
  std::ostringstream sink;
  auto observability = std::make_shared<salvo::Observability>(salvo::LogLevel::kError, sink);
  salvo::ConnectionLimits limits;
  limits.max_queue_messages = 4;
  limits.heartbeat_interval = std::chrono::milliseconds(60000);
  limits.heartbeat_timeout = std::chrono::milliseconds(120000);
  auto connection = std::make_shared<salvo::Connection>(std::move(pair.server), limits, observability);

  std::string close_reason;
  salvo::Connection::Callbacks callbacks;
  callbacks.on_closed = [&](const std::string& reason) { close_reason = reason; };
  connection->Start(std::move(callbacks));
  // 첫 쓰기 완료 전에 큐가 한도를 넘도록 한 번에 넣는다.
  for (int i = 0; i < 16; ++i) {
    connection->SendFrame(std::string(1024, 'x') + "\n");
  }
  pair.ioc.run_for(std::chrono::seconds(2));

  EXPECT_EQ(close_reason, "backpressure_exceeded");
  EXPECT_TRUE(connection->IsClosed());
  EXPECT_EQ(observability->Snapshot(0, 0).backpressure_closes, 1u);
}

TEST(ConnectionTest, GracefulCloseFlushesQueuedFrames) {
  LocalPair pair;
  std::ostringstream sink;
  auto observability = std::make_shared<salvo::Observability>(salvo::LogLevel::kError, sink);
  salvo::ConnectionLimits limits;
  limits.heartbeat_interval = std::chrono::milliseconds(60000);
  auto connection = std::make_shared<salvo::Connection>(std::move(pair.server), limits, observability);

  int closed_calls = 0;
  salvo::Connection::Callbacks callbacks;
  callbacks.on_closed = [&](const std::string&) { ++closed_calls; };
  connection->Start(std::move(callbacks));
  connection->SendFrame("first\n");
  connection->SendFrame("second\n");
  connection->Close("done");
  connection->Close("again");
  pair.ioc.run_for(std::chrono::seconds(1));

  std::string received;
  boost::system::error_code ec;
  boost::asio::read(pair.client, boost::asio::dynamic_buffer(received), ec);
  EXPECT_EQ(received, "first\nsecond\n");
  EXPECT_EQ(closed_calls, 1);
}
