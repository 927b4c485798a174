#include <cstdlib>
#include <string>

#include <gtest/gtest.h>

#include "salvo/config.hpp"

namespace {

class ScopedEnv {
 public:
  ScopedEnv(const char* key, const char* value) : key_(key) {
    const char* previous = std::getenv(key);
    if (previous) {
      previous_ = previous;
      had_previous_ = true;
    }
    setenv(key, value, 1);
  }

  ~ScopedEnv() {
    if (had_previous_) {
      setenv(key_, previous_.c_str(), 1);
    } else {
      unsetenv(key_);
    }
  }

 private:
  const char* key_;
  std::string previous_;
  bool had_previous_{false};
};

}  // namespace

TEST(ConfigTest, ReadsValuesFromEnvironment) {
  ScopedEnv port("SERVER_PORT", "19000");
  ScopedEnv legacy("LEGACY_PORT", "19001");
  ScopedEnv token("OPS_TOKEN", "secret");
  ScopedEnv queue("SEND_QUEUE_LIMIT_MESSAGES", "5");
  ScopedEnv heartbeat("HEARTBEAT_INTERVAL_MS", "250");

  auto config = salvo::LoadConfigFromEnv();
  EXPECT_EQ(config.port, 19000);
  EXPECT_EQ(config.legacy_port, 19001);
  EXPECT_EQ(config.ops_token, "secret");
  EXPECT_EQ(config.send_queue_limit_messages, 5u);
  EXPECT_EQ(config.heartbeat_interval_ms, 250u);
}

TEST(ConfigTest, FallsBackToDefaultsForUnparsableValues) {
  ScopedEnv port("SERVER_PORT", "not-a-port");
  ScopedEnv ops("OPS_PORT", "70000");
  ScopedEnv frame("MAX_FRAME_BYTES", "-12");
  ScopedEnv level("LOG_LEVEL", "chatty");

  salvo::AppConfig defaults;
  auto config = salvo::LoadConfigFromEnv();
  EXPECT_EQ(config.port, defaults.port);
  EXPECT_EQ(config.ops_port, defaults.ops_port);
  EXPECT_EQ(config.max_frame_bytes, defaults.max_frame_bytes);
  EXPECT_EQ(config.log_level, "info");
}
