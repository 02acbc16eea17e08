// Tests for configuration defaults and validation.
#include "adbtrack/adbtrack.h"

#include <gtest/gtest.h>

TEST(ConfigTest, DefaultsMatchExpected) {
  adbtrack::Config config;
  EXPECT_EQ(config.host, "127.0.0.1");
  EXPECT_EQ(config.port, 5037);
  EXPECT_EQ(config.max_payload_length, 0xffffu);
  EXPECT_EQ(config.max_buffered_bytes, 1u << 20);
  EXPECT_FALSE(config.read_failure_reason);
  EXPECT_FALSE(static_cast<bool>(config.log_callback));
}

TEST(ConfigValidationTest, AcceptsDefaults) {
  adbtrack::Config config;
  std::string error;
  EXPECT_TRUE(config.Validate(&error));
  EXPECT_TRUE(config.Validate());
}

TEST(ConfigValidationTest, RejectsEmptyHost) {
  adbtrack::Config config;
  config.host.clear();
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("host"), std::string::npos);
}

TEST(ConfigValidationTest, RejectsZeroPort) {
  adbtrack::Config config;
  config.port = 0;
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("port"), std::string::npos);
}

TEST(ConfigValidationTest, RejectsPayloadLimitOutOfRange) {
  adbtrack::Config config;
  config.max_payload_length = 0;
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("max_payload_length"), std::string::npos);

  config.max_payload_length = 0x10000;
  error.clear();
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("max_payload_length"), std::string::npos);
}

TEST(ConfigValidationTest, RejectsBufferSmallerThanOneFrame) {
  adbtrack::Config config;
  config.max_payload_length = 100;
  config.max_buffered_bytes = 103;
  std::string error;
  EXPECT_FALSE(config.Validate(&error));
  EXPECT_NE(error.find("max_buffered_bytes"), std::string::npos);

  config.max_buffered_bytes = 104;
  EXPECT_TRUE(config.Validate(&error));
}

TEST(ConfigValidationTest, TransportRefusesInvalidConfig) {
  adbtrack::Config config;
  config.port = 0;
  adbtrack::Transport transport(config);
  adbtrack::Error error;
  EXPECT_FALSE(transport.Connect(&error));
  EXPECT_EQ(error.code, adbtrack::ErrorCode::kInvalidConfig);
  EXPECT_FALSE(transport.IsConnected());
}

TEST(ConfigValidationTest, TrackerRefusesInvalidConfig) {
  adbtrack::Config config;
  config.host.clear();
  adbtrack::DeviceTracker tracker(config);
  adbtrack::Error error;
  EXPECT_FALSE(tracker.Start(&error));
  EXPECT_EQ(error.code, adbtrack::ErrorCode::kInvalidConfig);
  EXPECT_EQ(tracker.GetState(), adbtrack::ConnectionState::kIdle);
  EXPECT_FALSE(tracker.WaitForClose());
}
