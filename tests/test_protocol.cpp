// Tests for request framing, length headers and roster decoding.
#include "adbtrack/adbtrack.h"

#include <gtest/gtest.h>

TEST(EncodeCommandTest, TrackDevicesRequest) {
  std::string frame;
  ASSERT_TRUE(adbtrack::EncodeCommand(adbtrack::kTrackDevicesCommand, &frame));
  EXPECT_EQ(frame, "0012host:track-devices");
}

TEST(EncodeCommandTest, UsesLowercaseZeroPaddedHex) {
  std::string frame;
  ASSERT_TRUE(adbtrack::EncodeCommand(std::string(255, 'x'), &frame));
  EXPECT_EQ(frame.substr(0, 4), "00ff");
  ASSERT_TRUE(adbtrack::EncodeCommand("", &frame));
  EXPECT_EQ(frame, "0000");
}

TEST(EncodeCommandTest, LengthCountsUtf8Bytes) {
  std::string frame;
  // "héllo" is six bytes in UTF-8.
  ASSERT_TRUE(adbtrack::EncodeCommand("h\xc3\xa9llo", &frame));
  EXPECT_EQ(frame.substr(0, 4), "0006");
}

TEST(EncodeCommandTest, LengthPrefixRoundTripsAtBoundaries) {
  for (size_t length : {size_t{0}, size_t{1}, size_t{0x1000}, adbtrack::kMaxFrameLength}) {
    std::string frame;
    ASSERT_TRUE(adbtrack::EncodeCommand(std::string(length, 'a'), &frame));
    size_t decoded = 0;
    ASSERT_TRUE(adbtrack::DecodeLengthPrefix(frame.substr(0, 4), &decoded));
    EXPECT_EQ(decoded, length);
    EXPECT_EQ(frame.size(), length + adbtrack::kLengthPrefixSize);
  }
}

TEST(EncodeCommandTest, RejectsOversizedCommand) {
  std::string frame = "untouched";
  adbtrack::Error error;
  EXPECT_FALSE(adbtrack::EncodeCommand(
      std::string(adbtrack::kMaxFrameLength + 1, 'a'), &frame, &error));
  EXPECT_EQ(error.code, adbtrack::ErrorCode::kProtocol);
  EXPECT_EQ(frame, "untouched");
}

TEST(DecodeLengthPrefixTest, AcceptsEitherCase) {
  size_t length = 0;
  ASSERT_TRUE(adbtrack::DecodeLengthPrefix("00ff", &length));
  EXPECT_EQ(length, 255u);
  ASSERT_TRUE(adbtrack::DecodeLengthPrefix("00FF", &length));
  EXPECT_EQ(length, 255u);
  ASSERT_TRUE(adbtrack::DecodeLengthPrefix("0000", &length));
  EXPECT_EQ(length, 0u);
}

TEST(DecodeLengthPrefixTest, RejectsMalformedHeaders) {
  size_t length = 0;
  EXPECT_FALSE(adbtrack::DecodeLengthPrefix("12g4", &length));
  EXPECT_FALSE(adbtrack::DecodeLengthPrefix("123", &length));
  EXPECT_FALSE(adbtrack::DecodeLengthPrefix("12345", &length));
  EXPECT_FALSE(adbtrack::DecodeLengthPrefix(" 123", &length));
  EXPECT_FALSE(adbtrack::DecodeLengthPrefix("OKAY", &length));
}

TEST(DeviceStatusTest, ParsesKnownTokensCaseInsensitively) {
  using adbtrack::DeviceStatus;
  EXPECT_EQ(adbtrack::ParseDeviceStatus("device"), DeviceStatus::kDevice);
  EXPECT_EQ(adbtrack::ParseDeviceStatus("DEVICE"), DeviceStatus::kDevice);
  EXPECT_EQ(adbtrack::ParseDeviceStatus("Offline"), DeviceStatus::kOffline);
  EXPECT_EQ(adbtrack::ParseDeviceStatus("unauthorized"), DeviceStatus::kUnauthorized);
  EXPECT_EQ(adbtrack::ParseDeviceStatus("authorizing"), DeviceStatus::kAuthorizing);
  EXPECT_EQ(adbtrack::ParseDeviceStatus("no-permissions"), DeviceStatus::kNoPermissions);
  EXPECT_EQ(adbtrack::ParseDeviceStatus("NO_PERMISSIONS"), DeviceStatus::kNoPermissions);
  EXPECT_EQ(adbtrack::ParseDeviceStatus("bootloader"), DeviceStatus::kBootloader);
  EXPECT_EQ(adbtrack::ParseDeviceStatus("recovery"), DeviceStatus::kRecovery);
}

TEST(DeviceStatusTest, UnknownTokensFallBack) {
  using adbtrack::DeviceStatus;
  EXPECT_EQ(adbtrack::ParseDeviceStatus("WEIRD"), DeviceStatus::kUnknown);
  EXPECT_EQ(adbtrack::ParseDeviceStatus("sideload"), DeviceStatus::kUnknown);
  EXPECT_EQ(adbtrack::ParseDeviceStatus(""), DeviceStatus::kUnknown);
}

TEST(DeviceStatusTest, NamesAreStable) {
  EXPECT_STREQ(adbtrack::DeviceStatusName(adbtrack::DeviceStatus::kDevice), "device");
  EXPECT_STREQ(adbtrack::DeviceStatusName(adbtrack::DeviceStatus::kNoPermissions),
               "no-permissions");
  EXPECT_STREQ(adbtrack::ErrorCodeName(adbtrack::ErrorCode::kCommandFailed),
               "command_failed");
  EXPECT_STREQ(adbtrack::ConnectionStateName(adbtrack::ConnectionState::kTracking),
               "tracking");
}

TEST(DecodeDeviceListTest, DropsMalformedLines) {
  std::vector<std::string> rejected;
  const auto devices = adbtrack::DecodeDeviceList(
      "dev1 device\njunk\ndev2\tunauthorized", &rejected);
  ASSERT_EQ(devices.size(), 2u);
  EXPECT_EQ(devices[0].id, "dev1");
  EXPECT_EQ(devices[0].status, adbtrack::DeviceStatus::kDevice);
  EXPECT_EQ(devices[1].id, "dev2");
  EXPECT_EQ(devices[1].status, adbtrack::DeviceStatus::kUnauthorized);
  ASSERT_EQ(rejected.size(), 1u);
  EXPECT_EQ(rejected[0], "junk");
}

TEST(DecodeDeviceListTest, UnknownStatusDecodesToUnknown) {
  const auto devices = adbtrack::DecodeDeviceList("dev1 WEIRD");
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].id, "dev1");
  EXPECT_EQ(devices[0].status, adbtrack::DeviceStatus::kUnknown);
}

TEST(DecodeDeviceListTest, SkipsBlankLinesAndTrimsWhitespace) {
  const auto devices = adbtrack::DecodeDeviceList(
      "\n   \nemulator-5554\tdevice\r\n  192.168.1.7:5555   offline  \n\n");
  ASSERT_EQ(devices.size(), 2u);
  EXPECT_EQ(devices[0].id, "emulator-5554");
  EXPECT_EQ(devices[1].id, "192.168.1.7:5555");
  EXPECT_EQ(devices[1].status, adbtrack::DeviceStatus::kOffline);
}

TEST(DecodeDeviceListTest, RejectsLinesWithExtraTokens) {
  std::vector<std::string> rejected;
  const auto devices = adbtrack::DecodeDeviceList(
      "abc no permissions (user in plugdev group)\nxyz device", &rejected);
  ASSERT_EQ(devices.size(), 1u);
  EXPECT_EQ(devices[0].id, "xyz");
  EXPECT_EQ(rejected.size(), 1u);
}

TEST(DecodeDeviceListTest, EmptyPayloadIsEmptyRoster) {
  EXPECT_TRUE(adbtrack::DecodeDeviceList("").empty());
}

TEST(DecodeDeviceListTest, PreservesServerOrderAndDuplicates) {
  const auto devices = adbtrack::DecodeDeviceList("b device\na offline\nb offline");
  ASSERT_EQ(devices.size(), 3u);
  EXPECT_EQ(devices[0].id, "b");
  EXPECT_EQ(devices[1].id, "a");
  EXPECT_EQ(devices[2].id, "b");
}
