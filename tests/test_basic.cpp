// Basic sanity tests for protocol constants and format sizes.
#include "ltxlink/ltxlink.h"

#include <gtest/gtest.h>

#include <cstring>

TEST(BasicTest, WellKnownPorts) {
  EXPECT_EQ(ltxlink::kControlPort, 41412);
  EXPECT_EQ(ltxlink::kUploadPort, 8888);
}

TEST(BasicTest, DeviceIdentifier) {
  EXPECT_EQ(std::strlen(ltxlink::kDeviceIdentifier), 12u);
  EXPECT_STREQ(ltxlink::kDeviceIdentifier, "NPLAYLTXBALL");
}

TEST(BasicTest, CommandOpcodes) {
  EXPECT_EQ(static_cast<uint8_t>(ltxlink::CommandOpcode::kColor), 0x0a);
  EXPECT_EQ(static_cast<uint8_t>(ltxlink::CommandOpcode::kBrightness), 0x10);
}

TEST(BasicTest, EncodedProgramSize) {
  EXPECT_EQ(ltxlink::EncodedProgramSize(1), 357u);
  EXPECT_EQ(ltxlink::EncodedProgramSize(3), 32u + 3 * 19 + 3 * 300 + 6);
}

TEST(BasicTest, DefaultSessionStartsIdle) {
  ltxlink::PlaybackSession session;
  EXPECT_EQ(session.next_play_op_id, 0x14);
  EXPECT_FALSE(session.last_playing_op_id.has_value());
  EXPECT_FALSE(session.assumed_playing);
}
