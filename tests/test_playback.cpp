// Tests for the play/stop state machine and redundant control commands.
#include "ltxlink/test_hooks.h"

#include <gtest/gtest.h>

namespace {

struct SentCommand {
  std::vector<uint8_t> data;
  std::string address;
  uint16_t port = 0;
};

class FakeTransport : public ltxlink::CommandTransport {
 public:
  FakeTransport(std::vector<SentCommand>* sent, const bool* fail) : sent_(sent), fail_(fail) {}

  bool Send(const std::vector<uint8_t>& data,
            const std::string& address,
            uint16_t port,
            std::string* error) override {
    if (fail_ && *fail_) {
      if (error) {
        *error = "simulated failure";
      }
      return false;
    }
    sent_->push_back({data, address, port});
    return true;
  }

 private:
  std::vector<SentCommand>* sent_;
  const bool* fail_;
};

ltxlink::DeviceRecord MakeRecord(uint8_t ts0, uint8_t ts1) {
  ltxlink::DeviceRecord record;
  record.address = "10.0.0.5";
  ltxlink::EchoFields echo;
  echo.timestamp = {ts0, ts1};
  record.echo = echo;
  return record;
}

struct Harness {
  explicit Harness(ltxlink::Config config = ltxlink::Config()) {
    config.log_callback = [](const std::string&) {};
    controller.reset(new ltxlink::PlaybackController(
        config,
        [this]() { return record; },
        std::unique_ptr<ltxlink::CommandTransport>(new FakeTransport(&sent, &fail))));
  }

  std::vector<SentCommand> sent;
  bool fail = false;
  std::optional<ltxlink::DeviceRecord> record;
  std::unique_ptr<ltxlink::PlaybackController> controller;
};

}  // namespace

TEST(PlaybackTest, PlayWithoutStatusIsRejected) {
  Harness harness;
  const auto result = harness.controller->Play();
  EXPECT_EQ(result.status, ltxlink::CommandStatus::kNoDeviceStatus);
  EXPECT_TRUE(harness.sent.empty());
  EXPECT_FALSE(harness.controller->GetSession().assumed_playing);

  ltxlink::DeviceRecord no_echo;
  no_echo.address = "10.0.0.5";
  harness.record = no_echo;
  EXPECT_EQ(harness.controller->Play().status, ltxlink::CommandStatus::kNoDeviceStatus);
}

TEST(PlaybackTest, PlayThenStopAdvancesOpId) {
  Harness harness;
  harness.record = MakeRecord(0xab, 0xcd);

  ASSERT_TRUE(harness.controller->Play().ok());
  ASSERT_EQ(harness.sent.size(), 1u);
  const auto& play = harness.sent[0].data;
  ASSERT_EQ(play.size(), 9u);
  EXPECT_EQ(play[0], 0x61);
  EXPECT_EQ(play[1], 0x14);
  EXPECT_EQ(play[2], 0x01);
  EXPECT_GE(play[5], 0x01);
  EXPECT_LE(play[5], 0xfe);
  EXPECT_GE(play[6], 0x01);
  EXPECT_LE(play[6], 0xfe);
  EXPECT_EQ(play[7], 0xab);
  EXPECT_EQ(play[8], 0xcd);
  EXPECT_EQ(harness.sent[0].address, "255.255.255.255");
  EXPECT_EQ(harness.sent[0].port, ltxlink::kControlPort);

  auto session = harness.controller->GetSession();
  EXPECT_TRUE(session.assumed_playing);
  EXPECT_EQ(session.last_playing_op_id.value(), 0x14);

  harness.record = MakeRecord(0x01, 0x02);
  ASSERT_TRUE(harness.controller->Stop().ok());
  ASSERT_EQ(harness.sent.size(), 2u);
  EXPECT_EQ(harness.sent[1].data,
            ltxlink::test::BuildStopCommand(0x1e, {0x01, 0x02}));

  session = harness.controller->GetSession();
  EXPECT_FALSE(session.assumed_playing);
  EXPECT_EQ(session.next_play_op_id, 0x28);

  ASSERT_TRUE(harness.controller->Play().ok());
  EXPECT_EQ(harness.sent[2].data[1], 0x28);
}

TEST(PlaybackTest, OpIdWrapSkipsZero) {
  Harness harness;
  harness.record = MakeRecord(0, 0);

  // The twelfth play uses 0xf0; the next one wraps to 0x04.
  std::vector<uint8_t> play_ids;
  for (int i = 0; i < 14; ++i) {
    ASSERT_TRUE(harness.controller->Play().ok());
    play_ids.push_back(harness.sent.back().data[1]);
    ASSERT_TRUE(harness.controller->Stop().ok());
  }
  for (const uint8_t id : play_ids) {
    EXPECT_NE(id, 0x00);
  }
  EXPECT_EQ(play_ids[11], 0xf0);
  EXPECT_EQ(play_ids[12], 0x04);
  EXPECT_EQ(play_ids[13], 0x18);
}

TEST(PlaybackTest, OpIdThatWouldWrapToZeroRestarts) {
  Harness harness;
  harness.record = MakeRecord(0, 0);

  // 0xec + 0x14 wraps to 0x00, which is skipped.
  bool saw_ec = false;
  for (int i = 0; i < 256 && !saw_ec; ++i) {
    ASSERT_TRUE(harness.controller->Play().ok());
    saw_ec = harness.sent.back().data[1] == 0xec;
    ASSERT_TRUE(harness.controller->Stop().ok());
  }
  ASSERT_TRUE(saw_ec);
  EXPECT_EQ(harness.controller->GetSession().next_play_op_id, 0x14);
}

TEST(PlaybackTest, InvalidStateTransitions) {
  Harness harness;
  harness.record = MakeRecord(0, 0);

  EXPECT_EQ(harness.controller->Stop().status, ltxlink::CommandStatus::kInvalidState);
  ASSERT_TRUE(harness.controller->Play().ok());
  EXPECT_EQ(harness.controller->Play().status, ltxlink::CommandStatus::kInvalidState);
  EXPECT_EQ(harness.sent.size(), 1u);
}

TEST(PlaybackTest, SendFailureLeavesSessionUnchanged) {
  Harness harness;
  harness.record = MakeRecord(0, 0);
  harness.fail = true;

  EXPECT_EQ(harness.controller->Play().status, ltxlink::CommandStatus::kSendFailed);
  auto session = harness.controller->GetSession();
  EXPECT_FALSE(session.assumed_playing);
  EXPECT_EQ(session.next_play_op_id, 0x14);

  harness.fail = false;
  ASSERT_TRUE(harness.controller->Play().ok());
  harness.fail = true;
  EXPECT_EQ(harness.controller->Stop().status, ltxlink::CommandStatus::kSendFailed);
  session = harness.controller->GetSession();
  EXPECT_TRUE(session.assumed_playing);
  EXPECT_EQ(session.last_playing_op_id.value(), 0x14);
}

TEST(PlaybackTest, ConfirmStoppedAdvancesWithoutSending) {
  Harness harness;
  harness.record = MakeRecord(0, 0);

  harness.controller->ConfirmStopped();
  EXPECT_EQ(harness.controller->GetSession().next_play_op_id, 0x14);

  ASSERT_TRUE(harness.controller->Play().ok());
  harness.controller->ConfirmStopped();
  const auto session = harness.controller->GetSession();
  EXPECT_FALSE(session.assumed_playing);
  EXPECT_EQ(session.next_play_op_id, 0x28);
  EXPECT_EQ(harness.sent.size(), 1u);
}

TEST(PlaybackTest, StopWithZeroTail) {
  ltxlink::Config config;
  config.stop_echoes_timestamp = false;
  Harness harness(config);
  harness.record = MakeRecord(0x55, 0x66);

  ASSERT_TRUE(harness.controller->Play().ok());
  harness.record.reset();
  ASSERT_TRUE(harness.controller->Stop().ok());
  EXPECT_EQ(harness.sent.back().data, ltxlink::test::BuildStopCommand(0x1e, {0x00, 0x00}));
}

TEST(PlaybackTest, StopEchoingTimestampNeedsStatus) {
  Harness harness;
  harness.record = MakeRecord(0x55, 0x66);
  ASSERT_TRUE(harness.controller->Play().ok());
  harness.record.reset();
  EXPECT_EQ(harness.controller->Stop().status, ltxlink::CommandStatus::kNoDeviceStatus);
  EXPECT_TRUE(harness.controller->GetSession().assumed_playing);
}

TEST(ControlCommandTest, ColorSentSixTimesWithPrefixes) {
  Harness harness;
  ASSERT_TRUE(harness.controller->SendColor("10.0.0.5", {1, 2, 3}).ok());
  ASSERT_EQ(harness.sent.size(), 6u);
  const std::vector<uint8_t> prefixes = {0x1e, 0x19, 0x14, 0x0f, 0x0a, 0x05};
  for (size_t i = 0; i < prefixes.size(); ++i) {
    EXPECT_EQ(harness.sent[i].data, ltxlink::test::BuildColorCommand(prefixes[i], {1, 2, 3}));
    EXPECT_EQ(harness.sent[i].address, "10.0.0.5");
    EXPECT_EQ(harness.sent[i].port, ltxlink::kControlPort);
  }
  EXPECT_FALSE(harness.controller->GetSession().assumed_playing);
}

TEST(ControlCommandTest, BrightnessSentSixTimes) {
  Harness harness;
  ASSERT_TRUE(harness.controller->SendBrightness("10.0.0.5", 0x40).ok());
  ASSERT_EQ(harness.sent.size(), 6u);
  EXPECT_EQ(harness.sent[0].data, ltxlink::test::BuildBrightnessCommand(0x1e, 0x40));
  EXPECT_EQ(harness.sent[5].data, ltxlink::test::BuildBrightnessCommand(0x05, 0x40));
}

TEST(ControlCommandTest, RejectsInvalidAddressAndReportsFailure) {
  Harness harness;
  EXPECT_EQ(harness.controller->SendColor("ball", {0, 0, 0}).status,
            ltxlink::CommandStatus::kInvalidArgument);
  EXPECT_TRUE(harness.sent.empty());

  harness.fail = true;
  EXPECT_EQ(harness.controller->SendBrightness("10.0.0.5", 1).status,
            ltxlink::CommandStatus::kSendFailed);
}
