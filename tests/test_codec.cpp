// Tests for segment splitting, header fields and .prg encoding.
#include "ltxlink/test_hooks.h"

#include <gtest/gtest.h>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <iterator>

namespace {

ltxlink::Segment MakeSegment(uint32_t duration, ltxlink::Rgb color, uint8_t pixels = 4) {
  ltxlink::Segment segment;
  segment.duration_units = duration;
  segment.color = color;
  segment.pixel_count = pixels;
  return segment;
}

ltxlink::CompiledSequence Compile(const std::vector<ltxlink::Segment>& segments,
                                  uint8_t pixels = 4,
                                  uint16_t refresh_rate = 100) {
  ltxlink::CompiledSequence sequence;
  std::string error;
  EXPECT_TRUE(ltxlink::CompileSequence(segments, pixels, refresh_rate, &sequence, &error))
      << error;
  return sequence;
}

uint16_t Le16(const std::vector<uint8_t>& data, size_t offset) {
  return static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
}

const ltxlink::Rgb kRed{0xff, 0x00, 0x00};
const ltxlink::Rgb kGreen{0x00, 0xff, 0x00};
const ltxlink::Rgb kBlue{0x00, 0x00, 0xff};

}  // namespace

TEST(SplitSegmentsTest, ShortSegmentsPassThrough) {
  const std::vector<ltxlink::Segment> input = {MakeSegment(100, kRed),
                                               MakeSegment(65535, kBlue, 2)};
  const auto result = ltxlink::SplitSegments(input);
  ASSERT_EQ(result.size(), 2u);
  EXPECT_EQ(result[0].duration_units, 100u);
  EXPECT_EQ(result[1].duration_units, 65535u);
  EXPECT_EQ(result[1].pixel_count, 2);
}

TEST(SplitSegmentsTest, LongSegmentSplitsIntoFullPiecesAndRemainder) {
  const auto result = ltxlink::SplitSegments({MakeSegment(200000, kGreen, 3)});
  ASSERT_EQ(result.size(), 4u);
  uint32_t total = 0;
  for (size_t i = 0; i < 3; ++i) {
    EXPECT_EQ(result[i].duration_units, 65535u);
  }
  EXPECT_EQ(result[3].duration_units, 3395u);
  for (const auto& piece : result) {
    EXPECT_LE(piece.duration_units, ltxlink::kMaxSegmentDuration);
    EXPECT_EQ(piece.color, kGreen);
    EXPECT_EQ(piece.pixel_count, 3);
    total += piece.duration_units;
  }
  EXPECT_EQ(total, 200000u);
}

TEST(SplitSegmentsTest, ExactMultipleHasNoRemainder) {
  const auto result = ltxlink::SplitSegments({MakeSegment(65535 * 2, kRed)});
  ASSERT_EQ(result.size(), 2u);
  EXPECT_EQ(result[0].duration_units, 65535u);
  EXPECT_EQ(result[1].duration_units, 65535u);
}

TEST(HeaderFieldsTest, FittedValues) {
  auto fields = ltxlink::DeriveHeaderFields(100);
  EXPECT_EQ(fields.field_a, 1);
  EXPECT_EQ(fields.field_b, 0);

  fields = ltxlink::DeriveHeaderFields(1000);
  EXPECT_EQ(fields.field_a, 10);
  EXPECT_EQ(fields.field_b, 1000);

  fields = ltxlink::DeriveHeaderFields(1050);
  EXPECT_EQ(fields.field_a, 10);
  EXPECT_EQ(fields.field_b, 50);

  fields = ltxlink::DeriveHeaderFields(65);
  EXPECT_EQ(fields.field_a, 0);
  EXPECT_EQ(fields.field_b, 65);

  fields = ltxlink::DeriveHeaderFields(65535);
  EXPECT_EQ(fields.field_a, 655);
  EXPECT_EQ(fields.field_b, 35);
}

TEST(EncodeSequenceTest, SingleRedSegmentMatchesReferenceFile) {
  const auto sequence = Compile({MakeSegment(100, kRed)}, 4, 1);
  std::vector<uint8_t> bytes;
  std::string error;
  ASSERT_TRUE(ltxlink::EncodeSequence(sequence, &bytes, &error)) << error;
  ASSERT_EQ(bytes.size(), 357u);

  const std::vector<uint8_t> expected_prefix = {
      0x50, 0x52, 0x03, 0x49, 0x4e, 0x05, 0x00, 0x00, 0x00, 0x04, 0x00, 0x08,
      0x01, 0x00, 0x50, 0x49, 0x15, 0x00, 0x00, 0x00, 0x01, 0x00, 0x01, 0x00,
      0x64, 0x00, 0x33, 0x00, 0x00, 0x00, 0x00, 0x00, 0x04, 0x00, 0x01, 0x00,
      0x00, 0x64, 0x00, 0x00, 0x00, 0x43, 0x44, 0x30, 0x01, 0x00, 0x00, 0x64,
      0x00, 0x00, 0x00};
  ASSERT_EQ(expected_prefix.size(), 0x33u);
  EXPECT_TRUE(std::equal(expected_prefix.begin(), expected_prefix.end(), bytes.begin()));

  for (size_t i = 0; i < 100; ++i) {
    const size_t offset = 0x33 + i * 3;
    EXPECT_EQ(bytes[offset], 0xff);
    EXPECT_EQ(bytes[offset + 1], 0x00);
    EXPECT_EQ(bytes[offset + 2], 0x00);
  }
  const std::vector<uint8_t> footer = {0x42, 0x54, 0x00, 0x00, 0x00, 0x00};
  EXPECT_TRUE(std::equal(footer.begin(), footer.end(), bytes.end() - 6));
}

TEST(EncodeSequenceTest, LengthAndSentinelFollowSegmentCount) {
  for (size_t count = 1; count <= 5; ++count) {
    std::vector<ltxlink::Segment> segments;
    for (size_t i = 0; i < count; ++i) {
      segments.push_back(MakeSegment(50 + static_cast<uint32_t>(i) * 10, kBlue));
    }
    std::vector<uint8_t> bytes;
    ASSERT_TRUE(ltxlink::EncodeSequence(Compile(segments), &bytes));
    EXPECT_EQ(bytes.size(), 32 + 19 * count + 300 * count + 6);
    EXPECT_EQ(bytes[32 + 19 * count + 300 * count], ltxlink::kProgramSentinel);
  }
}

TEST(EncodeSequenceTest, EncodingIsDeterministic) {
  const auto sequence = Compile({MakeSegment(120, kRed), MakeSegment(40, kGreen, 1)});
  std::vector<uint8_t> first;
  std::vector<uint8_t> second;
  ASSERT_TRUE(ltxlink::EncodeSequence(sequence, &first));
  ASSERT_TRUE(ltxlink::EncodeSequence(sequence, &second));
  EXPECT_EQ(first, second);
}

TEST(EncodeSequenceTest, ThreeEqualSegmentsDescriptorTable) {
  const auto sequence =
      Compile({MakeSegment(100, kRed), MakeSegment(100, kGreen), MakeSegment(100, kBlue)});
  std::vector<uint8_t> bytes;
  ASSERT_TRUE(ltxlink::EncodeSequence(sequence, &bytes));

  EXPECT_EQ(Le16(bytes, 0x10), 0x3b);
  EXPECT_EQ(Le16(bytes, 0x14), 3);
  EXPECT_EQ(Le16(bytes, 0x1a), 89);

  const size_t first = 32;
  const size_t second = first + 19;
  const size_t terminal = second + 19;
  EXPECT_EQ(Le16(bytes, first + 9), 1);
  EXPECT_EQ(Le16(bytes, first + 13), 389);
  EXPECT_EQ(Le16(bytes, first + 17), 0);
  EXPECT_EQ(Le16(bytes, second + 9), 100);
  EXPECT_EQ(Le16(bytes, second + 13), 689);
  EXPECT_EQ(bytes[terminal + 9], 0x43);
  EXPECT_EQ(bytes[terminal + 10], 0x44);
  EXPECT_EQ(Le16(bytes, terminal + 11), 904);
  EXPECT_EQ(Le16(bytes, terminal + 15), 300);

  EXPECT_EQ(bytes[89], 0xff);
  EXPECT_EQ(bytes[389 + 1], 0xff);
  EXPECT_EQ(bytes[689 + 2], 0xff);
}

TEST(EncodeSequenceTest, DecodeRecoversSegments) {
  const std::vector<ltxlink::Segment> input = {
      MakeSegment(150000, kRed, 4), MakeSegment(250, kGreen, 2), MakeSegment(7, kBlue, 1)};
  const auto sequence = Compile(input, 3, 50);
  std::vector<uint8_t> bytes;
  ASSERT_TRUE(ltxlink::EncodeSequence(sequence, &bytes));

  ltxlink::test::DecodedProgram decoded;
  ASSERT_TRUE(ltxlink::test::DecodeProgram(bytes, &decoded));
  EXPECT_EQ(decoded.pixel_count, 3);
  EXPECT_EQ(decoded.refresh_rate, 50);
  EXPECT_EQ(decoded.segment_count, sequence.segments.size());
  EXPECT_EQ(decoded.segment_table_length, 2 + 19u * decoded.segment_count);
  ASSERT_EQ(decoded.segments.size(), sequence.segments.size());

  uint64_t total = 0;
  for (size_t i = 0; i < decoded.segments.size(); ++i) {
    EXPECT_EQ(decoded.segments[i].duration_units, sequence.segments[i].duration_units);
    EXPECT_EQ(decoded.segments[i].color, sequence.segments[i].color);
    EXPECT_EQ(decoded.segments[i].pixel_count, sequence.segments[i].pixel_count);
    total += decoded.segments[i].duration_units;
  }
  EXPECT_EQ(total, 150000u + 250u + 7u);
  EXPECT_EQ(decoded.header_fields.field_a, 655);
}

TEST(EncodeSequenceTest, InvalidSequenceLeavesOutputUntouched) {
  ltxlink::CompiledSequence sequence;
  sequence.pixel_count = 5;
  sequence.segments.push_back(MakeSegment(10, kRed));
  std::vector<uint8_t> bytes = {0xaa};
  std::string error;
  EXPECT_FALSE(ltxlink::EncodeSequence(sequence, &bytes, &error));
  EXPECT_NE(error.find("pixel_count"), std::string::npos);
  ASSERT_EQ(bytes.size(), 1u);
  EXPECT_EQ(bytes[0], 0xaa);

  sequence.pixel_count = 4;
  sequence.segments[0].duration_units = 70000;
  EXPECT_FALSE(ltxlink::EncodeSequence(sequence, &bytes, &error));
  EXPECT_NE(error.find("duration"), std::string::npos);

  sequence.segments.clear();
  EXPECT_FALSE(ltxlink::EncodeSequence(sequence, &bytes, &error));
  EXPECT_NE(error.find("at least one segment"), std::string::npos);
}

TEST(CompileSequenceTest, RejectsInvalidInput) {
  ltxlink::CompiledSequence sequence;
  std::string error;
  EXPECT_FALSE(ltxlink::CompileSequence({MakeSegment(0, kRed)}, 4, 100, &sequence, &error));
  EXPECT_NE(error.find("zero duration"), std::string::npos);

  EXPECT_FALSE(ltxlink::CompileSequence({MakeSegment(10, kRed, 0)}, 4, 100, &sequence, &error));
  EXPECT_NE(error.find("pixel_count"), std::string::npos);

  EXPECT_FALSE(ltxlink::CompileSequence({MakeSegment(10, kRed)}, 4, 0, &sequence, &error));
  EXPECT_NE(error.find("refresh_rate"), std::string::npos);

  EXPECT_FALSE(ltxlink::CompileSequence({}, 4, 100, &sequence, &error));
}

TEST(CompileSequenceTest, RejectsOversizedTable) {
  std::vector<ltxlink::Segment> segments(4000, MakeSegment(1, kRed));
  ltxlink::CompiledSequence sequence;
  std::string error;
  EXPECT_FALSE(ltxlink::CompileSequence(segments, 4, 100, &sequence, &error));
  EXPECT_NE(error.find("too many segments"), std::string::npos);
}

TEST(WriteProgramFileTest, WritesBytesToDisk) {
  std::vector<uint8_t> bytes;
  ASSERT_TRUE(ltxlink::EncodeSequence(Compile({MakeSegment(100, kRed)}), &bytes));
  const std::string path = ::testing::TempDir() + "ltxlink_write_test.prg";
  std::string error;
  ASSERT_TRUE(ltxlink::WriteProgramFile(path, bytes, &error)) << error;

  std::ifstream stream(path, std::ios::binary);
  std::vector<uint8_t> read((std::istreambuf_iterator<char>(stream)),
                            std::istreambuf_iterator<char>());
  EXPECT_EQ(read, bytes);
  std::remove(path.c_str());

  EXPECT_FALSE(ltxlink::WriteProgramFile("/nonexistent-dir/x.prg", bytes, &error));
  EXPECT_NE(error.find("failed to open"), std::string::npos);
}
