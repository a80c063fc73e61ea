#include "ltxlink/ltxlink.h"
#include "ltxlink/test_hooks.h"
#include "internal.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>

namespace ltxlink {
namespace {

using internal::AppendBe16;
using internal::AppendLe16;
using internal::AppendLe32;

constexpr uint8_t kSignature[8] = {0x50, 0x52, 0x03, 0x49, 0x4e, 0x05, 0x00, 0x00};
constexpr uint8_t kSignatureConst[2] = {0x00, 0x08};
constexpr uint8_t kRefreshMarker[2] = {0x50, 0x49};  // "PI"
constexpr uint8_t kDescriptorMarker[3] = {0x01, 0x00, 0x00};
constexpr uint8_t kTerminalMarker[2] = {0x43, 0x44};  // "CD"
constexpr uint8_t kFooter[kProgramFooterSize] = {kProgramSentinel, 0x54, 0x00, 0x00, 0x00, 0x00};

constexpr uint16_t kRgbRepetitions = kColorBlockSize / 3;
constexpr uint32_t kHeaderFieldBase = 100;
constexpr uint32_t kHeaderFieldThreshold = 1000;
constexpr uint32_t kSegmentTableBase = 2;
constexpr uint32_t kTerminalIntroBase = 4;

constexpr size_t kOffsetPixelCount = 0x08;
constexpr size_t kOffsetRefreshRate = 0x0c;
constexpr size_t kOffsetTableLength = 0x10;
constexpr size_t kOffsetSegmentCount = 0x14;
constexpr size_t kOffsetFieldA = 0x16;
constexpr size_t kOffsetColorStart = 0x1a;
constexpr size_t kOffsetFieldB = 0x1e;
constexpr size_t kOffsetDescriptorPixels = 0x00;
constexpr size_t kOffsetDescriptorDuration = 0x05;

void Append(std::vector<uint8_t>& data, const uint8_t* bytes, size_t length) {
  data.insert(data.end(), bytes, bytes + length);
}

bool IsValidPixelCount(uint32_t pixel_count) {
  return pixel_count >= kMinPixelCount && pixel_count <= kMaxPixelCount;
}

// Largest table whose color data start still fits the 16-bit header field.
constexpr size_t kMaxSegmentCount =
    (0xffff - kProgramHeaderSize) / kSegmentDescriptorSize;

bool ValidateSequence(const CompiledSequence& sequence, std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!IsValidPixelCount(sequence.pixel_count)) {
    return fail("pixel_count must be between 1 and 4");
  }
  if (sequence.refresh_rate == 0) {
    return fail("refresh_rate must be positive");
  }
  if (sequence.segments.empty()) {
    return fail("sequence must contain at least one segment");
  }
  if (sequence.segments.size() > kMaxSegmentCount) {
    return fail("sequence has too many segments");
  }
  for (size_t i = 0; i < sequence.segments.size(); ++i) {
    const Segment& segment = sequence.segments[i];
    if (!IsValidPixelCount(segment.pixel_count)) {
      return fail("segment " + std::to_string(i) + " pixel_count must be between 1 and 4");
    }
    if (segment.duration_units == 0 || segment.duration_units > kMaxSegmentDuration) {
      return fail("segment " + std::to_string(i) + " duration must be between 1 and 65535");
    }
  }
  return true;
}

// Second pair of an intermediate descriptor.
uint16_t IntroPart(const std::vector<Segment>& segments, size_t index) {
  const uint32_t duration = segments[index].duration_units;
  if (index == 0) {
    return 1;
  }
  if (duration == segments[index - 1].duration_units) {
    return static_cast<uint16_t>(duration);
  }
  return static_cast<uint16_t>(index + 1);
}

// Trailing field of an intermediate descriptor, keyed on the next duration.
uint16_t NextDurationField(uint32_t duration, uint32_t next_duration) {
  if (next_duration < kHeaderFieldBase) {
    return static_cast<uint16_t>(next_duration);
  }
  if (next_duration == kHeaderFieldBase || duration == kHeaderFieldBase) {
    return 0;
  }
  return static_cast<uint16_t>(next_duration);
}

void AppendDescriptorStart(std::vector<uint8_t>& data, const Segment& segment) {
  AppendLe16(data, segment.pixel_count);
  Append(data, kDescriptorMarker, sizeof(kDescriptorMarker));
  AppendLe16(data, segment.duration_units);
  AppendLe16(data, 0);
}

void AppendIntermediateDescriptor(std::vector<uint8_t>& data,
                                  const std::vector<Segment>& segments,
                                  size_t index,
                                  uint32_t color_start) {
  const Segment& segment = segments[index];
  AppendDescriptorStart(data, segment);
  AppendLe16(data, IntroPart(segments, index));
  AppendLe16(data, segment.duration_units);
  // Offset of the next segment's color block.
  AppendLe16(data, static_cast<uint32_t>(color_start + kColorBlockSize * (index + 1)) & 0xffff);
  AppendLe16(data, 0);
  AppendLe16(data, NextDurationField(segment.duration_units,
                                     segments[index + 1].duration_units));
}

void AppendTerminalDescriptor(std::vector<uint8_t>& data,
                              const Segment& segment,
                              size_t segment_count) {
  AppendDescriptorStart(data, segment);
  Append(data, kTerminalMarker, sizeof(kTerminalMarker));
  AppendLe16(data,
             static_cast<uint32_t>(kColorBlockSize * segment_count + kTerminalIntroBase) & 0xffff);
  AppendLe16(data, 0);
  AppendLe16(data, static_cast<uint32_t>(kRgbRepetitions * segment_count) & 0xffff);
  AppendLe16(data, 0);
}

}  // namespace

std::vector<Segment> SplitSegments(const std::vector<Segment>& segments) {
  std::vector<Segment> result;
  result.reserve(segments.size());
  for (const auto& segment : segments) {
    if (segment.duration_units <= kMaxSegmentDuration) {
      result.push_back(segment);
      continue;
    }
    Segment piece = segment;
    piece.duration_units = kMaxSegmentDuration;
    const uint32_t full_pieces = segment.duration_units / kMaxSegmentDuration;
    const uint32_t remainder = segment.duration_units % kMaxSegmentDuration;
    result.insert(result.end(), full_pieces, piece);
    if (remainder > 0) {
      piece.duration_units = remainder;
      result.push_back(piece);
    }
  }
  return result;
}

HeaderFields DeriveHeaderFields(uint32_t first_segment_duration) {
  HeaderFields fields;
  const uint32_t quotient = first_segment_duration / kHeaderFieldBase;
  const uint32_t remainder = first_segment_duration - quotient * kHeaderFieldBase;
  fields.field_a = static_cast<uint16_t>(quotient);
  if (remainder == 0 && first_segment_duration >= kHeaderFieldThreshold) {
    fields.field_b = static_cast<uint16_t>(first_segment_duration & 0xffff);
  } else {
    fields.field_b = static_cast<uint16_t>(remainder);
  }
  return fields;
}

bool CompileSequence(const std::vector<Segment>& segments,
                     uint8_t pixel_count,
                     uint16_t refresh_rate,
                     CompiledSequence* out,
                     std::string* error) {
  if (!out) {
    if (error) {
      *error = "output sequence is null";
    }
    return false;
  }
  for (size_t i = 0; i < segments.size(); ++i) {
    if (segments[i].duration_units == 0) {
      if (error) {
        *error = "segment " + std::to_string(i) + " has zero duration";
      }
      return false;
    }
  }
  CompiledSequence compiled;
  compiled.pixel_count = pixel_count;
  compiled.refresh_rate = refresh_rate;
  compiled.segments = SplitSegments(segments);
  if (!ValidateSequence(compiled, error)) {
    return false;
  }
  *out = std::move(compiled);
  return true;
}

size_t EncodedProgramSize(size_t segment_count) {
  return kProgramHeaderSize + segment_count * (kSegmentDescriptorSize + kColorBlockSize) +
         kProgramFooterSize;
}

bool EncodeSequence(const CompiledSequence& sequence,
                    std::vector<uint8_t>* out,
                    std::string* error) {
  if (!out) {
    if (error) {
      *error = "output buffer is null";
    }
    return false;
  }
  if (!ValidateSequence(sequence, error)) {
    return false;
  }
  const auto& segments = sequence.segments;
  const size_t count = segments.size();
  const uint32_t table_length =
      kSegmentTableBase + static_cast<uint32_t>(count * kSegmentDescriptorSize);
  const uint32_t color_start =
      static_cast<uint32_t>(kProgramHeaderSize + count * kSegmentDescriptorSize);
  const HeaderFields fields = DeriveHeaderFields(segments.front().duration_units);

  std::vector<uint8_t> data;
  data.reserve(EncodedProgramSize(count));

  Append(data, kSignature, sizeof(kSignature));
  // The only big-endian field in the file.
  AppendBe16(data, sequence.pixel_count);
  Append(data, kSignatureConst, sizeof(kSignatureConst));
  AppendLe16(data, sequence.refresh_rate);
  Append(data, kRefreshMarker, sizeof(kRefreshMarker));

  AppendLe32(data, table_length);
  AppendLe16(data, static_cast<uint32_t>(count));
  AppendLe16(data, fields.field_a);
  AppendLe16(data, kRgbRepetitions);
  AppendLe16(data, color_start);
  AppendLe16(data, 0);
  AppendLe16(data, fields.field_b);

  for (size_t i = 0; i + 1 < count; ++i) {
    AppendIntermediateDescriptor(data, segments, i, color_start);
  }
  AppendTerminalDescriptor(data, segments.back(), count);

  for (const auto& segment : segments) {
    for (uint16_t i = 0; i < kRgbRepetitions; ++i) {
      data.push_back(segment.color.r);
      data.push_back(segment.color.g);
      data.push_back(segment.color.b);
    }
  }
  Append(data, kFooter, sizeof(kFooter));

  *out = std::move(data);
  return true;
}

bool WriteProgramFile(const std::string& path,
                      const std::vector<uint8_t>& bytes,
                      std::string* error) {
  std::ofstream stream(path, std::ios::binary | std::ios::out | std::ios::trunc);
  if (!stream) {
    if (error) {
      *error = "failed to open program file: " + path + ": " + std::strerror(errno);
    }
    return false;
  }
  stream.write(reinterpret_cast<const char*>(bytes.data()),
               static_cast<std::streamsize>(bytes.size()));
  stream.close();
  if (!stream) {
    if (error) {
      *error = "failed to write program file: " + path;
    }
    return false;
  }
  return true;
}

#ifdef LTXLINK_TESTING
namespace test {

bool DecodeProgram(const std::vector<uint8_t>& data, DecodedProgram* out) {
  using internal::ReadBe16;
  using internal::ReadLe16;
  using internal::ReadLe32;
  if (!out || data.size() < kProgramHeaderSize ||
      std::memcmp(data.data(), kSignature, sizeof(kSignature)) != 0) {
    return false;
  }
  const uint8_t* bytes = data.data();
  DecodedProgram decoded;
  decoded.pixel_count = static_cast<uint8_t>(ReadBe16(bytes, kOffsetPixelCount));
  decoded.refresh_rate = ReadLe16(bytes, kOffsetRefreshRate);
  decoded.segment_table_length = ReadLe32(bytes, kOffsetTableLength);
  decoded.segment_count = ReadLe16(bytes, kOffsetSegmentCount);
  decoded.header_fields.field_a = ReadLe16(bytes, kOffsetFieldA);
  decoded.header_fields.field_b = ReadLe16(bytes, kOffsetFieldB);
  decoded.color_start = ReadLe16(bytes, kOffsetColorStart);
  if (data.size() != EncodedProgramSize(decoded.segment_count) ||
      decoded.color_start !=
          kProgramHeaderSize + decoded.segment_count * kSegmentDescriptorSize) {
    return false;
  }
  for (size_t i = 0; i < decoded.segment_count; ++i) {
    const size_t descriptor = kProgramHeaderSize + i * kSegmentDescriptorSize;
    const size_t block = decoded.color_start + i * kColorBlockSize;
    Segment segment;
    segment.pixel_count =
        static_cast<uint8_t>(ReadLe16(bytes, descriptor + kOffsetDescriptorPixels));
    segment.duration_units = ReadLe16(bytes, descriptor + kOffsetDescriptorDuration);
    segment.color = {bytes[block], bytes[block + 1], bytes[block + 2]};
    decoded.segments.push_back(segment);
  }
  *out = std::move(decoded);
  return true;
}

}  // namespace test
#endif

}  // namespace ltxlink
