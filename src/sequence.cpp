#include "ltxlink/ltxlink.h"

#include <cmath>
#include <limits>

namespace ltxlink {

bool ResampleProgram(const SequenceProgram& program,
                     uint16_t refresh_rate,
                     SequenceProgram* out,
                     std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!out) {
    return fail("output program is null");
  }
  if (refresh_rate == 0) {
    return fail("refresh_rate must be positive");
  }
  if (program.refresh_rate == 0) {
    return fail("source refresh_rate must be positive");
  }
  if (refresh_rate == program.refresh_rate) {
    *out = program;
    return true;
  }
  const double scale = static_cast<double>(refresh_rate) / program.refresh_rate;
  auto rescale = [scale](uint32_t units, uint32_t* scaled) {
    const double value = std::round(units * scale);
    if (value > static_cast<double>(std::numeric_limits<uint32_t>::max())) {
      return false;
    }
    *scaled = static_cast<uint32_t>(value);
    return true;
  };

  SequenceProgram result;
  result.pixel_count = program.pixel_count;
  result.refresh_rate = refresh_rate;
  if (!rescale(program.end_time_units, &result.end_time_units)) {
    return fail("end_time " + std::to_string(program.end_time_units) +
                " overflows 32 bits at refresh_rate " + std::to_string(refresh_rate));
  }
  result.samples.reserve(program.samples.size());
  for (const auto& sample : program.samples) {
    ColorSample scaled = sample;
    if (!rescale(sample.time_units, &scaled.time_units)) {
      return fail("sample at " + std::to_string(sample.time_units) +
                  " overflows 32 bits at refresh_rate " + std::to_string(refresh_rate));
    }
    if (!result.samples.empty() &&
        result.samples.back().time_units == scaled.time_units) {
      result.samples.back() = scaled;
      continue;
    }
    result.samples.push_back(scaled);
  }
  *out = std::move(result);
  return true;
}

bool BuildSegments(const SequenceProgram& program,
                   std::vector<Segment>* out,
                   std::string* error) {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (!out) {
    return fail("output segments are null");
  }
  if (program.pixel_count < kMinPixelCount || program.pixel_count > kMaxPixelCount) {
    return fail("pixel_count must be between 1 and 4");
  }
  if (program.samples.empty()) {
    return fail("sequence must contain at least one sample");
  }
  std::vector<Segment> segments;
  segments.reserve(program.samples.size());
  for (size_t i = 0; i < program.samples.size(); ++i) {
    const ColorSample& sample = program.samples[i];
    if (sample.pixel_count < kMinPixelCount || sample.pixel_count > kMaxPixelCount) {
      return fail("sample at " + std::to_string(sample.time_units) +
                  " has pixel_count outside 1-4");
    }
    const bool last = i + 1 == program.samples.size();
    const uint32_t next_time =
        last ? program.end_time_units : program.samples[i + 1].time_units;
    if (next_time <= sample.time_units) {
      if (last) {
        return fail("end_time must be after the last sample");
      }
      return fail("sample times must be strictly ascending");
    }
    Segment segment;
    segment.duration_units = next_time - sample.time_units;
    segment.color = sample.color;
    segment.pixel_count = sample.pixel_count;
    segments.push_back(segment);
  }
  *out = std::move(segments);
  return true;
}

}  // namespace ltxlink
