#include "ltxlink/ltxlink.h"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <memory>
#include <sstream>

#include <cjson/cJSON.h>

namespace ltxlink {
namespace {

struct JsonDeleter {
  void operator()(cJSON* json) const { cJSON_Delete(json); }
};

using JsonPtr = std::unique_ptr<cJSON, JsonDeleter>;

constexpr double kMaxTimeUnits = 4294967295.0;

bool ReadInteger(const cJSON* item, double min_value, double max_value, long* out) {
  if (!cJSON_IsNumber(item)) {
    return false;
  }
  const double value = item->valuedouble;
  if (value != std::floor(value) || value < min_value || value > max_value) {
    return false;
  }
  *out = static_cast<long>(value);
  return true;
}

bool ReadTimeUnits(double value, uint32_t* out) {
  if (!std::isfinite(value) || value < 0.0) {
    return false;
  }
  const double rounded = std::round(value);
  if (rounded > kMaxTimeUnits) {
    return false;
  }
  *out = static_cast<uint32_t>(rounded);
  return true;
}

bool ParseTimeKey(const char* key, uint32_t* out) {
  if (!key || *key == '\0') {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const double value = std::strtod(key, &end);
  if (errno != 0 || end == key || *end != '\0') {
    return false;
  }
  return ReadTimeUnits(value, out);
}

bool ParseColor(const cJSON* item, Rgb* out) {
  if (!cJSON_IsArray(item) || cJSON_GetArraySize(item) != 3) {
    return false;
  }
  uint8_t channels[3] = {0, 0, 0};
  for (int i = 0; i < 3; ++i) {
    long value = 0;
    if (!ReadInteger(cJSON_GetArrayItem(item, i), 0, 255, &value)) {
      return false;
    }
    channels[i] = static_cast<uint8_t>(value);
  }
  out->r = channels[0];
  out->g = channels[1];
  out->b = channels[2];
  return true;
}

}  // namespace

bool ParseSequenceJson(const std::string& text,
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
  JsonPtr root(cJSON_Parse(text.c_str()));
  if (!root) {
    const char* where = cJSON_GetErrorPtr();
    std::string message = "invalid JSON";
    if (where && *where != '\0') {
      message += " near: ";
      message += std::string(where).substr(0, 32);
    }
    return fail(message);
  }
  if (!cJSON_IsObject(root.get())) {
    return fail("sequence document must be a JSON object");
  }

  SequenceProgram program;

  const cJSON* pixels = cJSON_GetObjectItemCaseSensitive(root.get(), "pixels");
  if (!pixels) {
    pixels = cJSON_GetObjectItemCaseSensitive(root.get(), "default_pixels");
  }
  if (pixels) {
    long value = 0;
    if (!ReadInteger(pixels, kMinPixelCount, kMaxPixelCount, &value)) {
      return fail("pixels must be an integer between 1 and 4");
    }
    program.pixel_count = static_cast<uint8_t>(value);
  }

  const cJSON* refresh_rate = cJSON_GetObjectItemCaseSensitive(root.get(), "refresh_rate");
  if (refresh_rate) {
    long value = 0;
    if (!ReadInteger(refresh_rate, 1, 0xffff, &value)) {
      return fail("refresh_rate must be an integer between 1 and 65535");
    }
    program.refresh_rate = static_cast<uint16_t>(value);
  }

  const cJSON* end_time = cJSON_GetObjectItemCaseSensitive(root.get(), "end_time");
  if (!end_time) {
    return fail("end_time is required");
  }
  if (!cJSON_IsNumber(end_time) ||
      !ReadTimeUnits(end_time->valuedouble, &program.end_time_units)) {
    return fail("end_time must be a non-negative number");
  }

  const cJSON* sequence = cJSON_GetObjectItemCaseSensitive(root.get(), "sequence");
  if (!cJSON_IsObject(sequence) || !sequence->child) {
    return fail("sequence must be a non-empty object");
  }
  const cJSON* entry = nullptr;
  cJSON_ArrayForEach(entry, sequence) {
    const std::string key = entry->string ? entry->string : "";
    ColorSample sample;
    if (!ParseTimeKey(entry->string, &sample.time_units)) {
      return fail("invalid sequence time: " + key);
    }
    if (!cJSON_IsObject(entry)) {
      return fail("sequence entry " + key + " must be an object");
    }
    if (!ParseColor(cJSON_GetObjectItemCaseSensitive(entry, "color"), &sample.color)) {
      return fail("sequence entry " + key + " needs color [r, g, b] with values 0-255");
    }
    sample.pixel_count = program.pixel_count;
    const cJSON* entry_pixels = cJSON_GetObjectItemCaseSensitive(entry, "pixels");
    if (entry_pixels) {
      long value = 0;
      if (!ReadInteger(entry_pixels, kMinPixelCount, kMaxPixelCount, &value)) {
        return fail("sequence entry " + key + " pixels must be between 1 and 4");
      }
      sample.pixel_count = static_cast<uint8_t>(value);
    }
    program.samples.push_back(sample);
  }

  std::stable_sort(program.samples.begin(), program.samples.end(),
                   [](const ColorSample& a, const ColorSample& b) {
                     return a.time_units < b.time_units;
                   });
  for (size_t i = 1; i < program.samples.size(); ++i) {
    if (program.samples[i].time_units == program.samples[i - 1].time_units) {
      return fail("duplicate sequence time: " +
                  std::to_string(program.samples[i].time_units));
    }
  }

  *out = std::move(program);
  return true;
}

bool LoadSequenceFile(const std::string& path,
                      SequenceProgram* out,
                      std::string* error) {
  std::ifstream stream(path, std::ios::in | std::ios::binary);
  if (!stream) {
    if (error) {
      *error = "failed to open sequence file: " + path + ": " + std::strerror(errno);
    }
    return false;
  }
  std::ostringstream contents;
  contents << stream.rdbuf();
  if (!ParseSequenceJson(contents.str(), out, error)) {
    if (error) {
      *error = path + ": " + *error;
    }
    return false;
  }
  return true;
}

}  // namespace ltxlink
