// Example: set a ball's color or brightness directly.
#include "ltxlink/ltxlink.h"

#include <cstdlib>
#include <iostream>
#include <string>

namespace {

bool ParseByte(const char* text, uint8_t* out) {
  char* end = nullptr;
  const long value = std::strtol(text, &end, 10);
  if (end == text || *end != '\0' || value < 0 || value > 255) {
    return false;
  }
  *out = static_cast<uint8_t>(value);
  return true;
}

}  // namespace

int main(int argc, char** argv) {
  const std::string usage = std::string("usage: ") + argv[0] +
                            " <ball_address> color <r> <g> <b> | brightness <level>";
  if (argc < 4) {
    std::cerr << usage << std::endl;
    return 2;
  }
  const std::string address = argv[1];
  const std::string command = argv[2];

  ltxlink::Config config;
  ltxlink::PlaybackController controller(config, ltxlink::PlaybackController::SnapshotProvider());

  ltxlink::CommandResult result;
  if (command == "color" && argc == 6) {
    ltxlink::Rgb color;
    if (!ParseByte(argv[3], &color.r) || !ParseByte(argv[4], &color.g) ||
        !ParseByte(argv[5], &color.b)) {
      std::cerr << usage << std::endl;
      return 2;
    }
    result = controller.SendColor(address, color);
  } else if (command == "brightness" && argc == 4) {
    uint8_t level = 0;
    if (!ParseByte(argv[3], &level)) {
      std::cerr << usage << std::endl;
      return 2;
    }
    result = controller.SendBrightness(address, level);
  } else {
    std::cerr << usage << std::endl;
    return 2;
  }

  if (!result.ok()) {
    std::cerr << "Command failed: " << result.message << std::endl;
    return 1;
  }
  std::cout << "Sent " << command << " to " << address << std::endl;
  return 0;
}
