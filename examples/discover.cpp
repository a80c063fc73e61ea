// Example: listen for balls on the control port and print lifecycle events.
#include "ltxlink/ltxlink.h"

#include <iomanip>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
  ltxlink::Config config;
  if (argc > 1 && std::string(argv[1]) == "--raw") {
    config.capture_mode = ltxlink::CaptureMode::kRaw;
  }

  ltxlink::DeviceDiscovery discovery(config);
  discovery.SetDeviceEventCallback([](const ltxlink::DeviceEvent& event) {
    const auto& device = event.device;
    const char* type = "seen";
    switch (event.type) {
      case ltxlink::DeviceEventType::kSeen:
        type = "seen";
        break;
      case ltxlink::DeviceEventType::kUpdated:
        type = "updated";
        break;
      case ltxlink::DeviceEventType::kLost:
        type = "lost";
        break;
    }
    std::cout << "device " << type << ": " << device.address;
    if (device.echo.has_value()) {
      std::cout << " status=0x" << std::hex << std::setw(2) << std::setfill('0')
                << +device.echo->status << " ts=" << std::setw(2)
                << +device.echo->timestamp[0] << std::setw(2)
                << +device.echo->timestamp[1] << std::dec << std::setfill(' ');
    }
    std::cout << std::endl;
  });

  if (!discovery.Start()) {
    std::cerr << "Failed to start discovery: " << discovery.GetLastError() << std::endl;
    return 1;
  }
  std::cout << "Listening. Press Enter to stop." << std::endl;
  std::string line;
  std::getline(std::cin, line);
  discovery.Stop();

  const auto metrics = discovery.GetMetrics();
  std::cout << "packets=" << metrics.packets_received
            << " ignored=" << metrics.packets_ignored
            << " probes=" << metrics.probes_sent << std::endl;
  return 0;
}
