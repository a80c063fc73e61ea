// Example: discover a ball, upload a .prg program, then trigger play and stop.
#include "ltxlink/ltxlink.h"

#include <chrono>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "usage: " << argv[0] << " <program.prg> [ball_address]" << std::endl;
    return 2;
  }
  const std::string path = argv[1];

  ltxlink::Config config;
  config.verbose = true;

  ltxlink::DeviceDiscovery discovery(config);
  if (!discovery.Start()) {
    std::cerr << "Failed to start discovery: " << discovery.GetLastError() << std::endl;
    return 1;
  }

  std::cout << "Waiting for devices (5s)..." << std::endl;
  if (!discovery.WaitForDevice(std::chrono::seconds(5)) && argc < 3) {
    std::cerr << "No ball found" << std::endl;
    return 1;
  }
  std::string address = argc > 2 ? argv[2] : std::string();
  if (address.empty()) {
    const auto devices = discovery.GetDevices();
    if (devices.empty()) {
      std::cerr << "Ball went away before upload" << std::endl;
      return 1;
    }
    address = devices.front().address;
  }

  ltxlink::SequenceUploader uploader(config);
  const auto upload = uploader.UploadFile(address, path);
  if (upload.uncertain()) {
    std::cout << "Upload not acknowledged (" << upload.message
              << "); the ball may still have stored it" << std::endl;
  } else if (!upload.ok()) {
    std::cerr << "Upload failed: " << upload.message << std::endl;
    return 1;
  } else {
    std::cout << "Uploaded " << path << " to " << address << std::endl;
  }

  ltxlink::PlaybackController controller(config, discovery);
  const auto play = controller.Play();
  if (!play.ok()) {
    std::cerr << "Play failed: " << play.message << std::endl;
    return 1;
  }
  std::cout << "Playing. Press Enter to stop." << std::endl;
  std::string line;
  std::getline(std::cin, line);

  const auto stop = controller.Stop();
  if (!stop.ok()) {
    std::cerr << "Stop failed: " << stop.message << std::endl;
  }
  discovery.Stop();
  return stop.ok() ? 0 : 1;
}
