#include "internal.h"

#include <cerrno>
#include <cstring>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>

#include <arpa/inet.h>
#include <sys/select.h>
#include <unistd.h>

namespace ltxlink {
namespace internal {

void LogError(const std::string& message, const Config* config) {
  if (config && config->log_callback) {
    config->log_callback(message);
    return;
  }
  std::cerr << "[ltxlink] " << message << std::endl;
}

void LogInfo(const std::string& message, const Config* config) {
  if (!config || !config->verbose) {
    return;
  }
  LogError(message, config);
}

void LogCallbackError(const char* name, const Config* config) {
  std::string message = "callback threw exception: ";
  message += name;
  LogError(message, config);
}

bool IsValidIpv4(const std::string& address) {
  if (address.empty()) {
    return false;
  }
  in_addr parsed{};
  return inet_pton(AF_INET, address.c_str(), &parsed) == 1;
}

// Convert a string address and port into a sockaddr_in.
sockaddr_in MakeSockaddr(const std::string& address, uint16_t port) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(port);
  if (address.empty() || address == "0.0.0.0") {
    addr.sin_addr.s_addr = htonl(INADDR_ANY);
  } else {
    if (inet_pton(AF_INET, address.c_str(), &addr.sin_addr) != 1) {
      addr.sin_addr.s_addr = htonl(INADDR_ANY);
    }
  }
  return addr;
}

std::string AddrToString(const sockaddr_in& addr) {
  char buffer[INET_ADDRSTRLEN] = {0};
  if (inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer)) != nullptr) {
    return buffer;
  }
  return {};
}

std::string AddrToString(uint32_t network_order_ipv4) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = network_order_ipv4;
  return AddrToString(addr);
}

void AppendLe16(std::vector<uint8_t>& data, uint32_t value) {
  data.push_back(static_cast<uint8_t>(value & 0xff));
  data.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
}

void AppendLe32(std::vector<uint8_t>& data, uint32_t value) {
  data.push_back(static_cast<uint8_t>(value & 0xff));
  data.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
  data.push_back(static_cast<uint8_t>((value >> 16) & 0xff));
  data.push_back(static_cast<uint8_t>((value >> 24) & 0xff));
}

void AppendBe16(std::vector<uint8_t>& data, uint32_t value) {
  data.push_back(static_cast<uint8_t>((value >> 8) & 0xff));
  data.push_back(static_cast<uint8_t>(value & 0xff));
}

uint16_t ReadLe16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
}

uint32_t ReadLe32(const uint8_t* data, size_t offset) {
  return static_cast<uint32_t>(data[offset]) |
         (static_cast<uint32_t>(data[offset + 1]) << 8) |
         (static_cast<uint32_t>(data[offset + 2]) << 16) |
         (static_cast<uint32_t>(data[offset + 3]) << 24);
}

uint16_t ReadBe16(const uint8_t* data, size_t offset) {
  return static_cast<uint16_t>((data[offset] << 8) | data[offset + 1]);
}

uint8_t RandomByte(uint8_t min_value, uint8_t max_value) {
  static std::mutex mutex;
  static std::mt19937 engine{std::random_device{}()};
  std::uniform_int_distribution<int> dist(min_value, max_value);
  std::lock_guard<std::mutex> lock(mutex);
  return static_cast<uint8_t>(dist(engine));
}

bool UdpSocket::Open(uint16_t port, const std::string& bind_address,
                     bool allow_broadcast) {
  if (fd_ >= 0) {
    return true;
  }
  fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
  if (fd_ < 0) {
    last_error_ = "socket() failed: " + std::string(std::strerror(errno));
    return false;
  }
  int reuse = 1;
  if (::setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) {
    last_error_ = "setsockopt(SO_REUSEADDR) failed: " + std::string(std::strerror(errno));
    Close();
    return false;
  }
  if (allow_broadcast) {
    int broadcast = 1;
    if (::setsockopt(fd_, SOL_SOCKET, SO_BROADCAST, &broadcast, sizeof(broadcast)) < 0) {
      last_error_ = "setsockopt(SO_BROADCAST) failed: " + std::string(std::strerror(errno));
      Close();
      return false;
    }
  }
  sockaddr_in addr = MakeSockaddr(bind_address, port);
  if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    std::ostringstream oss;
    oss << "bind(" << bind_address << ":" << port << ") failed: "
        << std::strerror(errno);
    last_error_ = oss.str();
    Close();
    return false;
  }
  return true;
}

void UdpSocket::Close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

ssize_t UdpSocket::SendTo(const std::vector<uint8_t>& data, const sockaddr_in& addr) {
  if (fd_ < 0) {
    errno = EBADF;
    return -1;
  }
  return ::sendto(fd_, data.data(), data.size(), 0,
                  reinterpret_cast<const sockaddr*>(&addr), sizeof(addr));
}

ssize_t UdpSocket::RecvFrom(uint8_t* buffer, size_t length, sockaddr_in* addr,
                            socklen_t* addr_len) {
  return ::recvfrom(fd_, buffer, length, 0,
                    reinterpret_cast<sockaddr*>(addr), addr_len);
}

int WaitReadable(int fd, std::chrono::milliseconds timeout) {
  if (fd < 0) {
    return -1;
  }
  fd_set readfds;
  FD_ZERO(&readfds);
  FD_SET(fd, &readfds);
  const auto count = timeout.count() < 0 ? 0 : timeout.count();
  timeval tv{};
  tv.tv_sec = static_cast<time_t>(count / 1000);
  tv.tv_usec = static_cast<suseconds_t>((count % 1000) * 1000);
  const int ready = ::select(fd + 1, &readfds, nullptr, nullptr, &tv);
  if (ready < 0) {
    return errno == EINTR ? 0 : -1;
  }
  return ready > 0 ? 1 : 0;
}

}  // namespace internal

bool Config::Validate(std::string* error) const {
  auto fail = [&](const std::string& message) {
    if (error) {
      *error = message;
    }
    return false;
  };
  if (control_port == 0 || upload_port == 0) {
    return fail("control_port and upload_port must be non-zero");
  }
  if (probe_timeout.count() <= 0 || receive_timeout.count() <= 0) {
    return fail("probe and receive timeouts must be positive");
  }
  if (device_timeout.count() <= 0 || device_prune_interval.count() <= 0) {
    return fail("device timeouts must be positive");
  }
  if (connect_timeout.count() <= 0 || ack_timeout.count() <= 0) {
    return fail("upload timeouts must be positive");
  }
  if (!bind_address.empty() && bind_address != "0.0.0.0") {
    if (!internal::IsValidIpv4(bind_address)) {
      return fail("bind_address must be a valid IPv4 address");
    }
  }
  if (!internal::IsValidIpv4(broadcast_address)) {
    return fail("broadcast_address must be a valid IPv4 address");
  }
  if (!capture_file.empty() && !replay_file.empty()) {
    return fail("capture_file and replay_file are mutually exclusive");
  }
  return true;
}

}  // namespace ltxlink
