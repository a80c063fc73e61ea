#include "internal.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>

#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace ltxlink {
namespace {

using internal::AddrToString;
using internal::MakeSockaddr;
using internal::UdpSocket;
using internal::WaitReadable;

constexpr size_t kMaxDatagramSize = 2048;
constexpr size_t kMaxRawFrameSize = 65536;

bool SendDatagram(UdpSocket& socket, const std::vector<uint8_t>& data,
                  const std::string& address, uint16_t port, std::string* error) {
  const sockaddr_in addr = MakeSockaddr(address, port);
  const ssize_t result = socket.SendTo(data, addr);
  if (result < 0) {
    if (error) {
      *error = "sendto(" + address + ") failed: " + std::strerror(errno);
    }
    return false;
  }
  if (static_cast<size_t>(result) != data.size()) {
    if (error) {
      std::ostringstream oss;
      oss << "partial send to " << address << ": " << result << " of "
          << data.size() << " bytes";
      *error = oss.str();
    }
    return false;
  }
  return true;
}

// Datagrams from a UDP socket bound to the control port.
class UdpPacketSource : public PacketSource {
 public:
  explicit UdpPacketSource(const Config& config) : config_(config) {}

  bool Open(std::string* error) override {
    if (!socket_.Open(config_.control_port, config_.bind_address, true)) {
      if (error) {
        *error = socket_.last_error();
      }
      return false;
    }
    return true;
  }

  void Close() override { socket_.Close(); }

  ReceiveStatus Receive(std::chrono::milliseconds timeout, Datagram* out) override {
    const int ready = WaitReadable(socket_.fd(), timeout);
    if (ready < 0) {
      return socket_.fd() < 0 ? ReceiveStatus::kClosed : ReceiveStatus::kError;
    }
    if (ready == 0) {
      return ReceiveStatus::kTimeout;
    }
    std::array<uint8_t, kMaxDatagramSize> buffer{};
    sockaddr_in addr{};
    socklen_t addr_len = sizeof(addr);
    const ssize_t bytes = socket_.RecvFrom(buffer.data(), buffer.size(), &addr, &addr_len);
    if (bytes < 0) {
      return ReceiveStatus::kError;
    }
    out->address = AddrToString(addr);
    out->payload.assign(buffer.begin(), buffer.begin() + bytes);
    return ReceiveStatus::kPacket;
  }

  bool SendTo(const std::vector<uint8_t>& data, const std::string& address,
              uint16_t port, std::string* error) override {
    return SendDatagram(socket_, data, address, port, error);
  }

 private:
  Config config_;
  UdpSocket socket_;
};

// Raw IPv4/UDP capture; sees control-port traffic even when another process
// owns the port. Probes go out through an ordinary UDP socket.
class RawPacketSource : public PacketSource {
 public:
  explicit RawPacketSource(const Config& config) : config_(config) {}
  ~RawPacketSource() override { Close(); }

  bool Open(std::string* error) override {
    if (fd_ >= 0) {
      return true;
    }
    fd_ = ::socket(AF_INET, SOCK_RAW, IPPROTO_UDP);
    if (fd_ < 0) {
      if (error) {
        *error = "raw socket() failed (needs CAP_NET_RAW): " +
                 std::string(std::strerror(errno));
      }
      return false;
    }
    if (!send_socket_.Open(0, config_.bind_address, true)) {
      if (error) {
        *error = send_socket_.last_error();
      }
      Close();
      return false;
    }
    return true;
  }

  void Close() override {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
    send_socket_.Close();
  }

  ReceiveStatus Receive(std::chrono::milliseconds timeout, Datagram* out) override {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::vector<uint8_t> frame(kMaxRawFrameSize);
    while (true) {
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      const int ready = WaitReadable(fd_, remaining);
      if (ready < 0) {
        return fd_ < 0 ? ReceiveStatus::kClosed : ReceiveStatus::kError;
      }
      if (ready == 0) {
        return ReceiveStatus::kTimeout;
      }
      const ssize_t bytes = ::recv(fd_, frame.data(), frame.size(), 0);
      if (bytes < 0) {
        return ReceiveStatus::kError;
      }
      internal::RawUdpHeader header;
      if (!internal::ParseRawUdp(frame.data(), static_cast<size_t>(bytes), &header) ||
          header.destination_port != config_.control_port) {
        continue;
      }
      out->address = AddrToString(header.source_ipv4);
      const auto begin = frame.begin() + static_cast<std::ptrdiff_t>(header.payload_offset);
      out->payload.assign(begin, begin + static_cast<std::ptrdiff_t>(header.payload_length));
      return ReceiveStatus::kPacket;
    }
  }

  bool SendTo(const std::vector<uint8_t>& data, const std::string& address,
              uint16_t port, std::string* error) override {
    return SendDatagram(send_socket_, data, address, port, error);
  }

 private:
  Config config_;
  int fd_ = -1;
  UdpSocket send_socket_;
};

// Plays back a capture file written by DeviceDiscovery, paced by the
// recorded timestamps. Sends are accepted and dropped.
class ReplayPacketSource : public PacketSource {
 public:
  explicit ReplayPacketSource(const Config& config) : config_(config) {}

  bool Open(std::string* error) override {
    stream_.open(config_.replay_file, std::ios::binary | std::ios::in);
    if (!stream_) {
      if (error) {
        *error = "failed to open replay file: " + config_.replay_file;
      }
      return false;
    }
    last_timestamp_ = 0;
    return true;
  }

  void Close() override {
    if (stream_.is_open()) {
      stream_.close();
    }
  }

  ReceiveStatus Receive(std::chrono::milliseconds, Datagram* out) override {
    if (!stream_.is_open()) {
      return ReceiveStatus::kClosed;
    }
    uint64_t timestamp = 0;
    uint32_t ipv4 = 0;
    uint32_t length = 0;
    stream_.read(reinterpret_cast<char*>(&timestamp), sizeof(timestamp));
    stream_.read(reinterpret_cast<char*>(&ipv4), sizeof(ipv4));
    stream_.read(reinterpret_cast<char*>(&length), sizeof(length));
    if (!stream_) {
      return ReceiveStatus::kClosed;
    }
    if (length > kMaxRawFrameSize) {
      internal::LogError("Replay packet too large, aborting", &config_);
      Close();
      return ReceiveStatus::kClosed;
    }
    std::vector<uint8_t> data(length);
    if (length > 0) {
      stream_.read(reinterpret_cast<char*>(data.data()),
                   static_cast<std::streamsize>(length));
      if (!stream_) {
        return ReceiveStatus::kClosed;
      }
    }
    if (last_timestamp_ != 0 && timestamp >= last_timestamp_) {
      std::this_thread::sleep_for(std::chrono::microseconds(timestamp - last_timestamp_));
    }
    last_timestamp_ = timestamp;
    out->address = AddrToString(ipv4);
    out->payload = std::move(data);
    return ReceiveStatus::kPacket;
  }

  bool SendTo(const std::vector<uint8_t>&, const std::string&, uint16_t,
              std::string*) override {
    return true;
  }

 private:
  Config config_;
  std::ifstream stream_;
  uint64_t last_timestamp_ = 0;
};

}  // namespace

std::unique_ptr<PacketSource> MakePacketSource(const Config& config) {
  if (!config.replay_file.empty()) {
    return std::unique_ptr<PacketSource>(new ReplayPacketSource(config));
  }
  if (config.capture_mode == CaptureMode::kRaw) {
    return std::unique_ptr<PacketSource>(new RawPacketSource(config));
  }
  return std::unique_ptr<PacketSource>(new UdpPacketSource(config));
}

}  // namespace ltxlink
