#pragma once

#include "ltxlink/ltxlink.h"

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>

namespace ltxlink {
namespace internal {

// Color/brightness command layout.
constexpr size_t kColorCommandSize = 12;
constexpr size_t kOffsetCommandMarker = 0;
// Redundancy prefix byte. Captured vendor traffic leaves byte 1 at 0x00 for
// every copy; compare against that when debugging firmware responses.
constexpr size_t kOffsetCommandPrefix = 1;
constexpr size_t kOffsetCommandOpcode = 8;
constexpr size_t kOffsetCommandValues = 9;
constexpr uint8_t kColorCommandMarker = 0x42;
constexpr std::array<uint8_t, 6> kRedundancyPrefixes = {0x1e, 0x19, 0x14, 0x0f, 0x0a, 0x05};

// Play/stop trigger layout.
constexpr size_t kTriggerCommandSize = 9;
constexpr uint8_t kTriggerCommandGroup = 0x61;
constexpr uint8_t kTriggerCommandSubtype = 0x01;

// Status packet offsets.
constexpr size_t kStatusMinimumSize = 17;
constexpr size_t kOffsetStatusCommandSource = 10;
constexpr size_t kOffsetStatusByte = 12;
constexpr size_t kOffsetStatusTimestamp = 15;

void LogError(const std::string& message, const Config* config);
void LogInfo(const std::string& message, const Config* config);
void LogCallbackError(const char* name, const Config* config);

bool IsValidIpv4(const std::string& address);
sockaddr_in MakeSockaddr(const std::string& address, uint16_t port);
std::string AddrToString(const sockaddr_in& addr);
std::string AddrToString(uint32_t network_order_ipv4);

// Little-endian integers in .prg and upload frames.
void AppendLe16(std::vector<uint8_t>& data, uint32_t value);
void AppendLe32(std::vector<uint8_t>& data, uint32_t value);
void AppendBe16(std::vector<uint8_t>& data, uint32_t value);
uint16_t ReadLe16(const uint8_t* data, size_t offset);
uint32_t ReadLe32(const uint8_t* data, size_t offset);
uint16_t ReadBe16(const uint8_t* data, size_t offset);

// Uniform random byte in [min_value, max_value].
uint8_t RandomByte(uint8_t min_value = 0x00, uint8_t max_value = 0xff);

bool IsBeacon(const uint8_t* data, size_t length);
bool ParseEchoFields(const uint8_t* data, size_t length, EchoFields* out);

struct RawUdpHeader {
  uint32_t source_ipv4 = 0;
  uint16_t source_port = 0;
  uint16_t destination_port = 0;
  size_t payload_offset = 0;
  size_t payload_length = 0;
};

// Parse an IPv4 packet carrying UDP as delivered by a raw socket.
bool ParseRawUdp(const uint8_t* data, size_t length, RawUdpHeader* out);

std::vector<uint8_t> BuildControlCommand(uint8_t prefix, CommandOpcode opcode,
                                         uint8_t a, uint8_t b, uint8_t c);
std::vector<uint8_t> BuildProbeCommand();
std::vector<uint8_t> BuildPlayCommand(uint8_t op_id,
                                      const std::array<uint8_t, 2>& nonce,
                                      const std::array<uint8_t, 2>& timestamp);
std::vector<uint8_t> BuildStopCommand(uint8_t op_id,
                                      const std::array<uint8_t, 2>& tail);
std::vector<uint8_t> BuildUploadFrame(const std::string& filename,
                                      const std::vector<uint8_t>& payload,
                                      uint32_t declared_size,
                                      const std::array<uint8_t, 4>& nonce);

// Minimal UDP socket wrapper for send/recv with broadcast support.
class UdpSocket {
 public:
  UdpSocket() = default;
  ~UdpSocket() { Close(); }

  UdpSocket(const UdpSocket&) = delete;
  UdpSocket& operator=(const UdpSocket&) = delete;

  bool Open(uint16_t port, const std::string& bind_address, bool allow_broadcast);
  void Close();

  int fd() const { return fd_; }
  const std::string& last_error() const { return last_error_; }

  ssize_t SendTo(const std::vector<uint8_t>& data, const sockaddr_in& addr);
  ssize_t RecvFrom(uint8_t* buffer, size_t length, sockaddr_in* addr,
                   socklen_t* addr_len);

 private:
  int fd_ = -1;
  std::string last_error_;
};

// Wait until fd is readable. Returns 1 when readable, 0 on timeout, -1 on error.
int WaitReadable(int fd, std::chrono::milliseconds timeout);

}  // namespace internal
}  // namespace ltxlink
