#include "internal.h"
#include "ltxlink/test_hooks.h"

#include <algorithm>
#include <cstring>

namespace ltxlink {
namespace internal {
namespace {

constexpr size_t kIdentifierLength = sizeof(kDeviceIdentifier) - 1;

constexpr size_t kIpv4MinimumHeaderSize = 20;
constexpr size_t kOffsetIpTotalLength = 2;
constexpr size_t kOffsetIpProtocol = 9;
constexpr size_t kOffsetIpSource = 12;
constexpr uint8_t kIpProtocolUdp = 17;
constexpr size_t kUdpHeaderSize = 8;

constexpr uint8_t kUploadFrameSuffix[3] = {0x20, 0x00, 0x00};

}  // namespace

bool IsBeacon(const uint8_t* data, size_t length) {
  if (!data || length < kIdentifierLength) {
    return false;
  }
  const uint8_t* end = data + length;
  return std::search(data, end, kDeviceIdentifier,
                     kDeviceIdentifier + kIdentifierLength) != end;
}

// Status byte, command source and timestamp sit at fixed offsets in both
// beacon (47 bytes) and status (62/71 bytes) packets.
bool ParseEchoFields(const uint8_t* data, size_t length, EchoFields* out) {
  if (!data || !out || length < kStatusMinimumSize) {
    return false;
  }
  out->status = data[kOffsetStatusByte];
  out->command_source = data[kOffsetStatusCommandSource];
  out->timestamp[0] = data[kOffsetStatusTimestamp];
  out->timestamp[1] = data[kOffsetStatusTimestamp + 1];
  return true;
}

bool ParseRawUdp(const uint8_t* data, size_t length, RawUdpHeader* out) {
  if (!data || !out || length < kIpv4MinimumHeaderSize) {
    return false;
  }
  if ((data[0] >> 4) != 4) {
    return false;
  }
  const size_t header_length = static_cast<size_t>(data[0] & 0x0f) * 4;
  if (header_length < kIpv4MinimumHeaderSize || length < header_length + kUdpHeaderSize) {
    return false;
  }
  if (data[kOffsetIpProtocol] != kIpProtocolUdp) {
    return false;
  }
  size_t total_length = ReadBe16(data, kOffsetIpTotalLength);
  if (total_length == 0 || total_length > length) {
    total_length = length;
  }
  if (total_length < header_length + kUdpHeaderSize) {
    return false;
  }
  std::memcpy(&out->source_ipv4, data + kOffsetIpSource, sizeof(out->source_ipv4));
  out->source_port = ReadBe16(data, header_length);
  out->destination_port = ReadBe16(data, header_length + 2);
  const size_t udp_length = ReadBe16(data, header_length + 4);
  out->payload_offset = header_length + kUdpHeaderSize;
  size_t payload_length = total_length - out->payload_offset;
  if (udp_length >= kUdpHeaderSize) {
    payload_length = std::min(payload_length, udp_length - kUdpHeaderSize);
  }
  out->payload_length = payload_length;
  return true;
}

std::vector<uint8_t> BuildControlCommand(uint8_t prefix, CommandOpcode opcode,
                                         uint8_t a, uint8_t b, uint8_t c) {
  std::vector<uint8_t> packet(kColorCommandSize, 0x00);
  packet[kOffsetCommandMarker] = kColorCommandMarker;
  packet[kOffsetCommandPrefix] = prefix;
  packet[kOffsetCommandOpcode] = static_cast<uint8_t>(opcode);
  packet[kOffsetCommandValues] = a;
  packet[kOffsetCommandValues + 1] = b;
  packet[kOffsetCommandValues + 2] = c;
  return packet;
}

// A black color command; harmless, and any device answers it.
std::vector<uint8_t> BuildProbeCommand() {
  return BuildControlCommand(0x00, CommandOpcode::kColor, 0x00, 0x00, 0x00);
}

std::vector<uint8_t> BuildPlayCommand(uint8_t op_id,
                                      const std::array<uint8_t, 2>& nonce,
                                      const std::array<uint8_t, 2>& timestamp) {
  std::vector<uint8_t> packet;
  packet.reserve(kTriggerCommandSize);
  packet.push_back(kTriggerCommandGroup);
  packet.push_back(op_id);
  packet.push_back(kTriggerCommandSubtype);
  packet.push_back(0x00);
  packet.push_back(0x00);
  packet.insert(packet.end(), nonce.begin(), nonce.end());
  packet.insert(packet.end(), timestamp.begin(), timestamp.end());
  return packet;
}

std::vector<uint8_t> BuildStopCommand(uint8_t op_id,
                                      const std::array<uint8_t, 2>& tail) {
  std::vector<uint8_t> packet;
  packet.reserve(kTriggerCommandSize);
  packet.push_back(kTriggerCommandGroup);
  packet.push_back(op_id);
  packet.push_back(kTriggerCommandSubtype);
  packet.insert(packet.end(), 4, 0x00);
  packet.insert(packet.end(), tail.begin(), tail.end());
  return packet;
}

std::vector<uint8_t> BuildUploadFrame(const std::string& filename,
                                      const std::vector<uint8_t>& payload,
                                      uint32_t declared_size,
                                      const std::array<uint8_t, 4>& nonce) {
  std::vector<uint8_t> frame;
  frame.reserve(15 + filename.size() + 2 + payload.size());
  frame.insert(frame.end(), 4, 0x00);
  AppendLe32(frame, declared_size);
  frame.insert(frame.end(), nonce.begin(), nonce.end());
  frame.insert(frame.end(), kUploadFrameSuffix, kUploadFrameSuffix + sizeof(kUploadFrameSuffix));
  frame.push_back(0x00);
  frame.insert(frame.end(), filename.begin(), filename.end());
  frame.push_back(0x00);
  frame.insert(frame.end(), payload.begin(), payload.end());
  return frame;
}

}  // namespace internal

#ifdef LTXLINK_TESTING
namespace test {

bool ParseRawDatagram(const std::vector<uint8_t>& frame, RawDatagram* out) {
  internal::RawUdpHeader header;
  if (!out || !internal::ParseRawUdp(frame.data(), frame.size(), &header)) {
    return false;
  }
  out->source_address = internal::AddrToString(header.source_ipv4);
  out->source_port = header.source_port;
  out->destination_port = header.destination_port;
  const auto begin = frame.begin() + static_cast<std::ptrdiff_t>(header.payload_offset);
  out->payload.assign(begin, begin + static_cast<std::ptrdiff_t>(header.payload_length));
  return true;
}

bool IsBeaconPacket(const std::vector<uint8_t>& data) {
  return internal::IsBeacon(data.data(), data.size());
}

bool ParseEchoFields(const std::vector<uint8_t>& data, EchoFields* out) {
  return internal::ParseEchoFields(data.data(), data.size(), out);
}

std::vector<uint8_t> BuildProbeCommand() {
  return internal::BuildProbeCommand();
}

}  // namespace test
#endif

}  // namespace ltxlink
