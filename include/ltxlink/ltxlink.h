#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ltxlink {

class DeviceDiscovery;

#ifdef LTXLINK_TESTING
namespace test {
void InjectDatagram(DeviceDiscovery& discovery,
                    const std::string& address,
                    const std::vector<uint8_t>& data,
                    std::chrono::steady_clock::time_point now);
void SetDeviceLastSeen(DeviceDiscovery& discovery,
                       const std::string& address,
                       std::chrono::steady_clock::time_point when);
void PruneDevices(DeviceDiscovery& discovery,
                  std::chrono::steady_clock::time_point now);
size_t GetCandidateCount(DeviceDiscovery& discovery);
size_t GetDeviceRecordCount(DeviceDiscovery& discovery);
}  // namespace test
#endif

/**
 * Well-known ball ports.
 */
constexpr uint16_t kControlPort = 41412;
constexpr uint16_t kUploadPort = 8888;

/**
 * ASCII identifier carried in every ball beacon.
 */
constexpr char kDeviceIdentifier[] = "NPLAYLTXBALL";

/**
 * .prg format limits and fixed sizes.
 */
constexpr uint8_t kMinPixelCount = 1;
constexpr uint8_t kMaxPixelCount = 4;
constexpr uint32_t kMaxSegmentDuration = 0xffff;
constexpr uint16_t kDefaultRefreshRate = 100;
constexpr size_t kProgramHeaderSize = 32;
constexpr size_t kSegmentDescriptorSize = 19;
constexpr size_t kColorBlockSize = 300;
constexpr size_t kProgramFooterSize = 6;
constexpr uint8_t kProgramSentinel = 0x42;

/**
 * Play/stop op-id cycle.
 */
constexpr uint8_t kFirstPlayOpId = 0x14;
constexpr uint8_t kStopOpIdOffset = 0x0a;
constexpr uint8_t kPlayOpIdIncrement = 0x14;

/**
 * Opcode byte of the 12-byte color/brightness command.
 */
enum class CommandOpcode : uint8_t {
  kColor = 0x0a,
  kBrightness = 0x10,
};

struct Rgb {
  uint8_t r = 0;
  uint8_t g = 0;
  uint8_t b = 0;

  bool operator==(const Rgb& other) const {
    return r == other.r && g == other.g && b == other.b;
  }
  bool operator!=(const Rgb& other) const { return !(*this == other); }
};

/**
 * A color change at a point on the program timeline.
 */
struct ColorSample {
  /// Start time in refresh-rate ticks.
  uint32_t time_units = 0;
  Rgb color;
  /// Number of lit pixels (1-4).
  uint8_t pixel_count = kMaxPixelCount;
};

/**
 * One constant-color interval of a program.
 */
struct Segment {
  /// Duration in refresh-rate ticks. Never exceeds kMaxSegmentDuration once compiled.
  uint32_t duration_units = 0;
  Rgb color;
  uint8_t pixel_count = kMaxPixelCount;
};

/**
 * Validated, split segment list ready to be encoded.
 */
struct CompiledSequence {
  /// Pixel count written into the signature header.
  uint8_t pixel_count = kMaxPixelCount;
  /// Ticks per second of all segment durations.
  uint16_t refresh_rate = kDefaultRefreshRate;
  std::vector<Segment> segments;
};

/**
 * In-memory form of a JSON sequence document.
 */
struct SequenceProgram {
  uint8_t pixel_count = kMaxPixelCount;
  uint16_t refresh_rate = kDefaultRefreshRate;
  /// Program end in ticks; closes the last segment.
  uint32_t end_time_units = 0;
  /// Samples in ascending time order.
  std::vector<ColorSample> samples;
};

/**
 * Header scalars at 0x16 and 0x1e, fitted from known-good files.
 */
struct HeaderFields {
  uint16_t field_a = 0;
  uint16_t field_b = 0;
};

/**
 * Split segments longer than kMaxSegmentDuration into full-width pieces
 * followed by the nonzero remainder. Shorter segments pass through.
 */
std::vector<Segment> SplitSegments(const std::vector<Segment>& segments);

/**
 * Derive the two empirical header fields from the first compiled duration.
 */
HeaderFields DeriveHeaderFields(uint32_t first_segment_duration);

/**
 * Split and validate segments into a CompiledSequence.
 *
 * @param error Optional output string describing the first validation error.
 * @return true if the sequence can be encoded.
 */
bool CompileSequence(const std::vector<Segment>& segments,
                     uint8_t pixel_count,
                     uint16_t refresh_rate,
                     CompiledSequence* out,
                     std::string* error = nullptr);

/// Size in bytes of an encoded program with the given segment count.
size_t EncodedProgramSize(size_t segment_count);

/**
 * Encode a compiled sequence into .prg bytes. Nothing is written to out
 * unless the whole sequence validates.
 */
bool EncodeSequence(const CompiledSequence& sequence,
                    std::vector<uint8_t>* out,
                    std::string* error = nullptr);

/// Write encoded program bytes to a file.
bool WriteProgramFile(const std::string& path,
                      const std::vector<uint8_t>& bytes,
                      std::string* error = nullptr);

/**
 * Parse a JSON sequence document.
 *
 * Accepts "pixels" (or "default_pixels"), "refresh_rate", "end_time" and a
 * "sequence" object keyed by start time with {"color": [r, g, b], "pixels": n}.
 */
bool ParseSequenceJson(const std::string& text,
                       SequenceProgram* out,
                       std::string* error = nullptr);

/// Read and parse a JSON sequence file.
bool LoadSequenceFile(const std::string& path,
                      SequenceProgram* out,
                      std::string* error = nullptr);

/**
 * Rescale sample times and end time to another refresh rate. Samples that
 * collapse onto the same tick keep the later color. Fails if a rescaled time
 * does not fit 32 bits; out is untouched on failure.
 */
bool ResampleProgram(const SequenceProgram& program,
                     uint16_t refresh_rate,
                     SequenceProgram* out,
                     std::string* error = nullptr);

/**
 * Difference consecutive sample times into segments. The last segment ends
 * at end_time_units.
 */
bool BuildSegments(const SequenceProgram& program,
                   std::vector<Segment>* out,
                   std::string* error = nullptr);

/**
 * Echo fields copied out of the latest status packet of a device.
 */
struct EchoFields {
  /// Device status byte (0x00 when idle).
  uint8_t status = 0;
  /// Command-source byte.
  uint8_t command_source = 0;
  /// Rolling timestamp bytes echoed into play/stop commands.
  std::array<uint8_t, 2> timestamp = {0, 0};
};

/**
 * Tracked state of one verified ball.
 */
struct DeviceRecord {
  /// IPv4 address of the device.
  std::string address;
  /// Last time any packet was observed from this device.
  std::chrono::steady_clock::time_point last_seen;
  /// Raw bytes of the latest status packet (empty until one is seen).
  std::vector<uint8_t> latest_status_bytes;
  /// Echo fields of the latest status packet, if any.
  std::optional<EchoFields> echo;
};

/**
 * Device lifecycle events emitted by discovery tracking.
 */
enum class DeviceEventType {
  kSeen,
  kUpdated,
  kLost,
};

struct DeviceEvent {
  DeviceEventType type = DeviceEventType::kSeen;
  DeviceRecord device;
};

/**
 * Lightweight counters for discovery traffic and error reporting.
 */
struct DiscoveryMetrics {
  uint64_t packets_received = 0;
  uint64_t packets_ignored = 0;
  uint64_t probes_sent = 0;
  uint64_t send_errors = 0;
  uint64_t callback_exceptions = 0;
};

/**
 * How discovery receives control-port traffic.
 */
enum class CaptureMode {
  /// UDP socket bound to the control port.
  kUdp,
  /// Raw IPv4/UDP capture (needs CAP_NET_RAW).
  kRaw,
};

/**
 * Configuration for sockets, timeouts and logging.
 */
struct Config {
  using LogCallback = std::function<void(const std::string&)>;

  /// Local bind address for sockets (usually 0.0.0.0).
  std::string bind_address = "0.0.0.0";
  /// Broadcast address used for play/stop commands.
  std::string broadcast_address = "255.255.255.255";
  /// UDP port for beacons, probes and commands.
  uint16_t control_port = kControlPort;
  /// TCP port for program uploads.
  uint16_t upload_port = kUploadPort;

  /// Discovery receive mode.
  CaptureMode capture_mode = CaptureMode::kUdp;
  /// Require a reply to a probe before registering a device.
  bool verify_devices = true;
  /// How long a probed candidate has to answer.
  std::chrono::milliseconds probe_timeout{1000};
  /// Per-poll receive timeout of the discovery loop.
  std::chrono::milliseconds receive_timeout{200};
  /// Device timeout for discovery pruning.
  std::chrono::milliseconds device_timeout{5000};
  /// How often to check for device expiry.
  std::chrono::milliseconds device_prune_interval{1000};

  /// TCP connect timeout for uploads.
  std::chrono::milliseconds connect_timeout{10000};
  /// How long to wait for the device to close the upload connection.
  std::chrono::milliseconds ack_timeout{5000};

  /// Echo the beacon timestamp into stop commands instead of zeros.
  bool stop_echoes_timestamp = true;

  /// Log informational messages as well as errors.
  bool verbose = false;
  /// Optional log callback (defaults to stderr).
  LogCallback log_callback;

  /// Optional packet capture file (binary).
  std::string capture_file;
  /// Optional packet replay file (binary).
  std::string replay_file;

  /**
   * Validate configuration values.
   *
   * @param error Optional output string describing the first validation error.
   * @return true if the configuration is valid.
   */
  bool Validate(std::string* error = nullptr) const;
};

/**
 * A datagram received on the control port.
 */
struct Datagram {
  /// Source IPv4 address.
  std::string address;
  std::vector<uint8_t> payload;
};

enum class ReceiveStatus {
  kPacket,
  kTimeout,
  kClosed,
  kError,
};

/**
 * Source of control-port traffic for discovery, also used to send probes.
 */
class PacketSource {
 public:
  virtual ~PacketSource() = default;

  /// Acquire sockets or files. Returns false and fills error on failure.
  virtual bool Open(std::string* error) = 0;
  virtual void Close() = 0;
  /// Wait up to timeout for the next datagram.
  virtual ReceiveStatus Receive(std::chrono::milliseconds timeout, Datagram* out) = 0;
  virtual bool SendTo(const std::vector<uint8_t>& data,
                      const std::string& address,
                      uint16_t port,
                      std::string* error) = 0;
};

/**
 * Build the packet source selected by config (replay file, raw capture or UDP).
 */
std::unique_ptr<PacketSource> MakePacketSource(const Config& config);

/**
 * Listens for ball beacons, verifies and tracks devices, and publishes
 * snapshots of their latest status.
 */
class DeviceDiscovery {
 public:
  using DeviceEventCallback = std::function<void(const DeviceEvent&)>;

  /// Construct discovery with the packet source chosen by config.
  explicit DeviceDiscovery(Config config);
  /// Construct discovery reading from a caller-provided source.
  DeviceDiscovery(Config config, std::unique_ptr<PacketSource> source);
  /// Stop background threads and close the source.
  ~DeviceDiscovery();

  DeviceDiscovery(const DeviceDiscovery&) = delete;
  DeviceDiscovery& operator=(const DeviceDiscovery&) = delete;

  /// Open the packet source and start background threads.
  bool Start();
  /// Stop background threads and close the source.
  void Stop();
  bool IsRunning() const;

  /// Set callback invoked on device lifecycle events (seen/updated/lost).
  void SetDeviceEventCallback(DeviceEventCallback cb);

  /// Most recently updated device that carries echo fields, if any.
  std::optional<DeviceRecord> Snapshot() const;
  /// Record of one device, if it is currently tracked.
  std::optional<DeviceRecord> Snapshot(const std::string& address) const;
  /// Return all tracked devices.
  std::vector<DeviceRecord> GetDevices() const;
  /// Block until at least one device is tracked or the timeout elapses.
  bool WaitForDevice(std::chrono::milliseconds timeout) const;

  /// Return the last Start() error message, if any.
  std::string GetLastError() const;
  /// Return metrics for packets, probes, errors and callbacks.
  DiscoveryMetrics GetMetrics() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;

#ifdef LTXLINK_TESTING
  friend void test::InjectDatagram(DeviceDiscovery& discovery,
                                   const std::string& address,
                                   const std::vector<uint8_t>& data,
                                   std::chrono::steady_clock::time_point now);
  friend void test::SetDeviceLastSeen(DeviceDiscovery& discovery,
                                      const std::string& address,
                                      std::chrono::steady_clock::time_point when);
  friend void test::PruneDevices(DeviceDiscovery& discovery,
                                 std::chrono::steady_clock::time_point now);
  friend size_t test::GetCandidateCount(DeviceDiscovery& discovery);
  friend size_t test::GetDeviceRecordCount(DeviceDiscovery& discovery);
#endif
};

enum class UploadStatus {
  kOk,
  /// Data was sent but the device did not close the connection in time.
  kAckTimeout,
  kInvalidArgument,
  kConnectFailed,
  kConnectTimeout,
  kSendFailed,
  kReceiveFailed,
};

struct UploadResult {
  UploadStatus status = UploadStatus::kOk;
  std::string message;

  bool ok() const { return status == UploadStatus::kOk; }
  /// True when the outcome is unknown and the caller should retry or check.
  bool uncertain() const { return status == UploadStatus::kAckTimeout; }
};

struct UploadOptions {
  /// Size declared in the frame prefix; defaults to the payload size.
  std::optional<uint32_t> declared_size;
};

/**
 * Uploads .prg programs to a ball over TCP.
 */
class SequenceUploader {
 public:
  explicit SequenceUploader(Config config);

  /// Upload payload under filename to the device at address.
  UploadResult Upload(const std::string& address,
                      const std::string& filename,
                      const std::vector<uint8_t>& payload,
                      const UploadOptions& options = {}) const;
  /// Upload a .prg file from disk under its base name.
  UploadResult UploadFile(const std::string& address, const std::string& path) const;

 private:
  Config config_;
};

enum class CommandStatus {
  kOk,
  /// No status snapshot with echo fields is available yet.
  kNoDeviceStatus,
  /// Play while assumed playing, or stop while idle.
  kInvalidState,
  kInvalidArgument,
  kSendFailed,
};

struct CommandResult {
  CommandStatus status = CommandStatus::kOk;
  std::string message;

  bool ok() const { return status == CommandStatus::kOk; }
};

/**
 * Assumed playback state of the devices; updated only by successful sends.
 */
struct PlaybackSession {
  uint8_t next_play_op_id = kFirstPlayOpId;
  std::optional<uint8_t> last_playing_op_id;
  bool assumed_playing = false;
};

/**
 * Outgoing UDP command channel.
 */
class CommandTransport {
 public:
  virtual ~CommandTransport() = default;

  virtual bool Send(const std::vector<uint8_t>& data,
                    const std::string& address,
                    uint16_t port,
                    std::string* error) = 0;
};

/// Broadcast-capable UDP transport on an ephemeral local port.
std::unique_ptr<CommandTransport> MakeUdpCommandTransport(const Config& config);

/**
 * Play/stop state machine plus redundant color and brightness commands.
 */
class PlaybackController {
 public:
  using SnapshotProvider = std::function<std::optional<DeviceRecord>()>;

  /// Construct a controller reading status snapshots from provider.
  PlaybackController(Config config,
                     SnapshotProvider provider,
                     std::unique_ptr<CommandTransport> transport = nullptr);
  /// Construct a controller reading status snapshots from discovery.
  PlaybackController(Config config,
                     const DeviceDiscovery& discovery,
                     std::unique_ptr<CommandTransport> transport = nullptr);
  ~PlaybackController();

  PlaybackController(const PlaybackController&) = delete;
  PlaybackController& operator=(const PlaybackController&) = delete;

  /// Broadcast a play trigger echoing the latest device timestamp.
  CommandResult Play();
  /// Broadcast a stop for the last play trigger.
  CommandResult Stop();
  /// Record that the device returned to idle without a stop command.
  void ConfirmStopped();

  /// Send a solid color to one device (six redundant copies).
  CommandResult SendColor(const std::string& address, const Rgb& color);
  /// Send a brightness level to one device (six redundant copies).
  CommandResult SendBrightness(const std::string& address, uint8_t level);

  PlaybackSession GetSession() const;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace ltxlink
