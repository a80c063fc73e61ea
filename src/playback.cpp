#include "ltxlink/ltxlink.h"
#include "ltxlink/test_hooks.h"
#include "internal.h"

#include <cerrno>
#include <cstring>
#include <mutex>
#include <sstream>

namespace ltxlink {
namespace {

using internal::LogError;
using internal::LogInfo;

// Nonce bytes avoid 0x00 and 0xff.
constexpr uint8_t kMinNonceByte = 0x01;
constexpr uint8_t kMaxNonceByte = 0xfe;

class UdpCommandTransport : public CommandTransport {
 public:
  explicit UdpCommandTransport(const Config& config) : config_(config) {}

  bool Send(const std::vector<uint8_t>& data, const std::string& address,
            uint16_t port, std::string* error) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!socket_.Open(0, config_.bind_address, true)) {
      if (error) {
        *error = socket_.last_error();
      }
      return false;
    }
    const ssize_t result = socket_.SendTo(data, internal::MakeSockaddr(address, port));
    if (result < 0 || static_cast<size_t>(result) != data.size()) {
      if (error) {
        std::ostringstream oss;
        if (result < 0) {
          oss << "sendto(" << address << ") failed: " << std::strerror(errno);
        } else {
          oss << "partial send to " << address << ": " << result << " of "
              << data.size() << " bytes";
        }
        *error = oss.str();
      }
      return false;
    }
    return true;
  }

 private:
  Config config_;
  std::mutex mutex_;
  internal::UdpSocket socket_;
};

}  // namespace

std::unique_ptr<CommandTransport> MakeUdpCommandTransport(const Config& config) {
  return std::unique_ptr<CommandTransport>(new UdpCommandTransport(config));
}

struct PlaybackController::Impl {
  Impl(Config config, SnapshotProvider provider, std::unique_ptr<CommandTransport> transport)
      : config_(std::move(config)),
        provider_(std::move(provider)),
        transport_(std::move(transport)) {
    if (!transport_) {
      transport_ = MakeUdpCommandTransport(config_);
    }
    std::string error;
    if (!config_.Validate(&error)) {
      config_error_ = error;
      LogError(error, &config_);
    }
  }

  CommandResult Play() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_error_.empty()) {
      return Fail(CommandStatus::kInvalidArgument, config_error_);
    }
    if (session_.assumed_playing) {
      return Fail(CommandStatus::kInvalidState, "play rejected: already playing");
    }
    const std::optional<EchoFields> echo = LatestEcho();
    if (!echo.has_value()) {
      return Fail(CommandStatus::kNoDeviceStatus,
                  "play rejected: no device status yet, keep discovery running");
    }
    const uint8_t op_id = session_.next_play_op_id;
    const std::array<uint8_t, 2> nonce = {internal::RandomByte(kMinNonceByte, kMaxNonceByte),
                                          internal::RandomByte(kMinNonceByte, kMaxNonceByte)};
    const auto command = internal::BuildPlayCommand(op_id, nonce, echo->timestamp);
    std::string error;
    if (!transport_->Send(command, config_.broadcast_address, config_.control_port, &error)) {
      return Fail(CommandStatus::kSendFailed, "Failed to send play command: " + error);
    }
    session_.last_playing_op_id = op_id;
    session_.assumed_playing = true;
    LogInfo("play sent with op-id " + std::to_string(op_id), &config_);
    return {};
  }

  CommandResult Stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!config_error_.empty()) {
      return Fail(CommandStatus::kInvalidArgument, config_error_);
    }
    if (!session_.assumed_playing || !session_.last_playing_op_id.has_value()) {
      return Fail(CommandStatus::kInvalidState, "stop rejected: not playing");
    }
    std::array<uint8_t, 2> tail = {0x00, 0x00};
    if (config_.stop_echoes_timestamp) {
      const std::optional<EchoFields> echo = LatestEcho();
      if (!echo.has_value()) {
        return Fail(CommandStatus::kNoDeviceStatus, "stop rejected: no device status");
      }
      tail = echo->timestamp;
    }
    const uint8_t op_id =
        static_cast<uint8_t>(session_.last_playing_op_id.value() + kStopOpIdOffset);
    const auto command = internal::BuildStopCommand(op_id, tail);
    std::string error;
    if (!transport_->Send(command, config_.broadcast_address, config_.control_port, &error)) {
      return Fail(CommandStatus::kSendFailed, "Failed to send stop command: " + error);
    }
    AdvanceAfterStop();
    LogInfo("stop sent with op-id " + std::to_string(op_id), &config_);
    return {};
  }

  void ConfirmStopped() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.assumed_playing && session_.last_playing_op_id.has_value()) {
      AdvanceAfterStop();
    }
  }

  CommandResult SendRedundant(const std::string& address, CommandOpcode opcode,
                              uint8_t a, uint8_t b, uint8_t c) {
    if (!config_error_.empty()) {
      return Fail(CommandStatus::kInvalidArgument, config_error_);
    }
    if (!internal::IsValidIpv4(address)) {
      return Fail(CommandStatus::kInvalidArgument, "address must be a valid IPv4 address");
    }
    size_t delivered = 0;
    std::string last_error;
    for (const uint8_t prefix : internal::kRedundancyPrefixes) {
      const auto command = internal::BuildControlCommand(prefix, opcode, a, b, c);
      std::string error;
      if (transport_->Send(command, address, config_.control_port, &error)) {
        ++delivered;
      } else {
        last_error = error;
      }
    }
    if (delivered == 0) {
      return Fail(CommandStatus::kSendFailed, "Failed to send command: " + last_error);
    }
    if (delivered < internal::kRedundancyPrefixes.size()) {
      LogError("Partial command delivery to " + address + ": " + last_error, &config_);
    }
    return {};
  }

  PlaybackSession GetSession() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return session_;
  }

 private:
  CommandResult Fail(CommandStatus status, const std::string& message) {
    LogError(message, &config_);
    return {status, message};
  }

  std::optional<EchoFields> LatestEcho() const {
    if (!provider_) {
      return std::nullopt;
    }
    const std::optional<DeviceRecord> snapshot = provider_();
    if (!snapshot.has_value()) {
      return std::nullopt;
    }
    return snapshot->echo;
  }

  // Op-id 0x00 is never used for play.
  void AdvanceAfterStop() {
    const uint8_t next =
        static_cast<uint8_t>(session_.last_playing_op_id.value() + kPlayOpIdIncrement);
    session_.next_play_op_id = next == 0x00 ? kFirstPlayOpId : next;
    session_.assumed_playing = false;
  }

  Config config_;
  std::string config_error_;
  SnapshotProvider provider_;
  std::unique_ptr<CommandTransport> transport_;

  mutable std::mutex mutex_;
  PlaybackSession session_;
};

PlaybackController::PlaybackController(Config config,
                                       SnapshotProvider provider,
                                       std::unique_ptr<CommandTransport> transport)
    : impl_(new Impl(std::move(config), std::move(provider), std::move(transport))) {}

PlaybackController::PlaybackController(Config config,
                                       const DeviceDiscovery& discovery,
                                       std::unique_ptr<CommandTransport> transport)
    : impl_(new Impl(std::move(config),
                     [&discovery]() { return discovery.Snapshot(); },
                     std::move(transport))) {}

PlaybackController::~PlaybackController() = default;

CommandResult PlaybackController::Play() { return impl_->Play(); }
CommandResult PlaybackController::Stop() { return impl_->Stop(); }
void PlaybackController::ConfirmStopped() { impl_->ConfirmStopped(); }

CommandResult PlaybackController::SendColor(const std::string& address, const Rgb& color) {
  return impl_->SendRedundant(address, CommandOpcode::kColor, color.r, color.g, color.b);
}

CommandResult PlaybackController::SendBrightness(const std::string& address, uint8_t level) {
  return impl_->SendRedundant(address, CommandOpcode::kBrightness, level, 0x00, 0x00);
}

PlaybackSession PlaybackController::GetSession() const { return impl_->GetSession(); }

#ifdef LTXLINK_TESTING
namespace test {

std::vector<uint8_t> BuildColorCommand(uint8_t prefix, const Rgb& color) {
  return internal::BuildControlCommand(prefix, CommandOpcode::kColor, color.r, color.g,
                                       color.b);
}

std::vector<uint8_t> BuildBrightnessCommand(uint8_t prefix, uint8_t level) {
  return internal::BuildControlCommand(prefix, CommandOpcode::kBrightness, level, 0x00,
                                       0x00);
}

std::vector<uint8_t> BuildPlayCommand(uint8_t op_id,
                                      const std::array<uint8_t, 2>& nonce,
                                      const std::array<uint8_t, 2>& timestamp) {
  return internal::BuildPlayCommand(op_id, nonce, timestamp);
}

std::vector<uint8_t> BuildStopCommand(uint8_t op_id,
                                      const std::array<uint8_t, 2>& tail) {
  return internal::BuildStopCommand(op_id, tail);
}

}  // namespace test
#endif

}  // namespace ltxlink
