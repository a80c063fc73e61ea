#include "ltxlink/ltxlink.h"
#include "ltxlink/test_hooks.h"
#include "internal.h"

#include <atomic>
#include <condition_variable>
#include <fstream>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <arpa/inet.h>

namespace ltxlink {
namespace {

using internal::LogCallbackError;
using internal::LogError;
using internal::LogInfo;

struct DiscoveryMetricsAtomic {
  std::atomic<uint64_t> packets_received{0};
  std::atomic<uint64_t> packets_ignored{0};
  std::atomic<uint64_t> probes_sent{0};
  std::atomic<uint64_t> send_errors{0};
  std::atomic<uint64_t> callback_exceptions{0};

  DiscoveryMetrics Snapshot() const {
    DiscoveryMetrics snapshot;
    snapshot.packets_received = packets_received.load();
    snapshot.packets_ignored = packets_ignored.load();
    snapshot.probes_sent = probes_sent.load();
    snapshot.send_errors = send_errors.load();
    snapshot.callback_exceptions = callback_exceptions.load();
    return snapshot;
  }
};

}  // namespace

struct DeviceDiscovery::Impl {
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

  Impl(Config config, std::unique_ptr<PacketSource> source)
      : config_(std::move(config)), source_(std::move(source)) {
    if (!source_) {
      source_ = MakePacketSource(config_);
    }
  }

  bool Start() {
    if (started_ && !running_) {
      // The receive loop ended on its own; join it before starting again.
      Stop();
    }
    if (started_.exchange(true)) {
      return true;
    }
    start_error_.clear();
    std::string error;
    if (!config_.Validate(&error)) {
      start_error_ = error;
      LogError(error, &config_);
      started_ = false;
      return false;
    }
    if (!config_.capture_file.empty()) {
      std::lock_guard<std::mutex> lock(capture_mutex_);
      capture_stream_.open(config_.capture_file,
                           std::ios::binary | std::ios::out | std::ios::trunc);
      if (!capture_stream_) {
        start_error_ = "failed to open capture file: " + config_.capture_file;
        LogError(start_error_, &config_);
        started_ = false;
        return false;
      }
    }
    if (!source_->Open(&error)) {
      start_error_ = error;
      LogError(start_error_, &config_);
      CloseCapture();
      started_ = false;
      return false;
    }
    running_ = true;
    try {
      recv_thread_ = std::thread([this]() { RecvLoop(); });
      prune_thread_ = std::thread([this]() { PruneLoop(); });
    } catch (const std::exception& ex) {
      start_error_ = std::string("thread start failed: ") + ex.what();
      LogError(start_error_, &config_);
      Stop();
      return false;
    }
    LogInfo("discovery listening on port " + std::to_string(config_.control_port),
            &config_);
    return true;
  }

  void Stop() {
    if (!started_.exchange(false)) {
      return;
    }
    {
      std::lock_guard<std::mutex> lock(stop_mutex_);
      running_ = false;
    }
    stop_cv_.notify_all();
    if (recv_thread_.joinable()) {
      recv_thread_.join();
    }
    if (prune_thread_.joinable()) {
      prune_thread_.join();
    }
    source_->Close();
    CloseCapture();
  }

  bool IsRunning() const { return running_; }

  void SetDeviceEventCallback(DeviceEventCallback cb) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    device_event_cb_ = std::move(cb);
  }

  std::optional<DeviceRecord> Snapshot() const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    const TrackedDevice* latest = nullptr;
    for (const auto& entry : devices_) {
      const TrackedDevice& device = entry.second;
      if (!device.record.echo.has_value()) {
        continue;
      }
      if (!latest || device.status_updated > latest->status_updated) {
        latest = &device;
      }
    }
    if (!latest) {
      return std::nullopt;
    }
    return latest->record;
  }

  std::optional<DeviceRecord> Snapshot(const std::string& address) const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    auto it = devices_.find(address);
    if (it == devices_.end()) {
      return std::nullopt;
    }
    return it->second.record;
  }

  std::vector<DeviceRecord> GetDevices() const {
    std::lock_guard<std::mutex> lock(devices_mutex_);
    std::vector<DeviceRecord> result;
    result.reserve(devices_.size());
    for (const auto& entry : devices_) {
      result.push_back(entry.second.record);
    }
    return result;
  }

  bool WaitForDevice(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(devices_mutex_);
    return devices_cv_.wait_for(lock, timeout, [this]() { return !devices_.empty(); });
  }

  std::string GetLastError() const { return start_error_; }

  DiscoveryMetrics GetMetrics() const { return metrics_.Snapshot(); }

 private:
  struct TrackedDevice {
    DeviceRecord record;
    std::chrono::steady_clock::time_point status_updated;
  };

  void RecordCallbackException(const char* name) {
    metrics_.callback_exceptions.fetch_add(1);
    LogCallbackError(name, &config_);
  }

  void CloseCapture() {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    if (capture_stream_.is_open()) {
      capture_stream_.close();
    }
  }

  // Record layout: u64 timestamp_us, u32 IPv4 (network order), u32 length, data.
  void CapturePacket(const Datagram& datagram) {
    std::lock_guard<std::mutex> lock(capture_mutex_);
    if (!capture_stream_.is_open()) {
      return;
    }
    const auto now = std::chrono::steady_clock::now().time_since_epoch();
    const uint64_t timestamp_us =
        std::chrono::duration_cast<std::chrono::microseconds>(now).count();
    in_addr addr{};
    inet_pton(AF_INET, datagram.address.c_str(), &addr);
    const uint32_t ipv4 = addr.s_addr;
    const uint32_t length_u32 = static_cast<uint32_t>(datagram.payload.size());
    capture_stream_.write(reinterpret_cast<const char*>(&timestamp_us),
                          sizeof(timestamp_us));
    capture_stream_.write(reinterpret_cast<const char*>(&ipv4), sizeof(ipv4));
    capture_stream_.write(reinterpret_cast<const char*>(&length_u32),
                          sizeof(length_u32));
    capture_stream_.write(reinterpret_cast<const char*>(datagram.payload.data()),
                          static_cast<std::streamsize>(datagram.payload.size()));
  }

  void SendProbe(const std::string& address) {
    std::string error;
    if (source_->SendTo(internal::BuildProbeCommand(), address, config_.control_port,
                        &error)) {
      metrics_.probes_sent.fetch_add(1);
      LogInfo("probing candidate " + address, &config_);
      return;
    }
    metrics_.send_errors.fetch_add(1);
    LogError("Failed to send probe: " + error, &config_);
    std::lock_guard<std::mutex> lock(devices_mutex_);
    candidates_.erase(address);
  }

  void ProcessDatagram(const Datagram& datagram,
                       std::chrono::steady_clock::time_point now) {
    metrics_.packets_received.fetch_add(1);
    if (datagram.address.empty()) {
      metrics_.packets_ignored.fetch_add(1);
      return;
    }
    const uint8_t* data = datagram.payload.data();
    const size_t length = datagram.payload.size();
    const bool beacon = internal::IsBeacon(data, length);

    std::vector<DeviceEvent> events;
    bool send_probe = false;
    bool registered = false;
    {
      std::lock_guard<std::mutex> lock(devices_mutex_);
      auto it = devices_.find(datagram.address);
      if (it == devices_.end()) {
        bool accept = false;
        if (!config_.verify_devices) {
          accept = beacon;
        } else {
          auto candidate = candidates_.find(datagram.address);
          if (candidate != candidates_.end() &&
              now - candidate->second <= config_.probe_timeout) {
            accept = true;
            candidates_.erase(candidate);
          } else if (beacon) {
            candidates_[datagram.address] = now;
            send_probe = true;
          } else if (candidate != candidates_.end()) {
            candidates_.erase(candidate);
          }
        }
        if (!accept) {
          if (!send_probe) {
            metrics_.packets_ignored.fetch_add(1);
          }
        } else {
          TrackedDevice device;
          device.record.address = datagram.address;
          it = devices_.emplace(datagram.address, std::move(device)).first;
          registered = true;
        }
      }
      if (it != devices_.end()) {
        TrackedDevice& device = it->second;
        device.record.last_seen = now;
        EchoFields echo;
        if (internal::ParseEchoFields(data, length, &echo)) {
          const bool changed = !device.record.echo.has_value() ||
                               device.record.echo->status != echo.status ||
                               device.record.echo->command_source != echo.command_source;
          device.record.latest_status_bytes = datagram.payload;
          device.record.echo = echo;
          device.status_updated = now;
          if (changed && !registered) {
            events.push_back({DeviceEventType::kUpdated, device.record});
          }
        }
        if (registered) {
          events.push_back({DeviceEventType::kSeen, device.record});
        }
      }
    }
    if (registered) {
      LogInfo("device registered: " + datagram.address, &config_);
      devices_cv_.notify_all();
    }
    if (send_probe) {
      SendProbe(datagram.address);
    }
    EmitEvents(events);
  }

  void EmitEvents(const std::vector<DeviceEvent>& events) {
    if (events.empty()) {
      return;
    }
    DeviceEventCallback cb_copy;
    {
      std::lock_guard<std::mutex> lock(callback_mutex_);
      cb_copy = device_event_cb_;
    }
    if (!cb_copy) {
      return;
    }
    for (const auto& event : events) {
      try {
        cb_copy(event);
      } catch (const std::exception& ex) {
        RecordCallbackException("DeviceEventCallback");
        LogError(std::string("DeviceEventCallback: ") + ex.what(), &config_);
      } catch (...) {
        RecordCallbackException("DeviceEventCallback");
      }
    }
  }

  // Receive loop; each poll is bounded by receive_timeout so Stop() is observed.
  void RecvLoop() {
    while (running_) {
      Datagram datagram;
      const ReceiveStatus status = source_->Receive(config_.receive_timeout, &datagram);
      switch (status) {
        case ReceiveStatus::kPacket:
          CapturePacket(datagram);
          ProcessDatagram(datagram, std::chrono::steady_clock::now());
          break;
        case ReceiveStatus::kTimeout:
          break;
        case ReceiveStatus::kClosed:
          if (!config_.replay_file.empty()) {
            LogError("Replay file exhausted, stopping", &config_);
          } else {
            LogError("RecvLoop: packet source closed, stopping", &config_);
          }
          {
            std::lock_guard<std::mutex> lock(stop_mutex_);
            running_ = false;
          }
          stop_cv_.notify_all();
          return;
        case ReceiveStatus::kError:
          LogError("RecvLoop: receive failed", &config_);
          WaitForStop(config_.receive_timeout);
          break;
      }
    }
  }

  // Returns false once a stop was requested.
  bool WaitForStop(std::chrono::milliseconds duration) {
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, duration, [this]() { return !running_; });
  }

  void PruneLoop() {
    while (running_) {
      if (!WaitForStop(config_.device_prune_interval)) {
        return;
      }
      RunPrune(std::chrono::steady_clock::now());
    }
  }

  void RunPrune(std::chrono::steady_clock::time_point now) {
    std::vector<DeviceEvent> lost;
    {
      std::lock_guard<std::mutex> lock(devices_mutex_);
      auto it = devices_.begin();
      while (it != devices_.end()) {
        if (now - it->second.record.last_seen > config_.device_timeout) {
          lost.push_back({DeviceEventType::kLost, it->second.record});
          it = devices_.erase(it);
        } else {
          ++it;
        }
      }
      auto candidate = candidates_.begin();
      while (candidate != candidates_.end()) {
        if (now - candidate->second > config_.probe_timeout) {
          candidate = candidates_.erase(candidate);
        } else {
          ++candidate;
        }
      }
    }
    for (const auto& event : lost) {
      LogInfo("device lost: " + event.device.address, &config_);
    }
    EmitEvents(lost);
  }

  Config config_;
  std::unique_ptr<PacketSource> source_;

  std::atomic<bool> started_{false};
  std::atomic<bool> running_{false};
  std::string start_error_;

  std::mutex stop_mutex_;
  std::condition_variable stop_cv_;

  mutable std::mutex callback_mutex_;
  DeviceEventCallback device_event_cb_;

  mutable std::mutex devices_mutex_;
  mutable std::condition_variable devices_cv_;
  std::unordered_map<std::string, TrackedDevice> devices_;
  std::unordered_map<std::string, std::chrono::steady_clock::time_point> candidates_;

  DiscoveryMetricsAtomic metrics_;

  std::mutex capture_mutex_;
  std::ofstream capture_stream_;

  std::thread recv_thread_;
  std::thread prune_thread_;
};

DeviceDiscovery::DeviceDiscovery(Config config)
    : impl_(new Impl(std::move(config), nullptr)) {}

DeviceDiscovery::DeviceDiscovery(Config config, std::unique_ptr<PacketSource> source)
    : impl_(new Impl(std::move(config), std::move(source))) {}

DeviceDiscovery::~DeviceDiscovery() { impl_->Stop(); }

bool DeviceDiscovery::Start() { return impl_->Start(); }
void DeviceDiscovery::Stop() { impl_->Stop(); }
bool DeviceDiscovery::IsRunning() const { return impl_->IsRunning(); }

void DeviceDiscovery::SetDeviceEventCallback(DeviceEventCallback cb) {
  impl_->SetDeviceEventCallback(std::move(cb));
}

std::optional<DeviceRecord> DeviceDiscovery::Snapshot() const {
  return impl_->Snapshot();
}

std::optional<DeviceRecord> DeviceDiscovery::Snapshot(const std::string& address) const {
  return impl_->Snapshot(address);
}

std::vector<DeviceRecord> DeviceDiscovery::GetDevices() const {
  return impl_->GetDevices();
}

bool DeviceDiscovery::WaitForDevice(std::chrono::milliseconds timeout) const {
  return impl_->WaitForDevice(timeout);
}

std::string DeviceDiscovery::GetLastError() const {
  return impl_->GetLastError();
}

DiscoveryMetrics DeviceDiscovery::GetMetrics() const {
  return impl_->GetMetrics();
}

#ifdef LTXLINK_TESTING
namespace test {

void InjectDatagram(DeviceDiscovery& discovery,
                    const std::string& address,
                    const std::vector<uint8_t>& data,
                    std::chrono::steady_clock::time_point now) {
  Datagram datagram;
  datagram.address = address;
  datagram.payload = data;
  discovery.impl_->ProcessDatagram(datagram, now);
}

void SetDeviceLastSeen(DeviceDiscovery& discovery,
                       const std::string& address,
                       std::chrono::steady_clock::time_point when) {
  std::lock_guard<std::mutex> lock(discovery.impl_->devices_mutex_);
  auto it = discovery.impl_->devices_.find(address);
  if (it != discovery.impl_->devices_.end()) {
    it->second.record.last_seen = when;
  }
}

void PruneDevices(DeviceDiscovery& discovery,
                  std::chrono::steady_clock::time_point now) {
  discovery.impl_->RunPrune(now);
}

size_t GetCandidateCount(DeviceDiscovery& discovery) {
  std::lock_guard<std::mutex> lock(discovery.impl_->devices_mutex_);
  return discovery.impl_->candidates_.size();
}

size_t GetDeviceRecordCount(DeviceDiscovery& discovery) {
  std::lock_guard<std::mutex> lock(discovery.impl_->devices_mutex_);
  return discovery.impl_->devices_.size();
}

}  // namespace test
#endif

}  // namespace ltxlink
