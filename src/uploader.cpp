#include "ltxlink/ltxlink.h"
#include "ltxlink/test_hooks.h"
#include "internal.h"

#include <cerrno>
#include <cstring>
#include <fstream>
#include <iterator>
#include <sstream>

#include <fcntl.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace ltxlink {
namespace {

using internal::LogError;
using internal::LogInfo;

// Minimal TCP client socket with connect timeout.
class TcpSocket {
 public:
  TcpSocket() = default;
  ~TcpSocket() { Close(); }

  TcpSocket(const TcpSocket&) = delete;
  TcpSocket& operator=(const TcpSocket&) = delete;

  UploadStatus Connect(const sockaddr_in& addr, std::chrono::milliseconds timeout) {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) {
      last_error_ = "socket() failed: " + std::string(std::strerror(errno));
      return UploadStatus::kConnectFailed;
    }
    const int flags = ::fcntl(fd_, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
      last_error_ = "fcntl(O_NONBLOCK) failed: " + std::string(std::strerror(errno));
      return UploadStatus::kConnectFailed;
    }
    if (::connect(fd_, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
      if (errno != EINPROGRESS) {
        last_error_ = "connect() failed: " + std::string(std::strerror(errno));
        return UploadStatus::kConnectFailed;
      }
      fd_set writefds;
      FD_ZERO(&writefds);
      FD_SET(fd_, &writefds);
      timeval tv{};
      tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
      tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
      const int ready = ::select(fd_ + 1, nullptr, &writefds, nullptr, &tv);
      if (ready == 0) {
        last_error_ = "connect() timed out";
        return UploadStatus::kConnectTimeout;
      }
      if (ready < 0) {
        last_error_ = "select() failed: " + std::string(std::strerror(errno));
        return UploadStatus::kConnectFailed;
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      if (::getsockopt(fd_, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0 || so_error != 0) {
        last_error_ = "connect() failed: " +
                      std::string(std::strerror(so_error != 0 ? so_error : errno));
        return UploadStatus::kConnectFailed;
      }
    }
    if (::fcntl(fd_, F_SETFL, flags) < 0) {
      last_error_ = "fcntl() failed: " + std::string(std::strerror(errno));
      return UploadStatus::kConnectFailed;
    }
    timeval send_timeout{};
    send_timeout.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    send_timeout.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    if (::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &send_timeout, sizeof(send_timeout)) < 0) {
      last_error_ = "setsockopt(SO_SNDTIMEO) failed: " + std::string(std::strerror(errno));
      return UploadStatus::kConnectFailed;
    }
    return UploadStatus::kOk;
  }

  bool SendAll(const std::vector<uint8_t>& data) {
    size_t sent = 0;
    while (sent < data.size()) {
      const ssize_t result = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
      if (result < 0) {
        if (errno == EINTR) {
          continue;
        }
        std::ostringstream oss;
        oss << "send() failed after " << sent << " of " << data.size()
            << " bytes: " << std::strerror(errno);
        last_error_ = oss.str();
        return false;
      }
      sent += static_cast<size_t>(result);
    }
    return true;
  }

  bool ShutdownWrite() {
    if (::shutdown(fd_, SHUT_WR) < 0) {
      last_error_ = "shutdown(SHUT_WR) failed: " + std::string(std::strerror(errno));
      return false;
    }
    return true;
  }

  // Drain until the peer closes. The device closes once the program is stored.
  UploadStatus WaitForClose(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::array<uint8_t, 256> buffer{};
    while (true) {
      const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        last_error_ = "no acknowledgment before timeout";
        return UploadStatus::kAckTimeout;
      }
      const int ready = internal::WaitReadable(fd_, remaining);
      if (ready == 0) {
        continue;
      }
      if (ready < 0) {
        last_error_ = "select() failed: " + std::string(std::strerror(errno));
        return UploadStatus::kReceiveFailed;
      }
      const ssize_t bytes = ::recv(fd_, buffer.data(), buffer.size(), 0);
      if (bytes == 0) {
        return UploadStatus::kOk;
      }
      if (bytes < 0) {
        if (errno == EINTR) {
          continue;
        }
        last_error_ = "recv() failed: " + std::string(std::strerror(errno));
        return UploadStatus::kReceiveFailed;
      }
    }
  }

  void Close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  const std::string& last_error() const { return last_error_; }

 private:
  int fd_ = -1;
  std::string last_error_;
};

bool IsValidFilename(const std::string& filename) {
  if (filename.empty()) {
    return false;
  }
  for (const char c : filename) {
    const unsigned char byte = static_cast<unsigned char>(c);
    if (byte < 0x20 || byte > 0x7e) {
      return false;
    }
  }
  return true;
}

std::string BaseName(const std::string& path) {
  const auto pos = path.find_last_of('/');
  if (pos == std::string::npos) {
    return path;
  }
  return path.substr(pos + 1);
}

}  // namespace

SequenceUploader::SequenceUploader(Config config) : config_(std::move(config)) {}

UploadResult SequenceUploader::Upload(const std::string& address,
                                      const std::string& filename,
                                      const std::vector<uint8_t>& payload,
                                      const UploadOptions& options) const {
  auto result = [&](UploadStatus status, const std::string& message) {
    if (status != UploadStatus::kOk) {
      LogError("upload to " + address + ": " + message, &config_);
    }
    return UploadResult{status, message};
  };
  std::string error;
  if (!config_.Validate(&error)) {
    return result(UploadStatus::kInvalidArgument, error);
  }
  if (!internal::IsValidIpv4(address)) {
    return result(UploadStatus::kInvalidArgument, "address must be a valid IPv4 address");
  }
  if (!IsValidFilename(filename)) {
    return result(UploadStatus::kInvalidArgument, "filename must be non-empty printable ASCII");
  }
  if (payload.empty()) {
    return result(UploadStatus::kInvalidArgument, "payload must not be empty");
  }
  const uint32_t declared_size =
      options.declared_size.value_or(static_cast<uint32_t>(payload.size()));
  const std::array<uint8_t, 4> nonce = {internal::RandomByte(), internal::RandomByte(),
                                        internal::RandomByte(), internal::RandomByte()};
  const std::vector<uint8_t> frame =
      internal::BuildUploadFrame(filename, payload, declared_size, nonce);

  TcpSocket socket;
  const UploadStatus connected =
      socket.Connect(internal::MakeSockaddr(address, config_.upload_port),
                     config_.connect_timeout);
  if (connected != UploadStatus::kOk) {
    return result(connected, socket.last_error());
  }
  LogInfo("uploading " + filename + " (" + std::to_string(frame.size()) + " bytes) to " +
              address,
          &config_);
  if (!socket.SendAll(frame)) {
    return result(UploadStatus::kSendFailed, socket.last_error());
  }
  if (!socket.ShutdownWrite()) {
    return result(UploadStatus::kSendFailed, socket.last_error());
  }
  const UploadStatus acknowledged = socket.WaitForClose(config_.ack_timeout);
  if (acknowledged != UploadStatus::kOk) {
    return result(acknowledged, socket.last_error());
  }
  LogInfo("upload of " + filename + " acknowledged by " + address, &config_);
  return UploadResult{UploadStatus::kOk, {}};
}

UploadResult SequenceUploader::UploadFile(const std::string& address,
                                          const std::string& path) const {
  std::ifstream stream(path, std::ios::binary | std::ios::in);
  if (!stream) {
    const std::string message = "failed to open program file: " + path;
    LogError(message, &config_);
    return UploadResult{UploadStatus::kInvalidArgument, message};
  }
  std::vector<uint8_t> payload((std::istreambuf_iterator<char>(stream)),
                               std::istreambuf_iterator<char>());
  return Upload(address, BaseName(path), payload);
}

#ifdef LTXLINK_TESTING
namespace test {

std::vector<uint8_t> BuildUploadFrame(const std::string& filename,
                                      const std::vector<uint8_t>& payload,
                                      uint32_t declared_size,
                                      const std::array<uint8_t, 4>& nonce) {
  return internal::BuildUploadFrame(filename, payload, declared_size, nonce);
}

}  // namespace test
#endif

}  // namespace ltxlink
