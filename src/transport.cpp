#include "adbtrack/adbtrack.h"
#include "internal.h"

#include <algorithm>
#include <array>
#include <atomic>
#include <cerrno>
#include <condition_variable>
#include <cstring>
#include <mutex>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/select.h>
#include <sys/socket.h>
#include <unistd.h>

namespace adbtrack {
namespace {

constexpr size_t kRecvChunkSize = 4096;
constexpr long kSelectTimeoutUs = 200000;

// Render a status token for logs, escaping non-printable bytes.
std::string PrintableToken(const std::string& token) {
  std::ostringstream oss;
  for (unsigned char c : token) {
    if (c >= 0x20 && c < 0x7f) {
      oss << static_cast<char>(c);
    } else {
      static const char kHex[] = "0123456789abcdef";
      oss << "\\x" << kHex[c >> 4] << kHex[c & 0x0f];
    }
  }
  return oss.str();
}

// Wait up to kSelectTimeoutUs for fd to become readable or writable.
int WaitFd(int fd, bool for_write) {
  fd_set fds;
  FD_ZERO(&fds);
  FD_SET(fd, &fds);
  timeval tv{};
  tv.tv_sec = 0;
  tv.tv_usec = kSelectTimeoutUs;
  return ::select(fd + 1, for_write ? nullptr : &fds, for_write ? &fds : nullptr,
                  nullptr, &tv);
}

// Minimal TCP socket wrapper with a cancellable connect.
class TcpSocket {
 public:
  TcpSocket() = default;
  ~TcpSocket() { Close(); }

  bool Open(const std::string& host, uint16_t port,
            const std::atomic<bool>& cancel) {
    if (fd_ >= 0) {
      return true;
    }
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* results = nullptr;
    const std::string service = std::to_string(port);
    const int rc = ::getaddrinfo(host.c_str(), service.c_str(), &hints, &results);
    if (rc != 0) {
      last_error_ = "getaddrinfo(" + host + ") failed: " + ::gai_strerror(rc);
      return false;
    }
    last_error_ = "no usable address for " + host;
    for (addrinfo* ai = results; ai != nullptr; ai = ai->ai_next) {
      if (cancel) {
        last_error_ = "connect cancelled";
        break;
      }
      if (ConnectOne(ai, cancel)) {
        break;
      }
    }
    ::freeaddrinfo(results);
    return fd_ >= 0;
  }

  void Shutdown() {
    if (fd_ >= 0) {
      ::shutdown(fd_, SHUT_RDWR);
    }
  }

  void Close() {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

  int fd() const { return fd_; }
  const std::string& last_error() const { return last_error_; }

  bool SendAll(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
      const ssize_t result = ::send(fd_, data.data() + sent, data.size() - sent,
                                    MSG_NOSIGNAL);
      if (result < 0) {
        if (errno == EINTR) {
          continue;
        }
        last_error_ = "send() failed: " + std::string(std::strerror(errno));
        return false;
      }
      sent += static_cast<size_t>(result);
    }
    return true;
  }

  ssize_t Recv(char* buffer, size_t length) {
    return ::recv(fd_, buffer, length, 0);
  }

 private:
  bool ConnectOne(const addrinfo* ai, const std::atomic<bool>& cancel) {
    const int fd = ::socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
    if (fd < 0) {
      last_error_ = "socket() failed: " + std::string(std::strerror(errno));
      return false;
    }
    const int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
      last_error_ = "fcntl(O_NONBLOCK) failed: " + std::string(std::strerror(errno));
      ::close(fd);
      return false;
    }
    if (::connect(fd, ai->ai_addr, ai->ai_addrlen) < 0) {
      if (errno != EINPROGRESS) {
        last_error_ = "connect() failed: " + std::string(std::strerror(errno));
        ::close(fd);
        return false;
      }
      while (true) {
        if (cancel) {
          last_error_ = "connect cancelled";
          ::close(fd);
          return false;
        }
        const int ready = WaitFd(fd, true);
        if (ready < 0 && errno != EINTR) {
          last_error_ = "select() failed: " + std::string(std::strerror(errno));
          ::close(fd);
          return false;
        }
        if (ready > 0) {
          break;
        }
      }
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) < 0) {
        so_error = errno;
      }
      if (so_error != 0) {
        last_error_ = "connect() failed: " + std::string(std::strerror(so_error));
        ::close(fd);
        return false;
      }
    }
    if (::fcntl(fd, F_SETFL, flags) < 0) {
      last_error_ = "fcntl(restore) failed: " + std::string(std::strerror(errno));
      ::close(fd);
      return false;
    }
    fd_ = fd;
    return true;
  }

  int fd_ = -1;
  std::string last_error_;
};

}  // namespace

struct Transport::Impl {
  explicit Impl(Config config) : config_(std::move(config)) {}

  ~Impl() { Disconnect(); }

  bool Connect(Error* error) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      if (connected_) {
        return true;
      }
      if (closed_) {
        internal::SetError(error, ErrorCode::kInvalidState,
                           "transport already closed; create a new transport");
        return false;
      }
    }
    std::string config_error;
    if (!config_.Validate(&config_error)) {
      Log(LogLevel::kError, "Invalid configuration: " + config_error);
      internal::SetError(error, ErrorCode::kInvalidConfig, config_error);
      return false;
    }
    const std::string endpoint = Endpoint();
    Log(LogLevel::kInfo, "Connecting to ADB server: " + endpoint);
    if (!socket_.Open(config_.host, config_.port, disconnect_requested_)) {
      const std::string message =
          "Connection to " + endpoint + " failed: " + socket_.last_error();
      Log(LogLevel::kError, message);
      Log(LogLevel::kInfo,
          "Please make sure the ADB server is running (run 'adb start-server')");
      internal::SetError(error, ErrorCode::kConnection, message);
      return false;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      connected_ = true;
    }
    try {
      recv_thread_ = std::thread([this]() { RecvLoop(); });
    } catch (const std::exception& ex) {
      const std::string message = std::string("receive thread start failed: ") + ex.what();
      Log(LogLevel::kError, message);
      {
        std::lock_guard<std::mutex> lock(mutex_);
        MarkClosedLocked(ErrorCode::kConnection, message);
      }
      socket_.Close();
      internal::SetError(error, ErrorCode::kConnection, message);
      return false;
    }
    Log(LogLevel::kInfo, "Successfully connected to ADB server: " + endpoint);
    return true;
  }

  bool ReadExactBytes(size_t n, std::string* out, Error* error) {
    if (n > config_.max_buffered_bytes) {
      std::ostringstream oss;
      oss << "read of " << n << " bytes exceeds receive buffer limit of "
          << config_.max_buffered_bytes << " bytes";
      internal::SetError(error, ErrorCode::kProtocol, oss.str());
      return false;
    }
    std::unique_lock<std::mutex> lock(mutex_);
    const uint64_t ticket = next_ticket_++;
    cv_.wait(lock, [&]() {
      return serving_ticket_ == ticket && (buffer_.size() >= n || !connected_);
    });
    ++serving_ticket_;
    cv_.notify_all();
    if (buffer_.size() >= n) {
      if (out) {
        out->assign(buffer_, 0, n);
      }
      buffer_.erase(0, n);
      return true;
    }
    if (close_error_.code != ErrorCode::kNone) {
      internal::SetError(error, close_error_.code, close_error_.message);
    } else {
      std::ostringstream oss;
      oss << "connection closed before " << n << " bytes were received ("
          << buffer_.size() << " buffered)";
      internal::SetError(error, ErrorCode::kConnection, oss.str());
    }
    return false;
  }

  bool ReadLengthPrefixed(std::string* payload, Error* error, bool* header_read) {
    if (header_read) {
      *header_read = false;
    }
    std::string header;
    if (!ReadExactBytes(kLengthPrefixSize, &header, error)) {
      return false;
    }
    if (header_read) {
      *header_read = true;
    }
    size_t length = 0;
    if (!DecodeLengthPrefix(header, &length)) {
      internal::SetError(error, ErrorCode::kProtocol,
                         "invalid frame length header: " + PrintableToken(header));
      return false;
    }
    if (length > config_.max_payload_length) {
      std::ostringstream oss;
      oss << "declared frame length " << length << " exceeds limit of "
          << config_.max_payload_length << " bytes";
      internal::SetError(error, ErrorCode::kProtocol, oss.str());
      return false;
    }
    if (length == 0) {
      if (payload) {
        payload->clear();
      }
      return true;
    }
    return ReadExactBytes(length, payload, error);
  }

  bool SendCommand(const std::string& command, Error* error) {
    std::string frame;
    if (!EncodeCommand(command, &frame, error)) {
      Log(LogLevel::kError, "Refusing to send oversized command");
      return false;
    }
    if (!IsConnected()) {
      internal::SetError(error, ErrorCode::kConnection,
                         "cannot send command while disconnected: " + command);
      return false;
    }
    Log(LogLevel::kInfo, "Sending command: " + command);
    {
      std::lock_guard<std::mutex> lock(socket_mutex_);
      if (socket_.fd() < 0 || !socket_.SendAll(frame)) {
        const std::string message = "failed to send command " + command + ": " +
                                    socket_.last_error();
        Log(LogLevel::kError, message);
        internal::SetError(error, ErrorCode::kConnection, message);
        return false;
      }
    }
    std::string status;
    if (!ReadExactBytes(kStatusTokenSize, &status, error)) {
      return false;
    }
    if (status == kOkayToken) {
      Log(LogLevel::kInfo, "Command successful: " + command);
      return true;
    }
    if (status == kFailToken) {
      std::string message = "ADB command failed: " + command;
      if (config_.read_failure_reason) {
        std::string reason;
        Error reason_error;
        if (ReadLengthPrefixed(&reason, &reason_error, nullptr)) {
          message += ": " + reason;
        } else {
          Log(LogLevel::kWarning,
              "Could not read failure reason: " + reason_error.message);
        }
      }
      Log(LogLevel::kError, message);
      internal::SetError(error, ErrorCode::kCommandFailed, message);
      return false;
    }
    const std::string message = "Unexpected response: " + PrintableToken(status);
    Log(LogLevel::kError, message);
    internal::SetError(error, ErrorCode::kProtocol, message);
    return false;
  }

  bool IsConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
  }

  void Disconnect() {
    disconnect_requested_ = true;
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    {
      std::lock_guard<std::mutex> lock(mutex_);
      MarkClosedLocked(ErrorCode::kNone, {});
    }
    socket_.Shutdown();
    if (recv_thread_.joinable()) {
      if (recv_thread_.get_id() == std::this_thread::get_id()) {
        recv_thread_.detach();
      } else {
        recv_thread_.join();
      }
    }
    std::lock_guard<std::mutex> lock(socket_mutex_);
    socket_.Close();
  }

  bool WaitForClose(Error* error) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return !connected_; });
    if (close_error_.code != ErrorCode::kNone) {
      internal::SetError(error, close_error_.code, close_error_.message);
      return false;
    }
    return true;
  }

  size_t BufferedBytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffer_.size();
  }

 private:
  std::string Endpoint() const {
    return config_.host + ":" + std::to_string(config_.port);
  }

  void Log(LogLevel level, const std::string& message) const {
    internal::Log(config_.log_callback, level, message);
  }

  // Requires mutex_. The first recorded error is kept as the terminal error.
  void MarkClosedLocked(ErrorCode code, const std::string& message) {
    if (code != ErrorCode::kNone && close_error_.code == ErrorCode::kNone &&
        connected_) {
      close_error_.code = code;
      close_error_.message = message;
    }
    connected_ = false;
    closed_ = true;
    cv_.notify_all();
  }

  // Append incoming bytes to the buffer until the stream ends. A full buffer
  // leaves further data in the kernel until a reader makes room.
  void RecvLoop() {
    std::array<char, kRecvChunkSize> chunk{};
    const int fd = socket_.fd();
    while (!disconnect_requested_) {
      size_t room = 0;
      {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this]() {
          return disconnect_requested_ ||
                 buffer_.size() < config_.max_buffered_bytes;
        });
        if (disconnect_requested_) {
          break;
        }
        room = config_.max_buffered_bytes - buffer_.size();
      }
      const int ready = WaitFd(fd, false);
      if (ready == 0) {
        continue;
      }
      if (ready < 0) {
        if (errno == EINTR) {
          continue;
        }
        const std::string message = "select() failed: " + std::string(std::strerror(errno));
        std::lock_guard<std::mutex> lock(mutex_);
        MarkClosedLocked(ErrorCode::kConnection, message);
        break;
      }
      const ssize_t bytes = socket_.Recv(chunk.data(), std::min(chunk.size(), room));
      if (bytes > 0) {
        std::lock_guard<std::mutex> lock(mutex_);
        buffer_.append(chunk.data(), static_cast<size_t>(bytes));
        cv_.notify_all();
        continue;
      }
      if (bytes < 0 && (errno == EINTR || errno == EAGAIN)) {
        continue;
      }
      const std::string message = bytes == 0
          ? std::string()
          : "recv() failed: " + std::string(std::strerror(errno));
      std::lock_guard<std::mutex> lock(mutex_);
      if (bytes == 0 || disconnect_requested_) {
        MarkClosedLocked(ErrorCode::kNone, {});
      } else {
        MarkClosedLocked(ErrorCode::kConnection, message);
      }
      break;
    }
    {
      std::lock_guard<std::mutex> lock(mutex_);
      MarkClosedLocked(ErrorCode::kNone, {});
    }
    Log(LogLevel::kInfo, "Connection closed: " + Endpoint());
  }

  Config config_;
  TcpSocket socket_;
  std::thread recv_thread_;
  std::atomic<bool> disconnect_requested_{false};

  mutable std::mutex lifecycle_mutex_;
  mutable std::mutex socket_mutex_;

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::string buffer_;
  bool connected_ = false;
  bool closed_ = false;
  Error close_error_;
  uint64_t next_ticket_ = 0;
  uint64_t serving_ticket_ = 0;
};

Transport::Transport(Config config) : impl_(new Impl(std::move(config))) {}

Transport::~Transport() = default;

bool Transport::Connect(Error* error) { return impl_->Connect(error); }

bool Transport::ReadExactBytes(size_t n, std::string* out, Error* error) {
  return impl_->ReadExactBytes(n, out, error);
}

bool Transport::ReadLengthPrefixed(std::string* payload, Error* error,
                                   bool* header_read) {
  return impl_->ReadLengthPrefixed(payload, error, header_read);
}

bool Transport::SendCommand(const std::string& command, Error* error) {
  return impl_->SendCommand(command, error);
}

bool Transport::IsConnected() const { return impl_->IsConnected(); }

void Transport::Disconnect() { impl_->Disconnect(); }

bool Transport::WaitForClose(Error* error) { return impl_->WaitForClose(error); }

size_t Transport::BufferedBytes() const { return impl_->BufferedBytes(); }

}  // namespace adbtrack
