// Loopback TCP server that plays the ADB server side of a test script.
#pragma once

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <functional>
#include <string>
#include <thread>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace adbtrack_testing {

// Frame a payload as <4 lowercase hex digits><payload>.
inline std::string Frame(const std::string& payload) {
  char prefix[5] = {0};
  std::snprintf(prefix, sizeof(prefix), "%04x",
                static_cast<unsigned int>(payload.size()));
  return std::string(prefix) + payload;
}

inline bool WriteAll(int fd, const std::string& data) {
  size_t sent = 0;
  while (sent < data.size()) {
    const ssize_t result =
        ::send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    sent += static_cast<size_t>(result);
  }
  return true;
}

inline bool ReadAll(int fd, size_t n, std::string* out) {
  std::string data;
  data.reserve(n);
  char buffer[256];
  while (data.size() < n) {
    const size_t want = std::min(sizeof(buffer), n - data.size());
    const ssize_t result = ::recv(fd, buffer, want, 0);
    if (result < 0 && errno == EINTR) {
      continue;
    }
    if (result <= 0) {
      return false;
    }
    data.append(buffer, static_cast<size_t>(result));
  }
  if (out) {
    *out = data;
  }
  return true;
}

// Read one framed request from the client.
inline bool ReadRequest(int fd, std::string* command) {
  std::string header;
  if (!ReadAll(fd, 4, &header)) {
    return false;
  }
  const size_t length = std::strtoul(header.c_str(), nullptr, 16);
  return ReadAll(fd, length, command);
}

// Block until the client closes its end.
inline void WaitForPeerClose(int fd) {
  char buffer[64];
  while (true) {
    const ssize_t result = ::recv(fd, buffer, sizeof(buffer), 0);
    if (result < 0 && errno == EINTR) {
      continue;
    }
    if (result <= 0) {
      return;
    }
  }
}

class FakeAdbServer {
 public:
  using Script = std::function<void(int client_fd)>;

  FakeAdbServer() {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    int reuse = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    ::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    ::listen(listen_fd_, 4);
    socklen_t len = sizeof(addr);
    ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
  }

  ~FakeAdbServer() {
    Join();
    if (listen_fd_ >= 0) {
      ::close(listen_fd_);
    }
  }

  FakeAdbServer(const FakeAdbServer&) = delete;
  FakeAdbServer& operator=(const FakeAdbServer&) = delete;

  uint16_t port() const { return port_; }

  // Accept one client on a background thread and run the script against it.
  void Serve(Script script) {
    thread_ = std::thread([this, script]() {
      pollfd pfd{};
      pfd.fd = listen_fd_;
      pfd.events = POLLIN;
      if (::poll(&pfd, 1, 5000) <= 0) {
        return;
      }
      const int client = ::accept(listen_fd_, nullptr, nullptr);
      if (client < 0) {
        return;
      }
      script(client);
      ::close(client);
    });
  }

  void Join() {
    if (thread_.joinable()) {
      thread_.join();
    }
  }

 private:
  int listen_fd_ = -1;
  uint16_t port_ = 0;
  std::thread thread_;
};

// Return a loopback port with no listener.
inline uint16_t UnusedPort() {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = 0;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  socklen_t len = sizeof(addr);
  ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
  ::close(fd);
  return ntohs(addr.sin_port);
}

}  // namespace adbtrack_testing
