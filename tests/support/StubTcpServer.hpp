// Repository: loopcast
// Component: Test Support
// Purpose: Loopback TCP server with a scripted per-connection handler, for
//          exercising network clients against stalled or canned peers.
// Copyright (c) 2026 Loopcast

#ifndef LOOPCAST_TESTS_SUPPORT_STUB_TCP_SERVER_HPP_
#define LOOPCAST_TESTS_SUPPORT_STUB_TCP_SERVER_HPP_

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cstdlib>
#include <functional>
#include <initializer_list>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace loopcast::tests {

class StubTcpServer;

// One accepted connection. Reads give up (returning what they have) when the
// peer closes or the server is stopping.
class StubConnection {
 public:
  StubConnection(StubTcpServer& server, int fd) : server_(server), fd_(fd) {}

  // Consumes and returns everything up to and including `terminator`.
  std::string ReadUntil(const std::string& terminator);
  std::string ReadExactly(size_t count);

  void Write(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
      const ssize_t n = ::send(fd_, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
      if (n <= 0) return;
      sent += static_cast<size_t>(n);
    }
  }

  // Keeps the connection open without answering until the server stops.
  void Stall();

  StubTcpServer& server() { return server_; }

 private:
  bool Fill();

  StubTcpServer& server_;
  const int fd_;
  std::string pending_;
};

class StubTcpServer {
 public:
  using Handler = std::function<void(StubConnection&)>;

  explicit StubTcpServer(Handler handler) : handler_(std::move(handler)) {
    listen_fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (listen_fd_ < 0) throw std::runtime_error("socket() failed");
    const int one = 1;
    ::setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (::bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(listen_fd_, 8) != 0) {
      ::close(listen_fd_);
      throw std::runtime_error("cannot listen on loopback");
    }
    socklen_t len = sizeof(addr);
    ::getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
    port_ = ntohs(addr.sin_port);
    thread_ = std::thread([this] { AcceptLoop(); });
  }

  ~StubTcpServer() {
    stopping_.store(true);
    if (thread_.joinable()) thread_.join();
    ::close(listen_fd_);
  }

  StubTcpServer(const StubTcpServer&) = delete;
  StubTcpServer& operator=(const StubTcpServer&) = delete;

  int port() const { return port_; }
  bool stopping() const { return stopping_.load(); }
  int Connections() const { return connections_.load(); }

  void Record(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    received_.push_back(text);
  }

  std::vector<std::string> Received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_;
  }

 private:
  void AcceptLoop() {
    while (!stopping_.load()) {
      pollfd pfd{listen_fd_, POLLIN, 0};
      if (::poll(&pfd, 1, 20) <= 0) continue;
      const int fd = ::accept(listen_fd_, nullptr, nullptr);
      if (fd < 0) continue;
      ++connections_;
      StubConnection connection(*this, fd);
      handler_(connection);
      ::close(fd);
    }
  }

  Handler handler_;
  int listen_fd_ = -1;
  int port_ = 0;
  std::atomic<bool> stopping_{false};
  std::atomic<int> connections_{0};
  std::thread thread_;

  mutable std::mutex mutex_;
  std::vector<std::string> received_;
};

inline bool StubConnection::Fill() {
  while (!server_.stopping()) {
    pollfd pfd{fd_, POLLIN, 0};
    const int ready = ::poll(&pfd, 1, 20);
    if (ready < 0) return false;
    if (ready == 0) continue;
    char buf[4096];
    const ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
    if (n <= 0) return false;
    pending_.append(buf, static_cast<size_t>(n));
    return true;
  }
  return false;
}

inline std::string StubConnection::ReadUntil(const std::string& terminator) {
  size_t found;
  while ((found = pending_.find(terminator)) == std::string::npos) {
    if (!Fill()) {
      std::string rest;
      rest.swap(pending_);
      return rest;
    }
  }
  std::string out = pending_.substr(0, found + terminator.size());
  pending_.erase(0, found + terminator.size());
  return out;
}

inline std::string StubConnection::ReadExactly(size_t count) {
  while (pending_.size() < count) {
    if (!Fill()) break;
  }
  std::string out = pending_.substr(0, count);
  pending_.erase(0, out.size());
  return out;
}

inline void StubConnection::Stall() {
  while (!server_.stopping()) {
    pollfd pfd{fd_, POLLIN, 0};
    if (::poll(&pfd, 1, 20) > 0) {
      char buf[4096];
      if (::recv(fd_, buf, sizeof(buf), 0) <= 0) return;
    }
  }
}

// Canned HTTP/1.1 responder: records each request (head plus body) and
// answers with `response`.
inline StubTcpServer::Handler HttpResponder(std::string response) {
  return [response](StubConnection& connection) {
    const std::string head = connection.ReadUntil("\r\n\r\n");
    size_t length = 0;
    for (const char* marker : {"Content-Length: ", "content-length: "}) {
      const size_t at = head.find(marker);
      if (at != std::string::npos) {
        length = static_cast<size_t>(
            std::strtoul(head.c_str() + at + std::string(marker).size(), nullptr, 10));
      }
    }
    connection.server().Record(head + connection.ReadExactly(length));
    connection.Write(response);
  };
}

}  // namespace loopcast::tests

#endif  // LOOPCAST_TESTS_SUPPORT_STUB_TCP_SERVER_HPP_
