#pragma once
// ─── VeilProxy — Scripted loopback HTTP server for tests ────────────────
// Accepts one connection per canned response, records the raw request,
// optionally stalls, then writes the response and closes.

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

class ScriptedServer {
 public:
  explicit ScriptedServer(std::vector<std::string> responses, int stall_ms = 0)
      : responses_(std::move(responses)), stall_ms_(stall_ms) {
    listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
    int reuse = 1;
    setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = 0;
    if (bind(listen_fd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) != 0 ||
        listen(listen_fd_, 8) != 0) {
      std::abort();
    }
    socklen_t len = sizeof(addr);
    getsockname(listen_fd_, reinterpret_cast<sockaddr *>(&addr), &len);
    port_ = ntohs(addr.sin_port);
    worker_ = std::thread([this] { serve(); });
  }

  ~ScriptedServer() {
    shutdown(listen_fd_, SHUT_RDWR);
    if (worker_.joinable()) worker_.join();
    close(listen_fd_);
  }

  ScriptedServer(const ScriptedServer &) = delete;
  ScriptedServer &operator=(const ScriptedServer &) = delete;

  int port() const { return port_; }

  std::string url(const std::string &path = "/") const {
    return "http://127.0.0.1:" + std::to_string(port_) + path;
  }

  std::vector<std::string> requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
  }

 private:
  void serve() {
    for (const auto &response : responses_) {
      int client = accept(listen_fd_, nullptr, nullptr);
      if (client < 0) return;
      record(read_request(client));
      if (stall_ms_ > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(stall_ms_));
      }
      size_t sent = 0;
      while (sent < response.size()) {
        ssize_t n = send(client, response.data() + sent, response.size() - sent,
                         MSG_NOSIGNAL);
        if (n <= 0) break;
        sent += static_cast<size_t>(n);
      }
      close(client);
    }
  }

  static std::string read_request(int client) {
    std::string raw;
    char buffer[4096];
    size_t expected_total = std::string::npos;
    while (raw.size() < expected_total) {
      ssize_t n = recv(client, buffer, sizeof(buffer), 0);
      if (n <= 0) break;
      raw.append(buffer, static_cast<size_t>(n));
      size_t header_end = raw.find("\r\n\r\n");
      if (header_end != std::string::npos && expected_total == std::string::npos) {
        size_t body_len = 0;
        size_t cl = raw.find("Content-Length: ");
        if (cl != std::string::npos && cl < header_end) {
          body_len = std::stoul(raw.substr(cl + 16));
        }
        expected_total = header_end + 4 + body_len;
      }
    }
    return raw;
  }

  void record(const std::string &request) {
    std::lock_guard<std::mutex> lock(mutex_);
    requests_.push_back(request);
  }

  std::vector<std::string> responses_;
  int stall_ms_;
  int listen_fd_ = -1;
  int port_ = 0;
  std::thread worker_;
  mutable std::mutex mutex_;
  std::vector<std::string> requests_;
};

// A loopback port with nothing listening on it.
inline int closed_loopback_port() {
  int fd = socket(AF_INET, SOCK_STREAM, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  addr.sin_port = 0;
  bind(fd, reinterpret_cast<sockaddr *>(&addr), sizeof(addr));
  socklen_t len = sizeof(addr);
  getsockname(fd, reinterpret_cast<sockaddr *>(&addr), &len);
  int port = ntohs(addr.sin_port);
  close(fd);
  return port;
}
