// Repository: Sanchez
// Component: Metrics HTTP Server
// Purpose: Minimal HTTP endpoint serving Prometheus text.
// Copyright (c) 2025 Sanchez

#include "sanchez/telemetry/MetricsHTTPServer.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <iostream>
#include <sstream>

namespace sanchez::telemetry {

namespace {

constexpr int kInvalidSocket = -1;
constexpr int kAcceptPollMs = 100;
constexpr size_t kMaxRequestBytes = 8192;

std::string PlainResponse(const char* status, const std::string& content_type,
                          const std::string& body) {
  std::ostringstream response;
  response << "HTTP/1.1 " << status << "\r\n";
  response << "Content-Type: " << content_type << "\r\n";
  response << "Content-Length: " << body.size() << "\r\n";
  response << "Connection: close\r\n";
  response << "\r\n";
  response << body;
  return response.str();
}

}  // namespace

MetricsHTTPServer::MetricsHTTPServer(int port)
    : port_(port),
      running_(false),
      stop_requested_(false),
      server_socket_(kInvalidSocket) {}

MetricsHTTPServer::~MetricsHTTPServer() {
  Stop();
}

void MetricsHTTPServer::SetMetricsCallback(MetricsCallback callback) {
  metrics_callback_ = std::move(callback);
}

bool MetricsHTTPServer::Start() {
  if (running_.load(std::memory_order_acquire)) {
    std::cerr << "[MetricsHTTPServer] Already running" << std::endl;
    return false;
  }
  if (!metrics_callback_) {
    std::cerr << "[MetricsHTTPServer] Metrics callback not set" << std::endl;
    return false;
  }

  int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    std::cerr << "[MetricsHTTPServer] socket() failed: " << std::strerror(errno) << std::endl;
    return false;
  }

  int opt = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_addr.s_addr = htonl(INADDR_ANY);
  addr.sin_port = htons(static_cast<uint16_t>(port_));

  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    std::cerr << "[MetricsHTTPServer] Failed to bind port " << port_ << ": "
              << std::strerror(errno) << std::endl;
    ::close(fd);
    return false;
  }
  if (::listen(fd, 5) != 0) {
    std::cerr << "[MetricsHTTPServer] listen() failed: " << std::strerror(errno) << std::endl;
    ::close(fd);
    return false;
  }

  socklen_t len = sizeof(addr);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
    port_ = ntohs(addr.sin_port);
  }

  server_socket_ = fd;
  stop_requested_.store(false, std::memory_order_release);
  running_.store(true, std::memory_order_release);
  server_thread_ = std::make_unique<std::thread>(&MetricsHTTPServer::ServerLoop, this);

  std::cout << "[MetricsHTTPServer] Listening on port " << port_ << std::endl;
  return true;
}

void MetricsHTTPServer::Stop() {
  if (!server_thread_) {
    return;
  }

  stop_requested_.store(true, std::memory_order_release);
  if (server_thread_->joinable()) {
    server_thread_->join();
  }
  server_thread_.reset();

  if (server_socket_ != kInvalidSocket) {
    ::close(server_socket_);
    server_socket_ = kInvalidSocket;
  }
  running_.store(false, std::memory_order_release);
  std::cout << "[MetricsHTTPServer] Stopped" << std::endl;
}

void MetricsHTTPServer::ServerLoop() {
  while (!stop_requested_.load(std::memory_order_acquire)) {
    pollfd pfd{};
    pfd.fd = server_socket_;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, kAcceptPollMs);
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      std::cerr << "[MetricsHTTPServer] poll() failed: " << std::strerror(errno) << std::endl;
      break;
    }
    if (ready == 0) {
      continue;
    }

    const int client = ::accept4(server_socket_, nullptr, nullptr, SOCK_CLOEXEC);
    if (client < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK || errno == ECONNABORTED) {
        continue;
      }
      std::cerr << "[MetricsHTTPServer] accept() failed: " << std::strerror(errno) << std::endl;
      break;
    }

    HandleConnection(client);
    ::close(client);
  }

  running_.store(false, std::memory_order_release);
}

void MetricsHTTPServer::HandleConnection(int client_socket) {
  timeval timeout{};
  timeout.tv_sec = 5;
  ::setsockopt(client_socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));
  ::setsockopt(client_socket, SOL_SOCKET, SO_SNDTIMEO, &timeout, sizeof(timeout));

  // Read until the end of the request head.
  std::string request;
  char buffer[1024];
  while (request.size() < kMaxRequestBytes && request.find("\r\n\r\n") == std::string::npos) {
    const ssize_t n = ::recv(client_socket, buffer, sizeof(buffer), 0);
    if (n <= 0) {
      break;
    }
    request.append(buffer, static_cast<size_t>(n));
  }
  if (request.empty()) {
    return;
  }

  const std::string response = BuildResponse(ParseRequestPath(request));
  size_t sent = 0;
  while (sent < response.size()) {
    const ssize_t n = ::send(client_socket, response.data() + sent, response.size() - sent,
                             MSG_NOSIGNAL);
    if (n <= 0) {
      if (n < 0 && errno == EINTR) {
        continue;
      }
      return;
    }
    sent += static_cast<size_t>(n);
  }
}

std::string MetricsHTTPServer::ParseRequestPath(const std::string& request) {
  // GET /path HTTP/1.1
  const size_t first = request.find(' ');
  if (first == std::string::npos) {
    return "/";
  }
  const size_t second = request.find(' ', first + 1);
  if (second == std::string::npos) {
    return "/";
  }
  return request.substr(first + 1, second - first - 1);
}

std::string MetricsHTTPServer::BuildResponse(const std::string& path) {
  if (path == "/metrics") {
    return PlainResponse("200 OK", "text/plain; version=0.0.4; charset=utf-8",
                         metrics_callback_());
  }
  if (path == "/") {
    return PlainResponse("200 OK", "text/plain",
                         "Sanchez stream metrics\nMetrics available at: /metrics\n");
  }
  return PlainResponse("404 Not Found", "text/plain", "404 Not Found\n");
}

}  // namespace sanchez::telemetry
