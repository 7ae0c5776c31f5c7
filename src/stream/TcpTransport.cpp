// Repository: Sanchez
// Component: TCP Transport
// Purpose: Length-prefixed packet framing over a connected TCP socket, plus the listener.
// Copyright (c) 2025 Sanchez

#include "sanchez/stream/TcpTransport.h"

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <iostream>
#include <utility>

#include "sanchez/format/ByteOrder.h"
#include "stream/SocketUtil.h"

namespace sanchez::stream {

namespace {

constexpr size_t kReadBlock = 64 * 1024;

void CloseFd(std::atomic<int>& fd) {
  const int old = fd.exchange(-1);
  if (old >= 0) {
    shutdown(old, SHUT_RDWR);
    close(old);
  }
}

}  // namespace

TcpTransport::TcpTransport(int fd, std::string peer)
    : fd_(fd), peer_(std::move(peer)), rx_offset_(0) {
  int one = 1;
  setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
}

TcpTransport::~TcpTransport() {
  Close();
}

Status TcpTransport::Connect(const std::string& host, uint16_t port, uint32_t timeout_ms,
                             std::unique_ptr<TcpTransport>& out) {
  sockaddr_in addr{};
  Status status = ResolveIPv4(host, port, addr);
  if (!status.ok()) {
    return status;
  }

  const int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return SocketError("socket", errno);
  }

  // Non-blocking connect so the timeout applies.
  const int flags = fcntl(fd, F_GETFL, 0);
  fcntl(fd, F_SETFL, flags | O_NONBLOCK);
  int rc = connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
  if (rc < 0 && errno == EINPROGRESS) {
    status = PollFd(fd, POLLOUT, timeout_ms);
    if (status.ok()) {
      int err = 0;
      socklen_t len = sizeof(err);
      getsockopt(fd, SOL_SOCKET, SO_ERROR, &err, &len);
      if (err != 0) {
        status = SocketError("connect " + FormatAddress(addr), err);
      }
    }
  } else if (rc < 0) {
    status = SocketError("connect " + FormatAddress(addr), errno);
  }
  if (!status.ok()) {
    close(fd);
    if (status.code() == ErrorCode::kTimeout) {
      return Status(ErrorCode::kDisconnected, "connect to " + FormatAddress(addr) + " timed out");
    }
    return status;
  }
  fcntl(fd, F_SETFL, flags);

  out = std::make_unique<TcpTransport>(fd, FormatAddress(addr));
  return Status::Ok();
}

Status TcpTransport::Send(const Packet& packet) {
  const int fd = fd_.load();
  if (fd < 0) {
    return Status(ErrorCode::kDisconnected, "transport closed");
  }
  if (packet.wire_size() > kMaxPacketSize) {
    return Status(ErrorCode::kInvalidFormat, "packet exceeds maximum size");
  }

  tx_.clear();
  format::ByteWriter writer(tx_);
  writer.PutU32(static_cast<uint32_t>(packet.wire_size()));
  writer.PutU8(static_cast<uint8_t>(packet.type));
  writer.PutU32(packet.sequence);
  writer.PutBytes(packet.payload.data(), packet.payload.size());

  size_t sent = 0;
  while (sent < tx_.size()) {
    const ssize_t n = send(fd, tx_.data() + sent, tx_.size() - sent, MSG_NOSIGNAL);
    if (n > 0) {
      sent += static_cast<size_t>(n);
      continue;
    }
    if (n < 0 && errno == EINTR) {
      continue;
    }
    if (n < 0 && (errno == EPIPE || errno == ECONNRESET)) {
      return Status(ErrorCode::kDisconnected, "peer " + peer_ + " closed the connection");
    }
    return SocketError("send to " + peer_, errno);
  }
  return Status::Ok();
}

bool TcpTransport::TakeBuffered(Packet& packet, Status& status) {
  const size_t available = rx_.size() - rx_offset_;
  if (available < kLengthPrefixSize) {
    return false;
  }
  format::ByteReader prefix(rx_.data() + rx_offset_, kLengthPrefixSize);
  uint32_t length = 0;
  prefix.GetU32(length);
  if (length < kPacketHeaderSize || length > kMaxPacketSize) {
    status = Status(ErrorCode::kInvalidFormat,
                    "bad packet length " + std::to_string(length) + " from " + peer_);
    return true;
  }
  if (available < kLengthPrefixSize + length) {
    return false;
  }

  status = ParsePacket(rx_.data() + rx_offset_ + kLengthPrefixSize, length, packet);
  rx_offset_ += kLengthPrefixSize + length;
  if (rx_offset_ == rx_.size()) {
    rx_.clear();
    rx_offset_ = 0;
  } else if (rx_offset_ > rx_.size() / 2) {
    rx_.erase(rx_.begin(), rx_.begin() + static_cast<std::ptrdiff_t>(rx_offset_));
    rx_offset_ = 0;
  }
  return true;
}

Status TcpTransport::Receive(Packet& packet, uint32_t timeout_ms) {
  Status status;
  if (TakeBuffered(packet, status)) {
    return status;
  }

  while (true) {
    const int fd = fd_.load();
    if (fd < 0) {
      return Status(ErrorCode::kDisconnected, "transport closed");
    }
    status = PollFd(fd, POLLIN, timeout_ms);
    if (!status.ok()) {
      return status;
    }

    const size_t old_size = rx_.size();
    rx_.resize(old_size + kReadBlock);
    const ssize_t n = recv(fd, rx_.data() + old_size, kReadBlock, 0);
    if (n <= 0) {
      rx_.resize(old_size);
      if (n == 0) {
        return Status(ErrorCode::kDisconnected, "peer " + peer_ + " closed the connection");
      }
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      if (errno == ECONNRESET) {
        return Status(ErrorCode::kDisconnected, "connection reset by " + peer_);
      }
      return SocketError("recv from " + peer_, errno);
    }
    rx_.resize(old_size + static_cast<size_t>(n));

    if (TakeBuffered(packet, status)) {
      return status;
    }
  }
}

void TcpTransport::Close() {
  CloseFd(fd_);
}

TcpListener::TcpListener() : fd_(-1), port_(0) {}

TcpListener::~TcpListener() {
  Close();
}

Status TcpListener::Listen(const std::string& host, uint16_t port, int backlog) {
  sockaddr_in addr{};
  Status status = ResolveIPv4(host, port, addr);
  if (!status.ok()) {
    return status;
  }

  const int fd = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return SocketError("socket", errno);
  }
  int opt = 1;
  setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

  if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
    const int err = errno;
    close(fd);
    return SocketError("bind " + FormatAddress(addr), err);
  }
  if (listen(fd, backlog) < 0) {
    const int err = errno;
    close(fd);
    return SocketError("listen", err);
  }

  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len);
  port_ = ntohs(bound.sin_port);
  fd_.store(fd);
  std::cout << "[TcpListener] Listening on " << FormatAddress(bound) << std::endl;
  return Status::Ok();
}

Status TcpListener::Accept(std::unique_ptr<TcpTransport>& out, uint32_t timeout_ms) {
  const int fd = fd_.load();
  if (fd < 0) {
    return Status(ErrorCode::kDisconnected, "listener closed");
  }
  Status status = PollFd(fd, POLLIN, timeout_ms);
  if (!status.ok()) {
    return status;
  }

  sockaddr_in peer{};
  socklen_t len = sizeof(peer);
  const int client = accept4(fd, reinterpret_cast<sockaddr*>(&peer), &len, SOCK_CLOEXEC);
  if (client < 0) {
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR || errno == ECONNABORTED) {
      return Status(ErrorCode::kTimeout, "no pending connection");
    }
    return SocketError("accept", errno);
  }
  out = std::make_unique<TcpTransport>(client, FormatAddress(peer));
  return Status::Ok();
}

void TcpListener::Close() {
  CloseFd(fd_);
}

}  // namespace sanchez::stream
