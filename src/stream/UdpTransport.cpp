// Repository: Sanchez
// Component: UDP Transport
// Purpose: One packet per datagram to a unicast, multicast or broadcast destination.
// Copyright (c) 2025 Sanchez

#include "sanchez/stream/UdpTransport.h"

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <iostream>

#include "stream/SocketUtil.h"

namespace sanchez::stream {

UdpTransport::UdpTransport(int fd, const sockaddr_in& destination, uint16_t local_port)
    : fd_(fd), destination_(destination), local_port_(local_port), rx_(kMaxDatagram) {}

UdpTransport::~UdpTransport() {
  Close();
}

Status UdpTransport::OpenSender(StreamMode mode, const std::string& host, uint16_t port,
                                int multicast_ttl, std::unique_ptr<UdpTransport>& out) {
  sockaddr_in destination{};
  Status status = ResolveIPv4(host, port, destination);
  if (!status.ok()) {
    return status;
  }

  const int fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return SocketError("socket", errno);
  }

  switch (mode) {
    case StreamMode::kUdpBroadcast: {
      int on = 1;
      if (setsockopt(fd, SOL_SOCKET, SO_BROADCAST, &on, sizeof(on)) < 0) {
        const int err = errno;
        close(fd);
        return SocketError("SO_BROADCAST", err);
      }
      break;
    }
    case StreamMode::kUdpMulticast: {
      const unsigned char ttl = static_cast<unsigned char>(multicast_ttl);
      const unsigned char loop = 1;
      if (setsockopt(fd, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0 ||
          setsockopt(fd, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) < 0) {
        const int err = errno;
        close(fd);
        return SocketError("multicast options", err);
      }
      break;
    }
    case StreamMode::kUdpUnicast:
      break;
    case StreamMode::kTcpUnicast:
      close(fd);
      return Status(ErrorCode::kIOError, "UDP transport cannot serve TCP mode");
  }

  out.reset(new UdpTransport(fd, destination, 0));
  std::cout << "[UdpTransport] Sending " << StreamModeToString(mode) << " to "
            << FormatAddress(destination) << std::endl;
  return Status::Ok();
}

Status UdpTransport::OpenReceiver(StreamMode mode, const std::string& host, uint16_t port,
                                  const std::string& multicast_interface,
                                  std::unique_ptr<UdpTransport>& out) {
  if (mode == StreamMode::kTcpUnicast) {
    return Status(ErrorCode::kIOError, "UDP transport cannot serve TCP mode");
  }

  const bool multicast = mode == StreamMode::kUdpMulticast;
  const bool bind_any = multicast || mode == StreamMode::kUdpBroadcast;
  sockaddr_in local{};
  Status status = ResolveIPv4(bind_any ? "" : host, port, local);
  if (!status.ok()) {
    return status;
  }

  const int fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
  if (fd < 0) {
    return SocketError("socket", errno);
  }
  int on = 1;
  setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on));
  int bound_ok = bind(fd, reinterpret_cast<sockaddr*>(&local), sizeof(local));
  if (bound_ok < 0 && errno == EADDRNOTAVAIL && !bind_any) {
    // Unicast host names the server, not this machine.
    std::cout << "[UdpTransport] " << host << " is not a local address, receiving on any"
              << std::endl;
    local.sin_addr.s_addr = htonl(INADDR_ANY);
    bound_ok = bind(fd, reinterpret_cast<sockaddr*>(&local), sizeof(local));
  }
  if (bound_ok < 0) {
    const int err = errno;
    close(fd);
    return SocketError("bind " + FormatAddress(local), err);
  }

  if (multicast) {
    sockaddr_in group{};
    sockaddr_in iface{};
    status = ResolveIPv4(host, port, group);
    if (status.ok()) {
      status = ResolveIPv4(multicast_interface, 0, iface);
    }
    if (!status.ok()) {
      close(fd);
      return status;
    }
    ip_mreq membership{};
    membership.imr_multiaddr = group.sin_addr;
    membership.imr_interface = iface.sin_addr;
    if (setsockopt(fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &membership, sizeof(membership)) < 0) {
      const int err = errno;
      close(fd);
      return SocketError("join group " + host, err);
    }
  }

  sockaddr_in bound{};
  socklen_t len = sizeof(bound);
  getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &len);
  out.reset(new UdpTransport(fd, sockaddr_in{}, ntohs(bound.sin_port)));
  std::cout << "[UdpTransport] Receiving " << StreamModeToString(mode) << " on "
            << FormatAddress(bound) << (multicast ? " group " + host : std::string())
            << std::endl;
  return Status::Ok();
}

Status UdpTransport::Send(const Packet& packet) {
  const int fd = fd_.load();
  if (fd < 0) {
    return Status(ErrorCode::kDisconnected, "transport closed");
  }
  if (packet.wire_size() > kMaxDatagram) {
    return Status(ErrorCode::kInvalidFormat, "packet does not fit one datagram");
  }
  SerializePacket(packet, tx_);

  while (true) {
    const ssize_t n = sendto(fd, tx_.data(), tx_.size(), 0,
                             reinterpret_cast<const sockaddr*>(&destination_),
                             sizeof(destination_));
    if (n >= 0) {
      return Status::Ok();
    }
    if (errno == EINTR) {
      continue;
    }
    // Nobody listening on a unicast destination is not fatal for a datagram sender.
    if (errno == ECONNREFUSED) {
      return Status::Ok();
    }
    return SocketError("sendto " + FormatAddress(destination_), errno);
  }
}

Status UdpTransport::Receive(Packet& packet, uint32_t timeout_ms) {
  while (true) {
    const int fd = fd_.load();
    if (fd < 0) {
      return Status(ErrorCode::kDisconnected, "transport closed");
    }
    Status status = PollFd(fd, POLLIN, timeout_ms);
    if (!status.ok()) {
      return status;
    }
    const ssize_t n = recv(fd, rx_.data(), rx_.size(), 0);
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN || errno == ECONNREFUSED) {
        continue;
      }
      return SocketError("recv", errno);
    }
    return ParsePacket(rx_.data(), static_cast<size_t>(n), packet);
  }
}

void UdpTransport::Close() {
  const int fd = fd_.exchange(-1);
  if (fd >= 0) {
    close(fd);
  }
}

}  // namespace sanchez::stream
