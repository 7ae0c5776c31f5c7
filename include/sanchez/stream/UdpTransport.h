// Repository: Sanchez
// Component: UDP Transport
// Purpose: One packet per datagram to a unicast, multicast or broadcast destination.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_STREAM_UDP_TRANSPORT_H_
#define SANCHEZ_STREAM_UDP_TRANSPORT_H_

#include <netinet/in.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "sanchez/stream/ITransport.h"
#include "sanchez/stream/StreamConfig.h"

namespace sanchez::stream {

// UdpTransport is either a sender bound to one destination or a receiver
// bound to a local port (optionally joined to a multicast group).
// Datagram boundaries are packet boundaries; there is no length prefix.
class UdpTransport : public ITransport {
 public:
  // Maximum UDP payload over IPv4.
  static constexpr size_t kMaxDatagram = 65507;

  ~UdpTransport() override;

  UdpTransport(const UdpTransport&) = delete;
  UdpTransport& operator=(const UdpTransport&) = delete;

  // Sender to host:port. Multicast sets the TTL and enables loopback;
  // broadcast enables SO_BROADCAST.
  static Status OpenSender(StreamMode mode, const std::string& host, uint16_t port,
                           int multicast_ttl, std::unique_ptr<UdpTransport>& out);

  // Receiver on port. For multicast, host is the group to join; for unicast,
  // host is the local bind address ("" = any). A unicast host that is not a
  // local address (the sender's) falls back to any.
  static Status OpenReceiver(StreamMode mode, const std::string& host, uint16_t port,
                             const std::string& multicast_interface,
                             std::unique_ptr<UdpTransport>& out);

  Status Send(const Packet& packet) override;
  Status Receive(Packet& packet, uint32_t timeout_ms) override;
  void Close() override;
  size_t max_packet_size() const override { return kMaxDatagram; }

  // Locally bound port (receivers).
  uint16_t local_port() const { return local_port_; }

 private:
  UdpTransport(int fd, const sockaddr_in& destination, uint16_t local_port);

  std::atomic<int> fd_;
  sockaddr_in destination_;
  uint16_t local_port_;
  std::vector<uint8_t> tx_;
  std::vector<uint8_t> rx_;
};

}  // namespace sanchez::stream

#endif  // SANCHEZ_STREAM_UDP_TRANSPORT_H_
