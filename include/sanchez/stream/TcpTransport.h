// Repository: Sanchez
// Component: TCP Transport
// Purpose: Length-prefixed packet framing over a connected TCP socket, plus the listener.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_STREAM_TCP_TRANSPORT_H_
#define SANCHEZ_STREAM_TCP_TRANSPORT_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "sanchez/stream/ITransport.h"

namespace sanchez::stream {

// TcpTransport frames every packet as [length:u32][type][sequence][payload].
// Partial reads are buffered across Receive() calls. Send and Receive may be
// used from different threads; each direction is single-threaded.
class TcpTransport : public ITransport {
 public:
  // Takes ownership of a connected socket.
  TcpTransport(int fd, std::string peer);
  ~TcpTransport() override;

  TcpTransport(const TcpTransport&) = delete;
  TcpTransport& operator=(const TcpTransport&) = delete;

  static Status Connect(const std::string& host, uint16_t port, uint32_t timeout_ms,
                        std::unique_ptr<TcpTransport>& out);

  Status Send(const Packet& packet) override;
  Status Receive(Packet& packet, uint32_t timeout_ms) override;
  void Close() override;
  size_t max_packet_size() const override { return kMaxPacketSize; }

  const std::string& peer() const { return peer_; }

 private:
  // Extracts one complete packet from rx_ if present.
  bool TakeBuffered(Packet& packet, Status& status);

  std::atomic<int> fd_;
  std::string peer_;
  std::vector<uint8_t> tx_;
  std::vector<uint8_t> rx_;
  size_t rx_offset_;
};

// TcpListener accepts incoming stream clients.
class TcpListener {
 public:
  TcpListener();
  ~TcpListener();

  TcpListener(const TcpListener&) = delete;
  TcpListener& operator=(const TcpListener&) = delete;

  // Binds and listens. port 0 picks an ephemeral port (see port()).
  Status Listen(const std::string& host, uint16_t port, int backlog = 8);

  // kTimeout when nobody connected within timeout_ms.
  Status Accept(std::unique_ptr<TcpTransport>& out, uint32_t timeout_ms);

  void Close();

  uint16_t port() const { return port_; }

 private:
  std::atomic<int> fd_;
  uint16_t port_;
};

}  // namespace sanchez::stream

#endif  // SANCHEZ_STREAM_TCP_TRANSPORT_H_
