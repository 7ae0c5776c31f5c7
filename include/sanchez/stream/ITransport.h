// Repository: Sanchez
// Component: Transport Interface
// Purpose: Packet-level send/receive abstraction over TCP, UDP and in-memory links.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_STREAM_ITRANSPORT_H_
#define SANCHEZ_STREAM_ITRANSPORT_H_

#include <cstddef>
#include <cstdint>

#include "sanchez/core/Status.h"
#include "sanchez/stream/Packet.h"

namespace sanchez::stream {

// ITransport moves whole packets. Implementations own their socket or queue
// and release it in Close() and in the destructor.
//
// Receive() errors:
// - kTimeout: nothing arrived within timeout_ms (the session may continue)
// - kDisconnected: the peer closed or the transport was closed
// - kIOError: socket failure
// - kInvalidFormat: a malformed packet arrived (connectionless transports
//   report it and stay usable)
class ITransport {
 public:
  virtual ~ITransport() = default;

  virtual Status Send(const Packet& packet) = 0;

  virtual Status Receive(Packet& packet, uint32_t timeout_ms) = 0;

  virtual void Close() = 0;

  // Largest packet (header included) the transport carries in one piece.
  virtual size_t max_packet_size() const = 0;
};

}  // namespace sanchez::stream

#endif  // SANCHEZ_STREAM_ITRANSPORT_H_
