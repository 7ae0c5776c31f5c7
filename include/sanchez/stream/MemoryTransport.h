// Repository: Sanchez
// Component: Memory Transport
// Purpose: Ordered in-process packet link for loopback sessions, tests and soak runs.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_STREAM_MEMORY_TRANSPORT_H_
#define SANCHEZ_STREAM_MEMORY_TRANSPORT_H_

#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>

#include "sanchez/stream/ITransport.h"

namespace sanchez::stream {

// MemoryTransport is one end of a bidirectional in-process link.
// Packets arrive in send order. Closing either end makes the other end
// report kDisconnected once its queue has drained.
class MemoryTransport : public ITransport {
 public:
  struct Channel;

  MemoryTransport(std::shared_ptr<Channel> channel, int side, size_t max_packet_size);
  ~MemoryTransport() override;

  MemoryTransport(const MemoryTransport&) = delete;
  MemoryTransport& operator=(const MemoryTransport&) = delete;

  Status Send(const Packet& packet) override;
  Status Receive(Packet& packet, uint32_t timeout_ms) override;
  void Close() override;
  size_t max_packet_size() const override { return max_packet_size_; }

 private:
  std::shared_ptr<Channel> channel_;
  int side_;
  size_t max_packet_size_;
};

struct MemoryTransport::Channel {
  std::mutex mutex;
  std::condition_variable cv;
  std::deque<Packet> queues[2];
  bool closed = false;
};

// Creates both ends of a link.
void CreateMemoryTransportPair(std::unique_ptr<MemoryTransport>& a,
                               std::unique_ptr<MemoryTransport>& b,
                               size_t max_packet_size = kMaxPacketSize);

}  // namespace sanchez::stream

#endif  // SANCHEZ_STREAM_MEMORY_TRANSPORT_H_
