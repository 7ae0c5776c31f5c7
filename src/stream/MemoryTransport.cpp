// Repository: Sanchez
// Component: Memory Transport
// Purpose: Ordered in-process packet link for loopback sessions, tests and soak runs.
// Copyright (c) 2025 Sanchez

#include "sanchez/stream/MemoryTransport.h"

#include <chrono>
#include <utility>

namespace sanchez::stream {

MemoryTransport::MemoryTransport(std::shared_ptr<Channel> channel, int side,
                                 size_t max_packet_size)
    : channel_(std::move(channel)), side_(side), max_packet_size_(max_packet_size) {}

MemoryTransport::~MemoryTransport() {
  Close();
}

Status MemoryTransport::Send(const Packet& packet) {
  if (packet.wire_size() > max_packet_size_) {
    return Status(ErrorCode::kInvalidFormat, "packet exceeds link size");
  }
  std::lock_guard<std::mutex> lock(channel_->mutex);
  if (channel_->closed) {
    return Status(ErrorCode::kDisconnected, "link closed");
  }
  channel_->queues[1 - side_].push_back(packet);
  channel_->cv.notify_all();
  return Status::Ok();
}

Status MemoryTransport::Receive(Packet& packet, uint32_t timeout_ms) {
  std::unique_lock<std::mutex> lock(channel_->mutex);
  auto& queue = channel_->queues[side_];
  const bool ready = channel_->cv.wait_for(lock, std::chrono::milliseconds(timeout_ms), [&] {
    return !queue.empty() || channel_->closed;
  });
  if (!queue.empty()) {
    packet = std::move(queue.front());
    queue.pop_front();
    return Status::Ok();
  }
  if (ready && channel_->closed) {
    return Status(ErrorCode::kDisconnected, "link closed");
  }
  return Status(ErrorCode::kTimeout, "no packet");
}

void MemoryTransport::Close() {
  if (!channel_) {
    return;
  }
  std::lock_guard<std::mutex> lock(channel_->mutex);
  channel_->closed = true;
  channel_->cv.notify_all();
}

void CreateMemoryTransportPair(std::unique_ptr<MemoryTransport>& a,
                               std::unique_ptr<MemoryTransport>& b,
                               size_t max_packet_size) {
  auto channel = std::make_shared<MemoryTransport::Channel>();
  a = std::make_unique<MemoryTransport>(channel, 0, max_packet_size);
  b = std::make_unique<MemoryTransport>(channel, 1, max_packet_size);
}

}  // namespace sanchez::stream
