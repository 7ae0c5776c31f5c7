// Repository: Sanchez
// Component: Lossy Transport
// Purpose: Decorator that drops outgoing packets at random to simulate lossy links.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_STREAM_LOSSY_TRANSPORT_H_
#define SANCHEZ_STREAM_LOSSY_TRANSPORT_H_

#include <cstdint>
#include <memory>
#include <random>

#include "sanchez/stream/ITransport.h"

namespace sanchez::stream {

// LossyTransport forwards to an inner transport and silently discards each
// sent packet with probability loss_percent / 100. The generator is seeded,
// so a given seed always drops the same positions of the send sequence.
class LossyTransport : public ITransport {
 public:
  LossyTransport(std::unique_ptr<ITransport> inner, uint32_t loss_percent, uint32_t seed);

  Status Send(const Packet& packet) override;
  Status Receive(Packet& packet, uint32_t timeout_ms) override {
    return inner_->Receive(packet, timeout_ms);
  }
  void Close() override { inner_->Close(); }
  size_t max_packet_size() const override { return inner_->max_packet_size(); }

  uint64_t packets_offered() const { return offered_; }
  uint64_t packets_dropped() const { return dropped_; }

 private:
  std::unique_ptr<ITransport> inner_;
  uint32_t loss_percent_;
  std::minstd_rand rng_;
  uint64_t offered_;
  uint64_t dropped_;
};

}  // namespace sanchez::stream

#endif  // SANCHEZ_STREAM_LOSSY_TRANSPORT_H_
