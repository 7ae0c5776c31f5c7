// Repository: Sanchez
// Component: Lossy Transport
// Purpose: Decorator that drops outgoing packets at random to simulate lossy links.
// Copyright (c) 2025 Sanchez

#include "sanchez/stream/LossyTransport.h"

#include <utility>

namespace sanchez::stream {

LossyTransport::LossyTransport(std::unique_ptr<ITransport> inner, uint32_t loss_percent,
                               uint32_t seed)
    : inner_(std::move(inner)),
      loss_percent_(loss_percent > 100 ? 100 : loss_percent),
      rng_(seed),
      offered_(0),
      dropped_(0) {}

Status LossyTransport::Send(const Packet& packet) {
  ++offered_;
  if (rng_() % 100 < loss_percent_) {
    ++dropped_;
    return Status::Ok();
  }
  return inner_->Send(packet);
}

}  // namespace sanchez::stream
