// Repository: Sanchez
// Component: Frame Scaler
// Purpose: Deterministic bilinear resize of RGB24 frames (libswscale).
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_MEDIA_FRAME_SCALER_H_
#define SANCHEZ_MEDIA_FRAME_SCALER_H_

#include <cstdint>

#include "sanchez/core/Status.h"
#include "sanchez/media/RgbFrame.h"

struct SwsContext;

namespace sanchez::media {

// FrameScaler resizes RGB24 frames with bit-exact bilinear filtering, so the
// same input always yields the same output. The scaling context is cached
// and rebuilt only when dimensions change. Not thread-safe.
class FrameScaler {
 public:
  FrameScaler();
  ~FrameScaler();

  FrameScaler(const FrameScaler&) = delete;
  FrameScaler& operator=(const FrameScaler&) = delete;

  // Same-size scaling is a copy.
  Status Scale(const RgbFrame& in, uint32_t width, uint32_t height, RgbFrame& out);

 private:
  SwsContext* sws_ctx_;
  uint32_t src_width_;
  uint32_t src_height_;
  uint32_t dst_width_;
  uint32_t dst_height_;
};

}  // namespace sanchez::media

#endif  // SANCHEZ_MEDIA_FRAME_SCALER_H_
