// Repository: Sanchez
// Component: Frame Scaler
// Purpose: Deterministic bilinear resize of RGB24 frames (libswscale).
// Copyright (c) 2025 Sanchez

#include "sanchez/media/FrameScaler.h"

#include <iostream>
#include <string>

extern "C" {
#include <libavutil/pixfmt.h>
#include <libswscale/swscale.h>
}

namespace sanchez::media {

namespace {
constexpr int kScaleFlags = SWS_BILINEAR | SWS_ACCURATE_RND | SWS_BITEXACT;
}

FrameScaler::FrameScaler()
    : sws_ctx_(nullptr), src_width_(0), src_height_(0), dst_width_(0), dst_height_(0) {}

FrameScaler::~FrameScaler() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
}

Status FrameScaler::Scale(const RgbFrame& in, uint32_t width, uint32_t height,
                          RgbFrame& out) {
  if (in.data.size() != in.expected_size() || in.width == 0 || in.height == 0) {
    return Status(ErrorCode::kDimensionMismatch, "input frame has inconsistent size");
  }
  if (width == 0 || height == 0) {
    return Status(ErrorCode::kDimensionMismatch, "target size must be non-zero");
  }

  out.index = in.index;
  if (in.width == width && in.height == height) {
    out.width = width;
    out.height = height;
    out.data = in.data;
    return Status::Ok();
  }

  if (!sws_ctx_ || src_width_ != in.width || src_height_ != in.height ||
      dst_width_ != width || dst_height_ != height) {
    if (sws_ctx_) {
      sws_freeContext(sws_ctx_);
    }
    sws_ctx_ = sws_getContext(static_cast<int>(in.width), static_cast<int>(in.height),
                              AV_PIX_FMT_RGB24,
                              static_cast<int>(width), static_cast<int>(height),
                              AV_PIX_FMT_RGB24,
                              kScaleFlags, nullptr, nullptr, nullptr);
    if (!sws_ctx_) {
      std::cerr << "[FrameScaler] Failed to create scaler context" << std::endl;
      return Status(ErrorCode::kIOError, "cannot create scaler " +
                                             std::to_string(in.width) + "x" +
                                             std::to_string(in.height) + " -> " +
                                             std::to_string(width) + "x" +
                                             std::to_string(height));
    }
    src_width_ = in.width;
    src_height_ = in.height;
    dst_width_ = width;
    dst_height_ = height;
  }

  out.width = width;
  out.height = height;
  out.data.resize(out.expected_size());

  const uint8_t* src_planes[4] = {in.data.data(), nullptr, nullptr, nullptr};
  const int src_strides[4] = {static_cast<int>(in.width * 3), 0, 0, 0};
  uint8_t* dst_planes[4] = {out.data.data(), nullptr, nullptr, nullptr};
  const int dst_strides[4] = {static_cast<int>(width * 3), 0, 0, 0};

  const int rows = sws_scale(sws_ctx_, src_planes, src_strides, 0,
                             static_cast<int>(in.height), dst_planes, dst_strides);
  if (rows != static_cast<int>(height)) {
    return Status(ErrorCode::kIOError, "scaler produced " + std::to_string(rows) + " rows");
  }
  return Status::Ok();
}

}  // namespace sanchez::media
