// Repository: Sanchez
// Component: Frame Codec
// Purpose: Lossless per-frame compression and integrity checksum (zlib).
// Copyright (c) 2025 Sanchez

#include "sanchez/codec/FrameCodec.h"

#include <limits>
#include <string>

#include <zlib.h>

namespace sanchez::codec {

FrameCodec::FrameCodec(bool compression_enabled, int level)
    : compression_enabled_(compression_enabled),
      level_(level < 0 ? Z_DEFAULT_COMPRESSION : level) {}

Status FrameCodec::Compress(const uint8_t* raw, size_t raw_size,
                            std::vector<uint8_t>& stored) const {
  if (!compression_enabled_) {
    stored.assign(raw, raw + raw_size);
    return Status::Ok();
  }

  if (raw_size > std::numeric_limits<uLong>::max()) {
    return Status(ErrorCode::kDimensionMismatch, "frame too large to compress");
  }

  uLongf bound = compressBound(static_cast<uLong>(raw_size));
  stored.resize(bound);
  const int ret = compress2(stored.data(), &bound, raw,
                            static_cast<uLong>(raw_size), level_);
  if (ret != Z_OK) {
    stored.clear();
    return Status(ErrorCode::kIOError,
                  std::string("deflate failed: ") + zError(ret));
  }
  stored.resize(bound);
  return Status::Ok();
}

Status FrameCodec::Decompress(const uint8_t* stored, size_t stored_size,
                              size_t expected_raw_length,
                              std::vector<uint8_t>& raw) const {
  if (!compression_enabled_) {
    if (stored_size != expected_raw_length) {
      return Status(ErrorCode::kCorruptFrame,
                    "stored length " + std::to_string(stored_size) +
                        " != raw length " + std::to_string(expected_raw_length));
    }
    raw.assign(stored, stored + stored_size);
    return Status::Ok();
  }

  raw.resize(expected_raw_length);
  uLongf produced = static_cast<uLongf>(expected_raw_length);
  // A zero-length destination is legal for zlib but needs a valid pointer.
  Bytef scratch = 0;
  Bytef* dest = expected_raw_length > 0 ? raw.data() : &scratch;
  const int ret = uncompress(dest, &produced, stored, static_cast<uLong>(stored_size));
  if (ret != Z_OK) {
    raw.clear();
    // Z_BUF_ERROR here means the stream inflates past the expected length.
    return Status(ErrorCode::kCorruptFrame,
                  std::string("inflate failed: ") + zError(ret));
  }
  if (produced != expected_raw_length) {
    raw.clear();
    return Status(ErrorCode::kCorruptFrame,
                  "inflated " + std::to_string(produced) + " bytes, expected " +
                      std::to_string(expected_raw_length));
  }
  return Status::Ok();
}

size_t FrameCodec::MaxStoredSize(size_t raw_size) const {
  if (!compression_enabled_) {
    return raw_size;
  }
  if (raw_size > std::numeric_limits<uLong>::max()) {
    return std::numeric_limits<size_t>::max();
  }
  return compressBound(static_cast<uLong>(raw_size));
}

uint32_t FrameCodec::Checksum(const uint8_t* data, size_t size) {
  uLong crc = crc32(0L, Z_NULL, 0);
  // crc32() takes a uInt length; feed large buffers in slices.
  constexpr size_t kSlice = 1u << 30;
  while (size > 0) {
    const size_t n = size > kSlice ? kSlice : size;
    crc = crc32(crc, data, static_cast<uInt>(n));
    data += n;
    size -= n;
  }
  return static_cast<uint32_t>(crc);
}

}  // namespace sanchez::codec
