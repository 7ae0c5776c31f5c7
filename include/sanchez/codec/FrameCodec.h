// Repository: Sanchez
// Component: Frame Codec
// Purpose: Lossless per-frame compression and integrity checksum (zlib).
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_CODEC_FRAME_CODEC_H_
#define SANCHEZ_CODEC_FRAME_CODEC_H_

#include <cstddef>
#include <cstdint>
#include <vector>

#include "sanchez/core/Status.h"

namespace sanchez::codec {

// FrameCodec compresses one raw pixel buffer to a stored payload and back.
//
// Compression is zlib deflate and byte exact. With compression disabled both
// directions are identity copies. The codec holds no state besides its
// settings, so one instance may be shared across threads.
class FrameCodec {
 public:
  explicit FrameCodec(bool compression_enabled, int level = -1);

  // Produces the stored form of a raw buffer.
  Status Compress(const uint8_t* raw, size_t raw_size,
                  std::vector<uint8_t>& stored) const;

  // Restores a raw buffer. Fails with kCorruptFrame if the input is malformed
  // or the output length differs from expected_raw_length.
  Status Decompress(const uint8_t* stored, size_t stored_size,
                    size_t expected_raw_length,
                    std::vector<uint8_t>& raw) const;

  bool compression_enabled() const { return compression_enabled_; }

  // Upper bound on the stored size Compress() can produce for raw_size bytes.
  size_t MaxStoredSize(size_t raw_size) const;

  // CRC32 over the given bytes.
  static uint32_t Checksum(const uint8_t* data, size_t size);

 private:
  bool compression_enabled_;
  int level_;
};

}  // namespace sanchez::codec

#endif  // SANCHEZ_CODEC_FRAME_CODEC_H_
