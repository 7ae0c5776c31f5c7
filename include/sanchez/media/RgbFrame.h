// Repository: Sanchez
// Component: RGB Frame
// Purpose: Raw interleaved RGB24 pixel buffer exchanged between components.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_MEDIA_RGB_FRAME_H_
#define SANCHEZ_MEDIA_RGB_FRAME_H_

#include <cstddef>
#include <cstdint>
#include <vector>

namespace sanchez::media {

// RgbFrame holds width * height * 3 bytes, row-major, no padding.
struct RgbFrame {
  uint32_t index = 0;  // Position in the sequence that produced it.
  uint32_t width = 0;
  uint32_t height = 0;
  std::vector<uint8_t> data;

  [[nodiscard]] size_t expected_size() const {
    return static_cast<size_t>(width) * height * 3;
  }
};

}  // namespace sanchez::media

#endif  // SANCHEZ_MEDIA_RGB_FRAME_H_
