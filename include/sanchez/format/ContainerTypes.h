// Repository: Sanchez
// Component: Container Types
// Purpose: Metadata, config and frame index records of the .sanchez format.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_FORMAT_CONTAINER_TYPES_H_
#define SANCHEZ_FORMAT_CONTAINER_TYPES_H_

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "sanchez/format/ByteOrder.h"

namespace sanchez::format {

constexpr uint8_t kMagic[4] = {'S', 'N', 'C', 'Z'};
constexpr uint16_t kFormatVersion = 2;
constexpr const char* kFileExtension = ".sanchez";
constexpr uint32_t kBytesPerPixel = 3;

// Fixed sizes of the layout sections.
constexpr size_t kPreambleSize = 4 + 2;       // magic + version
constexpr size_t kConfigBlockSize = 4 * 4 + 2;
constexpr size_t kIndexEntrySize = 8 + 4 + 4 + 4;

// Metadata is set once at creation and immutable once published.
struct Metadata {
  std::string title;
  std::string creator;
  int64_t created_at = 0;  // Seconds since Unix epoch.
};

// Config describes the frames of one container.
struct Config {
  uint32_t width = 0;
  uint32_t height = 0;
  double fps = 0.0;
  uint32_t frame_count = 0;
  bool is_image = false;
  bool compression_enabled = true;

  // Size of one raw RGB frame.
  [[nodiscard]] size_t raw_frame_size() const {
    return static_cast<size_t>(width) * height * kBytesPerPixel;
  }
};

// FrameRecord locates one stored frame inside the payload region.
struct FrameRecord {
  uint32_t index = 0;
  uint64_t byte_offset = 0;  // Absolute from the start of the file.
  uint32_t stored_length = 0;
  uint32_t raw_length = 0;
  uint32_t checksum = 0;  // CRC32 over the stored bytes.
};

// fps is carried as fps * 1000 rounded.
uint32_t FpsToFixed(double fps);
double FpsFromFixed(uint32_t fps_fixed);

// Section codecs, shared by the file layout and the wire protocol.
void EncodeMetadata(const Metadata& metadata, std::vector<uint8_t>& out);
bool DecodeMetadata(ByteReader& reader, Metadata& metadata);

void EncodeConfig(const Config& config, std::vector<uint8_t>& out);
bool DecodeConfig(ByteReader& reader, Config& config);

}  // namespace sanchez::format

#endif  // SANCHEZ_FORMAT_CONTAINER_TYPES_H_
