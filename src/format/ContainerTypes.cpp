// Repository: Sanchez
// Component: Container Types
// Purpose: Metadata, config and frame index records of the .sanchez format.
// Copyright (c) 2025 Sanchez

#include "sanchez/format/ContainerTypes.h"

#include <cmath>

namespace sanchez::format {

uint32_t FpsToFixed(double fps) {
  if (!(fps > 0.0)) {
    return 0;
  }
  const double fixed = std::round(fps * 1000.0);
  if (fixed >= 4294967295.0) {
    return 0xFFFFFFFFu;
  }
  return static_cast<uint32_t>(fixed);
}

double FpsFromFixed(uint32_t fps_fixed) {
  return static_cast<double>(fps_fixed) / 1000.0;
}

void EncodeMetadata(const Metadata& metadata, std::vector<uint8_t>& out) {
  ByteWriter writer(out);
  writer.PutString16(metadata.title);
  writer.PutString16(metadata.creator);
  writer.PutI64(metadata.created_at);
}

bool DecodeMetadata(ByteReader& reader, Metadata& metadata) {
  return reader.GetString16(metadata.title) &&
         reader.GetString16(metadata.creator) &&
         reader.GetI64(metadata.created_at);
}

void EncodeConfig(const Config& config, std::vector<uint8_t>& out) {
  ByteWriter writer(out);
  writer.PutU32(config.width);
  writer.PutU32(config.height);
  writer.PutU32(FpsToFixed(config.fps));
  writer.PutU32(config.frame_count);
  writer.PutU8(config.is_image ? 1 : 0);
  writer.PutU8(config.compression_enabled ? 1 : 0);
}

bool DecodeConfig(ByteReader& reader, Config& config) {
  uint32_t fps_fixed = 0;
  uint8_t is_image = 0;
  uint8_t compression = 0;
  if (!reader.GetU32(config.width) || !reader.GetU32(config.height) ||
      !reader.GetU32(fps_fixed) || !reader.GetU32(config.frame_count) ||
      !reader.GetU8(is_image) || !reader.GetU8(compression)) {
    return false;
  }
  if (is_image > 1 || compression > 1) {
    return false;
  }
  config.fps = FpsFromFixed(fps_fixed);
  config.is_image = is_image != 0;
  config.compression_enabled = compression != 0;
  return true;
}

}  // namespace sanchez::format
