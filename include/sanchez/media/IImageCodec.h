// Repository: Sanchez
// Component: Image Codec Interface
// Purpose: External single-image encode/decode collaborator.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_MEDIA_IIMAGE_CODEC_H_
#define SANCHEZ_MEDIA_IIMAGE_CODEC_H_

#include <string>

#include "sanchez/core/Status.h"
#include "sanchez/media/RgbFrame.h"

namespace sanchez::media {

// IImageCodec writes and reads still images. The format follows the file
// extension (png, jpg/jpeg, bmp).
class IImageCodec {
 public:
  virtual ~IImageCodec() = default;

  virtual Status Encode(const std::string& path, const RgbFrame& frame) = 0;

  // Fails with kSourceUnreadable.
  virtual Status Decode(const std::string& path, RgbFrame& frame) = 0;
};

}  // namespace sanchez::media

#endif  // SANCHEZ_MEDIA_IIMAGE_CODEC_H_
