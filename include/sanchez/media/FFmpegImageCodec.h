// Repository: Sanchez
// Component: FFmpeg Image Codec
// Purpose: PNG/JPEG/BMP still image encode and decode through libavcodec.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_MEDIA_FFMPEG_IMAGE_CODEC_H_
#define SANCHEZ_MEDIA_FFMPEG_IMAGE_CODEC_H_

#include <string>

#include "sanchez/media/IImageCodec.h"

namespace sanchez::media {

// FFmpegImageCodec encodes one RGB frame with the image encoder matching the
// file extension and writes the single resulting packet as the file.
// Decode goes through FFmpegVideoSource (image2 demuxer).
class FFmpegImageCodec : public IImageCodec {
 public:
  Status Encode(const std::string& path, const RgbFrame& frame) override;
  Status Decode(const std::string& path, RgbFrame& frame) override;
};

}  // namespace sanchez::media

#endif  // SANCHEZ_MEDIA_FFMPEG_IMAGE_CODEC_H_
