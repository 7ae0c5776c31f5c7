// Repository: Sanchez
// Component: Decoder
// Purpose: Turns a container back into a playable file, single images, or an info summary.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_DECODE_DECODER_H_
#define SANCHEZ_DECODE_DECODER_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "sanchez/core/Status.h"
#include "sanchez/encode/Encoder.h"
#include "sanchez/format/ContainerTypes.h"
#include "sanchez/media/IImageCodec.h"
#include "sanchez/media/IVideoSink.h"

namespace sanchez::decode {

// InfoSummary is derived from the header alone.
struct InfoSummary {
  format::Metadata metadata;
  format::Config config;
  double duration_seconds = 0.0;  // frame_count / fps, 0 when fps is 0.
  uint64_t file_size_bytes = 0;
};

struct DecodeOptions {
  std::optional<encode::FrameSize> resize;
  std::string audio_path;  // Handed to the video sink untouched.
  bool continue_on_corrupt = false;
};

// ExtractReport lists what ExtractAllFrames() wrote and skipped.
struct ExtractReport {
  uint32_t frames_written = 0;
  std::vector<uint32_t> skipped_indices;
};

using VideoSinkFactory = std::function<std::unique_ptr<media::IVideoSink>()>;
using ImageCodecFactory = std::function<std::unique_ptr<media::IImageCodec>()>;

// Decoder reads containers without materializing every frame at once.
// Output collaborators come from injected factories (FFmpeg by default).
class Decoder {
 public:
  Decoder();
  Decoder(VideoSinkFactory sink_factory, ImageCodecFactory image_factory);

  // Never decompresses a payload.
  Status GetInfo(const std::string& path, InfoSummary& info) const;

  // Streams every frame into a playable file.
  Status Decode(const std::string& path,
                const std::string& output_path,
                const DecodeOptions& options = DecodeOptions()) const;

  // Writes frame_index as a still image.
  Status DecodeToImage(const std::string& path,
                       const std::string& output_path,
                       uint32_t frame_index,
                       const DecodeOptions& options = DecodeOptions()) const;

  // Writes frame_000000.<format>... into output_dir, creating it.
  // format is "png", "jpg" or "bmp". Stops at the first corrupt frame unless
  // options.continue_on_corrupt.
  Status ExtractAllFrames(const std::string& path,
                          const std::string& output_dir,
                          const std::string& format,
                          const DecodeOptions& options = DecodeOptions(),
                          ExtractReport* report = nullptr) const;

  // "frame_000042.png"
  static std::string FrameFileName(uint32_t index, const std::string& format);

 private:
  VideoSinkFactory sink_factory_;
  ImageCodecFactory image_factory_;
};

}  // namespace sanchez::decode

#endif  // SANCHEZ_DECODE_DECODER_H_
