// Repository: Sanchez
// Component: Encoder
// Purpose: Drives an external video/image source through the frame codec into a new container.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_ENCODE_ENCODER_H_
#define SANCHEZ_ENCODE_ENCODER_H_

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

#include "sanchez/core/Status.h"
#include "sanchez/media/IFrameSource.h"

namespace sanchez::encode {

// Target dimensions for an optional resize.
struct FrameSize {
  uint32_t width = 0;
  uint32_t height = 0;
};

// EncodeOptions
struct EncodeOptions {
  std::string title;  // Empty: the source file stem.
  std::string creator;
  std::optional<FrameSize> resize;
  std::optional<uint32_t> max_frames;
  bool use_compression = true;
};

// EncodeReport summarizes one finished encode.
struct EncodeReport {
  uint32_t frames_written = 0;
  uint32_t width = 0;
  uint32_t height = 0;
  double fps = 0.0;
};

using VideoSourceFactory = std::function<std::unique_ptr<media::IVideoSource>()>;

// Encoder converts conventional media files into .sanchez containers.
//
// The source decoder is created through the injected factory (FFmpeg by
// default). The container frame rate is the source frame rate; frames are
// never resampled in time, only in size.
class Encoder {
 public:
  Encoder();
  explicit Encoder(VideoSourceFactory source_factory);

  // Fails with kSourceUnreadable when the source cannot be opened, yields no
  // frames or fails mid-stream; kIOError when the container cannot be saved.
  Status Encode(const std::string& source_path,
                const std::string& output_path,
                const EncodeOptions& options,
                EncodeReport* report = nullptr);

  // Single still image: frame_count 1, is_image, fps 1.
  Status EncodeImage(const std::string& source_path,
                     const std::string& output_path,
                     const EncodeOptions& options,
                     EncodeReport* report = nullptr);

  // Shared core over an already opened source. title must be resolved.
  Status EncodeFromSource(media::IVideoSource& source,
                          const std::string& output_path,
                          const EncodeOptions& options,
                          bool is_image,
                          EncodeReport* report = nullptr);

  // "clips/intro.mp4" -> "intro".
  static std::string FileStem(const std::string& path);

 private:
  Status OpenSource(const std::string& source_path,
                    std::unique_ptr<media::IVideoSource>& source);

  VideoSourceFactory source_factory_;
};

}  // namespace sanchez::encode

#endif  // SANCHEZ_ENCODE_ENCODER_H_
