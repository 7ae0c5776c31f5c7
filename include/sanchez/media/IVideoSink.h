// Repository: Sanchez
// Component: Video Sink Interface
// Purpose: External video-encode collaborator producing a playable file.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_MEDIA_IVIDEO_SINK_H_
#define SANCHEZ_MEDIA_IVIDEO_SINK_H_

#include <cstdint>
#include <string>

#include "sanchez/core/Status.h"
#include "sanchez/media/RgbFrame.h"

namespace sanchez::media {

// IVideoSink accepts a sequence of RGB frames and writes a playable file.
//
// Lifecycle:
// 1. Open() with output path, dimensions, frame rate and optional audio file
// 2. WriteFrame() for every frame, in presentation order
// 3. Close() finalizes the file
class IVideoSink {
 public:
  virtual ~IVideoSink() = default;

  // audio_path may be empty. The audio file is muxed untouched.
  virtual Status Open(const std::string& path, uint32_t width, uint32_t height,
                      double fps, const std::string& audio_path) = 0;

  virtual Status WriteFrame(const RgbFrame& frame) = 0;

  virtual Status Close() = 0;
};

}  // namespace sanchez::media

#endif  // SANCHEZ_MEDIA_IVIDEO_SINK_H_
