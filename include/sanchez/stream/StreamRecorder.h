// Repository: Sanchez
// Component: Stream Recorder
// Purpose: Records a live stream into a new .sanchez container.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_STREAM_STREAM_RECORDER_H_
#define SANCHEZ_STREAM_STREAM_RECORDER_H_

#include <cstdint>
#include <optional>
#include <string>

#include "sanchez/core/Status.h"
#include "sanchez/stream/StreamClient.h"

namespace sanchez::stream {

struct RecordOptions {
  bool use_compression = true;
  std::optional<uint32_t> max_frames;
  // Write received side-channel audio next to the container.
  bool save_audio = true;
};

struct RecordReport {
  uint32_t frames_recorded = 0;
  std::string audio_path;  // Empty when no audio was saved.
  Status stream_status;    // How the stream itself ended.
};

// StreamRecorder drains a StreamClient into a container titled
// "<title> (stream)". Frames lost in transit are simply absent from the
// recording. A stream that ends abnormally still produces a container as long
// as at least one frame arrived.
class StreamRecorder {
 public:
  static Status Record(StreamClient& client,
                       const std::string& output_path,
                       const RecordOptions& options,
                       RecordReport* report = nullptr);

  // "out/show.sanchez" -> "out/show.mp3".
  static std::string AudioPathFor(const std::string& output_path);
};

}  // namespace sanchez::stream

#endif  // SANCHEZ_STREAM_STREAM_RECORDER_H_
