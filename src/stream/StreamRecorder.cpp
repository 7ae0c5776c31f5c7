// Repository: Sanchez
// Component: Stream Recorder
// Purpose: Records a live stream into a new .sanchez container.
// Copyright (c) 2025 Sanchez

#include "sanchez/stream/StreamRecorder.h"

#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include "sanchez/format/ContainerBuilder.h"

namespace sanchez::stream {

std::string StreamRecorder::AudioPathFor(const std::string& output_path) {
  return std::filesystem::path(output_path).replace_extension(".mp3").string();
}

Status StreamRecorder::Record(StreamClient& client,
                              const std::string& output_path,
                              const RecordOptions& options,
                              RecordReport* report) {
  std::unique_ptr<format::ContainerBuilder> builder;
  ReceivedFrame frame;

  while (client.Next(frame)) {
    if (!builder) {
      format::BuilderOptions builder_options;
      builder_options.fps = client.config().fps;
      builder_options.compression_enabled = options.use_compression;
      builder = std::make_unique<format::ContainerBuilder>(
          client.metadata().title + " (stream)", client.metadata().creator, frame.width,
          frame.height, builder_options);
    }

    Status status = builder->AppendFrame(frame.data);
    if (!status.ok()) {
      std::cerr << "[StreamRecorder] Cannot append frame " << frame.frame_index << ": "
                << status.ToString() << std::endl;
      client.Cancel();
      return status;
    }
    if (report) {
      report->frames_recorded = builder->frame_count();
    }
    if (options.max_frames && builder->frame_count() >= *options.max_frames) {
      client.Cancel();
      break;
    }
  }

  if (report) {
    report->stream_status = client.status();
  }
  if (!builder) {
    if (!client.status().ok()) {
      return client.status();
    }
    return Status(ErrorCode::kSourceUnreadable, "stream carried no frames");
  }
  if (!client.status().ok()) {
    std::cerr << "[StreamRecorder] Stream stopped early (" << client.status().ToString()
              << "), keeping " << builder->frame_count() << " frames" << std::endl;
  }

  Status status = builder->Save(output_path);
  if (!status.ok()) {
    return status;
  }
  std::cout << "[StreamRecorder] Recorded " << builder->frame_count() << " frames to "
            << output_path << std::endl;

  if (options.save_audio && client.audio_complete()) {
    const std::string audio_path = AudioPathFor(output_path);
    std::ofstream out(audio_path, std::ios::binary | std::ios::trunc);
    const std::vector<uint8_t>& audio = client.audio_data();
    out.write(reinterpret_cast<const char*>(audio.data()),
              static_cast<std::streamsize>(audio.size()));
    if (!out) {
      return Status(ErrorCode::kIOError, "cannot write audio to " + audio_path);
    }
    if (report) {
      report->audio_path = audio_path;
    }
  }
  return Status::Ok();
}

}  // namespace sanchez::stream
