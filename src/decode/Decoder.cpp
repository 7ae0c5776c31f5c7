// Repository: Sanchez
// Component: Decoder
// Purpose: Turns a container back into a playable file, single images, or an info summary.
// Copyright (c) 2025 Sanchez

#include "sanchez/decode/Decoder.h"

#include <cstdio>
#include <filesystem>
#include <iostream>
#include <system_error>
#include <utility>

#include "sanchez/format/Container.h"
#include "sanchez/media/FFmpegImageCodec.h"
#include "sanchez/media/FFmpegVideoSink.h"
#include "sanchez/media/FrameScaler.h"

namespace sanchez::decode {

namespace {

bool IsSupportedImageFormat(const std::string& format) {
  return format == "png" || format == "jpg" || format == "bmp";
}

// Applies the optional resize in place.
Status MaybeResize(media::FrameScaler& scaler, const DecodeOptions& options,
                   media::RgbFrame& frame, media::RgbFrame& scratch) {
  if (!options.resize) {
    return Status::Ok();
  }
  Status status = scaler.Scale(frame, options.resize->width, options.resize->height, scratch);
  if (status.ok()) {
    std::swap(frame, scratch);
  }
  return status;
}

}  // namespace

Decoder::Decoder()
    : Decoder([]() -> std::unique_ptr<media::IVideoSink> {
                return std::make_unique<media::FFmpegVideoSink>();
              },
              []() -> std::unique_ptr<media::IImageCodec> {
                return std::make_unique<media::FFmpegImageCodec>();
              }) {}

Decoder::Decoder(VideoSinkFactory sink_factory, ImageCodecFactory image_factory)
    : sink_factory_(std::move(sink_factory)), image_factory_(std::move(image_factory)) {}

std::string Decoder::FrameFileName(uint32_t index, const std::string& format) {
  char name[32];
  std::snprintf(name, sizeof(name), "frame_%06u.", index);
  return std::string(name) + format;
}

Status Decoder::GetInfo(const std::string& path, InfoSummary& info) const {
  std::unique_ptr<format::Container> container;
  Status status = format::Container::Open(path, container);
  if (!status.ok()) {
    return status;
  }

  info.metadata = container->metadata();
  info.config = container->config();
  info.file_size_bytes = container->file_size();
  info.duration_seconds =
      info.config.fps > 0.0 ? static_cast<double>(info.config.frame_count) / info.config.fps
                            : 0.0;
  return Status::Ok();
}

Status Decoder::Decode(const std::string& path,
                       const std::string& output_path,
                       const DecodeOptions& options) const {
  std::unique_ptr<format::Container> container;
  Status status = format::Container::Open(path, container);
  if (!status.ok()) {
    return status;
  }

  const format::Config& config = container->config();
  const uint32_t out_width = options.resize ? options.resize->width : config.width;
  const uint32_t out_height = options.resize ? options.resize->height : config.height;

  std::unique_ptr<media::IVideoSink> sink = sink_factory_ ? sink_factory_() : nullptr;
  if (!sink) {
    return Status(ErrorCode::kIOError, "no video sink available");
  }
  status = sink->Open(output_path, out_width, out_height, config.fps, options.audio_path);
  if (!status.ok()) {
    return status;
  }

  media::FrameScaler scaler;
  media::RgbFrame frame;
  media::RgbFrame scratch;
  auto frames = container->Frames(options.continue_on_corrupt);
  uint32_t written = 0;
  while (frames->Next(frame)) {
    status = MaybeResize(scaler, options, frame, scratch);
    if (status.ok()) {
      status = sink->WriteFrame(frame);
    }
    if (!status.ok()) {
      const Status close_status = sink->Close();
      if (!close_status.ok()) {
        std::cerr << "[Decoder] Close after failure: " << close_status.ToString() << std::endl;
      }
      return status;
    }
    ++written;
  }

  if (!frames->status().ok()) {
    std::cerr << "[Decoder] Aborting " << path << ": " << frames->status().ToString()
              << std::endl;
    const Status close_status = sink->Close();
    if (!close_status.ok()) {
      std::cerr << "[Decoder] Close after failure: " << close_status.ToString() << std::endl;
    }
    return frames->status();
  }

  status = sink->Close();
  if (!status.ok()) {
    return status;
  }
  std::cout << "[Decoder] Wrote " << written << " frames to " << output_path;
  if (!frames->skipped().empty()) {
    std::cout << " (" << frames->skipped().size() << " corrupt frames skipped)";
  }
  std::cout << std::endl;
  return Status::Ok();
}

Status Decoder::DecodeToImage(const std::string& path,
                              const std::string& output_path,
                              uint32_t frame_index,
                              const DecodeOptions& options) const {
  std::unique_ptr<format::Container> container;
  Status status = format::Container::Open(path, container);
  if (!status.ok()) {
    return status;
  }

  media::RgbFrame frame;
  frame.index = frame_index;
  frame.width = container->config().width;
  frame.height = container->config().height;
  status = container->GetFrame(frame_index, frame.data);
  if (!status.ok()) {
    return status;
  }

  media::FrameScaler scaler;
  media::RgbFrame scratch;
  status = MaybeResize(scaler, options, frame, scratch);
  if (!status.ok()) {
    return status;
  }

  std::unique_ptr<media::IImageCodec> codec = image_factory_ ? image_factory_() : nullptr;
  if (!codec) {
    return Status(ErrorCode::kIOError, "no image codec available");
  }
  return codec->Encode(output_path, frame);
}

Status Decoder::ExtractAllFrames(const std::string& path,
                                 const std::string& output_dir,
                                 const std::string& format,
                                 const DecodeOptions& options,
                                 ExtractReport* report) const {
  if (!IsSupportedImageFormat(format)) {
    return Status(ErrorCode::kIOError, "unsupported image format: " + format);
  }

  std::unique_ptr<format::Container> container;
  Status status = format::Container::Open(path, container);
  if (!status.ok()) {
    return status;
  }

  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    return Status(ErrorCode::kIOError, "cannot create " + output_dir + ": " + ec.message());
  }

  std::unique_ptr<media::IImageCodec> codec = image_factory_ ? image_factory_() : nullptr;
  if (!codec) {
    return Status(ErrorCode::kIOError, "no image codec available");
  }

  media::FrameScaler scaler;
  media::RgbFrame frame;
  media::RgbFrame scratch;
  auto frames = container->Frames(options.continue_on_corrupt);
  uint32_t written = 0;
  while (frames->Next(frame)) {
    status = MaybeResize(scaler, options, frame, scratch);
    if (!status.ok()) {
      return status;
    }
    const std::filesystem::path out =
        std::filesystem::path(output_dir) / FrameFileName(frame.index, format);
    status = codec->Encode(out.string(), frame);
    if (!status.ok()) {
      return status;
    }
    ++written;
  }

  if (report) {
    report->frames_written = written;
    report->skipped_indices = frames->skipped();
  }
  if (!frames->status().ok()) {
    std::cerr << "[Decoder] Extraction stopped after " << written
              << " frames: " << frames->status().ToString() << std::endl;
    return frames->status();
  }

  std::cout << "[Decoder] Extracted " << written << " frames to " << output_dir << std::endl;
  return Status::Ok();
}

}  // namespace sanchez::decode
