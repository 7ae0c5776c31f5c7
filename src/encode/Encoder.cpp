// Repository: Sanchez
// Component: Encoder
// Purpose: Drives an external video/image source through the frame codec into a new container.
// Copyright (c) 2025 Sanchez

#include "sanchez/encode/Encoder.h"

#include <iostream>
#include <utility>

#include "sanchez/format/ContainerBuilder.h"
#include "sanchez/media/FFmpegVideoSource.h"
#include "sanchez/media/FrameScaler.h"

namespace sanchez::encode {

namespace {

constexpr double kDefaultFps = 24.0;
constexpr double kImageFps = 1.0;

}  // namespace

Encoder::Encoder()
    : Encoder([]() -> std::unique_ptr<media::IVideoSource> {
        return std::make_unique<media::FFmpegVideoSource>();
      }) {}

Encoder::Encoder(VideoSourceFactory source_factory)
    : source_factory_(std::move(source_factory)) {}

std::string Encoder::FileStem(const std::string& path) {
  const size_t slash = path.find_last_of("/\\");
  std::string name = slash == std::string::npos ? path : path.substr(slash + 1);
  const size_t dot = name.find_last_of('.');
  if (dot != std::string::npos && dot > 0) {
    name.resize(dot);
  }
  return name;
}

Status Encoder::OpenSource(const std::string& source_path,
                           std::unique_ptr<media::IVideoSource>& source) {
  source = source_factory_ ? source_factory_() : nullptr;
  if (!source) {
    return Status(ErrorCode::kSourceUnreadable, "no video source available");
  }
  Status status = source->Open(source_path);
  if (!status.ok()) {
    std::cerr << "[Encoder] Cannot open " << source_path << ": " << status.ToString()
              << std::endl;
    if (status.code() != ErrorCode::kSourceUnreadable) {
      status = Status(ErrorCode::kSourceUnreadable, status.message());
    }
  }
  return status;
}

Status Encoder::Encode(const std::string& source_path,
                       const std::string& output_path,
                       const EncodeOptions& options,
                       EncodeReport* report) {
  std::unique_ptr<media::IVideoSource> source;
  Status status = OpenSource(source_path, source);
  if (!status.ok()) {
    return status;
  }

  EncodeOptions resolved = options;
  if (resolved.title.empty()) {
    resolved.title = FileStem(source_path);
  }
  status = EncodeFromSource(*source, output_path, resolved, false, report);
  source->Close();
  return status;
}

Status Encoder::EncodeImage(const std::string& source_path,
                            const std::string& output_path,
                            const EncodeOptions& options,
                            EncodeReport* report) {
  std::unique_ptr<media::IVideoSource> source;
  Status status = OpenSource(source_path, source);
  if (!status.ok()) {
    return status;
  }

  EncodeOptions resolved = options;
  if (resolved.title.empty()) {
    resolved.title = FileStem(source_path);
  }
  status = EncodeFromSource(*source, output_path, resolved, true, report);
  source->Close();
  return status;
}

Status Encoder::EncodeFromSource(media::IVideoSource& source,
                                 const std::string& output_path,
                                 const EncodeOptions& options,
                                 bool is_image,
                                 EncodeReport* report) {
  const uint32_t frame_limit =
      is_image ? 1u : options.max_frames.value_or(UINT32_MAX);

  double fps = source.fps();
  if (is_image) {
    fps = kImageFps;
  } else if (!(fps > 0.0)) {
    std::cout << "[Encoder] Source reports no frame rate, using " << kDefaultFps << std::endl;
    fps = kDefaultFps;
  }

  media::FrameScaler scaler;
  std::unique_ptr<format::ContainerBuilder> builder;
  media::RgbFrame frame;
  media::RgbFrame scaled;
  uint32_t written = 0;

  while (written < frame_limit && source.Next(frame)) {
    const media::RgbFrame* to_append = &frame;
    if (options.resize) {
      Status status = scaler.Scale(frame, options.resize->width, options.resize->height, scaled);
      if (!status.ok()) {
        return status;
      }
      to_append = &scaled;
    }

    if (!builder) {
      format::BuilderOptions builder_options;
      builder_options.fps = fps;
      builder_options.compression_enabled = options.use_compression;
      builder_options.is_image = is_image;
      builder = std::make_unique<format::ContainerBuilder>(
          options.title, options.creator, to_append->width, to_append->height,
          builder_options);
    }

    Status status = builder->AppendFrame(to_append->data);
    if (!status.ok()) {
      std::cerr << "[Encoder] Frame " << written << " rejected: " << status.ToString()
                << std::endl;
      return status;
    }
    ++written;
  }

  const Status source_status = source.status();
  if (!source_status.ok()) {
    return Status(ErrorCode::kSourceUnreadable,
                  "decode failed after " + std::to_string(written) +
                      " frames: " + source_status.message());
  }
  if (!builder) {
    return Status(ErrorCode::kSourceUnreadable, "source yielded no frames");
  }

  Status status = builder->Save(output_path);
  if (!status.ok()) {
    return status;
  }

  if (report) {
    report->frames_written = written;
    report->width = builder->config().width;
    report->height = builder->config().height;
    report->fps = fps;
  }
  std::cout << "[Encoder] Encoded " << written << (is_image ? " image frame" : " frames")
            << " to " << output_path << std::endl;
  return Status::Ok();
}

}  // namespace sanchez::encode
