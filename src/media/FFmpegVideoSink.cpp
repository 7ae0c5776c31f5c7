// Repository: Sanchez
// Component: FFmpeg Video Sink
// Purpose: Encodes RGB frames to H.264 and muxes them, with optional audio, via libavformat.
// Copyright (c) 2025 Sanchez

#include "sanchez/media/FFmpegVideoSink.h"

#include <iostream>
#include <limits>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/log.h>
#include <libavutil/mathematics.h>
#include <libavutil/opt.h>
#include <libswscale/swscale.h>
}

namespace sanchez::media {

namespace {

constexpr int kGopSize = 12;

std::string AvErrorString(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

Status SinkError(const std::string& message) {
  std::cerr << "[FFmpegVideoSink] " << message << std::endl;
  return Status(ErrorCode::kIOError, message);
}

// yuv420p needs even dimensions.
int EvenDimension(uint32_t value) {
  const int even = static_cast<int>(value & ~1u);
  return even < 2 ? 2 : even;
}

}  // namespace

FFmpegVideoSink::FFmpegVideoSink()
    : format_ctx_(nullptr),
      codec_ctx_(nullptr),
      video_stream_(nullptr),
      yuv_frame_(nullptr),
      packet_(nullptr),
      sws_ctx_(nullptr),
      audio_input_ctx_(nullptr),
      audio_stream_(nullptr),
      audio_packet_(nullptr),
      audio_input_index_(-1),
      audio_eof_(true),
      width_(0),
      height_(0),
      fps_(0.0),
      next_pts_(0),
      header_written_(false) {}

FFmpegVideoSink::~FFmpegVideoSink() {
  Release();
}

Status FFmpegVideoSink::Open(const std::string& path, uint32_t width, uint32_t height,
                             double fps, const std::string& audio_path) {
  if (format_ctx_) {
    return SinkError("sink already open");
  }
  if (width == 0 || height == 0 || !(fps > 0.0)) {
    return SinkError("invalid output geometry");
  }

  av_log_set_level(AV_LOG_ERROR);
  path_ = path;
  width_ = width;
  height_ = height;
  fps_ = fps;
  next_pts_ = 0;

  int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, nullptr, path.c_str());
  if (ret < 0 || !format_ctx_) {
    // Unknown extension: fall back to MP4.
    ret = avformat_alloc_output_context2(&format_ctx_, nullptr, "mp4", path.c_str());
  }
  if (ret < 0 || !format_ctx_) {
    return SinkError("failed to allocate output context: " + AvErrorString(ret));
  }

  const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_H264);
  if (!codec) {
    std::cout << "[FFmpegVideoSink] H.264 encoder not found, using MPEG-4" << std::endl;
    codec = avcodec_find_encoder(AV_CODEC_ID_MPEG4);
  }
  if (!codec) {
    Release();
    return SinkError("no video encoder available");
  }

  video_stream_ = avformat_new_stream(format_ctx_, nullptr);
  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!video_stream_ || !codec_ctx_) {
    Release();
    return SinkError("failed to allocate video stream");
  }

  const AVRational frame_rate = av_d2q(fps, 100000);
  codec_ctx_->codec_id = codec->id;
  codec_ctx_->codec_type = AVMEDIA_TYPE_VIDEO;
  codec_ctx_->width = EvenDimension(width);
  codec_ctx_->height = EvenDimension(height);
  codec_ctx_->pix_fmt = AV_PIX_FMT_YUV420P;
  codec_ctx_->time_base = av_inv_q(frame_rate);
  codec_ctx_->framerate = frame_rate;
  codec_ctx_->gop_size = kGopSize;
  codec_ctx_->max_b_frames = 0;
  if (format_ctx_->oformat->flags & AVFMT_GLOBALHEADER) {
    codec_ctx_->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
  }
  if (codec->id == AV_CODEC_ID_H264) {
    av_opt_set(codec_ctx_->priv_data, "preset", "medium", 0);
  }

  ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    Release();
    return SinkError("failed to open encoder: " + AvErrorString(ret));
  }

  ret = avcodec_parameters_from_context(video_stream_->codecpar, codec_ctx_);
  if (ret < 0) {
    Release();
    return SinkError("failed to copy codec parameters: " + AvErrorString(ret));
  }
  video_stream_->time_base = codec_ctx_->time_base;

  if (!audio_path.empty()) {
    Status status = OpenAudioInput(audio_path);
    if (!status.ok()) {
      Release();
      return status;
    }
  }

  if (!(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
    ret = avio_open(&format_ctx_->pb, path.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
      Release();
      return SinkError("cannot open " + path + ": " + AvErrorString(ret));
    }
  }

  ret = avformat_write_header(format_ctx_, nullptr);
  if (ret < 0) {
    Release();
    return SinkError("failed to write header: " + AvErrorString(ret));
  }
  header_written_ = true;

  yuv_frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!yuv_frame_ || !packet_) {
    Release();
    return SinkError("failed to allocate frame or packet");
  }
  yuv_frame_->format = codec_ctx_->pix_fmt;
  yuv_frame_->width = codec_ctx_->width;
  yuv_frame_->height = codec_ctx_->height;
  ret = av_frame_get_buffer(yuv_frame_, 32);
  if (ret < 0) {
    Release();
    return SinkError("failed to allocate frame buffer: " + AvErrorString(ret));
  }

  sws_ctx_ = sws_getContext(static_cast<int>(width), static_cast<int>(height), AV_PIX_FMT_RGB24,
                            codec_ctx_->width, codec_ctx_->height, AV_PIX_FMT_YUV420P,
                            SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    Release();
    return SinkError("failed to create scaler context");
  }

  std::cout << "[FFmpegVideoSink] Writing " << path << " (" << avcodec_get_name(codec->id)
            << ", " << codec_ctx_->width << "x" << codec_ctx_->height << " @ " << fps
            << " fps" << (audio_stream_ ? ", with audio" : "") << ")" << std::endl;
  return Status::Ok();
}

Status FFmpegVideoSink::OpenAudioInput(const std::string& audio_path) {
  int ret = avformat_open_input(&audio_input_ctx_, audio_path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    audio_input_ctx_ = nullptr;
    return Status(ErrorCode::kSourceUnreadable,
                  "cannot open audio " + audio_path + ": " + AvErrorString(ret));
  }
  ret = avformat_find_stream_info(audio_input_ctx_, nullptr);
  if (ret < 0) {
    return Status(ErrorCode::kSourceUnreadable,
                  "cannot read audio stream info: " + AvErrorString(ret));
  }
  audio_input_index_ =
      av_find_best_stream(audio_input_ctx_, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (audio_input_index_ < 0) {
    return Status(ErrorCode::kSourceUnreadable, "no audio stream in " + audio_path);
  }

  AVStream* in_stream = audio_input_ctx_->streams[audio_input_index_];
  audio_stream_ = avformat_new_stream(format_ctx_, nullptr);
  audio_packet_ = av_packet_alloc();
  if (!audio_stream_ || !audio_packet_) {
    return SinkError("failed to allocate audio stream");
  }
  ret = avcodec_parameters_copy(audio_stream_->codecpar, in_stream->codecpar);
  if (ret < 0) {
    return SinkError("failed to copy audio parameters: " + AvErrorString(ret));
  }
  audio_stream_->codecpar->codec_tag = 0;
  audio_stream_->time_base = in_stream->time_base;
  audio_eof_ = false;
  return Status::Ok();
}

Status FFmpegVideoSink::EncodeAndWrite(AVFrame* frame) {
  int ret = avcodec_send_frame(codec_ctx_, frame);
  if (ret < 0 && ret != AVERROR_EOF) {
    return SinkError("failed to send frame: " + AvErrorString(ret));
  }

  while (true) {
    ret = avcodec_receive_packet(codec_ctx_, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      return Status::Ok();
    }
    if (ret < 0) {
      return SinkError("encode error: " + AvErrorString(ret));
    }

    av_packet_rescale_ts(packet_, codec_ctx_->time_base, video_stream_->time_base);
    packet_->stream_index = video_stream_->index;
    ret = av_interleaved_write_frame(format_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0) {
      return SinkError("failed to write video packet: " + AvErrorString(ret));
    }
  }
}

Status FFmpegVideoSink::CopyAudioUntil(double video_seconds) {
  if (!audio_stream_) {
    return Status::Ok();
  }

  AVStream* in_stream = audio_input_ctx_->streams[audio_input_index_];
  while (!audio_eof_) {
    int ret = av_read_frame(audio_input_ctx_, audio_packet_);
    if (ret == AVERROR_EOF) {
      audio_eof_ = true;
      break;
    }
    if (ret < 0) {
      return SinkError("audio read error: " + AvErrorString(ret));
    }
    if (audio_packet_->stream_index != audio_input_index_) {
      av_packet_unref(audio_packet_);
      continue;
    }

    const int64_t pts = audio_packet_->pts != AV_NOPTS_VALUE ? audio_packet_->pts : 0;
    const double packet_seconds = static_cast<double>(pts) * av_q2d(in_stream->time_base);

    av_packet_rescale_ts(audio_packet_, in_stream->time_base, audio_stream_->time_base);
    audio_packet_->stream_index = audio_stream_->index;
    audio_packet_->pos = -1;
    ret = av_interleaved_write_frame(format_ctx_, audio_packet_);
    av_packet_unref(audio_packet_);
    if (ret < 0) {
      return SinkError("failed to write audio packet: " + AvErrorString(ret));
    }
    if (packet_seconds >= video_seconds) {
      break;
    }
  }
  return Status::Ok();
}

Status FFmpegVideoSink::WriteFrame(const RgbFrame& frame) {
  if (!header_written_) {
    return SinkError("sink not open");
  }
  if (frame.width != width_ || frame.height != height_ ||
      frame.data.size() != frame.expected_size()) {
    return Status(ErrorCode::kDimensionMismatch,
                  "frame " + std::to_string(frame.width) + "x" + std::to_string(frame.height) +
                      " does not match sink " + std::to_string(width_) + "x" +
                      std::to_string(height_));
  }

  int ret = av_frame_make_writable(yuv_frame_);
  if (ret < 0) {
    return SinkError("frame not writable: " + AvErrorString(ret));
  }

  const uint8_t* src_planes[4] = {frame.data.data(), nullptr, nullptr, nullptr};
  const int src_strides[4] = {static_cast<int>(width_ * 3), 0, 0, 0};
  sws_scale(sws_ctx_, src_planes, src_strides, 0, static_cast<int>(height_),
            yuv_frame_->data, yuv_frame_->linesize);
  yuv_frame_->pts = next_pts_++;

  Status status = EncodeAndWrite(yuv_frame_);
  if (!status.ok()) {
    return status;
  }
  return CopyAudioUntil(static_cast<double>(next_pts_) / fps_);
}

Status FFmpegVideoSink::Close() {
  if (!format_ctx_) {
    return Status::Ok();
  }

  Status status = Status::Ok();
  if (header_written_) {
    status = EncodeAndWrite(nullptr);
    if (status.ok()) {
      status = CopyAudioUntil(std::numeric_limits<double>::infinity());
    }
    const int ret = av_write_trailer(format_ctx_);
    if (status.ok() && ret < 0) {
      status = SinkError("failed to write trailer: " + AvErrorString(ret));
    }
  }

  if (status.ok()) {
    std::cout << "[FFmpegVideoSink] Finished " << path_ << " (" << next_pts_ << " frames)"
              << std::endl;
  }
  Release();
  return status;
}

void FFmpegVideoSink::Release() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (yuv_frame_) {
    av_frame_free(&yuv_frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (audio_packet_) {
    av_packet_free(&audio_packet_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  if (audio_input_ctx_) {
    avformat_close_input(&audio_input_ctx_);
  }
  if (format_ctx_) {
    if (format_ctx_->pb && !(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
      avio_closep(&format_ctx_->pb);
    }
    avformat_free_context(format_ctx_);
    format_ctx_ = nullptr;
  }
  video_stream_ = nullptr;
  audio_stream_ = nullptr;
  audio_input_index_ = -1;
  audio_eof_ = true;
  header_written_ = false;
}

}  // namespace sanchez::media
