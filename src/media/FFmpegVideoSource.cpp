// Repository: Sanchez
// Component: FFmpeg Video Source
// Purpose: Decodes video files and still images to RGB24 using libavformat/libavcodec.
// Copyright (c) 2025 Sanchez

#include "sanchez/media/FFmpegVideoSource.h"

#include <iostream>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/imgutils.h>
#include <libavutil/log.h>
#include <libswscale/swscale.h>
}

namespace sanchez::media {

namespace {

std::string AvErrorString(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

FFmpegVideoSource::FFmpegVideoSource()
    : format_ctx_(nullptr),
      codec_ctx_(nullptr),
      frame_(nullptr),
      packet_(nullptr),
      sws_ctx_(nullptr),
      video_stream_index_(-1),
      eof_reached_(false),
      flushing_(false),
      frames_decoded_(0) {}

FFmpegVideoSource::~FFmpegVideoSource() {
  Close();
}

void FFmpegVideoSource::Fail(const std::string& message) {
  std::cerr << "[FFmpegVideoSource] " << message << std::endl;
  status_ = Status(ErrorCode::kSourceUnreadable, path_ + ": " + message);
}

Status FFmpegVideoSource::Open(const std::string& path) {
  Close();
  path_ = path;
  status_ = Status::Ok();
  std::cout << "[FFmpegVideoSource] Opening: " << path << std::endl;

  // Keep errors visible, suppress warnings.
  av_log_set_level(AV_LOG_ERROR);

  int ret = avformat_open_input(&format_ctx_, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    format_ctx_ = nullptr;
    Fail("failed to open input: " + AvErrorString(ret));
    return status_;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    Fail("failed to find stream info: " + AvErrorString(ret));
    Close();
    return status_;
  }

  if (!FindVideoStream()) {
    Fail("no video stream found");
    Close();
    return status_;
  }

  if (!InitializeCodec()) {
    Close();
    return status_;
  }

  packet_ = av_packet_alloc();
  frame_ = av_frame_alloc();
  if (!packet_ || !frame_) {
    Fail("failed to allocate packet or frame");
    Close();
    return status_;
  }

  std::cout << "[FFmpegVideoSource] Opened successfully: " << width() << "x" << height()
            << " @ " << fps() << " fps" << std::endl;
  return Status::Ok();
}

void FFmpegVideoSource::Close() {
  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }
  if (frame_) {
    av_frame_free(&frame_);
  }
  if (packet_) {
    av_packet_free(&packet_);
  }
  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }
  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }
  video_stream_index_ = -1;
  eof_reached_ = false;
  flushing_ = false;
  frames_decoded_ = 0;
}

uint32_t FFmpegVideoSource::width() const {
  if (!codec_ctx_) return 0;
  return static_cast<uint32_t>(codec_ctx_->width);
}

uint32_t FFmpegVideoSource::height() const {
  if (!codec_ctx_) return 0;
  return static_cast<uint32_t>(codec_ctx_->height);
}

double FFmpegVideoSource::fps() const {
  if (!format_ctx_ || video_stream_index_ < 0) return 0.0;

  AVStream* stream = format_ctx_->streams[video_stream_index_];
  AVRational rate = stream->avg_frame_rate;
  if (rate.num == 0 || rate.den == 0) {
    rate = stream->r_frame_rate;
  }
  if (rate.num == 0 || rate.den == 0) return 0.0;
  return av_q2d(rate);
}

bool FFmpegVideoSource::FindVideoStream() {
  const int index = av_find_best_stream(format_ctx_, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (index < 0) {
    return false;
  }
  video_stream_index_ = index;
  return true;
}

bool FFmpegVideoSource::InitializeCodec() {
  AVCodecParameters* codecpar = format_ctx_->streams[video_stream_index_]->codecpar;

  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    Fail(std::string("decoder not found for codec ") + avcodec_get_name(codecpar->codec_id));
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    Fail("failed to allocate codec context");
    return false;
  }

  int ret = avcodec_parameters_to_context(codec_ctx_, codecpar);
  if (ret < 0) {
    Fail("failed to copy codec parameters: " + AvErrorString(ret));
    return false;
  }
  codec_ctx_->thread_type = FF_THREAD_FRAME;

  ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    Fail("failed to open codec: " + AvErrorString(ret));
    return false;
  }

  if (codec_ctx_->width <= 0 || codec_ctx_->height <= 0) {
    Fail("stream reports no dimensions");
    return false;
  }
  return true;
}

bool FFmpegVideoSource::ReadAndDecodeFrame() {
  while (true) {
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == 0) {
      return true;
    }
    if (ret == AVERROR_EOF) {
      eof_reached_ = true;
      return false;
    }
    if (ret != AVERROR(EAGAIN)) {
      Fail("decode error: " + AvErrorString(ret));
      return false;
    }

    if (flushing_) {
      // Drained but the decoder still asks for input.
      eof_reached_ = true;
      return false;
    }

    ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF) {
      flushing_ = true;
      ret = avcodec_send_packet(codec_ctx_, nullptr);
      if (ret < 0 && ret != AVERROR_EOF) {
        Fail("decoder flush failed: " + AvErrorString(ret));
        return false;
      }
      continue;
    }
    if (ret < 0) {
      Fail("read error: " + AvErrorString(ret));
      return false;
    }

    if (packet_->stream_index == video_stream_index_) {
      ret = avcodec_send_packet(codec_ctx_, packet_);
      if (ret < 0 && ret != AVERROR(EAGAIN)) {
        av_packet_unref(packet_);
        Fail("failed to send packet: " + AvErrorString(ret));
        return false;
      }
    }
    av_packet_unref(packet_);
  }
}

bool FFmpegVideoSource::ConvertFrame(RgbFrame& out) {
  const int w = frame_->width;
  const int h = frame_->height;

  sws_ctx_ = sws_getCachedContext(sws_ctx_,
                                  w, h, static_cast<AVPixelFormat>(frame_->format),
                                  w, h, AV_PIX_FMT_RGB24,
                                  SWS_BILINEAR | SWS_BITEXACT, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    Fail("failed to create scaler context");
    return false;
  }

  out.width = static_cast<uint32_t>(w);
  out.height = static_cast<uint32_t>(h);
  out.data.resize(out.expected_size());

  uint8_t* dst_planes[4] = {out.data.data(), nullptr, nullptr, nullptr};
  int dst_strides[4] = {w * 3, 0, 0, 0};
  sws_scale(sws_ctx_, frame_->data, frame_->linesize, 0, h, dst_planes, dst_strides);
  return true;
}

bool FFmpegVideoSource::Next(RgbFrame& frame) {
  if (!IsOpen() || !status_.ok() || eof_reached_) {
    return false;
  }

  if (!ReadAndDecodeFrame()) {
    return false;
  }

  const bool converted = ConvertFrame(frame);
  av_frame_unref(frame_);
  if (!converted) {
    return false;
  }

  frame.index = frames_decoded_++;
  return true;
}

}  // namespace sanchez::media
