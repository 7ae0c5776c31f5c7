// Repository: Sanchez
// Component: FFmpeg Image Codec
// Purpose: PNG/JPEG/BMP still image encode and decode through libavcodec.
// Copyright (c) 2025 Sanchez

#include "sanchez/media/FFmpegImageCodec.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>

#include "sanchez/media/FFmpegVideoSource.h"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/frame.h>
#include <libswscale/swscale.h>
}

namespace sanchez::media {

namespace {

std::string AvErrorString(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

std::string LowerExtension(const std::string& path) {
  const size_t dot = path.find_last_of('.');
  if (dot == std::string::npos) {
    return "";
  }
  std::string ext = path.substr(dot + 1);
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return ext;
}

// Encoder id and input pixel format per extension.
bool SelectEncoder(const std::string& ext, AVCodecID& codec_id, AVPixelFormat& pix_fmt) {
  if (ext == "png") {
    codec_id = AV_CODEC_ID_PNG;
    pix_fmt = AV_PIX_FMT_RGB24;
    return true;
  }
  if (ext == "jpg" || ext == "jpeg") {
    codec_id = AV_CODEC_ID_MJPEG;
    pix_fmt = AV_PIX_FMT_YUVJ444P;
    return true;
  }
  if (ext == "bmp") {
    codec_id = AV_CODEC_ID_BMP;
    pix_fmt = AV_PIX_FMT_BGR24;
    return true;
  }
  return false;
}

struct EncodeHandles {
  AVCodecContext* codec_ctx = nullptr;
  AVFrame* frame = nullptr;
  AVPacket* packet = nullptr;
  SwsContext* sws_ctx = nullptr;

  ~EncodeHandles() {
    if (sws_ctx) sws_freeContext(sws_ctx);
    if (packet) av_packet_free(&packet);
    if (frame) av_frame_free(&frame);
    if (codec_ctx) avcodec_free_context(&codec_ctx);
  }
};

Status EncodeError(const std::string& message) {
  std::cerr << "[FFmpegImageCodec] " << message << std::endl;
  return Status(ErrorCode::kIOError, message);
}

}  // namespace

Status FFmpegImageCodec::Encode(const std::string& path, const RgbFrame& frame) {
  if (frame.width == 0 || frame.height == 0 || frame.data.size() != frame.expected_size()) {
    return Status(ErrorCode::kDimensionMismatch, "image frame has inconsistent size");
  }

  AVCodecID codec_id = AV_CODEC_ID_NONE;
  AVPixelFormat pix_fmt = AV_PIX_FMT_NONE;
  if (!SelectEncoder(LowerExtension(path), codec_id, pix_fmt)) {
    return EncodeError("unsupported image format: " + path);
  }

  const AVCodec* codec = avcodec_find_encoder(codec_id);
  if (!codec) {
    return EncodeError(std::string("encoder not available: ") + avcodec_get_name(codec_id));
  }

  EncodeHandles h;
  h.codec_ctx = avcodec_alloc_context3(codec);
  h.frame = av_frame_alloc();
  h.packet = av_packet_alloc();
  if (!h.codec_ctx || !h.frame || !h.packet) {
    return EncodeError("allocation failed");
  }

  const int width = static_cast<int>(frame.width);
  const int height = static_cast<int>(frame.height);
  h.codec_ctx->width = width;
  h.codec_ctx->height = height;
  h.codec_ctx->pix_fmt = pix_fmt;
  h.codec_ctx->time_base = AVRational{1, 1};
  if (codec_id == AV_CODEC_ID_MJPEG) {
    h.codec_ctx->flags |= AV_CODEC_FLAG_QSCALE;
    h.codec_ctx->global_quality = FF_QP2LAMBDA * 2;
  }

  int ret = avcodec_open2(h.codec_ctx, codec, nullptr);
  if (ret < 0) {
    return EncodeError("failed to open image encoder: " + AvErrorString(ret));
  }

  h.frame->format = pix_fmt;
  h.frame->width = width;
  h.frame->height = height;
  ret = av_frame_get_buffer(h.frame, 32);
  if (ret < 0) {
    return EncodeError("failed to allocate image buffer: " + AvErrorString(ret));
  }

  h.sws_ctx = sws_getContext(width, height, AV_PIX_FMT_RGB24, width, height, pix_fmt,
                             SWS_BILINEAR | SWS_BITEXACT, nullptr, nullptr, nullptr);
  if (!h.sws_ctx) {
    return EncodeError("failed to create scaler context");
  }
  const uint8_t* src_planes[4] = {frame.data.data(), nullptr, nullptr, nullptr};
  const int src_strides[4] = {width * 3, 0, 0, 0};
  sws_scale(h.sws_ctx, src_planes, src_strides, 0, height, h.frame->data, h.frame->linesize);
  h.frame->pts = 0;

  ret = avcodec_send_frame(h.codec_ctx, h.frame);
  if (ret >= 0) {
    ret = avcodec_send_frame(h.codec_ctx, nullptr);
  }
  if (ret < 0) {
    return EncodeError("failed to send image: " + AvErrorString(ret));
  }

  ret = avcodec_receive_packet(h.codec_ctx, h.packet);
  if (ret < 0) {
    return EncodeError("image encoder produced no data: " + AvErrorString(ret));
  }

  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    return EncodeError("cannot open " + path + " for writing");
  }
  out.write(reinterpret_cast<const char*>(h.packet->data), h.packet->size);
  out.close();
  if (!out) {
    return EncodeError("failed writing " + path);
  }
  return Status::Ok();
}

Status FFmpegImageCodec::Decode(const std::string& path, RgbFrame& frame) {
  FFmpegVideoSource source;
  Status status = source.Open(path);
  if (!status.ok()) {
    return status;
  }
  if (!source.Next(frame)) {
    status = source.status();
    if (status.ok()) {
      status = Status(ErrorCode::kSourceUnreadable, path + ": image holds no picture");
    }
    return status;
  }
  return Status::Ok();
}

}  // namespace sanchez::media
