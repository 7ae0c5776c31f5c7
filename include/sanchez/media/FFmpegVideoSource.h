// Repository: Sanchez
// Component: FFmpeg Video Source
// Purpose: Decodes video files and still images to RGB24 using libavformat/libavcodec.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_MEDIA_FFMPEG_VIDEO_SOURCE_H_
#define SANCHEZ_MEDIA_FFMPEG_VIDEO_SOURCE_H_

#include <string>

#include "sanchez/media/IFrameSource.h"

struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace sanchez::media {

// FFmpegVideoSource demuxes and decodes the first video stream of any input
// libavformat understands (still images go through the image2 demuxer) and
// converts every decoded picture to RGB24 at its native size.
class FFmpegVideoSource : public IVideoSource {
 public:
  FFmpegVideoSource();
  ~FFmpegVideoSource() override;

  FFmpegVideoSource(const FFmpegVideoSource&) = delete;
  FFmpegVideoSource& operator=(const FFmpegVideoSource&) = delete;

  Status Open(const std::string& path) override;
  void Close() override;

  bool Next(RgbFrame& frame) override;
  Status status() const override { return status_; }

  uint32_t width() const override;
  uint32_t height() const override;
  double fps() const override;

 private:
  bool IsOpen() const { return format_ctx_ != nullptr; }
  bool FindVideoStream();
  bool InitializeCodec();
  // Pulls one decoded picture; false at end of stream or on error.
  bool ReadAndDecodeFrame();
  bool ConvertFrame(RgbFrame& out);
  void Fail(const std::string& message);

  std::string path_;
  AVFormatContext* format_ctx_;
  AVCodecContext* codec_ctx_;
  AVFrame* frame_;
  AVPacket* packet_;
  SwsContext* sws_ctx_;
  int video_stream_index_;
  bool eof_reached_;
  bool flushing_;
  uint32_t frames_decoded_;
  Status status_;
};

}  // namespace sanchez::media

#endif  // SANCHEZ_MEDIA_FFMPEG_VIDEO_SOURCE_H_
