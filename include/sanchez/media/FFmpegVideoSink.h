// Repository: Sanchez
// Component: FFmpeg Video Sink
// Purpose: Encodes RGB frames to H.264 and muxes them, with optional audio, via libavformat.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_MEDIA_FFMPEG_VIDEO_SINK_H_
#define SANCHEZ_MEDIA_FFMPEG_VIDEO_SINK_H_

#include <cstdint>
#include <string>

#include "sanchez/media/IVideoSink.h"

struct AVFormatContext;
struct AVCodecContext;
struct AVStream;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace sanchez::media {

// FFmpegVideoSink owns the encoder and muxer handles for one output file.
// The container format follows the output extension. H.264 is preferred;
// MPEG-4 Part 2 is used when no H.264 encoder is built in. When an audio
// file is given its first audio stream is remuxed without re-encoding,
// interleaved with the video by timestamp.
class FFmpegVideoSink : public IVideoSink {
 public:
  FFmpegVideoSink();
  ~FFmpegVideoSink() override;

  FFmpegVideoSink(const FFmpegVideoSink&) = delete;
  FFmpegVideoSink& operator=(const FFmpegVideoSink&) = delete;

  Status Open(const std::string& path, uint32_t width, uint32_t height,
              double fps, const std::string& audio_path) override;
  Status WriteFrame(const RgbFrame& frame) override;
  Status Close() override;

 private:
  Status OpenAudioInput(const std::string& audio_path);
  // Sends frame (or flush when null) and writes every packet the encoder yields.
  Status EncodeAndWrite(AVFrame* frame);
  // Copies audio packets whose timestamp is before the given video time.
  Status CopyAudioUntil(double video_seconds);
  void Release();

  std::string path_;
  AVFormatContext* format_ctx_;
  AVCodecContext* codec_ctx_;
  AVStream* video_stream_;
  AVFrame* yuv_frame_;
  AVPacket* packet_;
  SwsContext* sws_ctx_;

  AVFormatContext* audio_input_ctx_;
  AVStream* audio_stream_;
  AVPacket* audio_packet_;
  int audio_input_index_;
  bool audio_eof_;

  uint32_t width_;
  uint32_t height_;
  double fps_;
  int64_t next_pts_;
  bool header_written_;
};

}  // namespace sanchez::media

#endif  // SANCHEZ_MEDIA_FFMPEG_VIDEO_SINK_H_
