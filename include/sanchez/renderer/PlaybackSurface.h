// Repository: Sanchez
// Component: Playback Surface
// Purpose: Rendering targets for decoded frames: headless counter and SDL2 window.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_RENDERER_PLAYBACK_SURFACE_H_
#define SANCHEZ_RENDERER_PLAYBACK_SURFACE_H_

#include <cstdint>
#include <string>

#include "sanchez/core/Status.h"
#include "sanchez/media/RgbFrame.h"

namespace sanchez::renderer {

// IPlaybackSurface displays RGB24 frames of a fixed size.
class IPlaybackSurface {
 public:
  virtual ~IPlaybackSurface() = default;

  virtual Status Open(uint32_t width, uint32_t height, const std::string& title) = 0;

  // Returns false once the viewer closed the surface.
  virtual bool Present(const media::RgbFrame& frame) = 0;

  virtual void Close() = 0;
};

// HeadlessSurface consumes frames without displaying them.
class HeadlessSurface : public IPlaybackSurface {
 public:
  HeadlessSurface();
  ~HeadlessSurface() override;

  Status Open(uint32_t width, uint32_t height, const std::string& title) override;
  bool Present(const media::RgbFrame& frame) override;
  void Close() override;

  uint64_t frames_presented() const { return frames_presented_; }
  // Frames whose size did not match the opened surface.
  uint64_t frames_rejected() const { return frames_rejected_; }
  bool is_open() const { return open_; }

 private:
  uint32_t width_;
  uint32_t height_;
  bool open_;
  uint64_t frames_presented_;
  uint64_t frames_rejected_;
};

// SdlPlaybackSurface shows frames in an SDL2 window through a streaming
// RGB24 texture scaled to the window. The window starts at scale times the
// frame size, or covers the desktop when fullscreen is set.
class SdlPlaybackSurface : public IPlaybackSurface {
 public:
  explicit SdlPlaybackSurface(bool vsync_enabled = true, double scale = 1.0,
                              bool fullscreen = false);
  ~SdlPlaybackSurface() override;

  SdlPlaybackSurface(const SdlPlaybackSurface&) = delete;
  SdlPlaybackSurface& operator=(const SdlPlaybackSurface&) = delete;

  Status Open(uint32_t width, uint32_t height, const std::string& title) override;
  bool Present(const media::RgbFrame& frame) override;
  void Close() override;

 private:
  bool vsync_enabled_;
  double scale_;
  bool fullscreen_;
  uint32_t width_;
  uint32_t height_;

  // SDL handles (opaque pointers)
  void* window_;    // SDL_Window*
  void* renderer_;  // SDL_Renderer*
  void* texture_;   // SDL_Texture*
};

}  // namespace sanchez::renderer

#endif  // SANCHEZ_RENDERER_PLAYBACK_SURFACE_H_
