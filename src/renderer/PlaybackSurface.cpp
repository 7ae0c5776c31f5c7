// Repository: Sanchez
// Component: Playback Surface
// Purpose: Rendering targets for decoded frames: headless counter and SDL2 window.
// Copyright (c) 2025 Sanchez

#include "sanchez/renderer/PlaybackSurface.h"

#include <algorithm>
#include <cmath>
#include <iostream>

#ifdef SANCHEZ_SDL2_AVAILABLE
extern "C" {
#include <SDL2/SDL.h>
}
#endif

namespace sanchez::renderer {

// ============================================================================
// HeadlessSurface
// ============================================================================

HeadlessSurface::HeadlessSurface()
    : width_(0), height_(0), open_(false), frames_presented_(0), frames_rejected_(0) {}

HeadlessSurface::~HeadlessSurface() = default;

Status HeadlessSurface::Open(uint32_t width, uint32_t height, const std::string& title) {
  if (width == 0 || height == 0) {
    return Status(ErrorCode::kDimensionMismatch, "surface dimensions must be non-zero");
  }
  width_ = width;
  height_ = height;
  open_ = true;
  std::cout << "[HeadlessSurface] Opened '" << title << "' " << width << "x" << height
            << std::endl;
  return Status::Ok();
}

bool HeadlessSurface::Present(const media::RgbFrame& frame) {
  if (!open_) {
    return false;
  }
  if (frame.width != width_ || frame.height != height_ ||
      frame.data.size() != frame.expected_size()) {
    ++frames_rejected_;
    return true;
  }
  ++frames_presented_;
  return true;
}

void HeadlessSurface::Close() {
  open_ = false;
}

// ============================================================================
// SdlPlaybackSurface
// ============================================================================

SdlPlaybackSurface::SdlPlaybackSurface(bool vsync_enabled, double scale, bool fullscreen)
    : vsync_enabled_(vsync_enabled),
      scale_(scale > 0.0 ? scale : 1.0),
      fullscreen_(fullscreen),
      width_(0),
      height_(0),
      window_(nullptr),
      renderer_(nullptr),
      texture_(nullptr) {}

SdlPlaybackSurface::~SdlPlaybackSurface() {
  Close();
}

#ifdef SANCHEZ_SDL2_AVAILABLE

Status SdlPlaybackSurface::Open(uint32_t width, uint32_t height, const std::string& title) {
  if (window_) {
    return Status(ErrorCode::kIOError, "surface already open");
  }
  if (SDL_Init(SDL_INIT_VIDEO) < 0) {
    return Status(ErrorCode::kIOError, std::string("SDL_Init failed: ") + SDL_GetError());
  }

  const int window_width = std::max(1, static_cast<int>(std::lround(width * scale_)));
  const int window_height = std::max(1, static_cast<int>(std::lround(height * scale_)));
  Uint32 window_flags = SDL_WINDOW_SHOWN | SDL_WINDOW_RESIZABLE;
  if (fullscreen_) {
    window_flags |= SDL_WINDOW_FULLSCREEN_DESKTOP;
  }
  SDL_Window* window = SDL_CreateWindow(title.c_str(), SDL_WINDOWPOS_CENTERED,
                                        SDL_WINDOWPOS_CENTERED, window_width, window_height,
                                        window_flags);
  if (!window) {
    Status status(ErrorCode::kIOError, std::string("SDL_CreateWindow failed: ") + SDL_GetError());
    SDL_Quit();
    return status;
  }
  window_ = window;

  Uint32 flags = SDL_RENDERER_ACCELERATED;
  if (vsync_enabled_) {
    flags |= SDL_RENDERER_PRESENTVSYNC;
  }
  SDL_Renderer* renderer = SDL_CreateRenderer(window, -1, flags);
  if (!renderer) {
    Status status(ErrorCode::kIOError,
                  std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
    Close();
    return status;
  }
  renderer_ = renderer;

  SDL_Texture* texture = SDL_CreateTexture(renderer, SDL_PIXELFORMAT_RGB24,
                                           SDL_TEXTUREACCESS_STREAMING,
                                           static_cast<int>(width), static_cast<int>(height));
  if (!texture) {
    Status status(ErrorCode::kIOError, std::string("SDL_CreateTexture failed: ") + SDL_GetError());
    Close();
    return status;
  }
  texture_ = texture;
  width_ = width;
  height_ = height;

  std::cout << "[SdlPlaybackSurface] Opened " << width << "x" << height << " in a "
            << window_width << "x" << window_height
            << (fullscreen_ ? " fullscreen" : "") << " window" << std::endl;
  return Status::Ok();
}

bool SdlPlaybackSurface::Present(const media::RgbFrame& frame) {
  if (!window_) {
    return false;
  }

  SDL_Event event;
  while (SDL_PollEvent(&event)) {
    if (event.type == SDL_QUIT) {
      return false;
    }
  }

  SDL_Renderer* renderer = static_cast<SDL_Renderer*>(renderer_);
  SDL_Texture* texture = static_cast<SDL_Texture*>(texture_);
  if (frame.width == width_ && frame.height == height_ &&
      frame.data.size() == frame.expected_size()) {
    SDL_UpdateTexture(texture, nullptr, frame.data.data(), static_cast<int>(width_ * 3));
  }

  SDL_RenderClear(renderer);
  SDL_RenderCopy(renderer, texture, nullptr, nullptr);
  SDL_RenderPresent(renderer);
  return true;
}

void SdlPlaybackSurface::Close() {
  if (!window_) {
    return;
  }
  if (texture_) {
    SDL_DestroyTexture(static_cast<SDL_Texture*>(texture_));
    texture_ = nullptr;
  }
  if (renderer_) {
    SDL_DestroyRenderer(static_cast<SDL_Renderer*>(renderer_));
    renderer_ = nullptr;
  }
  SDL_DestroyWindow(static_cast<SDL_Window*>(window_));
  window_ = nullptr;
  SDL_Quit();
}

#else

Status SdlPlaybackSurface::Open(uint32_t, uint32_t, const std::string&) {
  return Status(ErrorCode::kIOError, "built without SDL2; use a headless surface");
}

bool SdlPlaybackSurface::Present(const media::RgbFrame&) {
  return false;
}

void SdlPlaybackSurface::Close() {}

#endif  // SANCHEZ_SDL2_AVAILABLE

}  // namespace sanchez::renderer
