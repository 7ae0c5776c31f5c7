// Repository: Sanchez
// Component: Frame Source Interfaces
// Purpose: Pull-based frame sequences and the external video-decode collaborator.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_MEDIA_IFRAME_SOURCE_H_
#define SANCHEZ_MEDIA_IFRAME_SOURCE_H_

#include <string>

#include "sanchez/core/Status.h"
#include "sanchez/media/RgbFrame.h"

namespace sanchez::media {

// IFrameSource yields one frame per Next() call.
// Next() returns false at the end of the sequence or on error; status()
// tells the two apart (ok() at a normal end).
class IFrameSource {
 public:
  virtual ~IFrameSource() = default;

  virtual bool Next(RgbFrame& frame) = 0;

  virtual Status status() const = 0;
};

// IVideoSource decodes a video or image file into a finite,
// non-restartable sequence of RGB frames.
class IVideoSource : public IFrameSource {
 public:
  // Opens the input. Fails with kSourceUnreadable.
  virtual Status Open(const std::string& path) = 0;

  virtual void Close() = 0;

  virtual uint32_t width() const = 0;
  virtual uint32_t height() const = 0;

  // Nominal frame rate; 0 when the input carries none.
  virtual double fps() const = 0;
};

}  // namespace sanchez::media

#endif  // SANCHEZ_MEDIA_IFRAME_SOURCE_H_
