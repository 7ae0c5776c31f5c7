// Repository: Sanchez
// Component: Frame Player
// Purpose: Presents a frame sequence on a playback surface at the container frame rate.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_RENDERER_FRAME_PLAYER_H_
#define SANCHEZ_RENDERER_FRAME_PLAYER_H_

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

#include "sanchez/core/Status.h"
#include "sanchez/media/IFrameSource.h"
#include "sanchez/renderer/PlaybackSurface.h"
#include "sanchez/timing/MasterClock.h"

namespace sanchez::renderer {

// PlayerConfig
struct PlayerConfig {
  double fps = 24.0;
  std::string title = "Sanchez";
  bool realtime_pacing = true;
  // Frames with a smaller index are pulled from the source and discarded.
  uint32_t start_frame = 0;
};

struct PlayerStats {
  uint64_t frames_presented = 0;
  uint64_t frames_skipped = 0;
  uint64_t late_frames = 0;
};

// FramePlayer pulls frames from any IFrameSource (a container, a live
// stream) and presents them at 1/fps against the MasterClock. The surface is
// opened with the size of the first frame.
//
// Play() blocks; Stop() may be called from another thread and takes effect
// within one pacing slice.
class FramePlayer {
 public:
  FramePlayer(const PlayerConfig& config, std::shared_ptr<timing::MasterClock> clock);

  // Ok when the source ended or the viewer closed the surface; kCancelled
  // after Stop(); kIndexOutOfRange when the source ended before start_frame;
  // otherwise the source or surface error.
  Status Play(media::IFrameSource& source, IPlaybackSurface& surface);

  void Stop() { stop_requested_.store(true, std::memory_order_release); }

  const PlayerStats& stats() const { return stats_; }

 private:
  PlayerConfig config_;
  std::shared_ptr<timing::MasterClock> clock_;
  std::atomic<bool> stop_requested_;
  PlayerStats stats_;
};

}  // namespace sanchez::renderer

#endif  // SANCHEZ_RENDERER_FRAME_PLAYER_H_
