// Repository: Sanchez
// Component: Frame Player
// Purpose: Presents a frame sequence on a playback surface at the container frame rate.
// Copyright (c) 2025 Sanchez

#include "sanchez/renderer/FramePlayer.h"

#include <iostream>
#include <string>
#include <utility>

#include "sanchez/timing/FramePacer.h"

namespace sanchez::renderer {

FramePlayer::FramePlayer(const PlayerConfig& config, std::shared_ptr<timing::MasterClock> clock)
    : config_(config), clock_(std::move(clock)), stop_requested_(false) {
  if (!clock_) {
    clock_ = timing::MakeSystemMasterClock();
  }
}

Status FramePlayer::Play(media::IFrameSource& source, IPlaybackSurface& surface) {
  stop_requested_.store(false, std::memory_order_release);
  stats_ = PlayerStats();

  timing::FramePacer pacer(clock_, config_.fps);
  bool surface_open = false;
  bool viewer_closed = false;
  Status result = Status::Ok();
  uint64_t frame_number = 0;

  media::RgbFrame frame;
  while (true) {
    if (stop_requested_.load(std::memory_order_acquire)) {
      result = Status(ErrorCode::kCancelled, "playback stopped");
      break;
    }
    if (!source.Next(frame)) {
      result = source.status();
      break;
    }
    if (frame.index < config_.start_frame) {
      ++stats_.frames_skipped;
      continue;
    }

    if (!surface_open) {
      result = surface.Open(frame.width, frame.height, config_.title);
      if (!result.ok()) {
        std::cerr << "[FramePlayer] Cannot open surface: " << result.ToString() << std::endl;
        return result;
      }
      surface_open = true;
    }

    if (config_.realtime_pacing && config_.fps > 0.0 &&
        !pacer.WaitForFrame(frame_number, stop_requested_)) {
      result = Status(ErrorCode::kCancelled, "playback stopped");
      break;
    }
    ++frame_number;

    if (!surface.Present(frame)) {
      std::cout << "[FramePlayer] Surface closed by viewer" << std::endl;
      viewer_closed = true;
      break;
    }
    ++stats_.frames_presented;
    if (stats_.frames_presented % 100 == 0) {
      std::cout << "[FramePlayer] Presented " << stats_.frames_presented
                << " frames, late: " << pacer.late_frames() << std::endl;
    }
  }

  if (result.ok() && !viewer_closed && stats_.frames_presented == 0 && config_.start_frame > 0) {
    result = Status(ErrorCode::kIndexOutOfRange,
                    "start frame " + std::to_string(config_.start_frame) +
                        " is past the end of the source");
  }
  stats_.late_frames = pacer.late_frames();
  if (surface_open) {
    surface.Close();
  }
  std::cout << "[FramePlayer] Done: presented=" << stats_.frames_presented
            << " skipped=" << stats_.frames_skipped
            << " late=" << stats_.late_frames << std::endl;
  return result;
}

}  // namespace sanchez::renderer
