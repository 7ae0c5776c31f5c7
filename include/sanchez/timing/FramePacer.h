// Repository: Sanchez
// Component: Frame Pacer
// Purpose: Emits frames at 1/fps intervals against a MasterClock, cancellable between slices.
// Copyright (c) 2025 Sanchez

#ifndef SANCHEZ_TIMING_FRAME_PACER_H_
#define SANCHEZ_TIMING_FRAME_PACER_H_

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>

#include "sanchez/timing/MasterClock.h"

namespace sanchez::timing {

// FramePacer schedules frame n at start + n / fps. Deadlines are absolute,
// so a late frame does not shift the ones after it.
//
// Waits are split into slices of at most slice_us so a stop flag is observed
// promptly and the caller can do idle work (keepalives) between slices.
class FramePacer {
 public:
  static constexpr int64_t kDefaultSliceUs = 50'000;
  // A frame whose deadline passed by more than this is counted late.
  static constexpr int64_t kLateToleranceUs = 5'000;

  FramePacer(std::shared_ptr<MasterClock> clock, double fps,
             int64_t slice_us = kDefaultSliceUs);

  // Anchors frame 0 at the current clock time.
  void Start();

  int64_t DeadlineUtcUs(uint64_t frame_number) const;

  // Blocks until frame_number is due. on_slice runs after every partial wait.
  // Returns false when stop was raised before the deadline.
  bool WaitForFrame(uint64_t frame_number,
                    const std::atomic<bool>& stop,
                    const std::function<void()>& on_slice = nullptr);

  int64_t period_us() const { return period_us_; }
  uint64_t late_frames() const { return late_frames_; }
  bool started() const { return started_; }

 private:
  std::shared_ptr<MasterClock> clock_;
  int64_t period_us_;
  int64_t slice_us_;
  int64_t start_utc_us_;
  uint64_t late_frames_;
  bool started_;
};

}  // namespace sanchez::timing

#endif  // SANCHEZ_TIMING_FRAME_PACER_H_
