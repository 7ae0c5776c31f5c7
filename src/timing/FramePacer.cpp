// Repository: Sanchez
// Component: Frame Pacer
// Purpose: Emits frames at 1/fps intervals against a MasterClock, cancellable between slices.
// Copyright (c) 2025 Sanchez

#include "sanchez/timing/FramePacer.h"

#include <algorithm>
#include <cmath>
#include <utility>

namespace sanchez::timing {

namespace {
constexpr double kMillion = 1'000'000.0;
}

FramePacer::FramePacer(std::shared_ptr<MasterClock> clock, double fps, int64_t slice_us)
    : clock_(std::move(clock)),
      period_us_(fps > 0.0 ? static_cast<int64_t>(std::llround(kMillion / fps)) : 0),
      slice_us_(slice_us > 0 ? slice_us : kDefaultSliceUs),
      start_utc_us_(0),
      late_frames_(0),
      started_(false) {}

void FramePacer::Start() {
  start_utc_us_ = clock_->now_utc_us();
  late_frames_ = 0;
  started_ = true;
}

int64_t FramePacer::DeadlineUtcUs(uint64_t frame_number) const {
  return start_utc_us_ + static_cast<int64_t>(frame_number) * period_us_;
}

bool FramePacer::WaitForFrame(uint64_t frame_number,
                              const std::atomic<bool>& stop,
                              const std::function<void()>& on_slice) {
  if (!started_) {
    Start();
  }
  const int64_t deadline = DeadlineUtcUs(frame_number);

  int64_t now = clock_->now_utc_us();
  if (now - deadline > kLateToleranceUs) {
    ++late_frames_;
  }

  while (now < deadline) {
    if (stop.load(std::memory_order_acquire)) {
      return false;
    }
    clock_->WaitUntilUtcUs(std::min(deadline, now + slice_us_));
    if (on_slice) {
      on_slice();
    }
    now = clock_->now_utc_us();
  }
  return !stop.load(std::memory_order_acquire);
}

}  // namespace sanchez::timing
