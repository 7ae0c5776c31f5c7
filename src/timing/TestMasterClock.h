#ifndef SANCHEZ_TIMING_TEST_MASTER_CLOCK_H_
#define SANCHEZ_TIMING_TEST_MASTER_CLOCK_H_

#include "sanchez/timing/MasterClock.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>

namespace sanchez::timing {

// TestMasterClock only moves when advanced.
// - RealTime: waits poll with short sleeps until another thread advances time
// - Deterministic: waits block on a condition variable woken by AdvanceMicroseconds()
class TestMasterClock : public MasterClock {
 public:
  enum class Mode {
    RealTime,
    Deterministic
  };

  explicit TestMasterClock(int64_t start_time_us = 0, Mode mode = Mode::Deterministic);

  int64_t now_utc_us() const override;
  double now_monotonic_s() const override;
  bool is_fake() const override;
  void WaitUntilUtcUs(int64_t target_utc_us) const override;

  void AdvanceMicroseconds(int64_t delta_us);
  void AdvanceSeconds(double delta_s);
  void set_time_us(int64_t time_us);

  // Deterministic waits give up after max_wait_us of real time (0 = never).
  void SetMaxWaitUs(int64_t max_wait_us);

  // Number of WaitUntilUtcUs() calls that had to block.
  int64_t blocked_waits() const { return blocked_waits_.load(std::memory_order_acquire); }

 private:
  Mode mode_;
  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::atomic<int64_t> utc_us_;
  int64_t start_time_us_;
  std::atomic<int64_t> max_wait_us_;
  mutable std::atomic<int64_t> blocked_waits_;
};

}  // namespace sanchez::timing

#endif  // SANCHEZ_TIMING_TEST_MASTER_CLOCK_H_
