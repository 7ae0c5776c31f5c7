#ifndef SANCHEZ_TIMING_MASTER_CLOCK_H_
#define SANCHEZ_TIMING_MASTER_CLOCK_H_

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <memory>
#include <thread>

namespace sanchez::timing {

// MasterClock provides wall-clock and monotonic time for pacing.
class MasterClock {
 public:
  virtual ~MasterClock() = default;

  // Returns current UTC time in microseconds since Unix epoch.
  virtual int64_t now_utc_us() const = 0;

  // Returns current monotonic time in seconds relative to clock start.
  virtual double now_monotonic_s() const = 0;

  // True for test clocks whose time only moves when advanced.
  virtual bool is_fake() const { return false; }

  // Blocks until the clock reaches or exceeds target_utc_us.
  virtual void WaitUntilUtcUs(int64_t target_utc_us) const {
    while (true) {
      const int64_t remaining = target_utc_us - now_utc_us();
      if (remaining <= 0) {
        break;
      }
      const int64_t sleep_us = (remaining > 2'000) ? remaining - 1'000
                                                    : std::max<int64_t>(remaining / 2, 200);
      std::this_thread::sleep_for(std::chrono::microseconds(sleep_us));
    }
  }
};

std::shared_ptr<MasterClock> MakeSystemMasterClock();

}  // namespace sanchez::timing

#endif  // SANCHEZ_TIMING_MASTER_CLOCK_H_
