#include "sanchez/timing/MasterClock.h"

#include <chrono>
#include <memory>

namespace sanchez::timing {

class SystemMasterClock : public MasterClock {
 public:
  SystemMasterClock() : monotonic_origin_(std::chrono::steady_clock::now()) {}

  int64_t now_utc_us() const override {
    const auto now = std::chrono::system_clock::now();
    return std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch())
        .count();
  }

  double now_monotonic_s() const override {
    const auto delta = std::chrono::steady_clock::now() - monotonic_origin_;
    return std::chrono::duration<double>(delta).count();
  }

 private:
  std::chrono::steady_clock::time_point monotonic_origin_;
};

std::shared_ptr<MasterClock> MakeSystemMasterClock() {
  return std::make_shared<SystemMasterClock>();
}

}  // namespace sanchez::timing
