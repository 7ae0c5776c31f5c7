#include "timing/TestMasterClock.h"

#include <chrono>
#include <cmath>
#include <thread>

namespace sanchez::timing {

namespace {
constexpr double kMillion = 1'000'000.0;
}

TestMasterClock::TestMasterClock(int64_t start_time_us, Mode mode)
    : mode_(mode),
      utc_us_(start_time_us),
      start_time_us_(start_time_us),
      max_wait_us_(0),
      blocked_waits_(0) {}

int64_t TestMasterClock::now_utc_us() const {
  return utc_us_.load(std::memory_order_acquire);
}

double TestMasterClock::now_monotonic_s() const {
  return static_cast<double>(now_utc_us() - start_time_us_) / kMillion;
}

bool TestMasterClock::is_fake() const {
  return true;
}

void TestMasterClock::WaitUntilUtcUs(int64_t target_utc_us) const {
  if (now_utc_us() >= target_utc_us) {
    return;
  }
  blocked_waits_.fetch_add(1, std::memory_order_acq_rel);

  if (mode_ == Mode::Deterministic) {
    std::unique_lock<std::mutex> lock(mutex_);
    const auto reached = [&] { return utc_us_.load(std::memory_order_acquire) >= target_utc_us; };
    const int64_t max_wait = max_wait_us_.load(std::memory_order_acquire);
    if (max_wait > 0) {
      cv_.wait_for(lock, std::chrono::microseconds(max_wait), reached);
    } else {
      cv_.wait(lock, reached);
    }
    return;
  }

  while (now_utc_us() < target_utc_us) {
    std::this_thread::sleep_for(std::chrono::microseconds(200));
  }
}

void TestMasterClock::AdvanceMicroseconds(int64_t delta_us) {
  std::lock_guard<std::mutex> lock(mutex_);
  utc_us_.fetch_add(delta_us, std::memory_order_acq_rel);
  cv_.notify_all();
}

void TestMasterClock::AdvanceSeconds(double delta_s) {
  AdvanceMicroseconds(static_cast<int64_t>(std::llround(delta_s * kMillion)));
}

void TestMasterClock::set_time_us(int64_t time_us) {
  std::lock_guard<std::mutex> lock(mutex_);
  utc_us_.store(time_us, std::memory_order_release);
  cv_.notify_all();
}

void TestMasterClock::SetMaxWaitUs(int64_t max_wait_us) {
  max_wait_us_.store(max_wait_us, std::memory_order_release);
}

}  // namespace sanchez::timing
