#include <sitescan/analysis/analysis_throttler.hpp>

namespace sitescan::analysis {

AnalysisThrottler::AnalysisThrottler(std::chrono::milliseconds min_interval)
    : min_interval_(min_interval < std::chrono::milliseconds(0) ? std::chrono::milliseconds(0)
                                                                 : min_interval) {}

bool AnalysisThrottler::try_accept(Clock::time_point now) noexcept {
  const std::int64_t now_ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
  const std::int64_t interval_ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(min_interval_).count();

  std::int64_t last = last_accepted_ns_.load(std::memory_order_acquire);
  for (;;) {
    if (last != kNever && now_ns - last < interval_ns) {
      return false;
    }
    if (last_accepted_ns_.compare_exchange_weak(last, now_ns, std::memory_order_acq_rel,
                                                std::memory_order_acquire)) {
      return true;
    }
  }
}

void AnalysisThrottler::reset() noexcept {
  last_accepted_ns_.store(kNever, std::memory_order_release);
}

}  // namespace sitescan::analysis
