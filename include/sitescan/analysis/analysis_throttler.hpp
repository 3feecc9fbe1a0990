#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <limits>

namespace sitescan::analysis {

/// Rate limit for streaming frame submissions. A frame is accepted only when
/// min_interval has elapsed since the last accepted frame; rejected frames are
/// dropped, never queued. Photo captures do not go through the throttler.
class AnalysisThrottler {
 public:
  using Clock = std::chrono::steady_clock;

  explicit AnalysisThrottler(std::chrono::milliseconds min_interval = std::chrono::milliseconds(500));

  /// Accepts or rejects a frame submitted at now. Thread-safe; among concurrent
  /// callers inside one window exactly one is accepted.
  [[nodiscard]] bool try_accept(Clock::time_point now = Clock::now()) noexcept;

  /// Forgets the last accepted frame; the next frame is accepted.
  void reset() noexcept;

  [[nodiscard]] std::chrono::milliseconds min_interval() const noexcept { return min_interval_; }

 private:
  static constexpr std::int64_t kNever = std::numeric_limits<std::int64_t>::min();

  std::chrono::milliseconds min_interval_;
  std::atomic<std::int64_t> last_accepted_ns_{kNever};
};

}  // namespace sitescan::analysis
