#pragma once

#include <atomic>
#include <memory>

namespace sitescan::core {

/// Shared cooperative cancellation flag. Copies observe the same flag; work
/// checks cancelled() at its safe checkpoints and stops early.
class CancellationToken {
 public:
  CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

  void cancel() noexcept { flag_->store(true, std::memory_order_release); }
  [[nodiscard]] bool cancelled() const noexcept {
    return flag_->load(std::memory_order_acquire);
  }

  /// Token that is never cancelled by anyone else.
  [[nodiscard]] static CancellationToken none() { return CancellationToken(); }

 private:
  std::shared_ptr<std::atomic<bool>> flag_;
};

}  // namespace sitescan::core
