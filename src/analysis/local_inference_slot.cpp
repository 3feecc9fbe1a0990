#include <sitescan/analysis/local_inference_slot.hpp>
#include <algorithm>
#include <chrono>

namespace sitescan::analysis {

namespace {
// Cancellation tokens are plain flags, so waiters re-check them on this period.
constexpr auto kCancelPollPeriod = std::chrono::milliseconds(5);
}  // namespace

LocalInferenceSlot::Lease& LocalInferenceSlot::Lease::operator=(Lease&& other) noexcept {
  if (this != &other) {
    release();
    slot_ = other.slot_;
    other.slot_ = nullptr;
  }
  return *this;
}

void LocalInferenceSlot::Lease::release() noexcept {
  if (slot_) {
    slot_->release_lease();
    slot_ = nullptr;
  }
}

bool LocalInferenceSlot::is_next_locked(std::uint64_t ticket) const {
  if (!capture_queue_.empty()) return capture_queue_.front() == ticket;
  return !streaming_queue_.empty() && streaming_queue_.front() == ticket;
}

void LocalInferenceSlot::drop_ticket_locked(std::uint64_t ticket) {
  for (auto* queue : {&capture_queue_, &streaming_queue_}) {
    const auto it = std::find(queue->begin(), queue->end(), ticket);
    if (it != queue->end()) {
      queue->erase(it);
      return;
    }
  }
}

std::optional<LocalInferenceSlot::Lease> LocalInferenceSlot::acquire(
    SlotPriority priority, const sitescan::core::CancellationToken& cancel) {
  std::unique_lock lock(mutex_);
  const std::uint64_t ticket = next_ticket_++;
  (priority == SlotPriority::Capture ? capture_queue_ : streaming_queue_).push_back(ticket);

  for (;;) {
    if (cancel.cancelled()) {
      drop_ticket_locked(ticket);
      lock.unlock();
      cv_.notify_all();
      return std::nullopt;
    }
    if (!held_ && is_next_locked(ticket)) {
      drop_ticket_locked(ticket);
      held_ = true;
      holder_priority_ = priority;
      holder_cancel_ = cancel;
      return Lease(this);
    }
    cv_.wait_for(lock, kCancelPollPeriod);
  }
}

void LocalInferenceSlot::release_lease() noexcept {
  {
    std::lock_guard lock(mutex_);
    held_ = false;
    holder_cancel_.reset();
  }
  cv_.notify_all();
}

bool LocalInferenceSlot::preempt_streaming() {
  std::lock_guard lock(mutex_);
  if (!held_ || holder_priority_ != SlotPriority::Streaming || !holder_cancel_) return false;
  holder_cancel_->cancel();
  return true;
}

bool LocalInferenceSlot::busy() const {
  std::lock_guard lock(mutex_);
  return held_;
}

std::size_t LocalInferenceSlot::waiting() const {
  std::lock_guard lock(mutex_);
  return capture_queue_.size() + streaming_queue_.size();
}

}  // namespace sitescan::analysis
