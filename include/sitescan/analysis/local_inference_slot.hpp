#pragma once

#include <sitescan/core/cancellation.hpp>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace sitescan::analysis {

enum class SlotPriority : std::uint8_t {
  Capture,    // photo capture; granted before any streaming waiter
  Streaming,  // live frame analysis
};

/// The device's single on-device inference context. At most one lease is
/// outstanding; waiters are served FIFO within a priority class and capture
/// waiters always go before streaming waiters.
class LocalInferenceSlot {
 public:
  /// Scoped ownership of the slot; released on destruction or release().
  class Lease {
   public:
    Lease() = default;
    Lease(Lease&& other) noexcept : slot_(other.slot_) { other.slot_ = nullptr; }
    Lease& operator=(Lease&& other) noexcept;
    Lease(const Lease&) = delete;
    Lease& operator=(const Lease&) = delete;
    ~Lease() { release(); }

    [[nodiscard]] bool held() const noexcept { return slot_ != nullptr; }
    void release() noexcept;

   private:
    friend class LocalInferenceSlot;
    explicit Lease(LocalInferenceSlot* slot) : slot_(slot) {}
    LocalInferenceSlot* slot_{nullptr};
  };

  LocalInferenceSlot() = default;
  LocalInferenceSlot(const LocalInferenceSlot&) = delete;
  LocalInferenceSlot& operator=(const LocalInferenceSlot&) = delete;

  /// Blocks until the slot is granted. Returns nullopt when cancel fires while
  /// waiting. The holder's token is kept so preempt_streaming() can cancel it.
  [[nodiscard]] std::optional<Lease> acquire(SlotPriority priority,
                                             const sitescan::core::CancellationToken& cancel);

  /// Cancels the current holder if it is streaming work. Returns true if it did.
  bool preempt_streaming();

  [[nodiscard]] bool busy() const;
  [[nodiscard]] std::size_t waiting() const;

 private:
  void release_lease() noexcept;
  [[nodiscard]] bool is_next_locked(std::uint64_t ticket) const;
  void drop_ticket_locked(std::uint64_t ticket);

  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<std::uint64_t> capture_queue_;
  std::deque<std::uint64_t> streaming_queue_;
  std::uint64_t next_ticket_{0};
  bool held_{false};
  SlotPriority holder_priority_{SlotPriority::Streaming};
  std::optional<sitescan::core::CancellationToken> holder_cancel_;
};

}  // namespace sitescan::analysis
