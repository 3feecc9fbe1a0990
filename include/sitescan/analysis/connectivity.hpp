#pragma once

#include <atomic>
#include <cstdint>

namespace sitescan::analysis {

enum class ConnectivityQuality : std::uint8_t {
  None,
  Poor,
  Good,
};

/// Network signal supplied by the device's network-monitoring collaborator.
/// Consulted once at session start.
class IConnectivityMonitor {
 public:
  virtual ~IConnectivityMonitor() = default;

  [[nodiscard]] virtual bool connected() const = 0;
  [[nodiscard]] virtual ConnectivityQuality quality() const = 0;
};

/// Connectivity fixed by the owner (CLI flag, tests); settable from any thread.
class StaticConnectivity : public IConnectivityMonitor {
 public:
  explicit StaticConnectivity(ConnectivityQuality quality = ConnectivityQuality::Good)
      : quality_(quality) {}

  [[nodiscard]] bool connected() const override {
    return quality_.load(std::memory_order_acquire) != ConnectivityQuality::None;
  }
  [[nodiscard]] ConnectivityQuality quality() const override {
    return quality_.load(std::memory_order_acquire);
  }

  void set_quality(ConnectivityQuality quality) noexcept {
    quality_.store(quality, std::memory_order_release);
  }

 private:
  std::atomic<ConnectivityQuality> quality_;
};

}  // namespace sitescan::analysis
