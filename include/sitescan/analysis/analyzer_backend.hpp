#pragma once

#include <sitescan/core/cancellation.hpp>
#include <sitescan/core/error.hpp>
#include <sitescan/core/hazard.hpp>
#include <sitescan/core/image.hpp>
#include <chrono>
#include <expected>
#include <set>
#include <string>
#include <vector>

namespace sitescan::analysis {

/// Detections produced by one backend call, or the classified failure.
using DetectionsOrError =
    std::expected<std::vector<sitescan::core::HazardDetection>, sitescan::core::BackendError>;

/// Uniform contract for one analysis engine (on-device multimodal model, on-device
/// lightweight detector, remote vision service).
///
/// Adapters never throw out of analyze(): every engine or transport failure is
/// converted to a BackendError at this boundary. analyze() may block for as long
/// as the engine takes; the orchestrator bounds it with a budget (timeout(), or a
/// shorter one on retry) and stops waiting when it passes. Adapters that can bound
/// their own I/O honor the budget; all check the cancellation token at their safe
/// checkpoints and return BackendError::Cancelled.
class IAnalyzerBackend {
 public:
  virtual ~IAnalyzerBackend() = default;

  [[nodiscard]] virtual const sitescan::core::BackendId& id() const noexcept = 0;
  [[nodiscard]] virtual sitescan::core::BackendTier tier() const noexcept = 0;
  [[nodiscard]] virtual sitescan::core::CostClass cost_class() const noexcept = 0;

  /// Hazard categories this engine can detect (taxonomy categories, e.g. "PPE").
  [[nodiscard]] virtual std::set<std::string> capabilities() const = 0;

  /// Cheap readiness check; no I/O and no model loading.
  [[nodiscard]] virtual bool available() const = 0;

  /// Per-call budget for this backend's tier.
  [[nodiscard]] virtual std::chrono::milliseconds timeout() const noexcept = 0;

  [[nodiscard]] virtual DetectionsOrError analyze(const sitescan::core::Image& image,
                                                  const sitescan::core::CaptureContext& context,
                                                  const sitescan::core::CancellationToken& cancel,
                                                  std::chrono::milliseconds budget) = 0;

  /// Re-attempts loading whatever analyze() depends on (e.g. model weights).
  /// Called from a background task after a ModelNotLoaded failure. Default: nothing to reload.
  [[nodiscard]] virtual std::expected<void, sitescan::core::BackendError> reload() { return {}; }

  /// True for backends that run on the exclusive on-device inference resource.
  [[nodiscard]] bool uses_local_device() const noexcept {
    return tier() != sitescan::core::BackendTier::Remote;
  }
};

/// Default per-tier budgets: on-device 2 s, remote 10 s.
[[nodiscard]] std::chrono::milliseconds default_timeout(sitescan::core::BackendTier tier) noexcept;

}  // namespace sitescan::analysis
