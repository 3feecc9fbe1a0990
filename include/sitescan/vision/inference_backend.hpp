#pragma once

#include <sitescan/core/error.hpp>
#include <sitescan/core/image.hpp>
#include <sitescan/vision/inference_result.hpp>
#include <expected>
#include <span>
#include <vector>

namespace sitescan::vision {

/// Abstract on-device model runtime: preprocessed Image -> InferenceResult.
/// Implement infer(); optionally override validate_input, infer_batch, warmup.
/// Implementations are not required to be thread-safe; the local inference slot
/// serializes access to the device.
class IInferenceBackend {
 public:
  virtual ~IInferenceBackend() = default;

  /// Single-image inference. Must be implemented.
  [[nodiscard]] virtual std::expected<InferenceResult, sitescan::core::BackendError>
  infer(const sitescan::core::Image& input) = 0;

  /// Optional: validate format/dimensions before infer. Default: accept non-empty images.
  [[nodiscard]] virtual std::expected<void, sitescan::core::BackendError>
  validate_input(const sitescan::core::Image& input) const;

  /// Optional: batch inference. Default: loop over infer().
  [[nodiscard]] virtual std::expected<std::vector<InferenceResult>, sitescan::core::BackendError>
  infer_batch(std::span<const sitescan::core::Image> inputs);

  /// Optional: warmup run after load. Default: no-op.
  virtual void warmup() {}
};

}  // namespace sitescan::vision
