#pragma once

#include <sitescan/vision/inference_backend.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace sitescan::vision {

/// One synthetic raw detection: class id, normalized box and score.
struct MockDetection {
  std::int64_t class_id{0};
  float x{0.f};
  float y{0.f};
  float w{0.f};
  float h{0.f};
  float score{0.f};
};

/// Model runtime that returns configurable synthetic detections (tests, demo CLI).
/// Can be told to fail the next calls with a given error.
class MockInferenceBackend : public IInferenceBackend {
 public:
  /// Set detections returned by subsequent infer() / infer_batch() calls.
  void set_detections(std::vector<MockDetection> detections);

  /// Make every subsequent call fail with error; std::nullopt restores success.
  void set_failure(std::optional<sitescan::core::BackendError> error);

  [[nodiscard]] std::uint32_t infer_calls() const noexcept { return infer_calls_; }

  [[nodiscard]] std::expected<InferenceResult, sitescan::core::BackendError>
  infer(const sitescan::core::Image& input) override;

  [[nodiscard]] std::expected<std::vector<InferenceResult>, sitescan::core::BackendError>
  infer_batch(std::span<const sitescan::core::Image> inputs) override;

 private:
  std::vector<MockDetection> detections_;
  std::optional<sitescan::core::BackendError> failure_;
  std::uint32_t infer_calls_{0};
};

}  // namespace sitescan::vision
