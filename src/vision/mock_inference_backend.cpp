#include <sitescan/vision/mock_inference_backend.hpp>
#include <sitescan/core/error.hpp>
#include <cstdint>
#include <span>
#include <vector>

namespace sitescan::vision {

void MockInferenceBackend::set_detections(std::vector<MockDetection> detections) {
  detections_ = std::move(detections);
}

void MockInferenceBackend::set_failure(std::optional<sitescan::core::BackendError> error) {
  failure_ = error;
}

static InferenceResult mock_to_result(const std::vector<MockDetection>& detections) {
  InferenceResult r;
  r.num_detections = static_cast<std::uint32_t>(detections.size());
  for (const auto& d : detections) {
    r.boxes.push_back(d.x);
    r.boxes.push_back(d.y);
    r.boxes.push_back(d.x + d.w);
    r.boxes.push_back(d.y + d.h);
    r.scores.push_back(d.score);
    r.class_ids.push_back(d.class_id);
  }
  return r;
}

std::expected<InferenceResult, sitescan::core::BackendError>
MockInferenceBackend::infer(const sitescan::core::Image& input) {
  ++infer_calls_;
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }
  if (failure_) {
    return std::unexpected(*failure_);
  }
  return mock_to_result(detections_);
}

std::expected<std::vector<InferenceResult>, sitescan::core::BackendError>
MockInferenceBackend::infer_batch(std::span<const sitescan::core::Image> inputs) {
  std::vector<InferenceResult> results;
  results.reserve(inputs.size());
  for (const auto& image : inputs) {
    auto one = infer(image);
    if (!one) {
      return std::unexpected(one.error());
    }
    results.push_back(std::move(*one));
  }
  return results;
}

}  // namespace sitescan::vision
