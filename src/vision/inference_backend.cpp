#include <sitescan/vision/inference_backend.hpp>
#include <sitescan/core/error.hpp>
#include <span>
#include <vector>

namespace sitescan::vision {

std::expected<void, sitescan::core::BackendError>
IInferenceBackend::validate_input(const sitescan::core::Image& input) const {
  if (input.empty()) {
    return std::unexpected(sitescan::core::BackendError::MalformedInput);
  }
  return {};
}

std::expected<std::vector<InferenceResult>, sitescan::core::BackendError>
IInferenceBackend::infer_batch(std::span<const sitescan::core::Image> inputs) {
  std::vector<InferenceResult> results;
  results.reserve(inputs.size());
  for (const auto& image : inputs) {
    auto single = infer(image);
    if (!single) {
      return std::unexpected(single.error());
    }
    results.push_back(std::move(*single));
  }
  return results;
}

}  // namespace sitescan::vision
