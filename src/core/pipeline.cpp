#include <sitescan/core/pipeline.hpp>
#include <chrono>

namespace sitescan::core {

void Pipeline::add_stage(std::unique_ptr<IImageStage> stage) {
  if (stage) {
    stages_.push_back(std::move(stage));
  }
}

std::expected<Image, BackendError> Pipeline::run(
    const Image& input,
    StageTimingCallback* timing_cb) const {
  Image current = input;

  for (std::size_t i = 0; i < stages_.size(); ++i) {
    const auto stage_start = std::chrono::steady_clock::now();
    auto result = stages_[i]->process(current);
    if (timing_cb) {
      const auto stage_end = std::chrono::steady_clock::now();
      const double ms = 1e-3 * static_cast<double>(
          std::chrono::duration_cast<std::chrono::microseconds>(stage_end - stage_start).count());
      (*timing_cb)(i, ms);
    }

    if (!result) {
      return std::unexpected(result.error());
    }
    current = std::move(*result);
  }
  return current;
}

}  // namespace sitescan::core
