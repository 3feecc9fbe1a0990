#pragma once

#include <sitescan/core/error.hpp>
#include <sitescan/core/image.hpp>
#include <sitescan/core/pipeline_stage.hpp>
#include <cstddef>
#include <expected>
#include <functional>
#include <memory>
#include <vector>

namespace sitescan::core {

/// Callback for per-stage timing: (stage_index, duration_ms). Optional; pass to run().
using StageTimingCallback = std::function<void(std::size_t stage_index, double duration_ms)>;

/// Runs a sequence of preprocessing stages, each consuming the previous stage's image.
class Pipeline {
 public:
  Pipeline() = default;

  void add_stage(std::unique_ptr<IImageStage> stage);

  /// Run all stages on one image. An empty pipeline returns a copy of the input.
  /// Stages are not modified during run(), so concurrent calls are safe when
  /// the stages themselves are stateless.
  [[nodiscard]] std::expected<Image, BackendError> run(
      const Image& input,
      StageTimingCallback* timing_cb = nullptr) const;

  [[nodiscard]] std::size_t stage_count() const noexcept {
    return stages_.size();
  }

 private:
  std::vector<std::unique_ptr<IImageStage>> stages_;
};

}  // namespace sitescan::core
