#pragma once

#include <sitescan/core/pipeline_stage.hpp>

namespace sitescan::vision {

/// Converts 8-bit pixels to HWC float: (value - mean) * scale.
class NormalizeStage : public sitescan::core::IImageStage {
 public:
  NormalizeStage(float mean, float scale);

  [[nodiscard]] std::expected<sitescan::core::Image, sitescan::core::BackendError>
  process(const sitescan::core::Image& input) override;

 private:
  float mean_;
  float scale_;
};

}  // namespace sitescan::vision
