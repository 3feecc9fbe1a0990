#pragma once

#include <sitescan/core/pipeline_stage.hpp>
#include <cstdint>

namespace sitescan::vision {

/// Resizes to the model's fixed input size.
class ResizeStage : public sitescan::core::IImageStage {
 public:
  ResizeStage(std::uint32_t target_width, std::uint32_t target_height);

  [[nodiscard]] std::expected<sitescan::core::Image, sitescan::core::BackendError>
  process(const sitescan::core::Image& input) override;

 private:
  std::uint32_t target_width_;
  std::uint32_t target_height_;
};

}  // namespace sitescan::vision
