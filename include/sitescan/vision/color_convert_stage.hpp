#pragma once

#include <sitescan/core/image.hpp>
#include <sitescan/core/pipeline_stage.hpp>

namespace sitescan::vision {

/// Converts between 8-bit pixel formats (e.g. BGR -> RGB for models trained on RGB).
class ColorConvertStage : public sitescan::core::IImageStage {
 public:
  explicit ColorConvertStage(sitescan::core::PixelFormat output_format);

  [[nodiscard]] std::expected<sitescan::core::Image, sitescan::core::BackendError>
  process(const sitescan::core::Image& input) override;

 private:
  sitescan::core::PixelFormat output_format_;
};

}  // namespace sitescan::vision
