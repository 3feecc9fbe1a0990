#pragma once

#include <sitescan/core/pipeline_stage.hpp>

namespace sitescan::vision {

/// Decodes compressed capture bytes (PixelFormat::Encoded, JPEG/PNG) into BGR8.
/// Raw pixel images pass through unchanged.
class DecodeStage : public sitescan::core::IImageStage {
 public:
  [[nodiscard]] std::expected<sitescan::core::Image, sitescan::core::BackendError>
  process(const sitescan::core::Image& input) override;
};

}  // namespace sitescan::vision
