#pragma once

#include <sitescan/core/error.hpp>
#include <sitescan/core/image.hpp>
#include <expected>

namespace sitescan::core {

/// One preprocessing step applied before model inference (resize, color convert, normalize).
class IImageStage {
 public:
  virtual ~IImageStage() = default;

  [[nodiscard]] virtual std::expected<Image, BackendError> process(const Image& input) = 0;
};

}  // namespace sitescan::core
