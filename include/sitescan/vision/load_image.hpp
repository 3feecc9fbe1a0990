#pragma once

#include <sitescan/core/image.hpp>
#include <optional>
#include <string>

namespace sitescan::vision {

/// Load an image file into an Image (BGR8 or Grayscale8). Returns nullopt on failure.
std::optional<sitescan::core::Image> load_image(const std::string& path);

}  // namespace sitescan::vision
