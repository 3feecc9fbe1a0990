#include <sitescan/vision/load_image.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/imgcodecs.hpp>

namespace sitescan::vision {

std::optional<sitescan::core::Image> load_image(const std::string& path) {
  cv::Mat mat = cv::imread(path, cv::IMREAD_UNCHANGED);
  if (mat.empty()) return std::nullopt;

  sitescan::core::PixelFormat format = sitescan::core::PixelFormat::BGR8;
  if (mat.channels() == 1) format = sitescan::core::PixelFormat::Grayscale8;
  else if (mat.channels() == 4) format = sitescan::core::PixelFormat::BGRA8;
  if (mat.depth() != CV_8U) return std::nullopt;

  return detail::mat_to_image(mat, format);
}

}  // namespace sitescan::vision
