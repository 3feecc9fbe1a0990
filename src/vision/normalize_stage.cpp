#include <sitescan/vision/normalize_stage.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <cstring>
#include <vector>

namespace sitescan::vision {

namespace sc = sitescan::core;

NormalizeStage::NormalizeStage(float mean, float scale) : mean_(mean), scale_(scale) {}

std::expected<sc::Image, sc::BackendError> NormalizeStage::process(const sc::Image& input) {
  auto mat_in = detail::image_to_mat(input);
  if (!mat_in || mat_in->channels() != 3) {
    return std::unexpected(sc::BackendError::MalformedInput);
  }

  cv::Mat mat_float;
  mat_in->convertTo(mat_float, CV_32FC3, scale_, -mean_ * scale_);
  return detail::mat_to_image(mat_float, sc::PixelFormat::Float32Planar);
}

}  // namespace sitescan::vision
