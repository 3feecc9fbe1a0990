#include <sitescan/vision/resize_stage.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/imgproc.hpp>

namespace sitescan::vision {

namespace sc = sitescan::core;

ResizeStage::ResizeStage(std::uint32_t target_width, std::uint32_t target_height)
    : target_width_(target_width), target_height_(target_height) {}

std::expected<sc::Image, sc::BackendError> ResizeStage::process(const sc::Image& input) {
  auto mat_in = detail::image_to_mat(input);
  if (!mat_in) {
    return std::unexpected(sc::BackendError::MalformedInput);
  }
  if (input.width() == target_width_ && input.height() == target_height_) {
    return input;
  }

  cv::Mat mat_out;
  cv::resize(*mat_in, mat_out,
             cv::Size(static_cast<int>(target_width_), static_cast<int>(target_height_)),
             0, 0, cv::INTER_LINEAR);
  return detail::mat_to_image(mat_out, input.format());
}

}  // namespace sitescan::vision
