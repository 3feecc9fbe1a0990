#include <sitescan/vision/color_convert_stage.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/imgproc.hpp>

namespace sitescan::vision {

namespace sc = sitescan::core;

namespace {

int conversion_code(sc::PixelFormat from, sc::PixelFormat to) {
  using F = sc::PixelFormat;
  if (from == F::BGR8 && to == F::RGB8) return cv::COLOR_BGR2RGB;
  if (from == F::RGB8 && to == F::BGR8) return cv::COLOR_RGB2BGR;
  if (from == F::BGRA8 && to == F::RGB8) return cv::COLOR_BGRA2RGB;
  if (from == F::RGBA8 && to == F::RGB8) return cv::COLOR_RGBA2RGB;
  if (from == F::Grayscale8 && to == F::RGB8) return cv::COLOR_GRAY2RGB;
  if (from == F::BGRA8 && to == F::BGR8) return cv::COLOR_BGRA2BGR;
  if (from == F::RGBA8 && to == F::BGR8) return cv::COLOR_RGBA2BGR;
  if (from == F::Grayscale8 && to == F::BGR8) return cv::COLOR_GRAY2BGR;
  return -1;
}

}  // namespace

ColorConvertStage::ColorConvertStage(sc::PixelFormat output_format)
    : output_format_(output_format) {}

std::expected<sc::Image, sc::BackendError> ColorConvertStage::process(const sc::Image& input) {
  if (input.format() == output_format_) {
    return input;
  }
  auto mat_in = detail::image_to_mat(input);
  if (!mat_in) {
    return std::unexpected(sc::BackendError::MalformedInput);
  }
  const int code = conversion_code(input.format(), output_format_);
  if (code < 0) {
    return std::unexpected(sc::BackendError::MalformedInput);
  }
  cv::Mat mat_out;
  cv::cvtColor(*mat_in, mat_out, code);
  return detail::mat_to_image(mat_out, output_format_);
}

}  // namespace sitescan::vision
