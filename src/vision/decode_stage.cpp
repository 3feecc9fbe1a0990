#include <sitescan/vision/decode_stage.hpp>
#include "image_cv_utils.hpp"
#include <opencv2/imgcodecs.hpp>

namespace sitescan::vision {

namespace sc = sitescan::core;

std::expected<sc::Image, sc::BackendError> DecodeStage::process(const sc::Image& input) {
  if (!input.well_formed()) {
    return std::unexpected(sc::BackendError::MalformedInput);
  }
  if (input.format() != sc::PixelFormat::Encoded) {
    return input;
  }

  const cv::Mat raw(1, static_cast<int>(input.size_bytes()), CV_8UC1,
                    const_cast<std::byte*>(input.data().data()));
  cv::Mat decoded = cv::imdecode(raw, cv::IMREAD_COLOR);
  if (decoded.empty()) {
    return std::unexpected(sc::BackendError::MalformedInput);
  }
  return detail::mat_to_image(decoded, sc::PixelFormat::BGR8);
}

}  // namespace sitescan::vision
