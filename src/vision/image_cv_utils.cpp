#include "image_cv_utils.hpp"
#include <opencv2/core.hpp>
#include <cstddef>
#include <cstring>
#include <vector>

namespace sitescan::vision::detail {

namespace sc = sitescan::core;

std::optional<cv::Mat> image_to_mat(const sc::Image& image) {
  if (!image.well_formed()) return std::nullopt;

  const int w = static_cast<int>(image.width());
  const int h = static_cast<int>(image.height());
  auto* data = const_cast<std::byte*>(image.data().data());

  int type = -1;
  switch (image.format()) {
    case sc::PixelFormat::Grayscale8:
      type = CV_8UC1;
      break;
    case sc::PixelFormat::RGB8:
    case sc::PixelFormat::BGR8:
      type = CV_8UC3;
      break;
    case sc::PixelFormat::RGBA8:
    case sc::PixelFormat::BGRA8:
      type = CV_8UC4;
      break;
    default:
      return std::nullopt;
  }
  const std::size_t step = image.size_bytes() / static_cast<std::size_t>(h);
  return cv::Mat(h, w, type, data, step);
}

sc::Image mat_to_image(const cv::Mat& mat, sc::PixelFormat format) {
  if (mat.empty()) return sc::Image();

  const cv::Mat contiguous = mat.isContinuous() ? mat : mat.clone();
  const std::size_t len = contiguous.total() * contiguous.elemSize();
  std::vector<std::byte> buffer(len);
  std::memcpy(buffer.data(), contiguous.ptr(), len);
  return sc::Image(static_cast<std::uint32_t>(contiguous.cols),
                   static_cast<std::uint32_t>(contiguous.rows), format, std::move(buffer));
}

}  // namespace sitescan::vision::detail
