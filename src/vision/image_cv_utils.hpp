#pragma once

#include <sitescan/core/image.hpp>
#include <opencv2/core/mat.hpp>
#include <optional>

namespace sitescan::vision::detail {

/// Wrap an 8-bit Image as cv::Mat (non-owning view). nullopt for float/encoded/unknown formats.
std::optional<cv::Mat> image_to_mat(const sitescan::core::Image& image);

/// Copy a cv::Mat into an owning Image.
sitescan::core::Image mat_to_image(const cv::Mat& mat, sitescan::core::PixelFormat format);

}  // namespace sitescan::vision::detail
