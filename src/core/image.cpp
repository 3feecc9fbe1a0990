#include <sitescan/core/image.hpp>
#include <cstddef>

namespace sitescan::core {

std::size_t Image::min_bytes(std::uint32_t width,
                             std::uint32_t height,
                             PixelFormat format) {
  const std::size_t pixels = static_cast<std::size_t>(width) * height;
  switch (format) {
    case PixelFormat::Grayscale8:
      return pixels;
    case PixelFormat::RGB8:
    case PixelFormat::BGR8:
      return pixels * 3;
    case PixelFormat::RGBA8:
    case PixelFormat::BGRA8:
      return pixels * 4;
    case PixelFormat::Float32Planar:
      return pixels * 3 * sizeof(float);
    case PixelFormat::Encoded:
    case PixelFormat::Unknown:
    default:
      return 0;
  }
}

bool Image::well_formed() const noexcept {
  if (buffer_.empty() || format_ == PixelFormat::Unknown) return false;
  if (format_ == PixelFormat::Encoded) return true;
  if (width_ == 0 || height_ == 0) return false;
  return buffer_.size() >= min_bytes(width_, height_, format_);
}

const char* to_string(PixelFormat format) noexcept {
  switch (format) {
    case PixelFormat::Grayscale8:
      return "gray8";
    case PixelFormat::RGB8:
      return "rgb8";
    case PixelFormat::BGR8:
      return "bgr8";
    case PixelFormat::RGBA8:
      return "rgba8";
    case PixelFormat::BGRA8:
      return "bgra8";
    case PixelFormat::Float32Planar:
      return "f32";
    case PixelFormat::Encoded:
      return "encoded";
    case PixelFormat::Unknown:
    default:
      return "unknown";
  }
}

}  // namespace sitescan::core
