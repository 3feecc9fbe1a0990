#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace sitescan::core {

/// Memory: Image owns a single contiguous buffer (std::vector<std::byte>);
/// analyzer backends only read it through data(). Distinct Image instances are
/// independent; one Image may be read from several backend threads at once.

/// Pixel layout / format.
enum class PixelFormat : std::uint8_t {
  Unknown,
  Grayscale8,
  RGB8,
  BGR8,
  RGBA8,
  BGRA8,
  Float32Planar,  // HWC float, produced by preprocessing for model input
  Encoded,        // compressed bytes (JPEG/PNG) straight from the capture subsystem
};

/// Captured photo or streamed frame: dimensions, format and pixel buffer.
class Image {
 public:
  Image() = default;

  Image(std::uint32_t width,
        std::uint32_t height,
        PixelFormat format,
        std::vector<std::byte> buffer)
      : width_(width),
        height_(height),
        format_(format),
        buffer_(std::move(buffer)) {}

  [[nodiscard]] std::uint32_t width() const noexcept { return width_; }
  [[nodiscard]] std::uint32_t height() const noexcept { return height_; }
  [[nodiscard]] PixelFormat format() const noexcept { return format_; }

  [[nodiscard]] std::span<std::byte> data() noexcept {
    return std::span<std::byte>(buffer_.data(), buffer_.size());
  }
  [[nodiscard]] std::span<const std::byte> data() const noexcept {
    return std::span<const std::byte>(buffer_.data(), buffer_.size());
  }

  [[nodiscard]] bool empty() const noexcept { return buffer_.empty(); }
  [[nodiscard]] std::size_t size_bytes() const noexcept { return buffer_.size(); }

  /// True when dimensions are non-zero and the buffer is large enough for the format.
  /// Encoded images only need a non-empty buffer.
  [[nodiscard]] bool well_formed() const noexcept;

  /// Minimum bytes required for given dimensions and format (0 for Unknown/Encoded).
  [[nodiscard]] static std::size_t min_bytes(std::uint32_t width,
                                             std::uint32_t height,
                                             PixelFormat format);

 private:
  std::uint32_t width_{0};
  std::uint32_t height_{0};
  PixelFormat format_{PixelFormat::Unknown};
  std::vector<std::byte> buffer_;
};

struct GeoLocation {
  double latitude{0.0};
  double longitude{0.0};
};

/// Capture metadata handed over with every image by the capture subsystem.
struct CaptureContext {
  std::chrono::system_clock::time_point captured_at{std::chrono::system_clock::now()};
  std::optional<GeoLocation> location;
  /// Trade / work type the photo documents (e.g. "roofing"); forwarded to remote analysis.
  std::string work_type{"general"};
  /// Caller-provided correlation id; the orchestrator generates one when unset.
  std::optional<std::string> correlation_id;
};

[[nodiscard]] const char* to_string(PixelFormat format) noexcept;

}  // namespace sitescan::core
