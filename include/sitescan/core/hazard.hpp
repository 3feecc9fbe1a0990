#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sitescan::core {

/// Hazard type id as configured in the taxonomy (e.g. "MISSING_HARD_HAT").
using HazardType = std::string;

/// Analyzer backend id (e.g. "gemma-on-device", "vertex-remote", "yolo-local").
using BackendId = std::string;

/// Hazard severity; declaration order is the ranking (Critical highest).
enum class Severity : std::uint8_t {
  Low,
  Medium,
  High,
  Critical,
};

/// Capability tier of an analyzer backend, in default selection preference order.
enum class BackendTier : std::uint8_t {
  OnDeviceMultimodal,
  Remote,
  LocalDetector,
};

enum class CostClass : std::uint8_t {
  LocalFree,
  LocalCompute,
  RemoteMetered,
};

/// Axis-aligned region in normalized image coordinates (0-1).
/// An empty box (w or h <= 0) means the backend reported no location.
struct BBox {
  float x{0.f};
  float y{0.f};
  float w{0.f};
  float h{0.f};

  [[nodiscard]] bool empty() const noexcept { return w <= 0.f || h <= 0.f; }
  [[nodiscard]] float area() const noexcept { return empty() ? 0.f : w * h; }

  friend bool operator==(const BBox&, const BBox&) = default;
};

/// Intersection-over-union of two regions; 0 when either is empty.
[[nodiscard]] float iou(const BBox& a, const BBox& b) noexcept;

/// One backend's raw finding. Created by an adapter per call; discarded after fusion.
struct HazardDetection {
  HazardType hazard_type;
  float confidence{0.f};
  BBox region{};
  BackendId source;
  BackendTier source_tier{BackendTier::LocalDetector};
  std::chrono::system_clock::time_point detected_at{};
};

/// Hazard believed to be one physical condition, merged across backend detections.
struct FusedHazard {
  HazardType hazard_type;
  float confidence{0.f};
  Severity severity{Severity::Medium};
  BBox region{};
  std::vector<BackendId> contributing_backends;  // sorted, unique
  std::uint32_t detection_count{0};

  friend bool operator==(const FusedHazard&, const FusedHazard&) = default;
};

[[nodiscard]] std::string_view to_string(Severity severity) noexcept;
[[nodiscard]] std::string_view to_string(BackendTier tier) noexcept;
[[nodiscard]] std::string_view to_string(CostClass cost) noexcept;

/// Parses "low" / "medium" / "high" / "critical" (case-insensitive); false if unknown.
bool parse_severity(std::string_view text, Severity& out);

}  // namespace sitescan::core
