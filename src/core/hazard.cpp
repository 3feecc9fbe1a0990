#include <sitescan/core/hazard.hpp>
#include <algorithm>
#include <cctype>
#include <string>

namespace sitescan::core {

float iou(const BBox& a, const BBox& b) noexcept {
  if (a.empty() || b.empty()) return 0.f;
  const float ix1 = std::max(a.x, b.x);
  const float iy1 = std::max(a.y, b.y);
  const float ix2 = std::min(a.x + a.w, b.x + b.w);
  const float iy2 = std::min(a.y + a.h, b.y + b.h);
  const float iw = ix2 - ix1;
  const float ih = iy2 - iy1;
  if (iw <= 0.f || ih <= 0.f) return 0.f;
  const float inter = iw * ih;
  const float uni = a.area() + b.area() - inter;
  return uni > 0.f ? inter / uni : 0.f;
}

std::string_view to_string(Severity severity) noexcept {
  switch (severity) {
    case Severity::Low:
      return "low";
    case Severity::Medium:
      return "medium";
    case Severity::High:
      return "high";
    case Severity::Critical:
      return "critical";
  }
  return "medium";
}

std::string_view to_string(BackendTier tier) noexcept {
  switch (tier) {
    case BackendTier::OnDeviceMultimodal:
      return "on-device-multimodal";
    case BackendTier::Remote:
      return "remote";
    case BackendTier::LocalDetector:
      return "local-detector";
  }
  return "unknown";
}

std::string_view to_string(CostClass cost) noexcept {
  switch (cost) {
    case CostClass::LocalFree:
      return "LOCAL_FREE";
    case CostClass::LocalCompute:
      return "LOCAL_COMPUTE";
    case CostClass::RemoteMetered:
      return "REMOTE_METERED";
  }
  return "unknown";
}

bool parse_severity(std::string_view text, Severity& out) {
  std::string lower(text);
  std::transform(lower.begin(), lower.end(), lower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (lower == "low") out = Severity::Low;
  else if (lower == "medium") out = Severity::Medium;
  else if (lower == "high") out = Severity::High;
  else if (lower == "critical") out = Severity::Critical;
  else return false;
  return true;
}

}  // namespace sitescan::core
