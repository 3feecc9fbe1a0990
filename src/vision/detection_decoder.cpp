#include <sitescan/vision/detection_decoder.hpp>
#include <algorithm>
#include <cmath>
#include <cstddef>

namespace sitescan::vision {

namespace sc = sitescan::core;

DetectionDecoder::DetectionDecoder(float confidence_threshold,
                                   ClassToHazardMap class_to_hazard,
                                   HazardThresholds per_hazard_thresholds)
    : confidence_threshold_(confidence_threshold),
      class_to_hazard_(std::move(class_to_hazard)),
      per_hazard_thresholds_(std::move(per_hazard_thresholds)) {}

float DetectionDecoder::threshold_for(const sc::HazardType& type) const {
  const auto it = per_hazard_thresholds_.find(type);
  if (it == per_hazard_thresholds_.end()) return confidence_threshold_;
  return std::max(confidence_threshold_, it->second);
}

std::vector<sc::HazardDetection> DetectionDecoder::decode(
    const InferenceResult& result,
    const sc::BackendId& source,
    sc::BackendTier tier,
    std::chrono::system_clock::time_point detected_at) const {
  std::vector<sc::HazardDetection> out;
  const std::size_t n = static_cast<std::size_t>(result.num_detections);
  const float sx = result.input_width > 0 ? 1.f / static_cast<float>(result.input_width) : 1.f;
  const float sy = result.input_height > 0 ? 1.f / static_cast<float>(result.input_height) : 1.f;

  for (std::size_t i = 0; i < n; ++i) {
    if (i >= result.scores.size() || i >= result.class_ids.size()) break;
    const float score = result.scores[i];
    if (std::isnan(score)) continue;

    const auto cid = result.class_ids[i];
    if (cid < 0 || static_cast<std::size_t>(cid) >= class_to_hazard_.size()) continue;
    const sc::HazardType& type = class_to_hazard_[static_cast<std::size_t>(cid)];
    if (type.empty()) continue;

    const float confidence = std::clamp(score, 0.f, 1.f);
    if (confidence < threshold_for(type)) continue;

    sc::HazardDetection d;
    d.hazard_type = type;
    d.confidence = confidence;
    d.source = source;
    d.source_tier = tier;
    d.detected_at = detected_at;
    if (i * 4 + 3 < result.boxes.size()) {
      const float x1 = std::clamp(result.boxes[i * 4 + 0] * sx, 0.f, 1.f);
      const float y1 = std::clamp(result.boxes[i * 4 + 1] * sy, 0.f, 1.f);
      const float x2 = std::clamp(result.boxes[i * 4 + 2] * sx, 0.f, 1.f);
      const float y2 = std::clamp(result.boxes[i * 4 + 3] * sy, 0.f, 1.f);
      d.region = sc::BBox{x1, y1, std::max(0.f, x2 - x1), std::max(0.f, y2 - y1)};
    }
    out.push_back(std::move(d));
  }
  return out;
}

}  // namespace sitescan::vision
