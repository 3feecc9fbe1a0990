#pragma once

#include <sitescan/core/hazard.hpp>
#include <sitescan/vision/inference_result.hpp>
#include <chrono>
#include <string>
#include <unordered_map>
#include <vector>

namespace sitescan::vision {

/// Maps model class id (index) to hazard type. An empty entry marks a class that is
/// not a hazard by itself (e.g. "guardrail" present) and is dropped.
using ClassToHazardMap = std::vector<sitescan::core::HazardType>;

/// Per-hazard minimum score; critical hazards usually demand more model confidence.
using HazardThresholds = std::unordered_map<sitescan::core::HazardType, float>;

/// Decodes InferenceResult -> HazardDetections: filters by score, maps classes,
/// normalizes pixel boxes to 0-1 and clamps scores into [0,1].
class DetectionDecoder {
 public:
  DetectionDecoder(float confidence_threshold,
                   ClassToHazardMap class_to_hazard,
                   HazardThresholds per_hazard_thresholds = {});

  [[nodiscard]] std::vector<sitescan::core::HazardDetection> decode(
      const InferenceResult& result,
      const sitescan::core::BackendId& source,
      sitescan::core::BackendTier tier,
      std::chrono::system_clock::time_point detected_at) const;

  void set_confidence_threshold(float t) noexcept { confidence_threshold_ = t; }
  [[nodiscard]] float confidence_threshold() const noexcept {
    return confidence_threshold_;
  }

 private:
  [[nodiscard]] float threshold_for(const sitescan::core::HazardType& type) const;

  float confidence_threshold_;
  ClassToHazardMap class_to_hazard_;
  HazardThresholds per_hazard_thresholds_;
};

}  // namespace sitescan::vision
