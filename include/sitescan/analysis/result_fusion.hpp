#pragma once

#include <sitescan/analysis/hazard_taxonomy.hpp>
#include <sitescan/core/hazard.hpp>
#include <map>
#include <vector>

namespace sitescan::analysis {

/// Fusion tuning. The defaults favor cross-backend confirmation over the
/// confidence of any single source.
struct FusionConfig {
  float iou_threshold{0.3f};
  float agreement_boost{0.1f};
  float weight_multimodal{1.0f};
  float weight_remote{1.2f};
  float weight_detector{0.7f};
  /// Per-backend reliability weights; take precedence over the tier weight.
  std::map<sitescan::core::BackendId, float> backend_weights;
};

/// Merges the detections of every backend that ran for a session into one
/// confidence-ranked hazard list.
///
/// Detections are grouped by hazard type and clustered by region overlap
/// (single linkage over IoU >= iou_threshold; region-less detections form their
/// own cluster per type). Each backend contributes its strongest member to a
/// cluster. With n >= 2 distinct backends the aggregate is
///   min(1, sum(w*c) / sum(w) * (1 + agreement_boost * (n - 1)))
/// and with one backend it is min(1, c * w).
///
/// The result depends only on the set of detections, not on their order, and is
/// sorted by confidence desc, severity desc, hazard type asc.
class ResultFusionEngine {
 public:
  /// taxonomy may be null; severities then default to Medium. Not owned.
  explicit ResultFusionEngine(FusionConfig config = {}, const HazardTaxonomy* taxonomy = nullptr);

  [[nodiscard]] std::vector<sitescan::core::FusedHazard> fuse(
      const std::vector<std::vector<sitescan::core::HazardDetection>>& backend_results) const;

  [[nodiscard]] std::vector<sitescan::core::FusedHazard> fuse(
      std::vector<sitescan::core::HazardDetection> detections) const;

  /// Reliability weight applied to detections from this backend.
  [[nodiscard]] float weight_for(const sitescan::core::BackendId& id,
                                 sitescan::core::BackendTier tier) const;

  [[nodiscard]] const FusionConfig& config() const noexcept { return config_; }

 private:
  [[nodiscard]] sitescan::core::FusedHazard merge_cluster(
      const std::vector<const sitescan::core::HazardDetection*>& members) const;

  FusionConfig config_;
  const HazardTaxonomy* taxonomy_;
};

}  // namespace sitescan::analysis
