#pragma once

#include <sitescan/analysis/hazard_taxonomy.hpp>
#include <sitescan/core/compliance_tag.hpp>
#include <sitescan/core/hazard.hpp>
#include <set>
#include <string>
#include <vector>

namespace sitescan::analysis {

struct RecommendationThresholds {
  float auto_select{0.80f};
  float display{0.40f};
};

struct RecommendationResult {
  std::vector<sitescan::core::TagRecommendation> recommendations;
  std::set<std::string> auto_select_tags;
};

/// Turns fused hazards into compliance tag recommendations.
///
/// Per tag the confidence is the maximum over the hazards mapping to it. At or above
/// auto_select the tag is AutoSelected (and in auto_select_tags); at or above display
/// it is Suggested; below display it is dropped. Output order: auto-selected first,
/// then confidence desc, priority rank asc, tag id asc. Pure and deterministic.
class TagRecommendationEngine {
 public:
  /// taxonomy must outlive the engine.
  explicit TagRecommendationEngine(const HazardTaxonomy& taxonomy,
                                   RecommendationThresholds thresholds = {});

  [[nodiscard]] RecommendationResult recommend(
      const std::vector<sitescan::core::FusedHazard>& hazards) const;

  [[nodiscard]] const RecommendationThresholds& thresholds() const noexcept { return thresholds_; }

 private:
  const HazardTaxonomy& taxonomy_;
  RecommendationThresholds thresholds_;
};

}  // namespace sitescan::analysis
