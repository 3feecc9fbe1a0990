#include <sitescan/analysis/tag_recommendation.hpp>
#include <algorithm>
#include <map>
#include <tuple>

namespace sitescan::analysis {

namespace sc = sitescan::core;

TagRecommendationEngine::TagRecommendationEngine(const HazardTaxonomy& taxonomy,
                                                 RecommendationThresholds thresholds)
    : taxonomy_(taxonomy), thresholds_(thresholds) {}

RecommendationResult TagRecommendationEngine::recommend(
    const std::vector<sc::FusedHazard>& hazards) const {
  struct Candidate {
    float confidence{0.f};
    std::set<std::string> hazard_types;
  };
  std::map<std::string, Candidate> by_tag;

  for (const auto& hazard : hazards) {
    if (!(hazard.confidence >= thresholds_.display)) continue;
    for (const auto& tag_id : taxonomy_.tags_for(hazard.hazard_type)) {
      auto& candidate = by_tag[tag_id];
      candidate.confidence = std::max(candidate.confidence, hazard.confidence);
      candidate.hazard_types.insert(hazard.hazard_type);
    }
  }

  RecommendationResult result;
  for (auto& [tag_id, candidate] : by_tag) {
    sc::TagRecommendation rec;
    rec.tag_id = tag_id;
    rec.confidence = candidate.confidence;
    rec.hazard_types.assign(candidate.hazard_types.begin(), candidate.hazard_types.end());
    if (candidate.confidence >= thresholds_.auto_select) {
      rec.reason = sc::RecommendationReason::AutoSelected;
      result.auto_select_tags.insert(tag_id);
    } else {
      rec.reason = sc::RecommendationReason::Suggested;
    }
    result.recommendations.push_back(std::move(rec));
  }

  const auto rank = [this](const std::string& tag_id) {
    const auto* tag = taxonomy_.find_tag(tag_id);
    return tag ? tag->priority_rank : sc::ComplianceTag{}.priority_rank;
  };
  std::sort(result.recommendations.begin(), result.recommendations.end(),
            [&rank](const sc::TagRecommendation& a, const sc::TagRecommendation& b) {
              const bool a_auto = a.reason == sc::RecommendationReason::AutoSelected;
              const bool b_auto = b.reason == sc::RecommendationReason::AutoSelected;
              if (a_auto != b_auto) return a_auto;
              if (a.confidence != b.confidence) return a.confidence > b.confidence;
              const auto ra = rank(a.tag_id);
              const auto rb = rank(b.tag_id);
              if (ra != rb) return ra < rb;
              return a.tag_id < b.tag_id;
            });
  return result;
}

}  // namespace sitescan::analysis
