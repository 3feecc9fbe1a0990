#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace sitescan::core {

/// User-facing documentation label tied to regulatory reference codes. Static,
/// loaded from the hazard taxonomy.
struct ComplianceTag {
  std::string id;            // e.g. "ppe-hard-hat-required"
  std::string display_name;  // e.g. "Hard Hat Required"
  std::string category;      // e.g. "PPE"
  std::vector<std::string> regulatory_codes;  // e.g. "29 CFR 1926.100(a)"
  std::uint32_t priority_rank{100};           // lower ranks first
};

enum class RecommendationReason : std::uint8_t {
  AutoSelected,
  Suggested,
};

/// One recommended tag for a session. Immutable once produced.
struct TagRecommendation {
  std::string tag_id;
  float confidence{0.f};
  RecommendationReason reason{RecommendationReason::Suggested};
  std::vector<std::string> hazard_types;  // fused hazards mapping to this tag, sorted

  friend bool operator==(const TagRecommendation&, const TagRecommendation&) = default;
};

[[nodiscard]] std::string_view to_string(RecommendationReason reason) noexcept;

}  // namespace sitescan::core
