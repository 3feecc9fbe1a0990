#pragma once

#include <sitescan/core/compliance_tag.hpp>
#include <sitescan/core/hazard.hpp>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace sitescan::analysis {

/// Taxonomy entry for one hazard type.
struct HazardEntry {
  sitescan::core::Severity severity{sitescan::core::Severity::Medium};
  std::vector<std::string> tag_ids;
  /// Minimum model score before a local detector reports this hazard.
  std::optional<float> min_detection_confidence;
};

/// Static, read-only lookup: hazard type -> compliance tags -> regulatory codes.
/// Built once at startup and shared by reference; all queries are const.
class HazardTaxonomy {
 public:
  /// Adds or replaces a tag. Throws std::invalid_argument on an empty id.
  void add_tag(sitescan::core::ComplianceTag tag);

  /// Adds or replaces a hazard mapping. Throws std::invalid_argument when a tag id is unknown.
  void add_hazard(const sitescan::core::HazardType& type, HazardEntry entry);

  [[nodiscard]] const sitescan::core::ComplianceTag* find_tag(const std::string& tag_id) const;
  [[nodiscard]] const HazardEntry* find_hazard(const sitescan::core::HazardType& type) const;

  /// Tag ids mapped to a hazard type; empty when the type is unknown.
  [[nodiscard]] std::vector<std::string> tags_for(const sitescan::core::HazardType& type) const;

  /// Severity for a hazard type; Medium when the type is unknown.
  [[nodiscard]] sitescan::core::Severity severity_of(const sitescan::core::HazardType& type) const;

  [[nodiscard]] std::vector<sitescan::core::HazardType> hazard_types() const;
  [[nodiscard]] std::size_t tag_count() const noexcept { return tags_.size(); }
  [[nodiscard]] std::size_t hazard_count() const noexcept { return hazards_.size(); }

 private:
  std::map<std::string, sitescan::core::ComplianceTag> tags_;
  std::map<sitescan::core::HazardType, HazardEntry> hazards_;
};

/// Built-in construction taxonomy (PPE, fall protection, electrical, fire, housekeeping,
/// scaffolds, ladders, heavy equipment) with OSHA 29 CFR 1926 references.
[[nodiscard]] HazardTaxonomy default_taxonomy();

/// Load a taxonomy from a key=value file:
///   tag.<id> = <display name>|<category>|<priority>|<code>;<code>
///   hazard.<TYPE> = <severity>|<tag id>,<tag id>[|<min detection confidence>]
/// Tags must be declared before hazards that reference them. Throws std::runtime_error
/// (with the line number) on malformed lines or when the file cannot be read.
[[nodiscard]] HazardTaxonomy load_taxonomy(const std::string& path);

}  // namespace sitescan::analysis
