#include <sitescan/analysis/hazard_taxonomy.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string_view>

namespace sitescan::analysis {

namespace sc = sitescan::core;

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string& s, char sep) {
  std::vector<std::string> parts;
  std::stringstream ss(s);
  std::string part;
  while (std::getline(ss, part, sep)) {
    trim(part);
    parts.push_back(part);
  }
  return parts;
}

std::vector<std::string> split_non_empty(const std::string& s, char sep) {
  std::vector<std::string> parts;
  for (auto& p : split(s, sep)) {
    if (!p.empty()) parts.push_back(std::move(p));
  }
  return parts;
}

[[noreturn]] void malformed(const std::string& path, int line_no, const std::string& why) {
  throw std::runtime_error("taxonomy " + path + ":" + std::to_string(line_no) + ": " + why);
}

}  // namespace

void HazardTaxonomy::add_tag(sc::ComplianceTag tag) {
  if (tag.id.empty()) {
    throw std::invalid_argument("compliance tag id must not be empty");
  }
  const std::string id = tag.id;
  tags_[id] = std::move(tag);
}

void HazardTaxonomy::add_hazard(const sc::HazardType& type, HazardEntry entry) {
  if (type.empty()) {
    throw std::invalid_argument("hazard type must not be empty");
  }
  for (const auto& id : entry.tag_ids) {
    if (!tags_.contains(id)) {
      throw std::invalid_argument("hazard " + type + " references unknown tag " + id);
    }
  }
  hazards_[type] = std::move(entry);
}

const sc::ComplianceTag* HazardTaxonomy::find_tag(const std::string& tag_id) const {
  const auto it = tags_.find(tag_id);
  return it == tags_.end() ? nullptr : &it->second;
}

const HazardEntry* HazardTaxonomy::find_hazard(const sc::HazardType& type) const {
  const auto it = hazards_.find(type);
  return it == hazards_.end() ? nullptr : &it->second;
}

std::vector<std::string> HazardTaxonomy::tags_for(const sc::HazardType& type) const {
  const HazardEntry* entry = find_hazard(type);
  return entry ? entry->tag_ids : std::vector<std::string>{};
}

sc::Severity HazardTaxonomy::severity_of(const sc::HazardType& type) const {
  const HazardEntry* entry = find_hazard(type);
  return entry ? entry->severity : sc::Severity::Medium;
}

std::vector<sc::HazardType> HazardTaxonomy::hazard_types() const {
  std::vector<sc::HazardType> types;
  types.reserve(hazards_.size());
  for (const auto& [type, entry] : hazards_) {
    types.push_back(type);
  }
  return types;
}

HazardTaxonomy default_taxonomy() {
  using sc::Severity;
  HazardTaxonomy t;

  t.add_tag({"ppe-hard-hat-required", "Hard Hat Required", "PPE", {"29 CFR 1926.100(a)"}, 10});
  t.add_tag({"ppe-high-visibility-vest", "High-Visibility Vest", "PPE",
             {"29 CFR 1926.201(a)", "29 CFR 1926.651(d)"}, 20});
  t.add_tag({"ppe-eye-face-protection", "Eye & Face Protection", "PPE", {"29 CFR 1926.102(a)"}, 30});
  t.add_tag({"fall-protection-required", "Fall Protection Required", "Fall Protection",
             {"29 CFR 1926.501(b)(1)"}, 5});
  t.add_tag({"fall-guardrail-missing", "Guardrail Missing", "Fall Protection",
             {"29 CFR 1926.502(b)"}, 6});
  t.add_tag({"scaffold-inspection", "Scaffold Deficiency", "Fall Protection",
             {"29 CFR 1926.451(g)"}, 15});
  t.add_tag({"ladder-unsafe-use", "Unsafe Ladder Use", "Fall Protection",
             {"29 CFR 1926.1053(b)"}, 25});
  t.add_tag({"electrical-exposed-wiring", "Exposed Wiring", "Electrical Safety",
             {"29 CFR 1926.405(a)(2)", "29 CFR 1926.416(a)(1)"}, 8});
  t.add_tag({"fire-hazard", "Fire Hazard", "Fire Safety", {"29 CFR 1926.150", "29 CFR 1926.151"}, 12});
  t.add_tag({"housekeeping-debris", "Debris / Housekeeping", "Housekeeping", {"29 CFR 1926.25(a)"}, 40});
  t.add_tag({"housekeeping-trip-hazard", "Trip Hazard", "Housekeeping", {"29 CFR 1926.25(a)"}, 45});
  t.add_tag({"equipment-unsafe-operation", "Unsafe Equipment Operation", "Equipment Safety",
             {"29 CFR 1926.600(a)", "29 CFR 1926.602(a)(9)"}, 18});
  t.add_tag({"equipment-damaged-tool", "Damaged Tool", "Equipment Safety", {"29 CFR 1926.300(a)"}, 35});

  t.add_hazard("MISSING_HARD_HAT", {Severity::High, {"ppe-hard-hat-required"}, 0.7f});
  t.add_hazard("MISSING_SAFETY_VEST", {Severity::Medium, {"ppe-high-visibility-vest"}, 0.6f});
  t.add_hazard("MISSING_EYE_PROTECTION", {Severity::Medium, {"ppe-eye-face-protection"}, 0.6f});
  t.add_hazard("WORKING_AT_HEIGHT_WITHOUT_PROTECTION",
               {Severity::Critical, {"fall-protection-required"}, 0.8f});
  t.add_hazard("UNGUARDED_EDGE",
               {Severity::Critical, {"fall-protection-required", "fall-guardrail-missing"}, 0.7f});
  t.add_hazard("SCAFFOLD_VIOLATION", {Severity::High, {"scaffold-inspection", "fall-guardrail-missing"}, {}});
  t.add_hazard("LADDER_UNSAFE_POSITION", {Severity::High, {"ladder-unsafe-use"}, {}});
  t.add_hazard("EXPOSED_WIRING", {Severity::Critical, {"electrical-exposed-wiring"}, 0.8f});
  t.add_hazard("FIRE_HAZARD", {Severity::Critical, {"fire-hazard"}, 0.8f});
  t.add_hazard("DEBRIS_ACCUMULATION", {Severity::Low, {"housekeeping-debris"}, 0.5f});
  t.add_hazard("TRIP_HAZARD", {Severity::Low, {"housekeeping-trip-hazard"}, 0.6f});
  t.add_hazard("UNSAFE_EQUIPMENT_OPERATION", {Severity::High, {"equipment-unsafe-operation"}, 0.7f});
  t.add_hazard("DAMAGED_TOOLS", {Severity::Medium, {"equipment-damaged-tool"}, {}});
  return t;
}

HazardTaxonomy load_taxonomy(const std::string& path) {
  std::ifstream f(path);
  if (!f) {
    throw std::runtime_error("cannot read taxonomy file " + path);
  }

  HazardTaxonomy t;
  std::string line;
  int line_no = 0;
  while (std::getline(f, line)) {
    ++line_no;
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    const auto eq = line.find('=');
    if (eq == std::string::npos) malformed(path, line_no, "expected key = value");
    std::string key = line.substr(0, eq);
    std::string value = line.substr(eq + 1);
    trim(key);
    trim(value);

    constexpr std::string_view kTag = "tag.";
    constexpr std::string_view kHazard = "hazard.";
    if (key.starts_with(kTag)) {
      const auto fields = split(value, '|');
      if (fields.size() < 3) malformed(path, line_no, "tag needs name|category|priority[|codes]");
      sc::ComplianceTag tag;
      tag.id = key.substr(kTag.size());
      tag.display_name = fields[0];
      tag.category = fields[1];
      try {
        tag.priority_rank = static_cast<std::uint32_t>(std::stoul(fields[2]));
      } catch (const std::exception&) {
        malformed(path, line_no, "invalid priority '" + fields[2] + "'");
      }
      if (fields.size() > 3) tag.regulatory_codes = split_non_empty(fields[3], ';');
      try {
        t.add_tag(std::move(tag));
      } catch (const std::invalid_argument& e) {
        malformed(path, line_no, e.what());
      }
    } else if (key.starts_with(kHazard)) {
      const auto fields = split(value, '|');
      if (fields.size() < 2) malformed(path, line_no, "hazard needs severity|tags[|min confidence]");
      HazardEntry entry;
      if (!sc::parse_severity(fields[0], entry.severity)) {
        malformed(path, line_no, "unknown severity '" + fields[0] + "'");
      }
      entry.tag_ids = split_non_empty(fields[1], ',');
      if (fields.size() > 2 && !fields[2].empty()) {
        try {
          entry.min_detection_confidence = std::stof(fields[2]);
        } catch (const std::exception&) {
          malformed(path, line_no, "invalid confidence '" + fields[2] + "'");
        }
      }
      try {
        t.add_hazard(key.substr(kHazard.size()), std::move(entry));
      } catch (const std::invalid_argument& e) {
        malformed(path, line_no, e.what());
      }
    } else {
      malformed(path, line_no, "unknown key '" + key + "'");
    }
  }
  return t;
}

}  // namespace sitescan::analysis
