#include <sitescan/analysis/result_fusion.hpp>
#include <algorithm>
#include <cmath>
#include <map>
#include <numeric>
#include <tuple>

namespace sitescan::analysis {

namespace sc = sitescan::core;

namespace {

float clamp_unit(float v) {
  if (std::isnan(v)) return 0.f;
  return std::clamp(v, 0.f, 1.f);
}

/// Total order over detections so clustering never depends on arrival order.
bool canonical_less(const sc::HazardDetection& a, const sc::HazardDetection& b) {
  return std::tie(a.hazard_type, a.source, a.confidence, a.region.x, a.region.y, a.region.w,
                  a.region.h) < std::tie(b.hazard_type, b.source, b.confidence, b.region.x,
                                         b.region.y, b.region.w, b.region.h);
}

bool same_cluster(const sc::HazardDetection& a, const sc::HazardDetection& b, float threshold) {
  const bool a_empty = a.region.empty();
  const bool b_empty = b.region.empty();
  if (a_empty || b_empty) return a_empty && b_empty;
  return sc::iou(a.region, b.region) >= threshold;
}

/// Union-find root lookup with path halving.
std::size_t find_root(std::vector<std::size_t>& parent, std::size_t i) {
  while (parent[i] != i) {
    parent[i] = parent[parent[i]];
    i = parent[i];
  }
  return i;
}

}  // namespace

ResultFusionEngine::ResultFusionEngine(FusionConfig config, const HazardTaxonomy* taxonomy)
    : config_(std::move(config)), taxonomy_(taxonomy) {}

float ResultFusionEngine::weight_for(const sc::BackendId& id, sc::BackendTier tier) const {
  if (const auto it = config_.backend_weights.find(id); it != config_.backend_weights.end()) {
    return it->second;
  }
  switch (tier) {
    case sc::BackendTier::OnDeviceMultimodal:
      return config_.weight_multimodal;
    case sc::BackendTier::Remote:
      return config_.weight_remote;
    case sc::BackendTier::LocalDetector:
      return config_.weight_detector;
  }
  return 1.f;
}

std::vector<sc::FusedHazard> ResultFusionEngine::fuse(
    const std::vector<std::vector<sc::HazardDetection>>& backend_results) const {
  std::vector<sc::HazardDetection> all;
  for (const auto& list : backend_results) {
    all.insert(all.end(), list.begin(), list.end());
  }
  return fuse(std::move(all));
}

std::vector<sc::FusedHazard> ResultFusionEngine::fuse(
    std::vector<sc::HazardDetection> detections) const {
  for (auto& d : detections) d.confidence = clamp_unit(d.confidence);
  std::sort(detections.begin(), detections.end(), canonical_less);

  std::vector<sc::FusedHazard> fused;
  std::size_t begin = 0;
  while (begin < detections.size()) {
    std::size_t end = begin;
    while (end < detections.size() && detections[end].hazard_type == detections[begin].hazard_type) {
      ++end;
    }

    const std::size_t n = end - begin;
    std::vector<std::size_t> parent(n);
    std::iota(parent.begin(), parent.end(), std::size_t{0});
    for (std::size_t i = 0; i < n; ++i) {
      for (std::size_t j = i + 1; j < n; ++j) {
        if (same_cluster(detections[begin + i], detections[begin + j], config_.iou_threshold)) {
          parent[find_root(parent, i)] = find_root(parent, j);
        }
      }
    }

    std::map<std::size_t, std::vector<const sc::HazardDetection*>> clusters;
    for (std::size_t i = 0; i < n; ++i) {
      clusters[find_root(parent, i)].push_back(&detections[begin + i]);
    }
    for (const auto& [root, members] : clusters) {
      fused.push_back(merge_cluster(members));
    }
    begin = end;
  }

  std::sort(fused.begin(), fused.end(), [](const sc::FusedHazard& a, const sc::FusedHazard& b) {
    if (a.confidence != b.confidence) return a.confidence > b.confidence;
    if (a.severity != b.severity) return a.severity > b.severity;
    if (a.hazard_type != b.hazard_type) return a.hazard_type < b.hazard_type;
    return std::tie(a.region.x, a.region.y, a.region.w, a.region.h) <
           std::tie(b.region.x, b.region.y, b.region.w, b.region.h);
  });
  return fused;
}

sc::FusedHazard ResultFusionEngine::merge_cluster(
    const std::vector<const sc::HazardDetection*>& members) const {
  // Strongest member per backend.
  std::map<sc::BackendId, const sc::HazardDetection*> best;
  for (const auto* d : members) {
    auto [it, inserted] = best.try_emplace(d->source, d);
    if (!inserted && d->confidence > it->second->confidence) it->second = d;
  }

  float aggregate = 0.f;
  if (best.size() == 1) {
    const auto* d = best.begin()->second;
    aggregate = d->confidence * weight_for(d->source, d->source_tier);
  } else {
    float weighted = 0.f;
    float total_weight = 0.f;
    for (const auto& [id, d] : best) {
      const float w = weight_for(id, d->source_tier);
      weighted += w * d->confidence;
      total_weight += w;
    }
    const float average = total_weight > 0.f ? weighted / total_weight : 0.f;
    aggregate = average * (1.f + config_.agreement_boost * static_cast<float>(best.size() - 1));
  }

  sc::FusedHazard out;
  out.hazard_type = members.front()->hazard_type;
  out.confidence = clamp_unit(aggregate);
  out.severity = taxonomy_ ? taxonomy_->severity_of(out.hazard_type) : sc::Severity::Medium;
  out.detection_count = static_cast<std::uint32_t>(members.size());
  for (const auto& [id, d] : best) out.contributing_backends.push_back(id);

  // Confidence-weighted mean box; region-less clusters stay empty.
  float sum_c = 0.f;
  sc::BBox box{};
  for (const auto* d : members) {
    if (d->region.empty()) continue;
    const float c = d->confidence > 0.f ? d->confidence : 1e-6f;
    box.x += c * d->region.x;
    box.y += c * d->region.y;
    box.w += c * d->region.w;
    box.h += c * d->region.h;
    sum_c += c;
  }
  if (sum_c > 0.f) {
    out.region = sc::BBox{box.x / sum_c, box.y / sum_c, box.w / sum_c, box.h / sum_c};
  }
  return out;
}

}  // namespace sitescan::analysis
