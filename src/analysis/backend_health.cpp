#include <sitescan/analysis/backend_health.hpp>
#include <sitescan/core/logging.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <stdexcept>

namespace sitescan::analysis {

namespace sc = sitescan::core;
using json = nlohmann::json;

namespace {

const sc::Logger& logger() {
  static const sc::Logger log = sc::get_logger("health");
  return log;
}

std::int64_t to_millis(BackendHealthRegistry::Clock::time_point t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

}  // namespace

BackendHealthRegistry::BackendHealthRegistry(HealthPolicy policy) : policy_(policy) {
  if (policy_.window == 0) policy_.window = 1;
}

BackendHealthRegistry& BackendHealthRegistry::global() {
  static BackendHealthRegistry registry;
  return registry;
}

float BackendHealthRegistry::success_rate(const Record& record) {
  if (record.outcomes.empty()) return 1.f;
  const auto ok = std::count(record.outcomes.begin(), record.outcomes.end(), true);
  return static_cast<float>(ok) / static_cast<float>(record.outcomes.size());
}

void BackendHealthRegistry::record_outcome(const sc::BackendId& id,
                                           bool success,
                                           std::chrono::milliseconds latency,
                                           Clock::time_point now) {
  std::lock_guard lock(mutex_);
  auto& record = records_[id];
  record.outcomes.push_back(success);
  record.latencies.push_back(latency);
  while (record.outcomes.size() > policy_.window) record.outcomes.pop_front();
  while (record.latencies.size() > policy_.window) record.latencies.pop_front();

  if (success) return;
  record.last_failure_at = now;
  const float rate = success_rate(record);
  if (record.outcomes.size() >= policy_.min_samples && rate < policy_.min_success_rate) {
    record.deprioritized_until = now + policy_.deprioritize_for;
    logger().warn("backend deprioritized",
                  {{"backend", id},
                   {"success_rate", std::to_string(rate)},
                   {"samples", std::to_string(record.outcomes.size())}});
  }
}

void BackendHealthRegistry::deprioritize(const sc::BackendId& id, Clock::time_point now) {
  std::lock_guard lock(mutex_);
  records_[id].deprioritized_until = now + policy_.deprioritize_for;
  logger().warn("backend deprioritized", {{"backend", id}, {"reason", "rate limited"}});
}

bool BackendHealthRegistry::is_deprioritized(const sc::BackendId& id, Clock::time_point now) const {
  std::lock_guard lock(mutex_);
  const auto it = records_.find(id);
  if (it == records_.end() || !it->second.deprioritized_until) return false;
  return now < *it->second.deprioritized_until;
}

BackendHealth BackendHealthRegistry::to_health(const sc::BackendId& id, const Record& record) const {
  BackendHealth health;
  health.backend_id = id;
  health.success_rate = success_rate(record);
  health.samples = record.outcomes.size();
  if (!record.latencies.empty()) {
    std::chrono::milliseconds total{0};
    for (const auto l : record.latencies) total += l;
    health.average_latency = total / static_cast<std::int64_t>(record.latencies.size());
  }
  health.last_failure_at = record.last_failure_at;
  health.deprioritized_until = record.deprioritized_until;
  return health;
}

BackendHealth BackendHealthRegistry::snapshot(const sc::BackendId& id) const {
  std::lock_guard lock(mutex_);
  const auto it = records_.find(id);
  if (it == records_.end()) {
    BackendHealth empty;
    empty.backend_id = id;
    return empty;
  }
  return to_health(id, it->second);
}

std::vector<BackendHealth> BackendHealthRegistry::snapshot_all() const {
  std::lock_guard lock(mutex_);
  std::vector<BackendHealth> out;
  out.reserve(records_.size());
  for (const auto& [id, record] : records_) out.push_back(to_health(id, record));
  return out;
}

void BackendHealthRegistry::reset() {
  std::lock_guard lock(mutex_);
  records_.clear();
}

void BackendHealthRegistry::save(const std::string& path) const {
  json doc = json::array();
  {
    std::lock_guard lock(mutex_);
    for (const auto& [id, record] : records_) {
      doc.push_back({{"backendId", id},
                     {"rollingSuccessRate", success_rate(record)},
                     {"lastFailureAtMillis",
                      record.last_failure_at ? to_millis(*record.last_failure_at) : 0}});
    }
  }
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Cannot write backend health file: " + path);
  }
  out << doc.dump(2) << '\n';
  if (!out) {
    throw std::runtime_error("Failed writing backend health file: " + path);
  }
}

void BackendHealthRegistry::load(const std::string& path) {
  std::ifstream in(path);
  if (!in) {
    throw std::runtime_error("Cannot open backend health file: " + path);
  }
  const json doc = json::parse(in, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_array()) {
    throw std::runtime_error("Backend health file is not a JSON array: " + path);
  }

  std::map<sc::BackendId, Record> loaded;
  for (const auto& item : doc) {
    if (!item.is_object() || !item.contains("backendId") || !item["backendId"].is_string() ||
        !item.contains("rollingSuccessRate") || !item["rollingSuccessRate"].is_number()) {
      throw std::runtime_error("Malformed backend health record in " + path);
    }
    const float rate = std::clamp(item["rollingSuccessRate"].get<float>(), 0.f, 1.f);
    const auto successes =
        static_cast<std::size_t>(std::lround(rate * static_cast<float>(policy_.window)));

    Record record;
    record.outcomes.assign(policy_.window - successes, false);
    record.outcomes.insert(record.outcomes.end(), successes, true);
    if (item.contains("lastFailureAtMillis") && item["lastFailureAtMillis"].is_number_integer()) {
      const auto ms = item["lastFailureAtMillis"].get<std::int64_t>();
      if (ms > 0) record.last_failure_at = Clock::time_point(std::chrono::milliseconds(ms));
    }
    loaded[item["backendId"].get<std::string>()] = std::move(record);
  }

  std::lock_guard lock(mutex_);
  for (auto& [id, record] : loaded) records_[id] = std::move(record);
  logger().info("backend health loaded", {{"path", path}, {"records", std::to_string(loaded.size())}});
}

}  // namespace sitescan::analysis
