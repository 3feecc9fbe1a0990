#pragma once

#include <sitescan/core/hazard.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sitescan::analysis {

struct HealthPolicy {
  std::size_t window{20};
  float min_success_rate{0.5f};
  std::chrono::minutes deprioritize_for{5};
  /// Outcomes needed before the success rate can deprioritize a backend.
  std::size_t min_samples{3};
};

/// Point-in-time view of one backend's reliability.
struct BackendHealth {
  sitescan::core::BackendId backend_id;
  float success_rate{1.f};  // over the rolling window; 1 with no samples
  std::size_t samples{0};
  std::chrono::milliseconds average_latency{0};
  std::optional<std::chrono::system_clock::time_point> last_failure_at;
  std::optional<std::chrono::system_clock::time_point> deprioritized_until;
};

/// Rolling reliability per backend, shared by every session. All members are
/// thread-safe; each update is applied atomically under one lock.
///
/// Cancelled calls must not be recorded: only calls that completed or timed out count.
class BackendHealthRegistry {
 public:
  using Clock = std::chrono::system_clock;

  explicit BackendHealthRegistry(HealthPolicy policy = {});

  /// Process-wide registry used when an orchestrator is not given its own.
  [[nodiscard]] static BackendHealthRegistry& global();

  /// Records one finished call. A failure that drops the window's success rate below
  /// the policy minimum deprioritizes the backend for policy.deprioritize_for.
  void record_outcome(const sitescan::core::BackendId& id,
                      bool success,
                      std::chrono::milliseconds latency,
                      Clock::time_point now = Clock::now());

  /// Deprioritizes immediately (e.g. the backend reported rate limiting).
  void deprioritize(const sitescan::core::BackendId& id, Clock::time_point now = Clock::now());

  [[nodiscard]] bool is_deprioritized(const sitescan::core::BackendId& id,
                                      Clock::time_point now = Clock::now()) const;

  [[nodiscard]] BackendHealth snapshot(const sitescan::core::BackendId& id) const;
  [[nodiscard]] std::vector<BackendHealth> snapshot_all() const;

  /// Drops every record. Intended for tests and owner resets.
  void reset();

  [[nodiscard]] const HealthPolicy& policy() const noexcept { return policy_; }

  /// Persists one JSON record per backend:
  /// [{"backendId": str, "rollingSuccessRate": float, "lastFailureAtMillis": int64}].
  /// lastFailureAtMillis is 0 when the backend never failed. Throws std::runtime_error on I/O failure.
  void save(const std::string& path) const;

  /// Seeds the registry from save() output; existing records for the listed backends are
  /// replaced by a window approximating the stored rate. Throws std::runtime_error when the
  /// file cannot be read or is not in the expected shape.
  void load(const std::string& path);

 private:
  struct Record {
    std::deque<bool> outcomes;
    std::deque<std::chrono::milliseconds> latencies;
    std::optional<Clock::time_point> last_failure_at;
    std::optional<Clock::time_point> deprioritized_until;
  };

  [[nodiscard]] static float success_rate(const Record& record);
  [[nodiscard]] BackendHealth to_health(const sitescan::core::BackendId& id, const Record& record) const;

  HealthPolicy policy_;
  mutable std::mutex mutex_;
  std::map<sitescan::core::BackendId, Record> records_;
};

}  // namespace sitescan::analysis
