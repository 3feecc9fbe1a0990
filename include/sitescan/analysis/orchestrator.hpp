#pragma once

#include <sitescan/analysis/analysis_throttler.hpp>
#include <sitescan/analysis/analyzer_backend.hpp>
#include <sitescan/analysis/backend_health.hpp>
#include <sitescan/analysis/connectivity.hpp>
#include <sitescan/analysis/hazard_taxonomy.hpp>
#include <sitescan/analysis/local_inference_slot.hpp>
#include <sitescan/analysis/result_fusion.hpp>
#include <sitescan/analysis/tag_recommendation.hpp>
#include <sitescan/core/cancellation.hpp>
#include <sitescan/core/image.hpp>
#include <sitescan/core/session.hpp>
#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <semaphore>
#include <set>
#include <vector>

namespace sitescan::analysis {

struct OrchestratorConfig {
  /// Run the preferred on-device backend and the remote backend concurrently.
  bool hybrid_mode{false};
  /// Budget for the single retry of a remote timeout / transient network failure.
  std::chrono::milliseconds remote_retry_timeout{5000};
  /// Maximum concurrent remote calls across all sessions.
  std::ptrdiff_t remote_concurrency{3};
  std::chrono::milliseconds frame_interval{500};
  FusionConfig fusion;
  RecommendationThresholds thresholds;
};

/// Availability and reliability of one registered backend.
struct BackendStatus {
  sitescan::core::BackendId id;
  sitescan::core::BackendTier tier{sitescan::core::BackendTier::LocalDetector};
  sitescan::core::CostClass cost_class{sitescan::core::CostClass::LocalCompute};
  bool available{false};
  bool deprioritized{false};
  bool reload_pending{false};
  BackendHealth health;
};

/// Runs analysis sessions: backend selection, concurrent calls, retry and fallback,
/// fusion, tag recommendation.
///
/// Selection order: on-device multimodal, then remote (only when connected), then
/// the lightweight local detector (session marked degraded). Unavailable backends are
/// skipped; deprioritized ones are tried last. Backend calls run on worker threads and
/// are bounded by the backend's timeout, counted from when the call actually starts
/// (after the local slot or a remote permit is obtained). Waiting for the slot or a
/// permit is bounded by the same timeout and ends the attempt as a Timeout.
///
/// The destructor cancels every in-flight session and waits for worker threads.
class SmartAnalysisOrchestrator {
 public:
  /// connectivity may be null (treated as connected). health defaults to the
  /// process-wide registry.
  SmartAnalysisOrchestrator(std::vector<std::shared_ptr<IAnalyzerBackend>> backends,
                            std::shared_ptr<const HazardTaxonomy> taxonomy,
                            std::shared_ptr<const IConnectivityMonitor> connectivity,
                            OrchestratorConfig config = {},
                            BackendHealthRegistry& health = BackendHealthRegistry::global());
  ~SmartAnalysisOrchestrator();

  SmartAnalysisOrchestrator(const SmartAnalysisOrchestrator&) = delete;
  SmartAnalysisOrchestrator& operator=(const SmartAnalysisOrchestrator&) = delete;

  /// Analyzes a captured photo. Never throttled; runs to Complete or Failed.
  [[nodiscard]] sitescan::core::AnalysisSession submit_photo(
      const sitescan::core::Image& image,
      const sitescan::core::CaptureContext& context = {});

  /// Analyzes a live frame asynchronously. Returns nullopt when the throttler drops
  /// the frame or the orchestrator is shutting down.
  [[nodiscard]] std::optional<std::shared_future<sitescan::core::AnalysisSession>> submit_frame(
      sitescan::core::Image image,
      sitescan::core::CaptureContext context = {});

  /// Cancels every session in flight. Sessions started afterwards run normally.
  void cancel_all();

  /// Blocks until no session, backend call or background reload is running.
  void wait_idle();

  /// Backend ids in the order a session started now would try them.
  [[nodiscard]] std::vector<sitescan::core::BackendId> selection_order() const;

  [[nodiscard]] std::vector<BackendStatus> health_report() const;

  [[nodiscard]] const OrchestratorConfig& config() const noexcept { return config_; }

 private:
  struct CallState;
  struct PendingCall;

  [[nodiscard]] std::vector<std::shared_ptr<IAnalyzerBackend>> select_backends() const;

  [[nodiscard]] sitescan::core::AnalysisSession run_session(
      std::shared_ptr<const sitescan::core::Image> image,
      const sitescan::core::CaptureContext& context,
      sitescan::core::SubmissionKind kind,
      const sitescan::core::CancellationToken& cancel);

  [[nodiscard]] PendingCall launch(const std::shared_ptr<IAnalyzerBackend>& backend,
                                   const std::shared_ptr<const sitescan::core::Image>& image,
                                   const sitescan::core::CaptureContext& context,
                                   SlotPriority priority,
                                   std::chrono::milliseconds budget);

  /// Waits for a launched call, enforcing its budget and the session's cancellation,
  /// and records the outcome in the health registry.
  [[nodiscard]] DetectionsOrError await(PendingCall& call,
                                        const sitescan::core::CancellationToken& session_cancel);

  /// One backend with the remote retry policy applied.
  [[nodiscard]] DetectionsOrError attempt(const std::shared_ptr<IAnalyzerBackend>& backend,
                                          const std::shared_ptr<const sitescan::core::Image>& image,
                                          const sitescan::core::CaptureContext& context,
                                          SlotPriority priority,
                                          const sitescan::core::CancellationToken& session_cancel);

  /// Reacts to a failed call: reload scheduling, rate-limit deprioritization.
  void handle_failure(const std::shared_ptr<IAnalyzerBackend>& backend,
                      sitescan::core::BackendError error);

  void schedule_reload(const std::shared_ptr<IAnalyzerBackend>& backend);

  [[nodiscard]] sitescan::core::CancellationToken current_token() const;
  [[nodiscard]] std::string next_correlation_id();

  /// Registers a detached worker; returns false when shutting down.
  bool begin_task();
  void end_task();

  std::vector<std::shared_ptr<IAnalyzerBackend>> backends_;
  std::shared_ptr<const HazardTaxonomy> taxonomy_;
  std::shared_ptr<const IConnectivityMonitor> connectivity_;
  OrchestratorConfig config_;
  BackendHealthRegistry& health_;

  ResultFusionEngine fusion_;
  TagRecommendationEngine recommender_;
  AnalysisThrottler throttler_;
  LocalInferenceSlot slot_;
  std::counting_semaphore<> remote_permits_;

  mutable std::mutex token_mutex_;
  sitescan::core::CancellationToken generation_token_;

  mutable std::mutex reload_mutex_;
  std::set<sitescan::core::BackendId> reloading_;

  std::mutex tasks_mutex_;
  std::condition_variable tasks_cv_;
  std::size_t active_tasks_{0};
  bool shutting_down_{false};

  std::atomic<std::uint64_t> session_counter_{0};
};

}  // namespace sitescan::analysis
