#include <sitescan/analysis/orchestrator.hpp>
#include <sitescan/core/logging.hpp>
#include <algorithm>
#include <exception>
#include <thread>

namespace sitescan::analysis {

namespace sc = sitescan::core;
using Clock = std::chrono::steady_clock;

namespace {

constexpr auto kPollPeriod = std::chrono::milliseconds(5);

const sc::Logger& logger() {
  static const sc::Logger log = sc::get_logger("orchestrator");
  return log;
}

std::chrono::milliseconds elapsed_since(Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

bool retryable_remote(sc::BackendError error) {
  return error == sc::BackendError::Timeout || error == sc::BackendError::TransientNetwork;
}

std::string join_ids(const std::vector<sc::BackendId>& ids) {
  std::string out;
  for (const auto& id : ids) {
    if (!out.empty()) out += ',';
    out += id;
  }
  return out;
}

}  // namespace

/// Shared between the orchestrator and a worker thread.
struct SmartAnalysisOrchestrator::CallState {
  std::atomic<bool> started{false};
  std::atomic<Clock::rep> started_at{0};
};

struct SmartAnalysisOrchestrator::PendingCall {
  std::shared_ptr<IAnalyzerBackend> backend;
  std::future<DetectionsOrError> result;
  std::shared_ptr<CallState> state;
  sc::CancellationToken cancel;
  std::chrono::milliseconds budget{0};
  Clock::time_point launched_at;
};

SmartAnalysisOrchestrator::SmartAnalysisOrchestrator(
    std::vector<std::shared_ptr<IAnalyzerBackend>> backends,
    std::shared_ptr<const HazardTaxonomy> taxonomy,
    std::shared_ptr<const IConnectivityMonitor> connectivity,
    OrchestratorConfig config,
    BackendHealthRegistry& health)
    : backends_(std::move(backends)),
      taxonomy_(taxonomy ? std::move(taxonomy) : std::make_shared<const HazardTaxonomy>()),
      connectivity_(std::move(connectivity)),
      config_(std::move(config)),
      health_(health),
      fusion_(config_.fusion, taxonomy_.get()),
      recommender_(*taxonomy_, config_.thresholds),
      throttler_(config_.frame_interval),
      remote_permits_(std::max<std::ptrdiff_t>(1, config_.remote_concurrency)) {
  std::erase(backends_, nullptr);
}

SmartAnalysisOrchestrator::~SmartAnalysisOrchestrator() {
  {
    std::lock_guard lock(tasks_mutex_);
    shutting_down_ = true;
  }
  cancel_all();
  wait_idle();
}

bool SmartAnalysisOrchestrator::begin_task() {
  std::lock_guard lock(tasks_mutex_);
  if (shutting_down_) return false;
  ++active_tasks_;
  return true;
}

void SmartAnalysisOrchestrator::end_task() {
  // Notify under the lock: once wait_idle() sees zero the orchestrator may be destroyed.
  std::lock_guard lock(tasks_mutex_);
  --active_tasks_;
  tasks_cv_.notify_all();
}

void SmartAnalysisOrchestrator::wait_idle() {
  std::unique_lock lock(tasks_mutex_);
  tasks_cv_.wait(lock, [this] { return active_tasks_ == 0; });
}

sc::CancellationToken SmartAnalysisOrchestrator::current_token() const {
  std::lock_guard lock(token_mutex_);
  return generation_token_;
}

void SmartAnalysisOrchestrator::cancel_all() {
  std::lock_guard lock(token_mutex_);
  generation_token_.cancel();
  generation_token_ = sc::CancellationToken();
  logger().info("in-flight sessions cancelled");
}

std::string SmartAnalysisOrchestrator::next_correlation_id() {
  const auto n = session_counter_.fetch_add(1, std::memory_order_relaxed) + 1;
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                      std::chrono::system_clock::now().time_since_epoch())
                      .count();
  return "sess-" + std::to_string(ms) + "-" + std::to_string(n);
}

std::vector<std::shared_ptr<IAnalyzerBackend>> SmartAnalysisOrchestrator::select_backends() const {
  const bool connected = !connectivity_ || connectivity_->connected();
  std::vector<std::shared_ptr<IAnalyzerBackend>> preferred;
  std::vector<std::shared_ptr<IAnalyzerBackend>> deprioritized;

  for (const auto tier : {sc::BackendTier::OnDeviceMultimodal, sc::BackendTier::Remote,
                          sc::BackendTier::LocalDetector}) {
    if (tier == sc::BackendTier::Remote && !connected) continue;
    for (const auto& backend : backends_) {
      if (backend->tier() != tier || !backend->available()) continue;
      if (health_.is_deprioritized(backend->id())) {
        deprioritized.push_back(backend);
      } else {
        preferred.push_back(backend);
      }
    }
  }
  preferred.insert(preferred.end(), deprioritized.begin(), deprioritized.end());
  return preferred;
}

std::vector<sc::BackendId> SmartAnalysisOrchestrator::selection_order() const {
  std::vector<sc::BackendId> ids;
  for (const auto& backend : select_backends()) ids.push_back(backend->id());
  return ids;
}

std::vector<BackendStatus> SmartAnalysisOrchestrator::health_report() const {
  std::vector<BackendStatus> report;
  report.reserve(backends_.size());
  for (const auto& backend : backends_) {
    BackendStatus status;
    status.id = backend->id();
    status.tier = backend->tier();
    status.cost_class = backend->cost_class();
    status.available = backend->available();
    status.deprioritized = health_.is_deprioritized(backend->id());
    {
      std::lock_guard lock(reload_mutex_);
      status.reload_pending = reloading_.contains(backend->id());
    }
    status.health = health_.snapshot(backend->id());
    report.push_back(std::move(status));
  }
  return report;
}

SmartAnalysisOrchestrator::PendingCall SmartAnalysisOrchestrator::launch(
    const std::shared_ptr<IAnalyzerBackend>& backend,
    const std::shared_ptr<const sc::Image>& image,
    const sc::CaptureContext& context,
    SlotPriority priority,
    std::chrono::milliseconds budget) {
  PendingCall call;
  call.backend = backend;
  call.state = std::make_shared<CallState>();
  call.budget = budget;
  call.launched_at = Clock::now();

  auto promise = std::make_shared<std::promise<DetectionsOrError>>();
  call.result = promise->get_future();

  if (!begin_task()) {
    promise->set_value(std::unexpected(sc::BackendError::Cancelled));
    return call;
  }

  std::thread([this, backend, image, context, priority, budget, promise, state = call.state,
               cancel = call.cancel] {
    // The lease and permit live until analyze() returns, even if the orchestrator
    // stopped waiting on this call.
    std::optional<LocalInferenceSlot::Lease> lease;
    bool permit = false;
    if (backend->uses_local_device()) {
      if (priority == SlotPriority::Capture && slot_.preempt_streaming()) {
        logger().info("streaming analysis pre-empted by capture", {{"backend", backend->id()}});
      }
      lease = slot_.acquire(priority, cancel);
    } else {
      while (!permit && !cancel.cancelled()) {
        permit = remote_permits_.try_acquire_for(kPollPeriod);
      }
    }

    if ((backend->uses_local_device() && !lease) || (!backend->uses_local_device() && !permit)) {
      promise->set_value(std::unexpected(sc::BackendError::Cancelled));
      end_task();
      return;
    }

    state->started_at.store(Clock::now().time_since_epoch().count(), std::memory_order_relaxed);
    state->started.store(true, std::memory_order_release);
    try {
      promise->set_value(backend->analyze(*image, context, cancel, budget));
    } catch (const std::exception& e) {
      logger().error("backend threw out of analyze",
                     {{"backend", backend->id()}, {"reason", e.what()}});
      promise->set_value(std::unexpected(sc::BackendError::Internal));
    }
    if (permit) remote_permits_.release();
    lease.reset();
    end_task();
  }).detach();
  return call;
}

DetectionsOrError SmartAnalysisOrchestrator::await(PendingCall& call,
                                                   const sc::CancellationToken& session_cancel) {
  const auto& id = call.backend->id();
  std::optional<DetectionsOrError> outcome;
  bool queued_out = false;
  for (;;) {
    if (call.result.wait_for(kPollPeriod) == std::future_status::ready) {
      outcome = call.result.get();
      break;
    }
    if (session_cancel.cancelled() || call.cancel.cancelled()) {
      call.cancel.cancel();
      outcome = std::unexpected(sc::BackendError::Cancelled);
      break;
    }
    if (call.state->started.load(std::memory_order_acquire)) {
      const Clock::time_point started{
          Clock::duration(call.state->started_at.load(std::memory_order_relaxed))};
      if (Clock::now() - started >= call.budget) {
        call.cancel.cancel();
        outcome = std::unexpected(sc::BackendError::Timeout);
        break;
      }
    } else if (Clock::now() - call.launched_at >= call.budget) {
      // Still queued for the device slot or a remote permit, e.g. behind a hung call.
      call.cancel.cancel();
      outcome = std::unexpected(sc::BackendError::Timeout);
      queued_out = true;
      break;
    }
  }

  std::chrono::milliseconds latency{0};
  const bool ran = !queued_out && call.state->started.load(std::memory_order_acquire);
  if (ran) {
    latency = elapsed_since(
        Clock::time_point{Clock::duration(call.state->started_at.load(std::memory_order_relaxed))});
  }

  if (outcome->has_value()) {
    health_.record_outcome(id, true, latency);
    logger().debug("backend succeeded", {{"backend", id},
                                         {"detections", std::to_string((*outcome)->size())},
                                         {"latency_ms", std::to_string(latency.count())}});
  } else {
    const auto error = outcome->error();
    // Cancelled calls say nothing about the backend; bad input says nothing either.
    // Neither does a call that never got the device slot or a remote permit.
    if (ran && error != sc::BackendError::Cancelled && error != sc::BackendError::MalformedInput) {
      health_.record_outcome(id, false, latency);
    }
    logger().warn("backend call failed", {{"backend", id},
                                          {"error", std::string(sc::to_string(error))},
                                          {"latency_ms", std::to_string(latency.count())}});
  }
  return std::move(*outcome);
}

DetectionsOrError SmartAnalysisOrchestrator::attempt(
    const std::shared_ptr<IAnalyzerBackend>& backend,
    const std::shared_ptr<const sc::Image>& image,
    const sc::CaptureContext& context,
    SlotPriority priority,
    const sc::CancellationToken& session_cancel) {
  auto call = launch(backend, image, context, priority, backend->timeout());
  auto result = await(call, session_cancel);
  if (result || backend->tier() != sc::BackendTier::Remote || !retryable_remote(result.error()) ||
      session_cancel.cancelled()) {
    return result;
  }

  const auto retry_budget = std::min(config_.remote_retry_timeout, backend->timeout());
  logger().info("retrying remote backend",
                {{"backend", backend->id()}, {"budget_ms", std::to_string(retry_budget.count())}});
  auto retry = launch(backend, image, context, priority, retry_budget);
  return await(retry, session_cancel);
}

void SmartAnalysisOrchestrator::handle_failure(const std::shared_ptr<IAnalyzerBackend>& backend,
                                               sc::BackendError error) {
  switch (error) {
    case sc::BackendError::ModelNotLoaded:
      schedule_reload(backend);
      break;
    case sc::BackendError::RemoteRateLimited:
      health_.deprioritize(backend->id());
      break;
    default:
      break;
  }
}

void SmartAnalysisOrchestrator::schedule_reload(const std::shared_ptr<IAnalyzerBackend>& backend) {
  {
    std::lock_guard lock(reload_mutex_);
    if (!reloading_.insert(backend->id()).second) return;
  }
  if (!begin_task()) {
    std::lock_guard lock(reload_mutex_);
    reloading_.erase(backend->id());
    return;
  }
  logger().info("background reload scheduled", {{"backend", backend->id()}});

  std::thread([this, backend] {
    std::expected<void, sc::BackendError> result;
    try {
      result = backend->reload();
    } catch (const std::exception& e) {
      logger().error("reload threw", {{"backend", backend->id()}, {"reason", e.what()}});
      result = std::unexpected(sc::BackendError::Internal);
    }
    if (result) {
      logger().info("backend reloaded", {{"backend", backend->id()}});
    } else {
      logger().warn("backend reload failed",
                    {{"backend", backend->id()}, {"error", std::string(sc::to_string(result.error()))}});
    }
    {
      std::lock_guard lock(reload_mutex_);
      reloading_.erase(backend->id());
    }
    end_task();
  }).detach();
}

sc::AnalysisSession SmartAnalysisOrchestrator::run_session(std::shared_ptr<const sc::Image> image,
                                                           const sc::CaptureContext& context,
                                                           sc::SubmissionKind kind,
                                                           const sc::CancellationToken& cancel) {
  const auto start = Clock::now();
  sc::SessionBuilder builder(context.correlation_id.value_or(next_correlation_id()), kind);
  const auto priority =
      kind == sc::SubmissionKind::Photo ? SlotPriority::Capture : SlotPriority::Streaming;

  const auto fail = [&](sc::AnalysisError error) {
    logger().warn("session failed", {{"session", builder.correlation_id()},
                                     {"kind", std::string(sc::to_string(kind))},
                                     {"error", std::string(sc::to_string(error))}});
    return builder.fail(error, elapsed_since(start));
  };

  if (cancel.cancelled()) return fail(sc::AnalysisError::Cancelled);

  builder.advance(sc::SessionState::SelectingBackends);
  if (!image->well_formed()) return fail(sc::AnalysisError::MalformedInput);

  auto chain = select_backends();
  {
    std::vector<sc::BackendId> ids;
    for (const auto& backend : chain) ids.push_back(backend->id());
    builder.set_backend_chain(ids);
    logger().debug("backends selected",
                   {{"session", builder.correlation_id()}, {"chain", join_ids(ids)}});
  }
  if (chain.empty()) return fail(sc::AnalysisError::NoBackendAvailable);

  builder.advance(sc::SessionState::Analyzing);
  std::vector<std::vector<sc::HazardDetection>> results;
  std::vector<std::shared_ptr<IAnalyzerBackend>> contributors;

  // Returns the session-ending error, if the failure is fatal.
  const auto absorb = [&](const std::shared_ptr<IAnalyzerBackend>& backend,
                          DetectionsOrError& result) -> std::optional<sc::AnalysisError> {
    if (result) {
      results.push_back(std::move(*result));
      contributors.push_back(backend);
      return std::nullopt;
    }
    const auto kind_of = sc::classify(result.error());
    if (kind_of == sc::AnalysisError::MalformedInput || kind_of == sc::AnalysisError::Cancelled) {
      return kind_of;
    }
    handle_failure(backend, result.error());
    return std::nullopt;
  };

  if (config_.hybrid_mode) {
    const auto local = std::find_if(chain.begin(), chain.end(),
                                    [](const auto& b) { return b->uses_local_device(); });
    const auto remote = std::find_if(chain.begin(), chain.end(),
                                     [](const auto& b) { return !b->uses_local_device(); });
    if (local != chain.end() && remote != chain.end()) {
      auto local_backend = *local;
      auto remote_backend = *remote;
      auto local_call = launch(local_backend, image, context, priority, local_backend->timeout());
      auto remote_call = launch(remote_backend, image, context, priority, remote_backend->timeout());
      auto local_result = await(local_call, cancel);
      auto remote_result = await(remote_call, cancel);

      const auto local_fatal = absorb(local_backend, local_result);
      const auto remote_fatal = absorb(remote_backend, remote_result);
      if (local_fatal) return fail(*local_fatal);
      if (remote_fatal) return fail(*remote_fatal);
      if (contributors.size() == 1) {
        logger().info("hybrid analysis continuing with one backend",
                      {{"session", builder.correlation_id()},
                       {"error", std::string(sc::to_string(sc::AnalysisError::PartialFusionFailure))},
                       {"backend", contributors.front()->id()}});
      }
      std::erase(chain, local_backend);
      std::erase(chain, remote_backend);
    }
  }

  for (const auto& backend : chain) {
    if (!contributors.empty()) break;
    auto result = attempt(backend, image, context, priority, cancel);
    if (const auto fatal = absorb(backend, result)) return fail(*fatal);
    if (contributors.empty()) {
      logger().info("falling back to next backend",
                    {{"session", builder.correlation_id()}, {"failed", backend->id()}});
    }
  }

  if (contributors.empty()) return fail(sc::AnalysisError::NoBackendAvailable);

  const bool degraded = std::all_of(contributors.begin(), contributors.end(), [](const auto& b) {
    return b->tier() == sc::BackendTier::LocalDetector;
  });
  builder.set_degraded_capability(degraded);
  for (const auto& backend : contributors) builder.add_contributing_backend(backend->id());

  builder.advance(sc::SessionState::Fusing);
  auto fused = fusion_.fuse(results);

  builder.advance(sc::SessionState::Recommending);
  auto recommendation = recommender_.recommend(fused);
  builder.set_fused_hazards(std::move(fused));
  builder.set_recommendations(std::move(recommendation.recommendations),
                              std::move(recommendation.auto_select_tags));

  auto session = builder.complete(elapsed_since(start));
  logger().info("session complete",
                {{"session", session.correlation_id()},
                 {"kind", std::string(sc::to_string(kind))},
                 {"hazards", std::to_string(session.fused_hazards().size())},
                 {"auto_selected", std::to_string(session.auto_select_tags().size())},
                 {"degraded", degraded ? "true" : "false"},
                 {"latency_ms", std::to_string(session.total_latency().count())}});
  return session;
}

sc::AnalysisSession SmartAnalysisOrchestrator::submit_photo(const sc::Image& image,
                                                            const sc::CaptureContext& context) {
  return run_session(std::make_shared<const sc::Image>(image), context, sc::SubmissionKind::Photo,
                     current_token());
}

std::optional<std::shared_future<sc::AnalysisSession>> SmartAnalysisOrchestrator::submit_frame(
    sc::Image image, sc::CaptureContext context) {
  if (!begin_task()) return std::nullopt;
  if (!throttler_.try_accept()) {
    end_task();
    logger().debug("frame dropped by throttler");
    return std::nullopt;
  }

  auto promise = std::make_shared<std::promise<sc::AnalysisSession>>();
  std::shared_future<sc::AnalysisSession> future = promise->get_future().share();
  auto shared_image = std::make_shared<const sc::Image>(std::move(image));
  auto cancel = current_token();

  std::thread([this, promise, shared_image, context = std::move(context), cancel] {
    try {
      promise->set_value(run_session(shared_image, context, sc::SubmissionKind::Frame, cancel));
    } catch (const std::exception& e) {
      logger().error("frame session aborted", {{"reason", e.what()}});
      promise->set_exception(std::current_exception());
    }
    end_task();
  }).detach();
  return future;
}

}  // namespace sitescan::analysis
