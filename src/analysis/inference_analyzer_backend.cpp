#include <sitescan/analysis/inference_analyzer_backend.hpp>
#include <sitescan/core/logging.hpp>
#include <chrono>
#include <exception>
#include <stdexcept>

namespace sitescan::analysis {

namespace sc = sitescan::core;

namespace {

const sc::Logger& logger() {
  static const sc::Logger log = sc::get_logger("backend.inference");
  return log;
}

}  // namespace

InferenceAnalyzerBackend::InferenceAnalyzerBackend(InferenceAnalyzerOptions options,
                                                   ModelLoader loader,
                                                   sc::Pipeline preprocessing,
                                                   sitescan::vision::DetectionDecoder decoder)
    : options_(std::move(options)),
      loader_(std::move(loader)),
      preprocessing_(std::move(preprocessing)),
      decoder_(std::move(decoder)) {}

bool InferenceAnalyzerBackend::available() const {
  return loader_ != nullptr && !load_failed_.load(std::memory_order_acquire);
}

bool InferenceAnalyzerBackend::model_loaded() const {
  std::lock_guard lock(model_mutex_);
  return model_ != nullptr;
}

std::expected<void, sc::BackendError> InferenceAnalyzerBackend::ensure_loaded_locked() {
  if (model_) return {};
  if (load_failed_.load(std::memory_order_acquire) || !loader_) {
    return std::unexpected(sc::BackendError::ModelNotLoaded);
  }
  try {
    auto model = loader_();
    if (!model) {
      throw std::runtime_error("loader returned no model");
    }
    if (options_.warmup_on_load) model->warmup();
    model_ = std::move(model);
    logger().info("model loaded", {{"backend", options_.id}});
    return {};
  } catch (const std::exception& e) {
    load_failed_.store(true, std::memory_order_release);
    logger().error("model load failed", {{"backend", options_.id}, {"reason", e.what()}});
    return std::unexpected(sc::BackendError::ModelNotLoaded);
  }
}

std::expected<void, sc::BackendError> InferenceAnalyzerBackend::reload() {
  std::lock_guard lock(model_mutex_);
  model_.reset();
  load_failed_.store(false, std::memory_order_release);
  return ensure_loaded_locked();
}

DetectionsOrError InferenceAnalyzerBackend::analyze(const sc::Image& image,
                                                    const sc::CaptureContext& /*context*/,
                                                    const sc::CancellationToken& cancel,
                                                    std::chrono::milliseconds /*budget*/) {
  if (!image.well_formed()) {
    return std::unexpected(sc::BackendError::MalformedInput);
  }
  if (cancel.cancelled()) {
    return std::unexpected(sc::BackendError::Cancelled);
  }

  try {
    auto prepared = preprocessing_.run(image);
    if (!prepared) {
      return std::unexpected(prepared.error());
    }
    if (cancel.cancelled()) {
      return std::unexpected(sc::BackendError::Cancelled);
    }

    std::lock_guard lock(model_mutex_);
    auto loaded = ensure_loaded_locked();
    if (!loaded) {
      return std::unexpected(loaded.error());
    }
    auto valid = model_->validate_input(*prepared);
    if (!valid) {
      return std::unexpected(valid.error());
    }
    auto raw = model_->infer(*prepared);
    if (!raw) {
      return std::unexpected(raw.error());
    }
    if (cancel.cancelled()) {
      return std::unexpected(sc::BackendError::Cancelled);
    }
    return decoder_.decode(*raw, options_.id, options_.tier, std::chrono::system_clock::now());
  } catch (const std::exception& e) {
    logger().error("inference failed", {{"backend", options_.id}, {"reason", e.what()}});
    return std::unexpected(sc::BackendError::Internal);
  }
}

}  // namespace sitescan::analysis
