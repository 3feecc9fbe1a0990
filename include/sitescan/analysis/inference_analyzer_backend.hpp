#pragma once

#include <sitescan/analysis/analyzer_backend.hpp>
#include <sitescan/core/pipeline.hpp>
#include <sitescan/vision/detection_decoder.hpp>
#include <sitescan/vision/inference_backend.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>

namespace sitescan::analysis {

/// Creates the model runtime. May throw when weights are missing or corrupt.
using ModelLoader = std::function<std::unique_ptr<sitescan::vision::IInferenceBackend>()>;

struct InferenceAnalyzerOptions {
  sitescan::core::BackendId id;
  sitescan::core::BackendTier tier{sitescan::core::BackendTier::LocalDetector};
  sitescan::core::CostClass cost_class{sitescan::core::CostClass::LocalCompute};
  std::set<std::string> capabilities;
  std::chrono::milliseconds timeout{default_timeout(sitescan::core::BackendTier::LocalDetector)};
  bool warmup_on_load{true};
};

/// On-device analyzer: preprocessing pipeline -> model runtime -> detection decoder.
/// Serves both the multimodal tier and the lightweight detector tier.
///
/// The model is loaded lazily on the first analyze() (or by reload()). A failed load
/// returns ModelNotLoaded and marks the backend unavailable until reload() succeeds.
class InferenceAnalyzerBackend : public IAnalyzerBackend {
 public:
  InferenceAnalyzerBackend(InferenceAnalyzerOptions options,
                           ModelLoader loader,
                           sitescan::core::Pipeline preprocessing,
                           sitescan::vision::DetectionDecoder decoder);

  [[nodiscard]] const sitescan::core::BackendId& id() const noexcept override { return options_.id; }
  [[nodiscard]] sitescan::core::BackendTier tier() const noexcept override { return options_.tier; }
  [[nodiscard]] sitescan::core::CostClass cost_class() const noexcept override {
    return options_.cost_class;
  }
  [[nodiscard]] std::set<std::string> capabilities() const override { return options_.capabilities; }
  [[nodiscard]] bool available() const override;
  [[nodiscard]] std::chrono::milliseconds timeout() const noexcept override { return options_.timeout; }

  [[nodiscard]] DetectionsOrError analyze(const sitescan::core::Image& image,
                                          const sitescan::core::CaptureContext& context,
                                          const sitescan::core::CancellationToken& cancel,
                                          std::chrono::milliseconds budget) override;

  [[nodiscard]] std::expected<void, sitescan::core::BackendError> reload() override;

  [[nodiscard]] bool model_loaded() const;

 private:
  /// Loads the model if needed. Caller holds model_mutex_.
  [[nodiscard]] std::expected<void, sitescan::core::BackendError> ensure_loaded_locked();

  InferenceAnalyzerOptions options_;
  ModelLoader loader_;
  sitescan::core::Pipeline preprocessing_;
  sitescan::vision::DetectionDecoder decoder_;

  mutable std::mutex model_mutex_;
  std::unique_ptr<sitescan::vision::IInferenceBackend> model_;
  std::atomic<bool> load_failed_{false};
};

}  // namespace sitescan::analysis
