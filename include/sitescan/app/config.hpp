#pragma once

#include <sitescan/analysis/orchestrator.hpp>
#include <sitescan/core/logging.hpp>
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace sitescan::app {

/// Model runtime behind the on-device backends: mock (synthetic) or onnx (real model).
enum class InferenceBackendType {
  Mock,
  Onnx,
};

/// Analysis configuration: backends, fusion and recommendation tuning, timeouts,
/// resources and logging.
struct AnalysisConfig {
  // Logging
  sitescan::core::LoggingConfig logging;

  // Resources
  std::string taxonomy_path;  // empty = built-in taxonomy
  std::string health_path;    // empty = no persistence

  // On-device backends
  InferenceBackendType inference_backend{InferenceBackendType::Mock};
  bool multimodal_enabled{true};
  std::string multimodal_model_path;
  bool detector_enabled{true};
  std::string detector_model_path;
  std::uint32_t input_width{640};
  std::uint32_t input_height{640};
  float normalize_mean{0.f};
  float normalize_scale{1.f / 255.f};
  float detector_confidence_threshold{0.25f};
  /// Model class index -> hazard type; an empty entry ignores that class.
  std::vector<std::string> class_map;
  std::chrono::milliseconds local_timeout{2000};

  // Remote backend
  std::string remote_endpoint;  // empty = no remote backend
  std::string remote_api_key;
  std::chrono::milliseconds remote_timeout{10000};
  std::chrono::milliseconds remote_retry_timeout{5000};
  std::int64_t remote_concurrency{3};

  // Orchestration
  bool hybrid_mode{false};
  std::chrono::milliseconds frame_interval{500};

  // Fusion and recommendation
  float iou_threshold{0.3f};
  float agreement_boost{0.1f};
  float weight_multimodal{1.0f};
  float weight_remote{1.2f};
  float weight_detector{0.7f};
  float auto_select_threshold{0.80f};
  float display_threshold{0.40f};
};

/// Load config from a key=value file (one per line, '#' comments) on top of the defaults.
/// A missing file yields the defaults. Unknown keys are ignored; a malformed value throws
/// std::runtime_error naming the key.
AnalysisConfig load_config(const std::string& path);

/// Default config when no file is provided.
AnalysisConfig default_config();

/// Orchestrator tuning taken from the config.
[[nodiscard]] sitescan::analysis::OrchestratorConfig orchestrator_config(const AnalysisConfig& config);

}  // namespace sitescan::app
