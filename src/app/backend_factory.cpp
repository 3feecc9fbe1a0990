#include <sitescan/app/backend_factory.hpp>
#include <sitescan/analysis/curl_vision_client.hpp>
#include <sitescan/analysis/inference_analyzer_backend.hpp>
#include <sitescan/analysis/remote_vision_backend.hpp>
#include <sitescan/vision/color_convert_stage.hpp>
#include <sitescan/vision/decode_stage.hpp>
#include <sitescan/vision/mock_inference_backend.hpp>
#include <sitescan/vision/normalize_stage.hpp>
#include <sitescan/vision/onnx_inference_backend.hpp>
#include <sitescan/vision/resize_stage.hpp>
#include <stdexcept>

namespace sitescan::app {

namespace sa = sitescan::analysis;
namespace sc = sitescan::core;
namespace sv = sitescan::vision;

namespace {

/// Category set of every hazard the class map can produce.
std::set<std::string> capabilities_of(const AnalysisConfig& config, const sa::HazardTaxonomy& taxonomy) {
  std::set<std::string> out;
  for (const auto& type : config.class_map) {
    for (const auto& tag_id : taxonomy.tags_for(type)) {
      if (const auto* tag = taxonomy.find_tag(tag_id)) out.insert(tag->category);
    }
  }
  return out;
}

/// Synthetic model output for the demo runtime: one finding per tier.
std::vector<sv::MockDetection> demo_detections(sc::BackendTier tier) {
  if (tier == sc::BackendTier::OnDeviceMultimodal) {
    return {{0, 0.30f, 0.10f, 0.20f, 0.25f, 0.92f}, {9, 0.05f, 0.70f, 0.40f, 0.25f, 0.55f}};
  }
  return {{0, 0.31f, 0.11f, 0.19f, 0.24f, 0.78f}};
}

sa::ModelLoader make_loader(const AnalysisConfig& config, const std::string& model_path,
                            sc::BackendTier tier) {
  if (config.inference_backend == InferenceBackendType::Onnx) {
    if (model_path.empty()) {
      throw std::runtime_error("inference_backend=onnx requires a model path for every enabled on-device backend");
    }
    return [model_path]() -> std::unique_ptr<sv::IInferenceBackend> {
      return std::make_unique<sv::OnnxInferenceBackend>(model_path);
    };
  }
  return [tier]() -> std::unique_ptr<sv::IInferenceBackend> {
    auto mock = std::make_unique<sv::MockInferenceBackend>();
    mock->set_detections(demo_detections(tier));
    return mock;
  };
}

}  // namespace

sc::Pipeline build_preprocessing(const AnalysisConfig& config) {
  sc::Pipeline pipeline;
  pipeline.add_stage(std::make_unique<sv::DecodeStage>());
  pipeline.add_stage(std::make_unique<sv::ColorConvertStage>(sc::PixelFormat::RGB8));
  pipeline.add_stage(std::make_unique<sv::ResizeStage>(config.input_width, config.input_height));
  pipeline.add_stage(std::make_unique<sv::NormalizeStage>(config.normalize_mean, config.normalize_scale));
  return pipeline;
}

sv::DetectionDecoder build_decoder(const AnalysisConfig& config, const sa::HazardTaxonomy& taxonomy) {
  sv::HazardThresholds per_hazard;
  for (const auto& type : config.class_map) {
    if (type.empty()) continue;
    if (const auto* entry = taxonomy.find_hazard(type); entry && entry->min_detection_confidence) {
      per_hazard[type] = *entry->min_detection_confidence;
    }
  }
  return sv::DetectionDecoder(config.detector_confidence_threshold, config.class_map,
                              std::move(per_hazard));
}

std::vector<std::shared_ptr<sa::IAnalyzerBackend>> build_backends(const AnalysisConfig& config,
                                                                  const sa::HazardTaxonomy& taxonomy) {
  std::vector<std::shared_ptr<sa::IAnalyzerBackend>> backends;
  const auto capabilities = capabilities_of(config, taxonomy);

  const auto add_local = [&](const std::string& id, sc::BackendTier tier, sc::CostClass cost,
                             const std::string& model_path) {
    sa::InferenceAnalyzerOptions options;
    options.id = id;
    options.tier = tier;
    options.cost_class = cost;
    options.capabilities = capabilities;
    options.timeout = config.local_timeout;
    backends.push_back(std::make_shared<sa::InferenceAnalyzerBackend>(
        std::move(options), make_loader(config, model_path, tier), build_preprocessing(config),
        build_decoder(config, taxonomy)));
  };

  if (config.multimodal_enabled) {
    add_local("multimodal-on-device", sc::BackendTier::OnDeviceMultimodal, sc::CostClass::LocalCompute,
              config.multimodal_model_path);
  }
  if (!config.remote_endpoint.empty()) {
    sa::RemoteVisionOptions options;
    options.endpoint = config.remote_endpoint;
    options.api_key = config.remote_api_key;
    options.timeout = config.remote_timeout;
    for (const auto& type : taxonomy.hazard_types()) {
      for (const auto& tag_id : taxonomy.tags_for(type)) {
        if (const auto* tag = taxonomy.find_tag(tag_id)) options.capabilities.insert(tag->category);
      }
    }
    backends.push_back(std::make_shared<sa::RemoteVisionBackend>(
        std::move(options), std::make_shared<sa::CurlVisionClient>()));
  }
  if (config.detector_enabled) {
    add_local("detector-on-device", sc::BackendTier::LocalDetector, sc::CostClass::LocalFree,
              config.detector_model_path);
  }
  return backends;
}

}  // namespace sitescan::app
