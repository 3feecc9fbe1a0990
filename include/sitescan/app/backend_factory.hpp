#pragma once

#include <sitescan/analysis/analyzer_backend.hpp>
#include <sitescan/analysis/hazard_taxonomy.hpp>
#include <sitescan/app/config.hpp>
#include <sitescan/core/pipeline.hpp>
#include <sitescan/vision/detection_decoder.hpp>
#include <memory>
#include <vector>

namespace sitescan::app {

/// Preprocessing for on-device models: decode, convert to RGB, resize to the
/// model input, normalize.
[[nodiscard]] sitescan::core::Pipeline build_preprocessing(const AnalysisConfig& config);

/// Decoder for the configured class map, with per-hazard minimum confidences taken
/// from the taxonomy.
[[nodiscard]] sitescan::vision::DetectionDecoder build_decoder(
    const AnalysisConfig& config,
    const sitescan::analysis::HazardTaxonomy& taxonomy);

/// Registers the configured backends: on-device multimodal, remote (when an endpoint is
/// set), on-device detector. Throws std::runtime_error for unusable combinations, e.g.
/// the onnx runtime without a model path or in a build without ONNX Runtime.
[[nodiscard]] std::vector<std::shared_ptr<sitescan::analysis::IAnalyzerBackend>> build_backends(
    const AnalysisConfig& config,
    const sitescan::analysis::HazardTaxonomy& taxonomy);

}  // namespace sitescan::app
