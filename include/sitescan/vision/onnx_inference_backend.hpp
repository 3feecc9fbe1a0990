#pragma once

#include <sitescan/core/error.hpp>
#include <sitescan/core/image.hpp>
#include <sitescan/vision/inference_backend.hpp>
#include <sitescan/vision/inference_result.hpp>
#include <cstdint>
#include <memory>
#include <string>

namespace sitescan::vision {

/// ONNX Runtime backend for on-device hazard models.
///
/// Supported output layouts:
/// - one tensor [1, N, 6] or [1, 6, N] of (x1, y1, x2, y2, score, class_id), YOLO-style;
/// - three tensors boxes [1, N, 4] / [N, 4], scores [1, N], class_ids [1, N].
///
/// Input contract: Float32Planar HWC image at the model's input size (see
/// input_width()/input_height()); transposed to NCHW when the model expects it.
/// Boxes are reported in model-input pixels; InferenceResult carries the input size.
///
/// The constructor throws (Ort::Exception or std::runtime_error) when the model cannot
/// be loaded; InferenceAnalyzerBackend turns that into BackendError::ModelNotLoaded.
class OnnxInferenceBackend : public IInferenceBackend {
 public:
  /// \param model_path Path to the .onnx model file.
  /// \param intra_op_threads Threads ONNX Runtime may use for one inference.
  explicit OnnxInferenceBackend(const std::string& model_path, int intra_op_threads = 1);

  ~OnnxInferenceBackend() override;

  OnnxInferenceBackend(const OnnxInferenceBackend&) = delete;
  OnnxInferenceBackend& operator=(const OnnxInferenceBackend&) = delete;

  [[nodiscard]] std::expected<InferenceResult, sitescan::core::BackendError>
  infer(const sitescan::core::Image& input) override;

  [[nodiscard]] std::expected<void, sitescan::core::BackendError>
  validate_input(const sitescan::core::Image& input) const override;

  void warmup() override;

  [[nodiscard]] std::uint32_t input_width() const noexcept;
  [[nodiscard]] std::uint32_t input_height() const noexcept;

 private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace sitescan::vision
