#include <sitescan/vision/onnx_inference_backend.hpp>
#include <onnxruntime_cxx_api.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace sitescan::vision {

namespace sc = sitescan::core;

namespace {

constexpr std::int64_t kChannels = 3;

void hwc_to_nchw(const float* hwc, std::uint32_t h, std::uint32_t w, float* nchw) {
  const std::size_t plane = static_cast<std::size_t>(h) * w;
  for (std::size_t p = 0; p < plane; ++p) {
    nchw[0 * plane + p] = hwc[p * kChannels + 0];
    nchw[1 * plane + p] = hwc[p * kChannels + 1];
    nchw[2 * plane + p] = hwc[p * kChannels + 2];
  }
}

/// Appends one detection read from a row-major ([N, 6]) or column-major ([6, N]) tensor.
void append_detection(InferenceResult& result, const float* data, std::int64_t i,
                      std::int64_t n, bool row_major) {
  auto at = [&](std::int64_t field) {
    return row_major ? data[i * 6 + field] : data[field * n + i];
  };
  result.boxes.insert(result.boxes.end(), {at(0), at(1), at(2), at(3)});
  result.scores.push_back(at(4));
  result.class_ids.push_back(static_cast<std::int64_t>(at(5)));
}

bool parse_single_output(Ort::Value& out, InferenceResult& result) {
  const auto shape = out.GetTensorTypeAndShapeInfo().GetShape();
  if (shape.size() != 3u || shape[0] != 1) return false;
  const bool row_major = shape[2] == 6;
  if (!row_major && shape[1] != 6) return false;
  const std::int64_t n = row_major ? shape[1] : shape[2];
  if (n < 0) return false;

  const float* data = out.GetTensorData<float>();
  result.num_detections = static_cast<std::uint32_t>(n);
  result.boxes.reserve(static_cast<std::size_t>(n) * 4u);
  for (std::int64_t i = 0; i < n; ++i) {
    append_detection(result, data, i, n, row_major);
  }
  return true;
}

bool parse_three_outputs(std::vector<Ort::Value>& outputs, InferenceResult& result) {
  if (outputs.size() < 3u) return false;
  const auto boxes_shape = outputs[0].GetTensorTypeAndShapeInfo().GetShape();
  std::int64_t n = -1;
  if (boxes_shape.size() == 3u && boxes_shape[0] == 1 && boxes_shape[2] == 4) {
    n = boxes_shape[1];
  } else if (boxes_shape.size() == 2u && boxes_shape[1] == 4) {
    n = boxes_shape[0];
  }
  if (n < 0) return false;

  const float* boxes = outputs[0].GetTensorData<float>();
  const float* scores = outputs[1].GetTensorData<float>();
  const std::int64_t* classes = outputs[2].GetTensorData<std::int64_t>();
  result.num_detections = static_cast<std::uint32_t>(n);
  result.boxes.assign(boxes, boxes + n * 4);
  result.scores.assign(scores, scores + n);
  result.class_ids.assign(classes, classes + n);
  return true;
}

}  // namespace

struct OnnxInferenceBackend::Impl {
  Ort::Env env{ORT_LOGGING_LEVEL_WARNING, "sitescan"};
  Ort::SessionOptions session_options;
  Ort::Session session{nullptr};

  std::string input_name;
  std::vector<std::string> output_names;
  std::vector<const char*> output_name_ptrs;

  std::uint32_t input_height{0};
  std::uint32_t input_width{0};
  bool input_is_nchw{true};

  std::vector<float> nchw_buffer;
};

OnnxInferenceBackend::OnnxInferenceBackend(const std::string& model_path, int intra_op_threads)
    : impl_(std::make_unique<Impl>()) {
  impl_->session_options.SetIntraOpNumThreads(intra_op_threads);
  impl_->session_options.SetGraphOptimizationLevel(GraphOptimizationLevel::ORT_ENABLE_EXTENDED);
  impl_->session = Ort::Session(impl_->env, model_path.c_str(), impl_->session_options);

  Ort::AllocatorWithDefaultOptions allocator;
  if (impl_->session.GetInputCount() == 0) {
    throw std::runtime_error("OnnxInferenceBackend: model has no inputs");
  }
  impl_->input_name = impl_->session.GetInputNameAllocated(0, allocator).get();

  const auto dims = impl_->session.GetInputTypeInfo(0).GetTensorTypeAndShapeInfo().GetShape();
  if (dims.size() != 4u) {
    throw std::runtime_error("OnnxInferenceBackend: expected 4D input");
  }
  if (dims[1] == kChannels) {
    impl_->input_is_nchw = true;
    impl_->input_height = static_cast<std::uint32_t>(dims[2]);
    impl_->input_width = static_cast<std::uint32_t>(dims[3]);
  } else if (dims[3] == kChannels) {
    impl_->input_is_nchw = false;
    impl_->input_height = static_cast<std::uint32_t>(dims[1]);
    impl_->input_width = static_cast<std::uint32_t>(dims[2]);
  } else {
    throw std::runtime_error("OnnxInferenceBackend: expected input shape [1,3,H,W] or [1,H,W,3]");
  }

  const std::size_t num_outputs = impl_->session.GetOutputCount();
  if (num_outputs != 1u && num_outputs < 3u) {
    throw std::runtime_error(
        "OnnxInferenceBackend: model must have 1 output (YOLO-style) or 3 outputs (boxes, scores, class_ids)");
  }
  const std::size_t used = num_outputs == 1u ? 1u : 3u;
  for (std::size_t i = 0; i < used; ++i) {
    impl_->output_names.emplace_back(impl_->session.GetOutputNameAllocated(i, allocator).get());
  }
  for (const auto& name : impl_->output_names) {
    impl_->output_name_ptrs.push_back(name.c_str());
  }
}

OnnxInferenceBackend::~OnnxInferenceBackend() = default;

std::uint32_t OnnxInferenceBackend::input_width() const noexcept { return impl_->input_width; }
std::uint32_t OnnxInferenceBackend::input_height() const noexcept { return impl_->input_height; }

std::expected<void, sc::BackendError>
OnnxInferenceBackend::validate_input(const sc::Image& input) const {
  if (input.format() != sc::PixelFormat::Float32Planar || !input.well_formed()) {
    return std::unexpected(sc::BackendError::MalformedInput);
  }
  if (input.width() != impl_->input_width || input.height() != impl_->input_height) {
    return std::unexpected(sc::BackendError::MalformedInput);
  }
  return {};
}

std::expected<InferenceResult, sc::BackendError>
OnnxInferenceBackend::infer(const sc::Image& input) {
  auto valid = validate_input(input);
  if (!valid) {
    return std::unexpected(valid.error());
  }

  const std::uint32_t h = input.height();
  const std::uint32_t w = input.width();
  const std::size_t num_floats = static_cast<std::size_t>(kChannels) * h * w;
  const float* src = reinterpret_cast<const float*>(input.data().data());

  Ort::MemoryInfo mem_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
  std::array<std::int64_t, 4> shape{1, kChannels, static_cast<std::int64_t>(h),
                                    static_cast<std::int64_t>(w)};
  float* tensor_data = const_cast<float*>(src);
  if (impl_->input_is_nchw) {
    impl_->nchw_buffer.resize(num_floats);
    hwc_to_nchw(src, h, w, impl_->nchw_buffer.data());
    tensor_data = impl_->nchw_buffer.data();
  } else {
    shape = {1, static_cast<std::int64_t>(h), static_cast<std::int64_t>(w), kChannels};
  }

  std::vector<Ort::Value> outputs;
  try {
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        mem_info, tensor_data, num_floats, shape.data(), shape.size());
    const char* input_names[] = {impl_->input_name.c_str()};
    outputs = impl_->session.Run(Ort::RunOptions{nullptr}, input_names, &input_tensor, 1,
                                 impl_->output_name_ptrs.data(), impl_->output_name_ptrs.size());
  } catch (const Ort::Exception&) {
    return std::unexpected(sc::BackendError::Internal);
  }

  InferenceResult result;
  result.input_width = w;
  result.input_height = h;
  const bool parsed = outputs.size() == 1u ? parse_single_output(outputs[0], result)
                                           : parse_three_outputs(outputs, result);
  if (!parsed) {
    return std::unexpected(sc::BackendError::Internal);
  }
  return result;
}

void OnnxInferenceBackend::warmup() {
  std::vector<std::byte> buffer(
      sc::Image::min_bytes(impl_->input_width, impl_->input_height, sc::PixelFormat::Float32Planar),
      std::byte{0});
  sc::Image image(impl_->input_width, impl_->input_height, sc::PixelFormat::Float32Planar,
                  std::move(buffer));
  (void)infer(image);
}

}  // namespace sitescan::vision
