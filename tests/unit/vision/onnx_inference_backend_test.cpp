// OnnxInferenceBackend against a real detector export. Only the missing-file test runs
// without a model; the rest need SITESCAN_TEST_ONNX_MODEL pointing at a .onnx file and are
// skipped otherwise. The input size is read from the model, so any square or rectangular
// detector export works.
#include <sitescan/core/error.hpp>
#include <sitescan/core/image.hpp>
#include <sitescan/vision/onnx_inference_backend.hpp>
#include <onnxruntime_cxx_api.h>
#include <gtest/gtest.h>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <vector>

namespace sv = sitescan::vision;
namespace sc = sitescan::core;

static std::string get_test_model_path() {
  const char* env = std::getenv("SITESCAN_TEST_ONNX_MODEL");
  if (env && env[0] != '\0' && std::filesystem::exists(env)) {
    return env;
  }
  return "";
}

static sc::Image make_float_image(std::uint32_t w, std::uint32_t h) {
  std::vector<std::byte> buffer(sc::Image::min_bytes(w, h, sc::PixelFormat::Float32Planar), std::byte{0});
  return sc::Image(w, h, sc::PixelFormat::Float32Planar, std::move(buffer));
}

#define SITESCAN_REQUIRE_MODEL(path)                                              \
  const std::string path = get_test_model_path();                                 \
  if (path.empty()) {                                                             \
    GTEST_SKIP() << "Set SITESCAN_TEST_ONNX_MODEL to run (path to .onnx file)"; \
  }

TEST(OnnxInferenceBackend, ConstructorThrowsWhenFileMissing) {
  EXPECT_THROW(
      { sv::OnnxInferenceBackend backend("missing_site_model_should_not_exist.onnx"); },
      Ort::Exception);
}

TEST(OnnxInferenceBackend, ValidateInputRejectsEmptyImage) {
  SITESCAN_REQUIRE_MODEL(path);
  sv::OnnxInferenceBackend backend(path);
  auto valid = backend.validate_input(sc::Image{});
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error(), sc::BackendError::MalformedInput);
}

TEST(OnnxInferenceBackend, ValidateInputRejectsRawPixels) {
  SITESCAN_REQUIRE_MODEL(path);
  sv::OnnxInferenceBackend backend(path);
  const auto w = backend.input_width();
  const auto h = backend.input_height();
  sc::Image rgb(w, h, sc::PixelFormat::RGB8, std::vector<std::byte>(static_cast<std::size_t>(w) * h * 3));
  auto valid = backend.validate_input(rgb);
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error(), sc::BackendError::MalformedInput);
}

TEST(OnnxInferenceBackend, ValidateInputRejectsWrongDimensions) {
  SITESCAN_REQUIRE_MODEL(path);
  sv::OnnxInferenceBackend backend(path);
  auto valid = backend.validate_input(make_float_image(backend.input_width() / 2, backend.input_height()));
  ASSERT_FALSE(valid.has_value());
  EXPECT_EQ(valid.error(), sc::BackendError::MalformedInput);
}

TEST(OnnxInferenceBackend, InferReturnsSaneResult) {
  SITESCAN_REQUIRE_MODEL(path);
  sv::OnnxInferenceBackend backend(path);
  backend.warmup();
  auto result = backend.infer(make_float_image(backend.input_width(), backend.input_height()));
  ASSERT_TRUE(result.has_value()) << "infer() should succeed with a matching image";
  EXPECT_EQ(result->boxes.size(), result->num_detections * 4u);
  EXPECT_EQ(result->scores.size(), result->num_detections);
  EXPECT_EQ(result->class_ids.size(), result->num_detections);
  EXPECT_EQ(result->input_width, backend.input_width());
  for (std::uint32_t i = 0; i < result->num_detections; ++i) {
    EXPECT_GE(result->scores[i], 0.f);
    EXPECT_LE(result->scores[i], 1.f);
  }
}
