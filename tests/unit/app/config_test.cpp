#include <sitescan/app/config.hpp>
#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace sapp = sitescan::app;
using namespace std::chrono_literals;

namespace {

class ConfigFileTest : public ::testing::Test {
 protected:
  void SetUp() override { path_ = std::filesystem::temp_directory_path() / "sitescan_config_test.conf"; }
  void TearDown() override { std::filesystem::remove(path_); }

  sapp::AnalysisConfig load(const std::string& text) {
    {
      std::ofstream out(path_);
      out << text;
    }
    return sapp::load_config(path_.string());
  }

  std::filesystem::path path_;
};

}  // namespace

TEST(Config, Defaults) {
  const auto c = sapp::default_config();
  EXPECT_EQ(c.inference_backend, sapp::InferenceBackendType::Mock);
  EXPECT_TRUE(c.multimodal_enabled);
  EXPECT_TRUE(c.detector_enabled);
  EXPECT_TRUE(c.remote_endpoint.empty());
  EXPECT_EQ(c.class_map.size(), 13u);
  EXPECT_EQ(c.class_map.front(), "MISSING_HARD_HAT");
  EXPECT_EQ(c.local_timeout, 2000ms);
  EXPECT_EQ(c.remote_timeout, 10000ms);
  EXPECT_EQ(c.remote_retry_timeout, 5000ms);
  EXPECT_EQ(c.frame_interval, 500ms);
  EXPECT_FLOAT_EQ(c.auto_select_threshold, 0.80f);
  EXPECT_FLOAT_EQ(c.display_threshold, 0.40f);
}

TEST(Config, MissingFileGivesDefaults) {
  const auto c = sapp::load_config("/nonexistent/sitescan.conf");
  EXPECT_EQ(c.class_map, sapp::default_config().class_map);
  EXPECT_FALSE(c.hybrid_mode);
}

TEST_F(ConfigFileTest, ParsesKeys) {
  const auto c = load(
      "# sitescan\n"
      "log_level = debug\n"
      "log_json = yes\n"
      "inference_backend = onnx\n"
      "multimodal_model_path = /models/mm.onnx\n"
      "detector_enabled = off\n"
      "input_width = 320\n"
      "class_map = MISSING_HARD_HAT, , TRIP_HAZARD\n"
      "remote_endpoint = https://vision.example.test\n"
      "remote_api_key = k\n"
      "remote_timeout_ms = 8000\n"
      "remote_retry_timeout_ms = 3000\n"
      "remote_concurrency = 5\n"
      "hybrid_mode = true\n"
      "frame_interval_ms = 250\n"
      "iou_threshold = 0.4\n"
      "weight_remote = 1.5\n"
      "auto_select_threshold = 0.9\n"
      "unknown_key = ignored\n");
  EXPECT_EQ(c.logging.level, sitescan::core::LogLevel::Debug);
  EXPECT_TRUE(c.logging.json);
  EXPECT_EQ(c.inference_backend, sapp::InferenceBackendType::Onnx);
  EXPECT_EQ(c.multimodal_model_path, "/models/mm.onnx");
  EXPECT_FALSE(c.detector_enabled);
  EXPECT_EQ(c.input_width, 320u);
  EXPECT_EQ(c.class_map, (std::vector<std::string>{"MISSING_HARD_HAT", "", "TRIP_HAZARD"}));
  EXPECT_EQ(c.remote_endpoint, "https://vision.example.test");
  EXPECT_EQ(c.remote_timeout, 8000ms);
  EXPECT_EQ(c.remote_concurrency, 5);
  EXPECT_TRUE(c.hybrid_mode);

  const auto o = sapp::orchestrator_config(c);
  EXPECT_TRUE(o.hybrid_mode);
  EXPECT_EQ(o.remote_retry_timeout, 3000ms);
  EXPECT_EQ(o.remote_concurrency, 5);
  EXPECT_EQ(o.frame_interval, 250ms);
  EXPECT_FLOAT_EQ(o.fusion.iou_threshold, 0.4f);
  EXPECT_FLOAT_EQ(o.fusion.weight_remote, 1.5f);
  EXPECT_FLOAT_EQ(o.thresholds.auto_select, 0.9f);
}

TEST_F(ConfigFileTest, MalformedValueNamesKey) {
  try {
    (void)load("remote_timeout_ms = soon\n");
    FAIL() << "expected runtime_error";
  } catch (const std::runtime_error& e) {
    EXPECT_NE(std::string(e.what()).find("remote_timeout_ms"), std::string::npos) << e.what();
  }
  EXPECT_THROW((void)load("hybrid_mode = maybe\n"), std::runtime_error);
  EXPECT_THROW((void)load("inference_backend = tflite\n"), std::runtime_error);
  EXPECT_THROW((void)load("local_timeout_ms = -5\n"), std::runtime_error);
  EXPECT_THROW((void)load("log_level = loud\n"), std::runtime_error);
}

TEST(Config, RemoteConcurrencyAtLeastOne) {
  auto c = sapp::default_config();
  c.remote_concurrency = 0;
  EXPECT_EQ(sapp::orchestrator_config(c).remote_concurrency, 1);
}
