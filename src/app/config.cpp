#include <sitescan/app/config.hpp>
#include <sitescan/core/logging.hpp>
#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <stdexcept>
#include <string_view>

namespace sitescan::app {

namespace {

void trim(std::string& s) {
  const auto start = s.find_first_not_of(" \t\r\n");
  if (start == std::string::npos) {
    s.clear();
    return;
  }
  const auto end = s.find_last_not_of(" \t\r\n");
  s = s.substr(start, end == std::string::npos ? std::string::npos : end - start + 1);
}

bool parse_line(std::string_view line, std::string& key, std::string& value) {
  const auto pos = line.find('=');
  if (pos == std::string_view::npos) return false;
  key.assign(line.substr(0, pos));
  value.assign(line.substr(pos + 1));
  trim(key);
  trim(value);
  return !key.empty();
}

[[noreturn]] void bad_value(const std::string& key, const std::string& value) {
  throw std::runtime_error("Invalid value for config key '" + key + "': '" + value + "'");
}

float to_float(const std::string& key, const std::string& value) {
  float out = 0.f;
  const auto* end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), end, out);
  if (ec != std::errc() || ptr != end) bad_value(key, value);
  return out;
}

std::int64_t to_int(const std::string& key, const std::string& value) {
  std::int64_t out = 0;
  const auto* end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(value.data(), end, out);
  if (ec != std::errc() || ptr != end) bad_value(key, value);
  return out;
}

std::int64_t to_non_negative(const std::string& key, const std::string& value) {
  const auto v = to_int(key, value);
  if (v < 0) bad_value(key, value);
  return v;
}

bool to_bool(const std::string& key, std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  if (value == "true" || value == "1" || value == "yes" || value == "on") return true;
  if (value == "false" || value == "0" || value == "no" || value == "off") return false;
  bad_value(key, value);
}

std::vector<std::string> to_list(const std::string& value) {
  std::vector<std::string> out;
  std::size_t start = 0;
  while (start <= value.size()) {
    const auto comma = value.find(',', start);
    std::string item = value.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
    trim(item);
    out.push_back(std::move(item));
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  return out;
}

}  // namespace

AnalysisConfig default_config() {
  AnalysisConfig c;
  c.class_map = {
      "MISSING_HARD_HAT",
      "MISSING_SAFETY_VEST",
      "MISSING_EYE_PROTECTION",
      "WORKING_AT_HEIGHT_WITHOUT_PROTECTION",
      "UNGUARDED_EDGE",
      "SCAFFOLD_VIOLATION",
      "LADDER_UNSAFE_POSITION",
      "EXPOSED_WIRING",
      "FIRE_HAZARD",
      "DEBRIS_ACCUMULATION",
      "TRIP_HAZARD",
      "UNSAFE_EQUIPMENT_OPERATION",
      "DAMAGED_TOOLS",
  };
  return c;
}

AnalysisConfig load_config(const std::string& path) {
  AnalysisConfig c = default_config();
  std::ifstream f(path);
  if (!f) {
    sitescan::core::get_logger("config").warn("config file not found, using defaults", {{"path", path}});
    return c;
  }

  std::string line;
  std::string key;
  std::string value;
  while (std::getline(f, line)) {
    trim(line);
    if (line.empty() || line[0] == '#') continue;
    if (!parse_line(line, key, value)) continue;

    if (key == "log_level") {
      if (!sitescan::core::parse_log_level(value, c.logging.level)) bad_value(key, value);
    }
    else if (key == "log_json") c.logging.json = to_bool(key, value);
    else if (key == "log_file") {
      if (value.empty()) c.logging.log_file.reset();
      else c.logging.log_file = value;
    }
    else if (key == "taxonomy_path") c.taxonomy_path = value;
    else if (key == "health_path") c.health_path = value;
    else if (key == "inference_backend") {
      if (value == "onnx") c.inference_backend = InferenceBackendType::Onnx;
      else if (value == "mock") c.inference_backend = InferenceBackendType::Mock;
      else bad_value(key, value);
    }
    else if (key == "multimodal_enabled") c.multimodal_enabled = to_bool(key, value);
    else if (key == "multimodal_model_path") c.multimodal_model_path = value;
    else if (key == "detector_enabled") c.detector_enabled = to_bool(key, value);
    else if (key == "detector_model_path") c.detector_model_path = value;
    else if (key == "input_width") c.input_width = static_cast<std::uint32_t>(to_non_negative(key, value));
    else if (key == "input_height") c.input_height = static_cast<std::uint32_t>(to_non_negative(key, value));
    else if (key == "normalize_mean") c.normalize_mean = to_float(key, value);
    else if (key == "normalize_scale") c.normalize_scale = to_float(key, value);
    else if (key == "detector_confidence_threshold") c.detector_confidence_threshold = to_float(key, value);
    else if (key == "class_map") c.class_map = to_list(value);
    else if (key == "local_timeout_ms") c.local_timeout = std::chrono::milliseconds(to_non_negative(key, value));
    else if (key == "remote_endpoint") c.remote_endpoint = value;
    else if (key == "remote_api_key") c.remote_api_key = value;
    else if (key == "remote_timeout_ms") c.remote_timeout = std::chrono::milliseconds(to_non_negative(key, value));
    else if (key == "remote_retry_timeout_ms") c.remote_retry_timeout = std::chrono::milliseconds(to_non_negative(key, value));
    else if (key == "remote_concurrency") c.remote_concurrency = to_non_negative(key, value);
    else if (key == "hybrid_mode") c.hybrid_mode = to_bool(key, value);
    else if (key == "frame_interval_ms") c.frame_interval = std::chrono::milliseconds(to_non_negative(key, value));
    else if (key == "iou_threshold") c.iou_threshold = to_float(key, value);
    else if (key == "agreement_boost") c.agreement_boost = to_float(key, value);
    else if (key == "weight_multimodal") c.weight_multimodal = to_float(key, value);
    else if (key == "weight_remote") c.weight_remote = to_float(key, value);
    else if (key == "weight_detector") c.weight_detector = to_float(key, value);
    else if (key == "auto_select_threshold") c.auto_select_threshold = to_float(key, value);
    else if (key == "display_threshold") c.display_threshold = to_float(key, value);
  }
  return c;
}

sitescan::analysis::OrchestratorConfig orchestrator_config(const AnalysisConfig& config) {
  sitescan::analysis::OrchestratorConfig out;
  out.hybrid_mode = config.hybrid_mode;
  out.remote_retry_timeout = config.remote_retry_timeout;
  out.remote_concurrency = static_cast<std::ptrdiff_t>(std::max<std::int64_t>(1, config.remote_concurrency));
  out.frame_interval = config.frame_interval;
  out.fusion.iou_threshold = config.iou_threshold;
  out.fusion.agreement_boost = config.agreement_boost;
  out.fusion.weight_multimodal = config.weight_multimodal;
  out.fusion.weight_remote = config.weight_remote;
  out.fusion.weight_detector = config.weight_detector;
  out.thresholds.auto_select = config.auto_select_threshold;
  out.thresholds.display = config.display_threshold;
  return out;
}

}  // namespace sitescan::app
