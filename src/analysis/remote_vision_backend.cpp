#include <sitescan/analysis/remote_vision_backend.hpp>
#include <sitescan/core/logging.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <exception>

namespace sitescan::analysis {

namespace sc = sitescan::core;
using json = nlohmann::json;

namespace {

const sc::Logger& logger() {
  static const sc::Logger log = sc::get_logger("backend.remote");
  return log;
}

sc::BackendError classify_status(long status) {
  switch (status) {
    case 400:
    case 413:
    case 415:
    case 422:
      return sc::BackendError::MalformedInput;
    case 401:
    case 403:
      return sc::BackendError::RemoteUnauthorized;
    case 429:
      return sc::BackendError::RemoteRateLimited;
    case 408:
    case 504:
      return sc::BackendError::Timeout;
    default:
      return sc::BackendError::TransientNetwork;
  }
}

}  // namespace

std::string base64_encode(const std::byte* data, std::size_t size) {
  static constexpr char kAlphabet[] =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  std::string out;
  out.reserve(((size + 2) / 3) * 4);
  std::size_t i = 0;
  for (; i + 2 < size; i += 3) {
    const auto n = (std::to_integer<std::uint32_t>(data[i]) << 16) |
                   (std::to_integer<std::uint32_t>(data[i + 1]) << 8) |
                   std::to_integer<std::uint32_t>(data[i + 2]);
    out += kAlphabet[(n >> 18) & 0x3F];
    out += kAlphabet[(n >> 12) & 0x3F];
    out += kAlphabet[(n >> 6) & 0x3F];
    out += kAlphabet[n & 0x3F];
  }
  if (i < size) {
    std::uint32_t n = std::to_integer<std::uint32_t>(data[i]) << 16;
    if (i + 1 < size) n |= std::to_integer<std::uint32_t>(data[i + 1]) << 8;
    out += kAlphabet[(n >> 18) & 0x3F];
    out += kAlphabet[(n >> 12) & 0x3F];
    out += i + 1 < size ? kAlphabet[(n >> 6) & 0x3F] : '=';
    out += '=';
  }
  return out;
}

RemoteVisionBackend::RemoteVisionBackend(RemoteVisionOptions options,
                                         std::shared_ptr<IVisionServiceClient> client)
    : options_(std::move(options)), client_(std::move(client)) {}

bool RemoteVisionBackend::available() const {
  if (!client_ || unauthorized_.load(std::memory_order_acquire)) return false;
  std::lock_guard lock(key_mutex_);
  return !options_.endpoint.empty() && !options_.api_key.empty();
}

void RemoteVisionBackend::set_api_key(std::string api_key) {
  std::lock_guard lock(key_mutex_);
  options_.api_key = std::move(api_key);
  unauthorized_.store(false, std::memory_order_release);
}

std::string RemoteVisionBackend::build_request_body(const sc::Image& image,
                                                    const sc::CaptureContext& context) const {
  json body;
  body["image"] = base64_encode(image.data().data(), image.size_bytes());
  body["format"] = sc::to_string(image.format());
  body["width"] = image.width();
  body["height"] = image.height();
  body["work_type"] = context.work_type;
  body["captured_at_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                               context.captured_at.time_since_epoch())
                               .count();
  if (context.location) {
    body["location"] = {{"lat", context.location->latitude}, {"lon", context.location->longitude}};
  }
  return body.dump();
}

DetectionsOrError RemoteVisionBackend::parse_response(const std::string& body) const {
  const json doc = json::parse(body, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded() || !doc.is_object() || !doc.contains("detections") ||
      !doc["detections"].is_array()) {
    return std::unexpected(sc::BackendError::Internal);
  }

  const auto now = std::chrono::system_clock::now();
  std::vector<sc::HazardDetection> detections;
  for (const auto& item : doc["detections"]) {
    if (!item.is_object() || !item.contains("hazard_type") || !item.contains("confidence")) {
      return std::unexpected(sc::BackendError::Internal);
    }
    const auto& type = item["hazard_type"];
    const auto& confidence = item["confidence"];
    if (!type.is_string() || !confidence.is_number()) {
      return std::unexpected(sc::BackendError::Internal);
    }
    const double score = confidence.get<double>();
    if (std::isnan(score)) continue;

    sc::HazardDetection d;
    d.hazard_type = type.get<std::string>();
    d.confidence = static_cast<float>(std::clamp(score, 0.0, 1.0));
    d.source = options_.id;
    d.source_tier = sc::BackendTier::Remote;
    d.detected_at = now;
    if (item.contains("box") && item["box"].is_array() && item["box"].size() == 4) {
      const auto& box = item["box"];
      if (std::all_of(box.begin(), box.end(), [](const json& v) { return v.is_number(); })) {
        d.region = sc::BBox{box[0].get<float>(), box[1].get<float>(), box[2].get<float>(),
                            box[3].get<float>()};
      }
    }
    detections.push_back(std::move(d));
  }
  return detections;
}

DetectionsOrError RemoteVisionBackend::analyze(const sc::Image& image,
                                               const sc::CaptureContext& context,
                                               const sc::CancellationToken& cancel,
                                               std::chrono::milliseconds budget) {
  if (!image.well_formed()) {
    return std::unexpected(sc::BackendError::MalformedInput);
  }
  if (!available()) {
    return std::unexpected(sc::BackendError::RemoteUnauthorized);
  }
  if (cancel.cancelled()) {
    return std::unexpected(sc::BackendError::Cancelled);
  }

  try {
    VisionRequest request;
    {
      std::lock_guard lock(key_mutex_);
      request.endpoint = options_.endpoint;
      request.api_key = options_.api_key;
    }
    request.body = build_request_body(image, context);
    request.timeout = std::min(budget, options_.timeout);

    auto response = client_->post(request);
    if (cancel.cancelled()) {
      return std::unexpected(sc::BackendError::Cancelled);
    }
    if (!response) {
      return std::unexpected(response.error() == TransportError::Timeout
                                 ? sc::BackendError::Timeout
                                 : sc::BackendError::TransientNetwork);
    }
    if (response->status < 200 || response->status >= 300) {
      const sc::BackendError error = classify_status(response->status);
      if (error == sc::BackendError::RemoteUnauthorized) {
        unauthorized_.store(true, std::memory_order_release);
      }
      logger().warn("service rejected request",
                    {{"backend", options_.id},
                     {"status", std::to_string(response->status)},
                     {"error", std::string(sc::to_string(error))}});
      return std::unexpected(error);
    }
    return parse_response(response->body);
  } catch (const std::exception& e) {
    logger().error("remote analysis failed", {{"backend", options_.id}, {"reason", e.what()}});
    return std::unexpected(sc::BackendError::Internal);
  }
}

}  // namespace sitescan::analysis
