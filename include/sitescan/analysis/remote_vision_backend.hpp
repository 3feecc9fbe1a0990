#pragma once

#include <sitescan/analysis/analyzer_backend.hpp>
#include <sitescan/analysis/vision_service_client.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>

namespace sitescan::analysis {

struct RemoteVisionOptions {
  sitescan::core::BackendId id{"remote-vision"};
  std::string endpoint;
  std::string api_key;
  std::set<std::string> capabilities;
  std::chrono::milliseconds timeout{default_timeout(sitescan::core::BackendTier::Remote)};
};

/// Remote vision service adapter.
///
/// Request body (JSON): image (base64), format, width, height, work_type,
/// captured_at_ms and optional location {lat, lon}.
/// Response body: {"detections": [{"hazard_type": str, "confidence": float,
/// "box": [x, y, w, h]}]} with the box normalized and optional.
///
/// HTTP outcome mapping: 2xx -> detections; 400/413/415/422 -> MalformedInput;
/// 401/403 -> RemoteUnauthorized (backend becomes unavailable); 429 -> RemoteRateLimited;
/// 408/504 or transport timeout -> Timeout; other failures -> TransientNetwork;
/// unparseable body -> Internal.
class RemoteVisionBackend : public IAnalyzerBackend {
 public:
  RemoteVisionBackend(RemoteVisionOptions options, std::shared_ptr<IVisionServiceClient> client);

  [[nodiscard]] const sitescan::core::BackendId& id() const noexcept override { return options_.id; }
  [[nodiscard]] sitescan::core::BackendTier tier() const noexcept override {
    return sitescan::core::BackendTier::Remote;
  }
  [[nodiscard]] sitescan::core::CostClass cost_class() const noexcept override {
    return sitescan::core::CostClass::RemoteMetered;
  }
  [[nodiscard]] std::set<std::string> capabilities() const override { return options_.capabilities; }

  /// Configured with endpoint and credential, and not rejected as unauthorized.
  [[nodiscard]] bool available() const override;
  [[nodiscard]] std::chrono::milliseconds timeout() const noexcept override { return options_.timeout; }

  [[nodiscard]] DetectionsOrError analyze(const sitescan::core::Image& image,
                                          const sitescan::core::CaptureContext& context,
                                          const sitescan::core::CancellationToken& cancel,
                                          std::chrono::milliseconds budget) override;

  /// Clears the unauthorized flag, e.g. after the credential was refreshed.
  void set_api_key(std::string api_key);

 private:
  [[nodiscard]] std::string build_request_body(const sitescan::core::Image& image,
                                               const sitescan::core::CaptureContext& context) const;
  [[nodiscard]] DetectionsOrError parse_response(const std::string& body) const;

  RemoteVisionOptions options_;
  std::shared_ptr<IVisionServiceClient> client_;
  std::atomic<bool> unauthorized_{false};
  mutable std::mutex key_mutex_;
};

/// Standard base64 (RFC 4648) with padding.
[[nodiscard]] std::string base64_encode(const std::byte* data, std::size_t size);

}  // namespace sitescan::analysis
