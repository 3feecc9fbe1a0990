#pragma once

#include <sitescan/analysis/vision_service_client.hpp>

namespace sitescan::analysis {

/// libcurl transport. Each post() uses its own easy handle, so concurrent calls are safe.
/// The API key is sent as "Authorization: Bearer <key>".
class CurlVisionClient : public IVisionServiceClient {
 public:
  CurlVisionClient();
  ~CurlVisionClient() override;

  CurlVisionClient(const CurlVisionClient&) = delete;
  CurlVisionClient& operator=(const CurlVisionClient&) = delete;

  [[nodiscard]] std::expected<VisionResponse, TransportError> post(
      const VisionRequest& request) override;
};

}  // namespace sitescan::analysis
