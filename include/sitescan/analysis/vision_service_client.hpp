#pragma once

#include <chrono>
#include <cstdint>
#include <expected>
#include <string>

namespace sitescan::analysis {

/// One POST to the remote vision service.
struct VisionRequest {
  std::string endpoint;
  std::string api_key;
  std::string body;  // JSON
  std::chrono::milliseconds timeout{10'000};
};

struct VisionResponse {
  long status{0};
  std::string body;
};

/// Failures below HTTP: the request never produced a status code.
enum class TransportError : std::uint8_t {
  Timeout,
  ConnectionFailed,
  Other,
};

/// Transport used by RemoteVisionBackend; CurlVisionClient in production,
/// scripted fakes in tests. Implementations must allow concurrent post() calls.
class IVisionServiceClient {
 public:
  virtual ~IVisionServiceClient() = default;

  [[nodiscard]] virtual std::expected<VisionResponse, TransportError> post(
      const VisionRequest& request) = 0;
};

}  // namespace sitescan::analysis
