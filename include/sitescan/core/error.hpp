#pragma once

#include <cstdint>
#include <string_view>

namespace sitescan::core {

/// Failure kinds an analyzer backend reports; used with std::expected.
/// Adapters convert every raw engine/transport failure into one of these.
enum class BackendError : std::uint8_t {
  ModelNotLoaded,
  Timeout,
  MalformedInput,
  RemoteUnauthorized,
  RemoteRateLimited,
  TransientNetwork,
  Cancelled,
  Internal,
};

/// Session-level error kinds seen by the orchestrator and its caller.
/// Only MalformedInput, NoBackendAvailable and Cancelled end a session as Failed;
/// the rest are absorbed through retry/fallback.
enum class AnalysisError : std::uint8_t {
  BackendUnavailable,
  BackendTimeout,
  BackendRateLimited,
  MalformedInput,
  NoBackendAvailable,
  PartialFusionFailure,
  Cancelled,
};

/// Maps an adapter failure to the session-level kind that drives retry/fallback policy.
[[nodiscard]] AnalysisError classify(BackendError error) noexcept;

[[nodiscard]] std::string_view to_string(BackendError error) noexcept;
[[nodiscard]] std::string_view to_string(AnalysisError error) noexcept;

}  // namespace sitescan::core
