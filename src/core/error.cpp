#include <sitescan/core/error.hpp>

namespace sitescan::core {

AnalysisError classify(BackendError error) noexcept {
  switch (error) {
    case BackendError::Timeout:
    case BackendError::TransientNetwork:
      return AnalysisError::BackendTimeout;
    case BackendError::RemoteRateLimited:
      return AnalysisError::BackendRateLimited;
    case BackendError::MalformedInput:
      return AnalysisError::MalformedInput;
    case BackendError::Cancelled:
      return AnalysisError::Cancelled;
    case BackendError::ModelNotLoaded:
    case BackendError::RemoteUnauthorized:
    case BackendError::Internal:
    default:
      return AnalysisError::BackendUnavailable;
  }
}

std::string_view to_string(BackendError error) noexcept {
  switch (error) {
    case BackendError::ModelNotLoaded:
      return "ModelNotLoaded";
    case BackendError::Timeout:
      return "Timeout";
    case BackendError::MalformedInput:
      return "MalformedInput";
    case BackendError::RemoteUnauthorized:
      return "RemoteUnauthorized";
    case BackendError::RemoteRateLimited:
      return "RemoteRateLimited";
    case BackendError::TransientNetwork:
      return "TransientNetwork";
    case BackendError::Cancelled:
      return "Cancelled";
    case BackendError::Internal:
      return "Internal";
  }
  return "Unknown";
}

std::string_view to_string(AnalysisError error) noexcept {
  switch (error) {
    case AnalysisError::BackendUnavailable:
      return "BackendUnavailable";
    case AnalysisError::BackendTimeout:
      return "BackendTimeout";
    case AnalysisError::BackendRateLimited:
      return "BackendRateLimited";
    case AnalysisError::MalformedInput:
      return "MalformedInput";
    case AnalysisError::NoBackendAvailable:
      return "NoBackendAvailable";
    case AnalysisError::PartialFusionFailure:
      return "PartialFusionFailure";
    case AnalysisError::Cancelled:
      return "Cancelled";
  }
  return "Unknown";
}

}  // namespace sitescan::core
