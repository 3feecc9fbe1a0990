#include <sitescan/analysis/analyzer_backend.hpp>

namespace sitescan::analysis {

std::chrono::milliseconds default_timeout(sitescan::core::BackendTier tier) noexcept {
  using namespace std::chrono_literals;
  return tier == sitescan::core::BackendTier::Remote ? 10'000ms : 2'000ms;
}

}  // namespace sitescan::analysis
