#pragma once

#include <sitescan/analysis/orchestrator.hpp>
#include <sitescan/core/image.hpp>
#include <sitescan/core/session.hpp>
#include <cstddef>
#include <functional>
#include <vector>

namespace sitescan::app {

/// One photo of a batch and its capture metadata.
struct BatchItem {
  sitescan::core::Image image;
  sitescan::core::CaptureContext context;
};

/// Callback for each finished session with the index of its batch item.
/// Must be thread-safe when used with the parallel runners.
using SessionCallback =
    std::function<void(std::size_t index, const sitescan::core::AnalysisSession&)>;

/// Default number of photos analyzed at once in a batch.
inline constexpr std::size_t kDefaultBatchConcurrency = 3;

/// Analyzes photos one after another; callback in item order.
void analyze_batch(sitescan::analysis::SmartAnalysisOrchestrator& orchestrator,
                   const std::vector<BatchItem>& items,
                   const SessionCallback& callback);

/// Analyzes photos on a small thread pool. Each item is submitted as a photo capture;
/// local inference is still serialized by the orchestrator's device slot.
/// max_concurrency 0 = kDefaultBatchConcurrency.
void analyze_batch_parallel(sitescan::analysis::SmartAnalysisOrchestrator& orchestrator,
                            const std::vector<BatchItem>& items,
                            const SessionCallback& callback,
                            std::size_t max_concurrency = kDefaultBatchConcurrency);

}  // namespace sitescan::app
