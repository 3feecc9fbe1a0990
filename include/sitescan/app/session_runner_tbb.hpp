#pragma once

#include <sitescan/app/session_runner.hpp>

#ifdef SITESCAN_HAS_TBB

namespace sitescan::app {

/// Analyzes a batch of photos in parallel using TBB, inside a task arena limited to
/// max_concurrency threads (0 = kDefaultBatchConcurrency).
///
/// Every item is submitted to the same orchestrator as a photo capture. The callback may
/// be invoked from TBB worker threads in any order and must be thread-safe.
void analyze_batch_tbb(sitescan::analysis::SmartAnalysisOrchestrator& orchestrator,
                       const std::vector<BatchItem>& items,
                       const SessionCallback& callback,
                       std::size_t max_concurrency = kDefaultBatchConcurrency);

}  // namespace sitescan::app

#endif  // SITESCAN_HAS_TBB
