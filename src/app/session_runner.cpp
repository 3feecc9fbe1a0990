#include <sitescan/app/session_runner.hpp>
#include <algorithm>
#include <atomic>
#include <thread>
#include <vector>

namespace sitescan::app {

void analyze_batch(sitescan::analysis::SmartAnalysisOrchestrator& orchestrator,
                   const std::vector<BatchItem>& items,
                   const SessionCallback& callback) {
  for (std::size_t i = 0; i < items.size(); ++i) {
    auto session = orchestrator.submit_photo(items[i].image, items[i].context);
    if (callback) callback(i, session);
  }
}

void analyze_batch_parallel(sitescan::analysis::SmartAnalysisOrchestrator& orchestrator,
                            const std::vector<BatchItem>& items,
                            const SessionCallback& callback,
                            std::size_t max_concurrency) {
  const std::size_t n = items.size();
  if (n == 0) return;

  const std::size_t limit = max_concurrency > 0 ? max_concurrency : kDefaultBatchConcurrency;
  const std::size_t workers = std::min(limit, n);
  if (workers <= 1) {
    analyze_batch(orchestrator, items, callback);
    return;
  }

  std::atomic<std::size_t> next{0};
  auto worker = [&]() {
    for (;;) {
      const std::size_t idx = next.fetch_add(1);
      if (idx >= n) break;
      auto session = orchestrator.submit_photo(items[idx].image, items[idx].context);
      if (callback) callback(idx, session);
    }
  };

  std::vector<std::thread> threads;
  threads.reserve(workers);
  for (std::size_t i = 0; i < workers; ++i) {
    threads.emplace_back(worker);
  }
  for (auto& t : threads) {
    t.join();
  }
}

}  // namespace sitescan::app
