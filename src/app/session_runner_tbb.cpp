#include <sitescan/app/session_runner_tbb.hpp>

#ifdef SITESCAN_HAS_TBB

#include <tbb/blocked_range.h>
#include <tbb/parallel_for.h>
#include <tbb/task_arena.h>

namespace sitescan::app {

void analyze_batch_tbb(sitescan::analysis::SmartAnalysisOrchestrator& orchestrator,
                       const std::vector<BatchItem>& items,
                       const SessionCallback& callback,
                       std::size_t max_concurrency) {
  if (items.empty()) return;

  const std::size_t limit = max_concurrency > 0 ? max_concurrency : kDefaultBatchConcurrency;
  tbb::task_arena arena(static_cast<int>(limit));
  arena.execute([&] {
    tbb::parallel_for(
        tbb::blocked_range<std::size_t>(0, items.size(), 1),
        [&orchestrator, &items, &callback](const tbb::blocked_range<std::size_t>& range) {
          for (std::size_t i = range.begin(); i != range.end(); ++i) {
            auto session = orchestrator.submit_photo(items[i].image, items[i].context);
            if (callback) callback(i, session);
          }
        });
  });
}

}  // namespace sitescan::app

#endif  // SITESCAN_HAS_TBB
