#include <sitescan/app/session_runner.hpp>
#include "support/fake_backends.hpp"
#include <gtest/gtest.h>
#include <mutex>
#include <set>

namespace sa = sitescan::analysis;
namespace sapp = sitescan::app;
namespace sc = sitescan::core;
using sitescan::testing::ScriptedBackend;
using sitescan::testing::detection;
using sitescan::testing::make_rgb_image;
using namespace std::chrono_literals;

namespace {

class SessionRunnerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    backend_->script({std::vector<sc::HazardDetection>{
        detection("MISSING_HARD_HAT", 0.9f, {0.1f, 0.1f, 0.2f, 0.2f}, "gemma", sc::BackendTier::OnDeviceMultimodal)}});
    orchestrator_ = std::make_unique<sa::SmartAnalysisOrchestrator>(
        std::vector<std::shared_ptr<sa::IAnalyzerBackend>>{backend_},
        std::make_shared<const sa::HazardTaxonomy>(sa::default_taxonomy()), nullptr,
        sa::OrchestratorConfig{}, health_);
  }

  std::vector<sapp::BatchItem> items(std::size_t n) {
    std::vector<sapp::BatchItem> out;
    for (std::size_t i = 0; i < n; ++i) {
      sapp::BatchItem item{make_rgb_image(), {}};
      item.context.correlation_id = "photo-" + std::to_string(i);
      out.push_back(std::move(item));
    }
    return out;
  }

  sa::BackendHealthRegistry health_;
  std::shared_ptr<ScriptedBackend> backend_ =
      std::make_shared<ScriptedBackend>("gemma", sc::BackendTier::OnDeviceMultimodal);
  std::unique_ptr<sa::SmartAnalysisOrchestrator> orchestrator_;
};

}  // namespace

TEST_F(SessionRunnerTest, SequentialCallsBackInOrder) {
  std::vector<std::size_t> order;
  sapp::analyze_batch(*orchestrator_, items(4), [&](std::size_t i, const sc::AnalysisSession& s) {
    EXPECT_TRUE(s.completed());
    EXPECT_EQ(s.correlation_id(), "photo-" + std::to_string(i));
    order.push_back(i);
  });
  EXPECT_EQ(order, (std::vector<std::size_t>{0, 1, 2, 3}));
}

TEST_F(SessionRunnerTest, ParallelVisitsEveryItemOnce) {
  std::mutex mutex;
  std::multiset<std::size_t> seen;
  sapp::analyze_batch_parallel(*orchestrator_, items(7), [&](std::size_t i, const sc::AnalysisSession& s) {
    EXPECT_TRUE(s.completed());
    EXPECT_EQ(s.kind(), sc::SubmissionKind::Photo);
    std::lock_guard lock(mutex);
    seen.insert(i);
  });
  ASSERT_EQ(seen.size(), 7u);
  for (std::size_t i = 0; i < 7; ++i) EXPECT_EQ(seen.count(i), 1u);
  EXPECT_EQ(backend_->calls(), 7);
}

TEST_F(SessionRunnerTest, EmptyBatchDoesNotCallBack) {
  int calls = 0;
  sapp::analyze_batch_parallel(*orchestrator_, {}, [&](std::size_t, const sc::AnalysisSession&) { ++calls; });
  sapp::analyze_batch(*orchestrator_, {}, [&](std::size_t, const sc::AnalysisSession&) { ++calls; });
  EXPECT_EQ(calls, 0);
}

TEST_F(SessionRunnerTest, NullCallbackIsAllowed) {
  sapp::analyze_batch_parallel(*orchestrator_, items(3), nullptr, 0);
  EXPECT_EQ(backend_->calls(), 3);
}
