#include <sitescan/app/backend_factory.hpp>
#include <sitescan/app/config.hpp>
#include <sitescan/app/session_runner.hpp>
#include "support/fake_backends.hpp"
#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <memory>
#include <vector>

namespace {

namespace sa = sitescan::analysis;
namespace sapp = sitescan::app;
namespace sc = sitescan::core;
using sitescan::testing::ScriptedBackend;
using sitescan::testing::detection;
using sitescan::testing::make_rgb_image;
using namespace std::chrono_literals;

std::shared_ptr<const sa::HazardTaxonomy> taxonomy() {
  return std::make_shared<const sa::HazardTaxonomy>(sa::default_taxonomy());
}

const sc::TagRecommendation* find_tag(const sc::AnalysisSession& s, const std::string& id) {
  const auto& recs = s.recommendations();
  const auto it = std::find_if(recs.begin(), recs.end(), [&](const auto& r) { return r.tag_id == id; });
  return it == recs.end() ? nullptr : &*it;
}

}  // namespace

TEST(FullAnalysis, MockModelsEndToEnd) {
  auto config = sapp::default_config();
  config.input_width = 64;
  config.input_height = 64;
  const auto tax = taxonomy();
  sa::BackendHealthRegistry health;
  sa::SmartAnalysisOrchestrator orchestrator(sapp::build_backends(config, *tax), tax, nullptr,
                                             sapp::orchestrator_config(config), health);

  const auto session = orchestrator.submit_photo(make_rgb_image(320, 240));
  ASSERT_TRUE(session.completed()) << session.user_message();
  EXPECT_EQ(session.contributing_backends(), (std::vector<sc::BackendId>{"multimodal-on-device"}));
  EXPECT_FALSE(session.degraded_capability());
  ASSERT_EQ(session.fused_hazards().size(), 2u);
  EXPECT_EQ(session.fused_hazards()[0].hazard_type, "MISSING_HARD_HAT");
  EXPECT_NEAR(session.fused_hazards()[0].confidence, 0.92f, 1e-5f);
  EXPECT_EQ(session.fused_hazards()[1].hazard_type, "DEBRIS_ACCUMULATION");

  EXPECT_EQ(session.auto_select_tags(), (std::set<std::string>{"ppe-hard-hat-required"}));
  const auto* debris = find_tag(session, "housekeeping-debris");
  ASSERT_NE(debris, nullptr);
  EXPECT_EQ(debris->reason, sc::RecommendationReason::Suggested);
}

TEST(FullAnalysis, BatchOfPhotos) {
  auto config = sapp::default_config();
  config.input_width = 32;
  config.input_height = 32;
  const auto tax = taxonomy();
  sa::BackendHealthRegistry health;
  sa::SmartAnalysisOrchestrator orchestrator(sapp::build_backends(config, *tax), tax, nullptr,
                                             sapp::orchestrator_config(config), health);

  std::vector<sapp::BatchItem> items;
  for (int i = 0; i < 6; ++i) items.push_back({make_rgb_image(64, 48), {}});
  std::atomic<int> completed{0};
  sapp::analyze_batch_parallel(orchestrator, items, [&](std::size_t, const sc::AnalysisSession& s) {
    if (s.completed()) ++completed;
  });
  EXPECT_EQ(completed.load(), 6);
  EXPECT_EQ(health.snapshot("multimodal-on-device").samples, 6u);
}

TEST(FullAnalysis, SingleOnDeviceDetectionIsAutoSelected) {
  auto mm = std::make_shared<ScriptedBackend>("gemma", sc::BackendTier::OnDeviceMultimodal);
  mm->script({std::vector<sc::HazardDetection>{detection("MISSING_HARD_HAT", 0.92f, {0.3f, 0.1f, 0.2f, 0.25f},
                                                         "gemma", sc::BackendTier::OnDeviceMultimodal)}});
  sa::BackendHealthRegistry health;
  sa::SmartAnalysisOrchestrator orchestrator({mm}, taxonomy(), nullptr, {}, health);

  const auto session = orchestrator.submit_photo(make_rgb_image());
  ASSERT_TRUE(session.completed());
  ASSERT_EQ(session.fused_hazards().size(), 1u);
  EXPECT_NEAR(session.fused_hazards()[0].confidence, 0.92f, 1e-5f);
  EXPECT_EQ(session.auto_select_tags().count("ppe-hard-hat-required"), 1u);
}

TEST(FullAnalysis, AgreementAcrossBackendsIsSuggested) {
  auto mm = std::make_shared<ScriptedBackend>("gemma", sc::BackendTier::OnDeviceMultimodal);
  auto remote = std::make_shared<ScriptedBackend>("vertex", sc::BackendTier::Remote);
  mm->script({std::vector<sc::HazardDetection>{detection("MISSING_HARD_HAT", 0.60f, {0.f, 0.f, 0.3f, 0.3f},
                                                         "gemma", sc::BackendTier::OnDeviceMultimodal)}});
  remote->script({std::vector<sc::HazardDetection>{detection("MISSING_HARD_HAT", 0.50f, {0.1f, 0.f, 0.3f, 0.3f},
                                                             "vertex", sc::BackendTier::Remote)}});
  sa::OrchestratorConfig config;
  config.hybrid_mode = true;
  sa::BackendHealthRegistry health;
  sa::SmartAnalysisOrchestrator orchestrator({mm, remote}, taxonomy(), nullptr, config, health);

  const auto session = orchestrator.submit_photo(make_rgb_image());
  ASSERT_TRUE(session.completed());
  ASSERT_EQ(session.fused_hazards().size(), 1u);
  EXPECT_NEAR(session.fused_hazards()[0].confidence, 0.60f, 1e-3f);
  const auto* tag = find_tag(session, "ppe-hard-hat-required");
  ASSERT_NE(tag, nullptr);
  EXPECT_EQ(tag->reason, sc::RecommendationReason::Suggested);
  EXPECT_TRUE(session.auto_select_tags().empty());
}

TEST(FullAnalysis, AllBackendsUnavailableFallsBackToManualTagging) {
  auto mm = std::make_shared<ScriptedBackend>("gemma", sc::BackendTier::OnDeviceMultimodal);
  auto remote = std::make_shared<ScriptedBackend>("vertex", sc::BackendTier::Remote);
  auto detector = std::make_shared<ScriptedBackend>("yolo", sc::BackendTier::LocalDetector);
  mm->script({std::unexpected(sc::BackendError::ModelNotLoaded)});
  remote->script({std::unexpected(sc::BackendError::RemoteUnauthorized)});
  detector->script({std::unexpected(sc::BackendError::Internal)});
  sa::BackendHealthRegistry health;
  sa::SmartAnalysisOrchestrator orchestrator({mm, remote, detector}, taxonomy(), nullptr, {}, health);

  const auto session = orchestrator.submit_photo(make_rgb_image());
  EXPECT_EQ(session.state(), sc::SessionState::Failed);
  EXPECT_EQ(session.error(), sc::AnalysisError::NoBackendAvailable);
  EXPECT_TRUE(session.recommendations().empty());
  EXPECT_NE(session.user_message().find("manually"), std::string::npos);
}

TEST(FullAnalysis, HybridRemoteTimeoutKeepsLocalResults) {
  auto mm = std::make_shared<ScriptedBackend>("gemma", sc::BackendTier::OnDeviceMultimodal);
  auto remote = std::make_shared<ScriptedBackend>("vertex", sc::BackendTier::Remote);
  mm->script({std::vector<sc::HazardDetection>{
      detection("MISSING_HARD_HAT", 0.9f, {0.1f, 0.1f, 0.1f, 0.1f}, "gemma", sc::BackendTier::OnDeviceMultimodal),
      detection("TRIP_HAZARD", 0.6f, {0.5f, 0.8f, 0.2f, 0.1f}, "gemma", sc::BackendTier::OnDeviceMultimodal),
      detection("FIRE_HAZARD", 0.85f, {0.7f, 0.2f, 0.2f, 0.2f}, "gemma", sc::BackendTier::OnDeviceMultimodal)}});
  remote->set_timeout(100ms);
  remote->set_delay(3000ms);
  sa::OrchestratorConfig config;
  config.hybrid_mode = true;
  sa::BackendHealthRegistry health;
  sa::SmartAnalysisOrchestrator orchestrator({mm, remote}, taxonomy(), nullptr, config, health);

  const auto session = orchestrator.submit_photo(make_rgb_image());
  ASSERT_TRUE(session.completed());
  EXPECT_FALSE(session.degraded_capability());
  EXPECT_EQ(session.fused_hazards().size(), 3u);
  EXPECT_EQ(session.contributing_backends(), (std::vector<sc::BackendId>{"gemma"}));
  EXPECT_LT(health.snapshot("vertex").success_rate, 1.f);
  EXPECT_EQ(remote->calls(), 1);
}

TEST(FullAnalysis, NoDetectionsStillCompletes) {
  auto mm = std::make_shared<ScriptedBackend>("gemma", sc::BackendTier::OnDeviceMultimodal);
  auto remote = std::make_shared<ScriptedBackend>("vertex", sc::BackendTier::Remote);
  sa::OrchestratorConfig config;
  config.hybrid_mode = true;
  sa::BackendHealthRegistry health;
  sa::SmartAnalysisOrchestrator orchestrator({mm, remote}, taxonomy(), nullptr, config, health);

  const auto session = orchestrator.submit_photo(make_rgb_image());
  EXPECT_TRUE(session.completed());
  EXPECT_TRUE(session.fused_hazards().empty());
  EXPECT_TRUE(session.recommendations().empty());
}

TEST(FullAnalysis, PhotosAreNeverThrottled) {
  auto mm = std::make_shared<ScriptedBackend>("gemma", sc::BackendTier::OnDeviceMultimodal);
  sa::OrchestratorConfig config;
  config.frame_interval = 10s;
  sa::BackendHealthRegistry health;
  sa::SmartAnalysisOrchestrator orchestrator({mm}, taxonomy(), nullptr, config, health);

  ASSERT_TRUE(orchestrator.submit_frame(make_rgb_image()).has_value());
  EXPECT_FALSE(orchestrator.submit_frame(make_rgb_image()).has_value());
  for (int i = 0; i < 5; ++i) EXPECT_TRUE(orchestrator.submit_photo(make_rgb_image()).completed());
  orchestrator.wait_idle();
}

TEST(FullAnalysis, OfflineUsesOnDeviceOnly) {
  auto remote = std::make_shared<ScriptedBackend>("vertex", sc::BackendTier::Remote);
  auto detector = std::make_shared<ScriptedBackend>("yolo", sc::BackendTier::LocalDetector);
  auto connectivity = std::make_shared<sa::StaticConnectivity>(sa::ConnectivityQuality::None);
  sa::BackendHealthRegistry health;
  sa::SmartAnalysisOrchestrator orchestrator({remote, detector}, taxonomy(), connectivity, {}, health);

  const auto session = orchestrator.submit_photo(make_rgb_image());
  ASSERT_TRUE(session.completed());
  EXPECT_TRUE(session.degraded_capability());
  EXPECT_EQ(remote->calls(), 0);
}
