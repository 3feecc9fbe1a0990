#include <sitescan/core/session.hpp>
#include <gtest/gtest.h>
#include <stdexcept>

namespace sc = sitescan::core;

TEST(SessionBuilder, CompletesThroughAllStates) {
  sc::SessionBuilder b("sess-1", sc::SubmissionKind::Photo);
  b.advance(sc::SessionState::SelectingBackends);
  b.set_backend_chain({"a", "b"});
  b.advance(sc::SessionState::Analyzing);
  b.add_contributing_backend("a");
  b.add_contributing_backend("a");
  b.advance(sc::SessionState::Fusing);
  b.set_fused_hazards({{"MISSING_HARD_HAT", 0.9f, sc::Severity::High, {}, {"a"}, 1}});
  b.advance(sc::SessionState::Recommending);
  b.set_recommendations({{"ppe-hard-hat-required", 0.9f, sc::RecommendationReason::AutoSelected,
                          {"MISSING_HARD_HAT"}}},
                         {"ppe-hard-hat-required"});
  const auto s = b.complete(std::chrono::milliseconds(12));

  EXPECT_TRUE(s.completed());
  EXPECT_EQ(s.state(), sc::SessionState::Complete);
  EXPECT_EQ(s.correlation_id(), "sess-1");
  EXPECT_EQ(s.contributing_backends().size(), 1u);
  EXPECT_EQ(s.fused_hazards().size(), 1u);
  EXPECT_EQ(s.auto_select_tags().count("ppe-hard-hat-required"), 1u);
  EXPECT_FALSE(s.error().has_value());
  EXPECT_TRUE(s.user_message().empty());
  EXPECT_EQ(s.total_latency().count(), 12);
  const std::vector<sc::SessionState> expected = {
      sc::SessionState::Idle,    sc::SessionState::SelectingBackends, sc::SessionState::Analyzing,
      sc::SessionState::Fusing,  sc::SessionState::Recommending,      sc::SessionState::Complete};
  EXPECT_EQ(s.transitions(), expected);
}

TEST(SessionBuilder, RejectsBackwardTransition) {
  sc::SessionBuilder b("sess-2", sc::SubmissionKind::Frame);
  b.advance(sc::SessionState::Analyzing);
  EXPECT_THROW(b.advance(sc::SessionState::SelectingBackends), std::logic_error);
  EXPECT_THROW(b.advance(sc::SessionState::Analyzing), std::logic_error);
}

TEST(SessionBuilder, TerminalStateIsFinal) {
  sc::SessionBuilder b("sess-3", sc::SubmissionKind::Photo);
  b.advance(sc::SessionState::SelectingBackends);
  (void)b.fail(sc::AnalysisError::NoBackendAvailable, std::chrono::milliseconds(1));
  EXPECT_THROW(b.advance(sc::SessionState::Complete), std::logic_error);
  EXPECT_THROW(b.set_degraded_capability(true), std::logic_error);
}

TEST(SessionBuilder, FailureCarriesUserMessageAndNoResults) {
  sc::SessionBuilder b("sess-4", sc::SubmissionKind::Photo);
  b.advance(sc::SessionState::Fusing);
  b.set_fused_hazards({{"TRIP_HAZARD", 0.5f, sc::Severity::Low, {}, {"a"}, 1}});
  const auto s = b.fail(sc::AnalysisError::MalformedInput, std::chrono::milliseconds(3));
  EXPECT_EQ(s.state(), sc::SessionState::Failed);
  ASSERT_TRUE(s.error().has_value());
  EXPECT_EQ(*s.error(), sc::AnalysisError::MalformedInput);
  EXPECT_EQ(s.user_message(), "Could not analyze this image. Please retake the photo.");
  EXPECT_TRUE(s.fused_hazards().empty());
}

TEST(FailureMessage, DistinguishesRetakeFromManualTagging) {
  EXPECT_NE(sc::failure_message(sc::AnalysisError::MalformedInput),
            sc::failure_message(sc::AnalysisError::NoBackendAvailable));
  EXPECT_EQ(sc::failure_message(sc::AnalysisError::NoBackendAvailable),
            "Analysis is temporarily unavailable. Tag the photo manually.");
}

TEST(SessionState, TerminalStates) {
  EXPECT_TRUE(sc::is_terminal(sc::SessionState::Complete));
  EXPECT_TRUE(sc::is_terminal(sc::SessionState::Failed));
  EXPECT_FALSE(sc::is_terminal(sc::SessionState::Recommending));
}
