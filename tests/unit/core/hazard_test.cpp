#include <sitescan/core/error.hpp>
#include <sitescan/core/hazard.hpp>
#include <gtest/gtest.h>

namespace sc = sitescan::core;

TEST(BBox, EmptyWhenNoExtent) {
  EXPECT_TRUE(sc::BBox{}.empty());
  EXPECT_TRUE((sc::BBox{0.1f, 0.1f, 0.f, 0.5f}.empty()));
  EXPECT_FALSE((sc::BBox{0.1f, 0.1f, 0.2f, 0.2f}.empty()));
  EXPECT_FLOAT_EQ((sc::BBox{0.f, 0.f, 0.5f, 0.4f}.area()), 0.2f);
}

TEST(Iou, IdenticalBoxesIsOne) {
  const sc::BBox b{0.1f, 0.1f, 0.4f, 0.4f};
  EXPECT_FLOAT_EQ(sc::iou(b, b), 1.f);
}

TEST(Iou, DisjointBoxesIsZero) {
  EXPECT_FLOAT_EQ(sc::iou({0.f, 0.f, 0.2f, 0.2f}, {0.5f, 0.5f, 0.2f, 0.2f}), 0.f);
}

TEST(Iou, HalfOverlap) {
  // Two unit-width boxes shifted by a third overlap 2/3 of each: IoU = (2/3) / (4/3) = 0.5.
  const sc::BBox a{0.f, 0.f, 0.3f, 0.3f};
  const sc::BBox b{0.1f, 0.f, 0.3f, 0.3f};
  EXPECT_NEAR(sc::iou(a, b), 0.5f, 1e-5f);
}

TEST(Iou, EmptyRegionIsZero) {
  EXPECT_FLOAT_EQ(sc::iou({}, {0.f, 0.f, 0.2f, 0.2f}), 0.f);
}

TEST(Severity, ParseIsCaseInsensitive) {
  sc::Severity s = sc::Severity::Low;
  EXPECT_TRUE(sc::parse_severity("CRITICAL", s));
  EXPECT_EQ(s, sc::Severity::Critical);
  EXPECT_TRUE(sc::parse_severity("high", s));
  EXPECT_EQ(s, sc::Severity::High);
  EXPECT_FALSE(sc::parse_severity("severe", s));
  EXPECT_EQ(s, sc::Severity::High);
}

TEST(Severity, RankOrder) {
  EXPECT_LT(sc::Severity::Low, sc::Severity::Medium);
  EXPECT_LT(sc::Severity::High, sc::Severity::Critical);
  EXPECT_EQ(sc::to_string(sc::Severity::Critical), "critical");
}

TEST(BackendError, ClassifiesForRetryPolicy) {
  EXPECT_EQ(sc::classify(sc::BackendError::Timeout), sc::AnalysisError::BackendTimeout);
  EXPECT_EQ(sc::classify(sc::BackendError::TransientNetwork), sc::AnalysisError::BackendTimeout);
  EXPECT_EQ(sc::classify(sc::BackendError::RemoteRateLimited), sc::AnalysisError::BackendRateLimited);
  EXPECT_EQ(sc::classify(sc::BackendError::MalformedInput), sc::AnalysisError::MalformedInput);
  EXPECT_EQ(sc::classify(sc::BackendError::Cancelled), sc::AnalysisError::Cancelled);
  EXPECT_EQ(sc::classify(sc::BackendError::ModelNotLoaded), sc::AnalysisError::BackendUnavailable);
  EXPECT_EQ(sc::classify(sc::BackendError::RemoteUnauthorized), sc::AnalysisError::BackendUnavailable);
  EXPECT_EQ(sc::classify(sc::BackendError::Internal), sc::AnalysisError::BackendUnavailable);
}
