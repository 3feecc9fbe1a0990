#include <sitescan/core/image.hpp>
#include <sitescan/core/pipeline.hpp>
#include <sitescan/core/pipeline_stage.hpp>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

namespace sc = sitescan::core;

namespace {

/// Doubles the width; keeps the buffer.
class WidenStage : public sc::IImageStage {
 public:
  std::expected<sc::Image, sc::BackendError> process(const sc::Image& input) override {
    std::vector<std::byte> buf(input.data().begin(), input.data().end());
    return sc::Image(input.width() * 2, input.height(), input.format(), std::move(buf));
  }
};

class FailingStage : public sc::IImageStage {
 public:
  std::expected<sc::Image, sc::BackendError> process(const sc::Image&) override {
    return std::unexpected(sc::BackendError::MalformedInput);
  }
};

sc::Image gray(std::uint32_t w, std::uint32_t h) {
  return sc::Image(w, h, sc::PixelFormat::Grayscale8,
                   std::vector<std::byte>(static_cast<std::size_t>(w) * h));
}

}  // namespace

TEST(Pipeline, EmptyPipelineReturnsInput) {
  sc::Pipeline p;
  auto result = p.run(gray(4, 4));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->width(), 4u);
  EXPECT_EQ(p.stage_count(), 0u);
}

TEST(Pipeline, StagesRunInOrder) {
  sc::Pipeline p;
  p.add_stage(std::make_unique<WidenStage>());
  p.add_stage(std::make_unique<WidenStage>());
  auto result = p.run(gray(4, 4));
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->width(), 16u);
}

TEST(Pipeline, StageErrorStopsRun) {
  sc::Pipeline p;
  p.add_stage(std::make_unique<FailingStage>());
  p.add_stage(std::make_unique<WidenStage>());
  auto result = p.run(gray(4, 4));
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::BackendError::MalformedInput);
}

TEST(Pipeline, TimingCallbackPerStage) {
  sc::Pipeline p;
  p.add_stage(std::make_unique<WidenStage>());
  p.add_stage(std::make_unique<WidenStage>());
  std::vector<std::size_t> seen;
  sc::StageTimingCallback cb = [&seen](std::size_t index, double ms) {
    EXPECT_GE(ms, 0.0);
    seen.push_back(index);
  };
  auto result = p.run(gray(2, 2), &cb);
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(seen, (std::vector<std::size_t>{0, 1}));
}

TEST(Pipeline, NullStageIgnored) {
  sc::Pipeline p;
  p.add_stage(nullptr);
  EXPECT_EQ(p.stage_count(), 0u);
}
