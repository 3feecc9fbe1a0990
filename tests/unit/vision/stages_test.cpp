#include <sitescan/core/image.hpp>
#include <sitescan/core/pipeline.hpp>
#include <sitescan/vision/color_convert_stage.hpp>
#include <sitescan/vision/decode_stage.hpp>
#include <sitescan/vision/normalize_stage.hpp>
#include <sitescan/vision/resize_stage.hpp>
#include <gtest/gtest.h>
#include <cstring>
#include <memory>
#include <vector>

namespace sv = sitescan::vision;
namespace sc = sitescan::core;

namespace {

sc::Image bgr(std::uint32_t w, std::uint32_t h, std::uint8_t b, std::uint8_t g, std::uint8_t r) {
  std::vector<std::byte> buf(static_cast<std::size_t>(w) * h * 3);
  for (std::size_t i = 0; i < buf.size(); i += 3) {
    buf[i] = std::byte{b};
    buf[i + 1] = std::byte{g};
    buf[i + 2] = std::byte{r};
  }
  return sc::Image(w, h, sc::PixelFormat::BGR8, std::move(buf));
}

}  // namespace

TEST(ResizeStage, ResizesToTarget) {
  sv::ResizeStage stage(16, 8);
  auto out = stage.process(bgr(64, 48, 1, 2, 3));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->width(), 16u);
  EXPECT_EQ(out->height(), 8u);
  EXPECT_EQ(out->format(), sc::PixelFormat::BGR8);
  EXPECT_TRUE(out->well_formed());
}

TEST(ResizeStage, RejectsMalformedImage) {
  sv::ResizeStage stage(16, 8);
  auto out = stage.process(sc::Image(10, 10, sc::PixelFormat::RGB8, std::vector<std::byte>(5)));
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), sc::BackendError::MalformedInput);
}

TEST(ColorConvertStage, SwapsChannels) {
  sv::ColorConvertStage stage(sc::PixelFormat::RGB8);
  auto out = stage.process(bgr(2, 2, 10, 20, 30));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->format(), sc::PixelFormat::RGB8);
  EXPECT_EQ(std::to_integer<int>(out->data()[0]), 30);
  EXPECT_EQ(std::to_integer<int>(out->data()[2]), 10);
}

TEST(NormalizeStage, ProducesScaledFloats) {
  sv::NormalizeStage stage(0.f, 1.f / 255.f);
  auto out = stage.process(bgr(2, 2, 255, 0, 51));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->format(), sc::PixelFormat::Float32Planar);
  ASSERT_EQ(out->size_bytes(), sc::Image::min_bytes(2, 2, sc::PixelFormat::Float32Planar));
  float first[3];
  std::memcpy(first, out->data().data(), sizeof(first));
  EXPECT_NEAR(first[0], 1.f, 1e-5f);
  EXPECT_NEAR(first[1], 0.f, 1e-5f);
  EXPECT_NEAR(first[2], 0.2f, 1e-5f);
}

TEST(DecodeStage, PassesThroughRawPixels) {
  sv::DecodeStage stage;
  auto out = stage.process(bgr(4, 4, 0, 0, 0));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->format(), sc::PixelFormat::BGR8);
}

TEST(DecodeStage, RejectsGarbageBytes) {
  sv::DecodeStage stage;
  std::vector<std::byte> junk(32, std::byte{0x5a});
  auto out = stage.process(sc::Image(0, 0, sc::PixelFormat::Encoded, std::move(junk)));
  ASSERT_FALSE(out.has_value());
  EXPECT_EQ(out.error(), sc::BackendError::MalformedInput);
}

TEST(Preprocessing, ResizeThenNormalize) {
  sc::Pipeline p;
  p.add_stage(std::make_unique<sv::ResizeStage>(8, 8));
  p.add_stage(std::make_unique<sv::NormalizeStage>(0.f, 1.f / 255.f));
  auto out = p.run(bgr(32, 24, 0, 0, 0));
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->width(), 8u);
  EXPECT_EQ(out->format(), sc::PixelFormat::Float32Planar);
}
