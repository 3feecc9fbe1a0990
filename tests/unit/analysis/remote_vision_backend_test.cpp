#include <sitescan/analysis/remote_vision_backend.hpp>
#include "support/fake_backends.hpp"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string_view>

namespace sa = sitescan::analysis;
namespace sc = sitescan::core;
using sitescan::testing::FakeVisionClient;
using sitescan::testing::make_rgb_image;
using namespace std::chrono_literals;

namespace {

sa::RemoteVisionOptions remote_options() {
  sa::RemoteVisionOptions o;
  o.id = "vertex-remote";
  o.endpoint = "https://vision.example.test/v1/analyze";
  o.api_key = "secret";
  o.capabilities = {"PPE", "Fall Protection"};
  o.timeout = 10000ms;
  return o;
}

std::string b64(std::string_view text) {
  return sa::base64_encode(reinterpret_cast<const std::byte*>(text.data()), text.size());
}

class RemoteVisionBackendTest : public ::testing::Test {
 protected:
  sa::DetectionsOrError analyze(std::chrono::milliseconds budget = 10000ms,
                                const sc::CaptureContext& context = {}) {
    return backend_.analyze(make_rgb_image(4, 2), context, sc::CancellationToken::none(), budget);
  }

  void respond_status(long status, std::string body = "{}") {
    client_->respond(sa::VisionResponse{status, std::move(body)});
  }

  std::shared_ptr<FakeVisionClient> client_ = std::make_shared<FakeVisionClient>();
  sa::RemoteVisionBackend backend_{remote_options(), client_};
};

}  // namespace

TEST(Base64, EncodesWithPadding) {
  EXPECT_EQ(b64(""), "");
  EXPECT_EQ(b64("f"), "Zg==");
  EXPECT_EQ(b64("fo"), "Zm8=");
  EXPECT_EQ(b64("foo"), "Zm9v");
  EXPECT_EQ(b64("foobar"), "Zm9vYmFy");
}

TEST_F(RemoteVisionBackendTest, DescribesItself) {
  EXPECT_EQ(backend_.id(), "vertex-remote");
  EXPECT_EQ(backend_.tier(), sc::BackendTier::Remote);
  EXPECT_EQ(backend_.cost_class(), sc::CostClass::RemoteMetered);
  EXPECT_FALSE(backend_.uses_local_device());
  EXPECT_TRUE(backend_.available());
}

TEST_F(RemoteVisionBackendTest, ParsesDetections) {
  respond_status(200, R"({"detections":[
      {"hazard_type":"MISSING_HARD_HAT","confidence":0.8,"box":[0.1,0.2,0.3,0.4]},
      {"hazard_type":"TRIP_HAZARD","confidence":1.7},
      {"hazard_type":"FIRE_HAZARD","confidence":0.6,"box":[0.1,"x",0.3,0.4]}]})");
  auto result = analyze();
  ASSERT_TRUE(result.has_value());
  ASSERT_EQ(result->size(), 3u);
  EXPECT_EQ((*result)[0].hazard_type, "MISSING_HARD_HAT");
  EXPECT_FLOAT_EQ((*result)[0].confidence, 0.8f);
  EXPECT_EQ((*result)[0].region, (sc::BBox{0.1f, 0.2f, 0.3f, 0.4f}));
  EXPECT_EQ((*result)[0].source, "vertex-remote");
  EXPECT_EQ((*result)[0].source_tier, sc::BackendTier::Remote);
  EXPECT_FLOAT_EQ((*result)[1].confidence, 1.f);
  EXPECT_TRUE((*result)[1].region.empty());
  EXPECT_TRUE((*result)[2].region.empty());
}

TEST_F(RemoteVisionBackendTest, RequestCarriesImageAndContext) {
  sc::CaptureContext context;
  context.work_type = "roofing";
  context.captured_at = std::chrono::system_clock::time_point(1234567ms);
  context.location = sc::GeoLocation{47.5, -122.25};
  (void)analyze(3000ms, context);

  const auto requests = client_->requests();
  ASSERT_EQ(requests.size(), 1u);
  EXPECT_EQ(requests[0].endpoint, "https://vision.example.test/v1/analyze");
  EXPECT_EQ(requests[0].api_key, "secret");
  EXPECT_EQ(requests[0].timeout, 3000ms);

  const auto body = nlohmann::json::parse(requests[0].body);
  EXPECT_EQ(body["width"], 4);
  EXPECT_EQ(body["height"], 2);
  EXPECT_EQ(body["format"], "rgb8");
  EXPECT_EQ(body["work_type"], "roofing");
  EXPECT_EQ(body["captured_at_ms"], 1234567);
  EXPECT_DOUBLE_EQ(body["location"]["lat"].get<double>(), 47.5);
  EXPECT_DOUBLE_EQ(body["location"]["lon"].get<double>(), -122.25);
  // 4x2 RGB zeros.
  EXPECT_EQ(body["image"], std::string(32, 'A'));
}

TEST_F(RemoteVisionBackendTest, RequestTimeoutNeverExceedsConfigured) {
  (void)analyze(60000ms);
  EXPECT_EQ(client_->requests().back().timeout, 10000ms);
}

TEST_F(RemoteVisionBackendTest, StatusCodesMapToErrors) {
  const std::vector<std::pair<long, sc::BackendError>> cases = {
      {400, sc::BackendError::MalformedInput},     {413, sc::BackendError::MalformedInput},
      {422, sc::BackendError::MalformedInput},     {429, sc::BackendError::RemoteRateLimited},
      {408, sc::BackendError::Timeout},            {504, sc::BackendError::Timeout},
      {500, sc::BackendError::TransientNetwork},   {503, sc::BackendError::TransientNetwork},
  };
  for (const auto& [status, expected] : cases) {
    respond_status(status);
    auto result = analyze();
    ASSERT_FALSE(result.has_value()) << status;
    EXPECT_EQ(result.error(), expected) << status;
  }
  EXPECT_TRUE(backend_.available());
}

TEST_F(RemoteVisionBackendTest, UnauthorizedDisablesUntilKeyRefreshed) {
  respond_status(401);
  auto result = analyze();
  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error(), sc::BackendError::RemoteUnauthorized);
  EXPECT_FALSE(backend_.available());

  // No further requests while unauthorized.
  respond_status(200, R"({"detections":[]})");
  EXPECT_EQ(analyze().error(), sc::BackendError::RemoteUnauthorized);
  EXPECT_EQ(client_->requests().size(), 1u);

  backend_.set_api_key("rotated");
  EXPECT_TRUE(backend_.available());
  ASSERT_TRUE(analyze().has_value());
  EXPECT_EQ(client_->requests().back().api_key, "rotated");
}

TEST_F(RemoteVisionBackendTest, TransportFailures) {
  client_->respond(std::unexpected(sa::TransportError::Timeout));
  EXPECT_EQ(analyze().error(), sc::BackendError::Timeout);
  client_->respond(std::unexpected(sa::TransportError::ConnectionFailed));
  EXPECT_EQ(analyze().error(), sc::BackendError::TransientNetwork);
}

TEST_F(RemoteVisionBackendTest, UnparseableBodyIsInternal) {
  respond_status(200, "<html>gateway</html>");
  EXPECT_EQ(analyze().error(), sc::BackendError::Internal);
  respond_status(200, R"({"detections":[{"confidence":0.5}]})");
  EXPECT_EQ(analyze().error(), sc::BackendError::Internal);
  respond_status(200, R"({"results":[]})");
  EXPECT_EQ(analyze().error(), sc::BackendError::Internal);
}

TEST_F(RemoteVisionBackendTest, MalformedImageNeverSent) {
  const sc::Image bad(0, 0, sc::PixelFormat::RGB8, {});
  auto result = backend_.analyze(bad, {}, sc::CancellationToken::none(), 1000ms);
  EXPECT_EQ(result.error(), sc::BackendError::MalformedInput);
  EXPECT_TRUE(client_->requests().empty());
}

TEST_F(RemoteVisionBackendTest, CancelledBeforeSend) {
  sc::CancellationToken cancel;
  cancel.cancel();
  auto result = backend_.analyze(make_rgb_image(), {}, cancel, 1000ms);
  EXPECT_EQ(result.error(), sc::BackendError::Cancelled);
  EXPECT_TRUE(client_->requests().empty());
}

TEST(RemoteVisionBackend, UnavailableWithoutCredentials) {
  auto o = remote_options();
  o.api_key.clear();
  sa::RemoteVisionBackend no_key(o, std::make_shared<FakeVisionClient>());
  EXPECT_FALSE(no_key.available());

  sa::RemoteVisionBackend no_client(remote_options(), nullptr);
  EXPECT_FALSE(no_client.available());
}
