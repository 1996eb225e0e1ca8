// =============================================================================
// Unit tests for WatermarkService (src/service/watermark_service.hpp)
// End-to-end over encoded bytes with fake model, client and detector
// =============================================================================
#include <gtest/gtest.h>
#include "service/watermark_service.hpp"
#include "utils/image_io.hpp"
#include "test_fakes.hpp"

using namespace wit;
using wit::test::FakeCloudClient;
using wit::test::FakeDetector;
using wit::test::FakeModel;
using wit::test::ThrowingDetector;
using wit::test::encode_png;
using wit::test::images_equal;
using wit::test::make_rect_mask;
using wit::test::make_test_image;

namespace {

Region make_region(int x, int y, int w, int h, float conf) {
    Region r;
    r.x = x;
    r.y = y;
    r.width = w;
    r.height = h;
    r.confidence = conf;
    return r;
}

AppConfig cloud_config() {
    AppConfig config;
    config.mode = AiMode::Cloud;
    config.replicate.api_token = "r8_test";
    config.cloud.poll_interval = std::chrono::milliseconds(0);
    config.cloud.timeout = std::chrono::milliseconds(2000);
    return config;
}

}  // namespace

// ---------------------------------------------------------------------------
// All-zero mask: output decodes to the exact input
// ---------------------------------------------------------------------------
TEST(WatermarkServiceTest, ZeroMaskIsByteIdentical) {
    auto model = std::make_shared<FakeModel>(512, FakeModel::Mode::Constant, cv::Scalar(0, 0, 0));
    WatermarkService service(AppConfig{}, model, nullptr, nullptr);

    cv::Mat image = make_test_image(320, 200);
    cv::Mat mask = cv::Mat::zeros(image.size(), CV_8UC1);

    RemovalResult result = service.remove_watermark(encode_png(image), encode_png(mask));
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_TRUE(result.no_op);
    EXPECT_EQ(result.error, ErrorKind::None);
    EXPECT_EQ(model->calls(), 0);
    EXPECT_TRUE(images_equal(decode_image(result.image), image));
}

TEST(WatermarkServiceTest, NoMaskNoDetectorIsNoOp) {
    WatermarkService service(AppConfig{}, nullptr, nullptr, nullptr);

    cv::Mat image = make_test_image(64, 64);
    RemovalResult result = service.remove_watermark(encode_png(image));
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.no_op);
    EXPECT_TRUE(images_equal(decode_image(result.image), image));
}

// ---------------------------------------------------------------------------
// Local model path keeps dimensions
// ---------------------------------------------------------------------------
TEST(WatermarkServiceTest, LocalModelPreservesDimensions) {
    auto model = std::make_shared<FakeModel>(256, FakeModel::Mode::Constant, cv::Scalar(10, 20, 30));
    WatermarkService service(AppConfig{}, model, nullptr, nullptr);

    cv::Mat image = make_test_image(777, 333);
    cv::Mat mask = make_rect_mask(image.size(), cv::Rect(600, 250, 120, 50));

    RemovalResult result = service.remove_watermark(encode_png(image), encode_png(mask));
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.backend, BackendType::Local);
    EXPECT_FALSE(result.best_effort);
    EXPECT_FALSE(result.no_op);

    cv::Mat output = decode_image(result.image);
    EXPECT_EQ(output.size(), image.size());
    EXPECT_EQ(output.at<cv::Vec3b>(270, 650), cv::Vec3b(10, 20, 30));
}

// A smaller user mask is stretched to the image
TEST(WatermarkServiceTest, MismatchedMaskResampled) {
    auto model = std::make_shared<FakeModel>(256, FakeModel::Mode::Constant, cv::Scalar(1, 2, 3));
    WatermarkService service(AppConfig{}, model, nullptr, nullptr);

    cv::Mat image = make_test_image(400, 400);
    cv::Mat mask = make_rect_mask(cv::Size(100, 100), cv::Rect(40, 40, 20, 20));

    RemovalResult result = service.remove_watermark(encode_png(image), encode_png(mask));
    ASSERT_TRUE(result.success) << result.message;
    cv::Mat output = decode_image(result.image);
    EXPECT_EQ(output.at<cv::Vec3b>(200, 200), cv::Vec3b(1, 2, 3));
}

// ---------------------------------------------------------------------------
// No local model, no credential -> classical, still a valid image
// ---------------------------------------------------------------------------
TEST(WatermarkServiceTest, FallsBackToClassical) {
    WatermarkService service(AppConfig{}, nullptr, nullptr, nullptr);

    cv::Mat image(200, 300, CV_8UC3, cv::Scalar(30, 60, 90));
    const cv::Rect rect(120, 80, 40, 20);
    image(rect).setTo(cv::Scalar(255, 255, 255));

    RemovalResult result = service.remove_watermark(encode_png(image), encode_png(make_rect_mask(image.size(), rect)));
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.backend, BackendType::Classical);
    EXPECT_TRUE(result.best_effort);

    cv::Mat output = decode_image(result.image);
    ASSERT_EQ(output.size(), image.size());
    const cv::Vec3b centre = output.at<cv::Vec3b>(90, 140);
    EXPECT_NEAR(centre[0], 30, 3);
    EXPECT_NEAR(centre[1], 60, 3);
    EXPECT_NEAR(centre[2], 90, 3);
}

// Unloaded model behaves like a missing one
TEST(WatermarkServiceTest, UnloadedModelFallsBack) {
    auto model = std::make_shared<FakeModel>(512, FakeModel::Mode::Echo, cv::Scalar(), false);
    WatermarkService service(AppConfig{}, model, nullptr, nullptr);

    cv::Mat image = make_test_image(128, 128);
    RemovalResult result = service.remove_watermark(
        encode_png(image), encode_png(make_rect_mask(image.size(), cv::Rect(10, 10, 20, 20))));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.backend, BackendType::Classical);
    EXPECT_EQ(model->calls(), 0);
}

// ---------------------------------------------------------------------------
// Detector regions
// ---------------------------------------------------------------------------
TEST(WatermarkServiceTest, OversizedRegionFilteredToNoOp) {
    cv::Mat image = make_test_image(500, 400);
    // 80% of the image area
    auto detector = std::make_shared<FakeDetector>(std::vector<Region>{make_region(0, 0, 500, 320, 0.95f)});
    auto model = std::make_shared<FakeModel>(512, FakeModel::Mode::Constant, cv::Scalar(0, 0, 0));
    WatermarkService service(AppConfig{}, model, detector, nullptr);

    RemovalResult result = service.remove_watermark(encode_png(image));
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.no_op);
    EXPECT_EQ(detector->calls, 1);
    EXPECT_EQ(model->calls(), 0);
    EXPECT_TRUE(images_equal(decode_image(result.image), image));
}

TEST(WatermarkServiceTest, DetectedRegionRemoved) {
    cv::Mat image = make_test_image(600, 400);
    auto detector = std::make_shared<FakeDetector>(std::vector<Region>{make_region(450, 350, 100, 30, 0.9f)});
    auto model = std::make_shared<FakeModel>(512, FakeModel::Mode::Constant, cv::Scalar(5, 5, 5));
    WatermarkService service(AppConfig{}, model, detector, nullptr);

    RemovalResult result = service.remove_watermark(encode_png(image));
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_FALSE(result.no_op);
    EXPECT_EQ(result.backend, BackendType::Local);
    EXPECT_EQ(decode_image(result.image).at<cv::Vec3b>(365, 500), cv::Vec3b(5, 5, 5));
}

// User mask wins; the detector is not consulted
TEST(WatermarkServiceTest, UserMaskSkipsDetector) {
    cv::Mat image = make_test_image(100, 100);
    auto detector = std::make_shared<FakeDetector>(std::vector<Region>{make_region(10, 10, 30, 15, 0.9f)});
    WatermarkService service(AppConfig{}, nullptr, detector, nullptr);

    RemovalResult result = service.remove_watermark(encode_png(image),
                                                    encode_png(cv::Mat::zeros(100, 100, CV_8UC1)));
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.no_op);
    EXPECT_EQ(detector->calls, 0);
}

TEST(WatermarkServiceTest, DetectRegionsFiltersAndSorts) {
    cv::Mat image = make_test_image(1000, 1000);
    auto detector = std::make_shared<FakeDetector>(std::vector<Region>{
        make_region(10, 10, 30, 15, 0.4f),
        make_region(0, 0, 1000, 800, 0.99f),    // too large
        make_region(500, 900, 200, 40, 0.8f),
        make_region(5, 5, 4, 4, 0.9f),          // too small
    });
    WatermarkService service(AppConfig{}, nullptr, detector, nullptr);

    std::vector<Region> regions = service.detect_regions(encode_png(image));
    ASSERT_EQ(regions.size(), 2u);
    EXPECT_FLOAT_EQ(regions[0].confidence, 0.8f);
    EXPECT_FLOAT_EQ(regions[1].confidence, 0.4f);
}

TEST(WatermarkServiceTest, DetectRegionsDegradesToEmpty) {
    WatermarkService without(AppConfig{}, nullptr, nullptr, nullptr);
    EXPECT_TRUE(without.detect_regions(encode_png(make_test_image(50, 50))).empty());

    auto detector = std::make_shared<FakeDetector>(std::vector<Region>{make_region(0, 0, 30, 15, 0.9f)});
    WatermarkService with(AppConfig{}, nullptr, detector, nullptr);
    EXPECT_TRUE(with.detect_regions({0x00, 0x01, 0x02}).empty());
    EXPECT_EQ(detector->calls, 0);
}

// A crashing detector degrades to "nothing found", not to an error
TEST(WatermarkServiceTest, DetectorFailureDegradesToNoOp) {
    cv::Mat image = make_test_image(200, 120);
    auto detector = std::make_shared<ThrowingDetector>();
    auto model = std::make_shared<FakeModel>(512, FakeModel::Mode::Constant, cv::Scalar(0, 0, 0));
    WatermarkService service(AppConfig{}, model, detector, nullptr);

    RemovalResult result = service.remove_watermark(encode_png(image));
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_TRUE(result.no_op);
    EXPECT_EQ(result.error, ErrorKind::None);
    EXPECT_EQ(detector->calls, 1);
    EXPECT_EQ(model->calls(), 0);
    EXPECT_TRUE(images_equal(decode_image(result.image), image));

    EXPECT_TRUE(service.detect_regions(encode_png(image)).empty());
    EXPECT_EQ(detector->calls, 2);
}

// ---------------------------------------------------------------------------
// Cloud first when configured
// ---------------------------------------------------------------------------
TEST(WatermarkServiceTest, CloudUsedWhenConfigured) {
    cv::Mat image = make_test_image(200, 200);
    auto client = std::make_unique<FakeCloudClient>();
    client->script = {FakeCloudClient::succeeded(cv::Mat(image.size(), CV_8UC3, cv::Scalar(7, 7, 7)))};
    FakeCloudClient* fake = client.get();

    auto model = std::make_shared<FakeModel>(256, FakeModel::Mode::Constant, cv::Scalar(0, 0, 0));
    WatermarkService service(cloud_config(), model, nullptr, std::move(client));
    EXPECT_TRUE(service.backend_status().cloud_available);

    RemovalResult result = service.remove_watermark(
        encode_png(image), encode_png(make_rect_mask(image.size(), cv::Rect(50, 50, 40, 40))));
    ASSERT_TRUE(result.success) << result.message;
    EXPECT_EQ(result.backend, BackendType::Cloud);
    EXPECT_EQ(fake->submits, 1);
    EXPECT_EQ(model->calls(), 0);
}

TEST(WatermarkServiceTest, CloudFailureFallsBackToLocal) {
    auto client = std::make_unique<FakeCloudClient>();
    client->fail_submit = true;

    auto model = std::make_shared<FakeModel>(256, FakeModel::Mode::Constant, cv::Scalar(0, 0, 0));
    WatermarkService service(cloud_config(), model, nullptr, std::move(client));

    cv::Mat image = make_test_image(200, 200);
    RemovalResult result = service.remove_watermark(
        encode_png(image), encode_png(make_rect_mask(image.size(), cv::Rect(50, 50, 40, 40))));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.backend, BackendType::Local);
    EXPECT_EQ(model->calls(), 1);
}

// Local mode ignores a client even if one is supplied
TEST(WatermarkServiceTest, LocalModeIgnoresCloudClient) {
    auto client = std::make_unique<FakeCloudClient>();
    FakeCloudClient* fake = client.get();
    AppConfig config = cloud_config();
    config.mode = AiMode::Local;

    WatermarkService service(config, nullptr, nullptr, std::move(client));
    EXPECT_FALSE(service.backend_status().cloud_available);

    cv::Mat image = make_test_image(64, 64);
    RemovalResult result = service.remove_watermark(
        encode_png(image), encode_png(make_rect_mask(image.size(), cv::Rect(8, 8, 16, 16))));
    ASSERT_TRUE(result.success);
    EXPECT_EQ(fake->submits, 0);
}

// ---------------------------------------------------------------------------
// Invalid input
// ---------------------------------------------------------------------------
TEST(WatermarkServiceTest, UndecodableInputRejected) {
    WatermarkService service(AppConfig{}, nullptr, nullptr, nullptr);

    RemovalResult result = service.remove_watermark({'n', 'o', 'p', 'e'});
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorKind::InvalidInput);
    EXPECT_TRUE(result.image.empty());

    result = service.remove_watermark({});
    EXPECT_EQ(result.error, ErrorKind::InvalidInput);

    result = service.remove_watermark(encode_png(make_test_image(32, 32)), std::vector<uint8_t>{1, 2, 3});
    EXPECT_EQ(result.error, ErrorKind::InvalidInput);
}

TEST(WatermarkServiceTest, UploadLimitEnforced) {
    AppConfig config;
    config.limits.max_upload_bytes = 64;
    WatermarkService service(config, nullptr, nullptr, nullptr);

    RemovalResult result = service.remove_watermark(encode_png(make_test_image(64, 64)));
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, ErrorKind::InvalidInput);
    EXPECT_NE(result.message.find("upload limit"), std::string::npos);
}

// ---------------------------------------------------------------------------
// Status and async entry point
// ---------------------------------------------------------------------------
TEST(WatermarkServiceTest, BackendStatusReported) {
    auto model = std::make_shared<FakeModel>(512);
    WatermarkService loaded(AppConfig{}, model, nullptr, nullptr);
    BackendStatus status = loaded.backend_status();
    EXPECT_EQ(status.mode, "local");
    EXPECT_TRUE(status.local_loaded);
    EXPECT_FALSE(status.cloud_available);
    EXPECT_FALSE(status.detector_ready);
    EXPECT_EQ(status.detector_compiled, is_detector_available());

    AppConfig config;
    config.mode = AiMode::Cloud;    // no token
    WatermarkService unconfigured(config, nullptr, nullptr, std::make_unique<FakeCloudClient>());
    status = unconfigured.backend_status();
    EXPECT_EQ(status.mode, "cloud");
    EXPECT_FALSE(status.local_loaded);
    EXPECT_FALSE(status.cloud_available);

    WatermarkService detecting(AppConfig{}, nullptr, std::make_shared<FakeDetector>(), nullptr);
    EXPECT_TRUE(detecting.backend_status().detector_ready);
}

TEST(WatermarkServiceTest, AsyncRequestsRunConcurrently) {
    WatermarkService service(AppConfig{}, nullptr, nullptr, nullptr);

    cv::Mat image = make_test_image(96, 96);
    std::vector<std::future<RemovalResult>> futures;
    for (int i = 0; i < 4; ++i) {
        futures.push_back(service.remove_watermark_async(
            encode_png(image), encode_png(make_rect_mask(image.size(), cv::Rect(10 + i, 10, 20, 20)))));
    }

    for (auto& f : futures) {
        RemovalResult result = f.get();
        ASSERT_TRUE(result.success) << result.message;
        EXPECT_EQ(result.backend, BackendType::Classical);
        EXPECT_EQ(decode_image(result.image).size(), image.size());
    }
}
