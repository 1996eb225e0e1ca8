// =============================================================================
// Unit tests for MaskBuilder (src/core/mask_builder.hpp)
// User mask normalization, region filtering and rasterization
// =============================================================================
#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>
#include "core/errors.hpp"
#include "core/mask_builder.hpp"

using namespace wit;

namespace {

Region make_region(int x, int y, int w, int h, float conf, const char* text = "") {
    Region r;
    r.x = x;
    r.y = y;
    r.width = w;
    r.height = h;
    r.confidence = conf;
    r.text = std::string(text);
    return r;
}

}  // namespace

// ---------------------------------------------------------------------------
// No mask and no regions -> all-zero mask of the image size
// ---------------------------------------------------------------------------
TEST(MaskBuilderTest, NothingGivenYieldsEmptyMask) {
    MaskBuilder builder;
    cv::Mat mask = builder.build(cv::Size(320, 240), std::nullopt);
    ASSERT_EQ(mask.type(), CV_8UC1);
    EXPECT_EQ(mask.size(), cv::Size(320, 240));
    EXPECT_EQ(cv::countNonZero(mask), 0);

    mask = builder.build(cv::Size(320, 240), std::nullopt, std::vector<Region>{});
    EXPECT_EQ(cv::countNonZero(mask), 0);
}

TEST(MaskBuilderTest, EmptyImageSizeThrows) {
    MaskBuilder builder;
    EXPECT_THROW(builder.build(cv::Size(0, 10), std::nullopt), InvalidInputError);
}

// ---------------------------------------------------------------------------
// User masks: channel reduction and nearest resampling
// ---------------------------------------------------------------------------
TEST(MaskBuilderTest, UserMaskSameSizeIsCopied) {
    MaskBuilder builder;
    cv::Mat user = cv::Mat::zeros(100, 200, CV_8UC1);
    user(cv::Rect(10, 10, 30, 20)).setTo(255);

    cv::Mat mask = builder.build(cv::Size(200, 100), user);
    EXPECT_EQ(cv::countNonZero(mask), 30 * 20);
    EXPECT_NE(mask.data, user.data);
}

TEST(MaskBuilderTest, ColorMaskConvertedToGray) {
    MaskBuilder builder;
    cv::Mat user(50, 50, CV_8UC3, cv::Scalar(0, 0, 0));
    user(cv::Rect(0, 0, 10, 10)).setTo(cv::Scalar(255, 255, 255));

    cv::Mat mask = builder.build(cv::Size(50, 50), user);
    ASSERT_EQ(mask.type(), CV_8UC1);
    EXPECT_EQ(mask.at<uchar>(5, 5), 255);
    EXPECT_EQ(mask.at<uchar>(20, 20), 0);
}

TEST(MaskBuilderTest, BgraMaskAccepted) {
    MaskBuilder builder;
    cv::Mat user(40, 40, CV_8UC4, cv::Scalar(255, 255, 255, 255));
    cv::Mat mask = builder.build(cv::Size(40, 40), user);
    EXPECT_EQ(cv::countNonZero(mask), 40 * 40);
}

TEST(MaskBuilderTest, MismatchedMaskResampledNearest) {
    MaskBuilder builder;
    cv::Mat user = cv::Mat::zeros(50, 50, CV_8UC1);
    user(cv::Rect(0, 0, 25, 50)).setTo(255);

    cv::Mat mask = builder.build(cv::Size(100, 100), user);
    ASSERT_EQ(mask.size(), cv::Size(100, 100));

    // Nearest resampling keeps the mask strictly binary
    cv::Mat not_binary = (mask > 0) & (mask < 255);
    EXPECT_EQ(cv::countNonZero(not_binary), 0);
    EXPECT_EQ(cv::countNonZero(mask), 50 * 100);
}

TEST(MaskBuilderTest, SixteenBitMaskScaledDown) {
    MaskBuilder builder;
    cv::Mat user(20, 20, CV_16UC1, cv::Scalar(65535));
    cv::Mat mask = builder.build(cv::Size(20, 20), user);
    ASSERT_EQ(mask.type(), CV_8UC1);
    EXPECT_EQ(mask.at<uchar>(0, 0), 255);
}

TEST(MaskBuilderTest, UnsupportedMaskRejected) {
    MaskBuilder builder;
    EXPECT_THROW(builder.build(cv::Size(10, 10), cv::Mat(10, 10, CV_8UC2, cv::Scalar(0, 0))),
                 InvalidInputError);
    EXPECT_THROW(builder.build(cv::Size(10, 10), cv::Mat(10, 10, CV_32FC1, cv::Scalar(1.0))),
                 InvalidInputError);
    EXPECT_THROW(builder.build(cv::Size(10, 10), cv::Mat()), InvalidInputError);
}

// ---------------------------------------------------------------------------
// User mask wins over regions
// ---------------------------------------------------------------------------
TEST(MaskBuilderTest, UserMaskTakesPrecedence) {
    MaskBuilder builder;
    cv::Mat user = cv::Mat::zeros(200, 200, CV_8UC1);
    std::vector<Region> regions{make_region(50, 50, 40, 20, 0.9f)};

    cv::Mat mask = builder.build(cv::Size(200, 200), user, regions);
    EXPECT_EQ(cv::countNonZero(mask), 0);
}

// ---------------------------------------------------------------------------
// Region filtering
// ---------------------------------------------------------------------------
TEST(MaskBuilderTest, FilterDropsTinyRegions) {
    MaskBuilder builder;
    std::vector<Region> regions{
        make_region(0, 0, 10, 30, 0.9f),     // too narrow
        make_region(0, 0, 40, 5, 0.9f),      // too low
        make_region(0, 0, 40, 20, 0.5f),
    };
    auto kept = builder.filter_regions(cv::Size(1000, 1000), regions);
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_EQ(kept[0].width, 40);
}

TEST(MaskBuilderTest, FilterDropsLargeArea) {
    MaskBuilder builder;
    // 80% of a 1000x1000 image
    std::vector<Region> regions{make_region(0, 0, 1000, 800, 0.99f)};
    EXPECT_TRUE(builder.filter_regions(cv::Size(1000, 1000), regions).empty());

    cv::Mat mask = builder.build(cv::Size(1000, 1000), std::nullopt, regions);
    EXPECT_EQ(cv::countNonZero(mask), 0);
}

TEST(MaskBuilderTest, FilterSortsAndTruncates) {
    MaskConfig config;
    config.max_regions = 2;
    MaskBuilder builder(config);

    std::vector<Region> regions{
        make_region(0, 0, 30, 15, 0.3f, "low"),
        make_region(0, 0, 30, 15, 0.9f, "high"),
        make_region(0, 0, 30, 15, 0.6f, "mid"),
    };
    auto kept = builder.filter_regions(cv::Size(800, 600), regions);
    ASSERT_EQ(kept.size(), 2u);
    EXPECT_EQ(kept[0].text.value(), "high");
    EXPECT_EQ(kept[1].text.value(), "mid");
}

TEST(MaskBuilderTest, FilterAppliesMinConfidence) {
    MaskConfig config;
    config.min_confidence = 0.5f;
    MaskBuilder builder(config);

    std::vector<Region> regions{
        make_region(0, 0, 30, 15, 0.4f),
        make_region(0, 0, 30, 15, 0.7f),
    };
    auto kept = builder.filter_regions(cv::Size(800, 600), regions);
    ASSERT_EQ(kept.size(), 1u);
    EXPECT_FLOAT_EQ(kept[0].confidence, 0.7f);
}

// ---------------------------------------------------------------------------
// Rasterization: padding applied, clipped to the image
// ---------------------------------------------------------------------------
TEST(MaskBuilderTest, RegionsRasterizedWithPadding) {
    MaskBuilder builder;
    std::vector<Region> regions{make_region(100, 100, 60, 20, 0.9f)};

    cv::Mat mask = builder.build(cv::Size(400, 300), std::nullopt, regions);
    ASSERT_EQ(mask.size(), cv::Size(400, 300));

    // Inside original box and inside padding
    EXPECT_GT(mask.at<uchar>(110, 130), 127);
    EXPECT_GT(mask.at<uchar>(95, 95), 127);
    // Well outside the padded box
    EXPECT_EQ(mask.at<uchar>(50, 50), 0);
    EXPECT_EQ(mask.at<uchar>(200, 300), 0);
}

TEST(MaskBuilderTest, RegionAtEdgeClipped) {
    MaskBuilder builder;
    std::vector<Region> regions{make_region(370, 280, 30, 20, 0.9f)};

    cv::Mat mask = builder.build(cv::Size(400, 300), std::nullopt, regions);
    ASSERT_EQ(mask.size(), cv::Size(400, 300));
    EXPECT_GT(mask.at<uchar>(299, 399), 127);
}
