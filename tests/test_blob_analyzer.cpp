#include <gtest/gtest.h>
#include <stdexcept>
#include "formreg/BlobAnalyzer.hpp"
#include "TestImages.hpp"

using namespace formreg;

namespace {

size_t darkBlobCount(const cv::Mat& img, const cv::Rect& window, int minSize) {
    PixelSampler s(img);
    BlobAnalyzer a(s, 160);
    return a.findDarkBlobs(window, minSize).size();
}

}

TEST(PixelSampler, LuminanceUsesRgbWeights) {
    cv::Mat bgr(1, 1, CV_8UC3, cv::Scalar(0, 0, 255));
    EXPECT_NEAR(PixelSampler(bgr).luminance(0, 0), 0.299 * 255, 1e-9);

    cv::Mat bgra(1, 1, CV_8UC4, cv::Scalar(255, 0, 0, 7));
    PixelSampler s(bgra);
    EXPECT_NEAR(s.luminance(0, 0), 0.114 * 255, 1e-9);
    EXPECT_EQ(s.bgra(0, 0), cv::Vec4b(255, 0, 0, 7));

    cv::Mat gray(1, 1, CV_8UC1, cv::Scalar(90));
    EXPECT_EQ(PixelSampler(gray).bgra(0, 0), cv::Vec4b(90, 90, 90, 255));
}

TEST(PixelSampler, RejectsFloatImages) {
    cv::Mat f(4, 4, CV_32FC1, cv::Scalar(0.5));
    EXPECT_THROW(PixelSampler s(f), std::invalid_argument);
}

TEST(BlobAnalyzer, BlobOfExactlyMinSizeIsAccepted) {
    cv::Mat img = testimg::paper(400, 400);
    testimg::ink(img, cv::Rect(20, 20, 15, 15));
    EXPECT_EQ(darkBlobCount(img, cv::Rect(0, 0, 80, 80), 15), 1u);
}

TEST(BlobAnalyzer, BlobOnePixelSmallerIsRejected) {
    cv::Mat narrow = testimg::paper(400, 400);
    testimg::ink(narrow, cv::Rect(20, 20, 14, 15));
    EXPECT_EQ(darkBlobCount(narrow, cv::Rect(0, 0, 80, 80), 15), 0u);

    cv::Mat flat = testimg::paper(400, 400);
    testimg::ink(flat, cv::Rect(20, 20, 15, 14));
    EXPECT_EQ(darkBlobCount(flat, cv::Rect(0, 0, 80, 80), 15), 0u);
}

TEST(BlobAnalyzer, ThinRulingsAreRejected) {
    cv::Mat img = testimg::paper(400, 400);
    testimg::ink(img, cv::Rect(5, 40, 70, 8));   // 560 px, aspect 8.75
    EXPECT_EQ(darkBlobCount(img, cv::Rect(0, 0, 80, 80), 15), 0u);
}

TEST(BlobAnalyzer, BlobsCoveringTooMuchOfThePageAreRejected) {
    cv::Mat img = testimg::paper(100, 100);
    testimg::ink(img, cv::Rect(10, 10, 30, 30));  // 900 px >= 5% of 10000
    EXPECT_EQ(darkBlobCount(img, cv::Rect(0, 0, 100, 100), 15), 0u);
}

TEST(BlobAnalyzer, DarkFloodFillStopsAtPixelCap) {
    cv::Mat img = testimg::paper(400, 400);
    testimg::ink(img, cv::Rect(10, 10, 100, 100));
    PixelSampler s(img);
    BlobAnalyzer a(s, 160);
    auto blobs = a.findDarkBlobs(cv::Rect(0, 0, 200, 200), 15);
    ASSERT_FALSE(blobs.empty());
    EXPECT_EQ(blobs.front().pixelCount, BlobAnalyzer::kMaxDarkBlobPixels);
}

TEST(BlobAnalyzer, CentroidAndBoundsOfSquare) {
    cv::Mat img = testimg::paper(300, 300);
    testimg::ink(img, cv::Rect(30, 40, 20, 20));
    PixelSampler s(img);
    BlobAnalyzer a(s, 160);
    auto blobs = a.findDarkBlobs(cv::Rect(0, 0, 100, 100), 15);
    ASSERT_EQ(blobs.size(), 1u);
    EXPECT_EQ(blobs[0].pixelCount, 400);
    EXPECT_EQ(blobs[0].bounds(), cv::Rect(30, 40, 20, 20));
    EXPECT_FLOAT_EQ(blobs[0].centroid.x, 39.5f);
    EXPECT_FLOAT_EQ(blobs[0].centroid.y, 49.5f);
}

TEST(BlobAnalyzer, ClosestBlobWins) {
    Blob closeBlob, distantBlob;
    closeBlob.pixelCount = distantBlob.pixelCount = 300;
    closeBlob.centroid = {30, 30};
    distantBlob.centroid = {10, 70};
    FillResult R = BlobAnalyzer::closestBlob({distantBlob, closeBlob}, cv::Point2f(0, 0));
    ASSERT_TRUE(R.ok());
    EXPECT_EQ(R.blob.centroid, cv::Point2f(30, 30));

    EXPECT_FALSE(BlobAnalyzer::closestBlob({}, cv::Point2f(0, 0)).ok());
}

TEST(BlobAnalyzer, ClosestBlobTieKeepsFirst) {
    Blob first, second;
    first.pixelCount = 300;
    first.centroid = cv::Point2f(30, 40);
    second.pixelCount = 500;
    second.centroid = cv::Point2f(40, 30);

    FillResult R = BlobAnalyzer::closestBlob({first, second}, cv::Point2f(0, 0));
    ASSERT_TRUE(R.ok());
    EXPECT_EQ(R.blob.pixelCount, 300);

    R = BlobAnalyzer::closestBlob({second, first}, cv::Point2f(0, 0));
    ASSERT_TRUE(R.ok());
    EXPECT_EQ(R.blob.pixelCount, 500);
}

TEST(BlobAnalyzer, HugeMinSizeRejectsWithoutOverflow) {
    cv::Mat img = testimg::paper(400, 400);
    testimg::ink(img, cv::Rect(20, 20, 15, 15));
    EXPECT_EQ(darkBlobCount(img, cv::Rect(0, 0, 80, 80), 50000), 0u);
}

TEST(BlobAnalyzer, BrightFillStopsAtDarkRing) {
    cv::Mat img = testimg::paper(200, 200);
    testimg::frame(img, cv::Rect(50, 60, 40, 30), 2);
    PixelSampler s(img);
    BlobAnalyzer a(s, 160);
    FillResult R = a.fillBrightRegion(cv::Point(70, 75), cv::Rect(0, 0, 200, 200));
    ASSERT_TRUE(R.ok());
    EXPECT_EQ(R.blob.bounds(), cv::Rect(52, 62, 36, 26));
    EXPECT_EQ(R.blob.pixelCount, 36 * 26);
}

TEST(BlobAnalyzer, BrightFillWithoutBorderIsRejected) {
    cv::Mat img = testimg::paper(100, 100);
    PixelSampler s(img);
    BlobAnalyzer a(s, 160);
    EXPECT_FALSE(a.fillBrightRegion(cv::Point(50, 50), cv::Rect(0, 0, 100, 100)).ok());
}

TEST(BlobAnalyzer, BrightFillFromDarkSeedIsRejected) {
    cv::Mat img = testimg::paper(100, 100);
    testimg::ink(img, cv::Rect(10, 10, 5, 5));
    PixelSampler s(img);
    BlobAnalyzer a(s, 160);
    EXPECT_FALSE(a.fillBrightRegion(cv::Point(12, 12), cv::Rect(0, 0, 100, 100)).ok());
}
