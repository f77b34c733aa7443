#include "detectors.hpp"

#include <gtest/gtest.h>

#include <opencv2/imgproc.hpp>

#include <stdexcept>

using namespace comic_mt;

namespace {

// White page with two dark text bands; the upper one sits further right.
cv::Mat two_band_page() {
    cv::Mat page(240, 320, CV_8UC3, cv::Scalar(255, 255, 255));
    cv::rectangle(page, cv::Rect(180, 30, 100, 24), cv::Scalar(0, 0, 0), cv::FILLED);
    cv::rectangle(page, cv::Rect(30, 150, 120, 30), cv::Scalar(0, 0, 0), cv::FILLED);
    return page;
}

bool contains(const BoxXYXY& outer, const cv::Rect& inner) {
    return outer.x1 <= inner.x && outer.y1 <= inner.y && outer.x2 >= inner.x + inner.width &&
        outer.y2 >= inner.y + inner.height;
}

}  // namespace

TEST(ContourDetector, FindsBandsTopToBottom) {
    ContourDetector detector;

    const auto blocks = detector.detect(two_band_page());

    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_TRUE(contains(blocks[0].xyxy, cv::Rect(180, 30, 100, 24)));
    EXPECT_TRUE(contains(blocks[1].xyxy, cv::Rect(30, 150, 120, 30)));
    EXPECT_LT(blocks[0].xyxy.y1, blocks[1].xyxy.y1);
}

TEST(ContourDetector, SamePageGivesSameBlocks) {
    ContourDetector detector;
    const cv::Mat page = two_band_page();

    const auto first = detector.detect(page);
    const auto second = detector.detect(page.clone());

    ASSERT_EQ(first.size(), second.size());
    for (std::size_t i = 0; i < first.size(); ++i) {
        EXPECT_EQ(first[i].xyxy, second[i].xyxy) << i;
    }
}

TEST(ContourDetector, IgnoresSpecksAndFlatPages) {
    ContourDetector detector;
    cv::Mat page(120, 120, CV_8UC3, cv::Scalar(255, 255, 255));
    EXPECT_TRUE(detector.detect(page).empty());

    cv::rectangle(page, cv::Rect(50, 50, 2, 2), cv::Scalar(0, 0, 0), cv::FILLED);
    EXPECT_TRUE(detector.detect(page).empty());
}

TEST(ContourDetector, RejectsEmptyImage) {
    ContourDetector detector;
    EXPECT_THROW(detector.detect(cv::Mat()), std::invalid_argument);
}
