#include "detectors.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace comic_mt {
namespace {

constexpr int kMinBlockSide = 8;
constexpr double kMaxBlockAreaRatio = 0.9;
constexpr int kEastStride = 32;
constexpr int kEastMaxSide = 1280;

bool keep_block(const cv::Rect& rect, const cv::Size& image_size) {
    if (rect.width < kMinBlockSide || rect.height < kMinBlockSide) {
        return false;
    }
    const double area_ratio = static_cast<double>(rect.area()) / static_cast<double>(image_size.area());
    return area_ratio <= kMaxBlockAreaRatio;
}

TextBlock block_from_rect(const cv::Rect& rect) {
    TextBlock blk;
    blk.xyxy = BoxXYXY{rect.x, rect.y, rect.x + rect.width, rect.y + rect.height};
    return blk;
}

int round_to_stride(int value) {
    const int capped = std::min(value, kEastMaxSide);
    return std::max(kEastStride, (capped / kEastStride) * kEastStride);
}

}  // namespace

std::vector<TextBlock> ContourDetector::detect(const cv::Mat& image) {
    if (image.empty()) {
        throw std::invalid_argument("detector received an empty image");
    }

    cv::Mat gray;
    if (image.channels() == 1) {
        gray = image;
    } else {
        cv::cvtColor(image, gray, image.channels() == 4 ? cv::COLOR_BGRA2GRAY : cv::COLOR_BGR2GRAY);
    }

    cv::Mat gradient;
    cv::morphologyEx(
        gray,
        gradient,
        cv::MORPH_GRADIENT,
        cv::getStructuringElement(cv::MORPH_ELLIPSE, cv::Size(3, 3))
    );

    cv::Mat binary;
    cv::threshold(gradient, binary, 0, 255, cv::THRESH_BINARY | cv::THRESH_OTSU);

    cv::Mat connected;
    cv::morphologyEx(
        binary,
        connected,
        cv::MORPH_CLOSE,
        cv::getStructuringElement(cv::MORPH_RECT, cv::Size(9, 9))
    );

    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(connected, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    std::vector<cv::Rect> rects;
    for (const auto& contour : contours) {
        const cv::Rect rect = cv::boundingRect(contour);
        if (keep_block(rect, image.size())) {
            rects.push_back(rect);
        }
    }

    std::sort(rects.begin(), rects.end(), [](const cv::Rect& a, const cv::Rect& b) {
        return a.y != b.y ? a.y < b.y : a.x < b.x;
    });

    std::vector<TextBlock> blocks;
    blocks.reserve(rects.size());
    for (const auto& rect : rects) {
        blocks.push_back(block_from_rect(rect));
    }
    return blocks;
}

EastDetector::EastDetector(const std::string& model_path)
    : model_(model_path) {
    model_.setConfidenceThreshold(0.5f);
    model_.setNMSThreshold(0.4f);
    model_.setInputParams(1.0, cv::Size(320, 320), cv::Scalar(123.68, 116.78, 103.94), true);
}

std::vector<TextBlock> EastDetector::detect(const cv::Mat& image) {
    if (image.empty()) {
        throw std::invalid_argument("detector received an empty image");
    }

    cv::Mat bgr = image;
    if (image.channels() == 4) {
        cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
    } else if (image.channels() == 1) {
        cv::cvtColor(image, bgr, cv::COLOR_GRAY2BGR);
    }

    model_.setInputSize(cv::Size(round_to_stride(bgr.cols), round_to_stride(bgr.rows)));

    std::vector<cv::RotatedRect> detections;
    model_.detectTextRectangles(bgr, detections);

    std::vector<TextBlock> blocks;
    for (const auto& rotated : detections) {
        const cv::Rect rect = rotated.boundingRect() & cv::Rect(0, 0, bgr.cols, bgr.rows);
        if (!keep_block(rect, bgr.size())) {
            continue;
        }

        TextBlock blk = block_from_rect(rect);
        if (std::abs(rotated.angle) > 1.0f && std::abs(rotated.angle) < 89.0f) {
            blk.angle = rotated.angle;
            blk.tr_origin_point = rotated.center;
        }
        blocks.push_back(std::move(blk));
    }
    return blocks;
}

}  // namespace comic_mt
