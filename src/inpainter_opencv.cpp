#include "inpainter_opencv.hpp"

#include <opencv2/imgproc.hpp>
#include <opencv2/photo.hpp>

#include <algorithm>
#include <stdexcept>
#include <vector>

namespace comic_mt {

OpencvInpainter::OpencvInpainter(int method, double radius)
    : method_(method), radius_(radius) {}

cv::Mat OpencvInpainter::inpaint_full(const cv::Mat& image, const cv::Mat& mask) const {
    cv::Mat out;
    cv::inpaint(image, mask, out, radius_, method_);
    return out;
}

cv::Mat OpencvInpainter::inpaint_resized(const cv::Mat& image, const cv::Mat& mask, int resize_limit) const {
    const int longest = std::max(image.cols, image.rows);
    if (resize_limit <= 0 || longest <= resize_limit) {
        return inpaint_full(image, mask);
    }

    const double scale = static_cast<double>(resize_limit) / static_cast<double>(longest);
    cv::Mat small_image;
    cv::Mat small_mask;
    cv::resize(image, small_image, cv::Size(), scale, scale, cv::INTER_AREA);
    cv::resize(mask, small_mask, small_image.size(), 0, 0, cv::INTER_NEAREST);

    cv::Mat restored;
    cv::resize(inpaint_full(small_image, small_mask), restored, image.size(), 0, 0, cv::INTER_CUBIC);

    // Only masked pixels come from the downscaled pass.
    cv::Mat out = image.clone();
    restored.copyTo(out, mask);
    return out;
}

cv::Mat OpencvInpainter::inpaint_crops(const cv::Mat& image, const cv::Mat& mask, int margin) const {
    std::vector<std::vector<cv::Point>> contours;
    cv::findContours(mask.clone(), contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

    const cv::Rect bounds(0, 0, image.cols, image.rows);
    cv::Mat out = image.clone();

    for (const auto& contour : contours) {
        cv::Rect region = cv::boundingRect(contour);
        region.x -= margin;
        region.y -= margin;
        region.width += 2 * margin;
        region.height += 2 * margin;
        region &= bounds;
        if (region.empty()) {
            continue;
        }

        const cv::Mat crop_mask = mask(region);
        const cv::Mat filled = inpaint_full(out(region), crop_mask);
        filled.copyTo(out(region), crop_mask);
    }
    return out;
}

cv::Mat OpencvInpainter::inpaint(const cv::Mat& image, const cv::Mat& mask, const InpaintConfig& config) {
    if (image.empty() || mask.empty() || image.size() != mask.size()) {
        throw std::invalid_argument("inpaint needs an image and a mask of the same size");
    }
    if (mask.type() != CV_8UC1) {
        throw std::invalid_argument("inpaint mask must be single-channel 8-bit");
    }

    cv::Mat bgr = image;
    if (image.channels() == 4) {
        cv::cvtColor(image, bgr, cv::COLOR_BGRA2BGR);
    }

    switch (config.strategy) {
    case HdStrategy::Original:
        return inpaint_full(bgr, mask);
    case HdStrategy::Resize:
        return inpaint_resized(bgr, mask, config.resize_limit);
    case HdStrategy::Crop:
        if (std::max(bgr.cols, bgr.rows) > config.crop_trigger_size) {
            return inpaint_crops(bgr, mask, config.crop_margin);
        }
        return inpaint_full(bgr, mask);
    }
    return inpaint_full(bgr, mask);
}

}  // namespace comic_mt
