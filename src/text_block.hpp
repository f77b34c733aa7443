#pragma once

#include <opencv2/core.hpp>

#include <optional>
#include <string>
#include <vector>

namespace comic_mt {

// Axis-aligned box in pixel coordinates, x2/y2 exclusive.
struct BoxXYXY {
    int x1 = 0;
    int y1 = 0;
    int x2 = 0;
    int y2 = 0;

    int width() const { return x2 - x1; }
    int height() const { return y2 - y1; }
    bool empty() const { return x2 <= x1 || y2 <= y1; }
    cv::Rect to_rect() const { return cv::Rect(x1, y1, width(), height()); }

    friend bool operator==(const BoxXYXY&, const BoxXYXY&) = default;
};

struct TextBlock {
    BoxXYXY xyxy;
    std::optional<BoxXYXY> bubble_xyxy;
    double angle = 0.0;
    std::optional<cv::Point2f> tr_origin_point;

    std::string text;
    std::string translation;
    float confidence = 0.0f;

    // Filled by layout; empty until the renderer has run.
    BoxXYXY render_xyxy;

    cv::Point2f center() const;
};

BoxXYXY clamp_to_image(const BoxXYXY& box, const cv::Size& image_size);

// Grows the box by a percentage of its own size on each axis and clamps it.
BoxXYXY expand_box(const BoxXYXY& box, int expand_x_percent, int expand_y_percent, const cv::Size& image_size);

// Reading order: rows top to bottom, blocks inside a row right-to-left for
// right_to_left sources and left-to-right otherwise.
std::vector<TextBlock> sort_blk_list(std::vector<TextBlock> blocks, bool right_to_left);

}  // namespace comic_mt
