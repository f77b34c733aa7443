#pragma once

#include "renderer.hpp"

namespace comic_mt {

// Renderer on OpenCV's Hershey fonts. Layout grows each block into the flat background
// the inpainter left around it; bubbles, when known, bound the area instead.
class OpencvRenderer final : public Renderer {
public:
    std::vector<TextBlock> compute_layout(
        std::vector<TextBlock> blocks,
        const cv::Mat& original_image,
        const cv::Mat& cleaned_image
    ) override;

    WrappedText word_wrap(
        const std::string& text,
        int width,
        int height,
        const RenderSettings& settings
    ) override;

    cv::Mat composite(const cv::Mat& cleaned_image, const std::vector<RenderState>& states) override;
};

// "#rrggbb" -> BGR; black when malformed.
cv::Scalar parse_color(const std::string& hex);

}  // namespace comic_mt
