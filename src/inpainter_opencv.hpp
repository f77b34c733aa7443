#pragma once

#include "stages.hpp"

namespace comic_mt {

// cv::inpaint with INPAINT_TELEA or INPAINT_NS, plus the HD strategies for large pages.
class OpencvInpainter final : public Inpainter {
public:
    explicit OpencvInpainter(int method, double radius = 3.0);

    cv::Mat inpaint(const cv::Mat& image, const cv::Mat& mask, const InpaintConfig& config) override;

private:
    cv::Mat inpaint_full(const cv::Mat& image, const cv::Mat& mask) const;
    cv::Mat inpaint_resized(const cv::Mat& image, const cv::Mat& mask, int resize_limit) const;
    cv::Mat inpaint_crops(const cv::Mat& image, const cv::Mat& mask, int margin) const;

    int method_;
    double radius_;
};

}  // namespace comic_mt
