#pragma once

#include "stages.hpp"

#include <opencv2/dnn.hpp>

#include <string>
#include <vector>

namespace comic_mt {

// Classical text-region detector: gradient, Otsu, closing, external contours.
// Needs no model file.
class ContourDetector final : public Detector {
public:
    std::vector<TextBlock> detect(const cv::Mat& image) override;
};

// EAST scene-text detector through cv::dnn. Rotated detections keep their angle.
class EastDetector final : public Detector {
public:
    explicit EastDetector(const std::string& model_path);

    std::vector<TextBlock> detect(const cv::Mat& image) override;

private:
    cv::dnn::TextDetectionModel_EAST model_;
};

}  // namespace comic_mt
