#pragma once

#include "text_block.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace comic_mt {

class Detector {
public:
    virtual ~Detector() = default;

    // Must be deterministic for a given image and configuration.
    virtual std::vector<TextBlock> detect(const cv::Mat& image) = 0;
};

class OcrEngine {
public:
    virtual ~OcrEngine() = default;

    // Called before every image; engines reload language data only when it changes.
    virtual void initialize(const std::string& source_lang) = 0;

    // Returns the same blocks, same order, with text filled in.
    virtual std::vector<TextBlock> process(const cv::Mat& image, std::vector<TextBlock> blocks) = 0;
};

enum class HdStrategy {
    Original,
    Resize,
    Crop
};

struct InpaintConfig {
    HdStrategy strategy = HdStrategy::Resize;
    int resize_limit = 960;
    int crop_margin = 512;
    int crop_trigger_size = 512;
};

// Built once per (tool, device) pair by the resource cache.
class Inpainter {
public:
    virtual ~Inpainter() = default;

    virtual cv::Mat inpaint(const cv::Mat& image, const cv::Mat& mask, const InpaintConfig& config) = 0;
};

}  // namespace comic_mt
