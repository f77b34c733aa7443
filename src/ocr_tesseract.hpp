#pragma once

#include "stages.hpp"

#include <tesseract/baseapi.h>

#include <string>
#include <vector>

namespace comic_mt {

class TesseractOcr final : public OcrEngine {
public:
    TesseractOcr(std::string tessdata_path, int expansion_percent);
    ~TesseractOcr() override;

    TesseractOcr(const TesseractOcr&) = delete;
    TesseractOcr& operator=(const TesseractOcr&) = delete;

    void initialize(const std::string& source_lang) override;
    std::vector<TextBlock> process(const cv::Mat& image, std::vector<TextBlock> blocks) override;

private:
    std::string recognize(const cv::Mat& crop, float& confidence);

    std::string tessdata_path_;
    int expansion_percent_;
    std::string loaded_language_;
    tesseract::TessBaseAPI api_;
};

}  // namespace comic_mt
