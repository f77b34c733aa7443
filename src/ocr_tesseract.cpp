#include "ocr_tesseract.hpp"

#include "languages.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cctype>
#include <memory>
#include <stdexcept>
#include <utility>

namespace comic_mt {
namespace {

std::string single_line(std::string text) {
    std::replace(text.begin(), text.end(), '\n', ' ');

    auto is_ws = [](unsigned char c) { return std::isspace(c) != 0; };
    while (!text.empty() && is_ws(static_cast<unsigned char>(text.front()))) {
        text.erase(text.begin());
    }
    while (!text.empty() && is_ws(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    return text;
}

}  // namespace

TesseractOcr::TesseractOcr(std::string tessdata_path, int expansion_percent)
    : tessdata_path_(std::move(tessdata_path)), expansion_percent_(expansion_percent) {}

TesseractOcr::~TesseractOcr() {
    api_.End();
}

void TesseractOcr::initialize(const std::string& source_lang) {
    const std::string language = tesseract_language(source_lang);
    if (language == loaded_language_) {
        return;
    }

    api_.End();
    loaded_language_.clear();

    const char* datapath = tessdata_path_.empty() ? nullptr : tessdata_path_.c_str();
    if (api_.Init(datapath, language.c_str(), tesseract::OEM_LSTM_ONLY) != 0) {
        throw std::runtime_error("tesseract could not load language data '" + language + "'");
    }
    api_.SetPageSegMode(tesseract::PSM_SINGLE_BLOCK);
    loaded_language_ = language;
}

std::string TesseractOcr::recognize(const cv::Mat& crop, float& confidence) {
    cv::Mat rgb;
    cv::cvtColor(crop, rgb, cv::COLOR_BGR2RGB);
    if (!rgb.isContinuous()) {
        rgb = rgb.clone();
    }

    api_.SetImage(rgb.data, rgb.cols, rgb.rows, 3, static_cast<int>(rgb.step[0]));

    std::unique_ptr<char[]> text(api_.GetUTF8Text());
    confidence = static_cast<float>(api_.MeanTextConf()) / 100.0f;
    api_.Clear();

    return text ? single_line(text.get()) : std::string();
}

std::vector<TextBlock> TesseractOcr::process(const cv::Mat& image, std::vector<TextBlock> blocks) {
    if (loaded_language_.empty()) {
        throw std::logic_error("TesseractOcr::process called before initialize");
    }

    for (auto& blk : blocks) {
        const BoxXYXY region = blk.bubble_xyxy
            ? clamp_to_image(*blk.bubble_xyxy, image.size())
            : expand_box(blk.xyxy, expansion_percent_, expansion_percent_, image.size());

        if (region.empty()) {
            blk.text.clear();
            blk.confidence = 0.0f;
            continue;
        }

        blk.text = recognize(image(region.to_rect()), blk.confidence);
    }
    return blocks;
}

}  // namespace comic_mt
