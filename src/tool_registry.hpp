#pragma once

#include "settings.hpp"
#include "stages.hpp"
#include "translator.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace comic_mt {

using DetectorFactory = std::function<std::unique_ptr<Detector>(const PipelineSettings&)>;
using InpainterFactory = std::function<std::unique_ptr<Inpainter>(const std::string& device)>;
using OcrFactory = std::function<std::unique_ptr<OcrEngine>(const PipelineSettings&)>;
using TranslatorFactory = std::function<std::unique_ptr<Translator>(const PipelineSettings&)>;

// Tool identifier -> factory. The only place a tool name decides which implementation runs.
class ToolRegistry {
public:
    void register_detector(const std::string& id, DetectorFactory factory);
    void register_inpainter(const std::string& id, InpainterFactory factory);
    void register_ocr(const std::string& id, OcrFactory factory);
    void register_translator(const std::string& id, TranslatorFactory factory);

    // Throw std::invalid_argument for unknown identifiers.
    std::unique_ptr<Detector> create_detector(const std::string& id, const PipelineSettings& settings) const;
    std::unique_ptr<Inpainter> create_inpainter(const std::string& id, const std::string& device) const;
    std::unique_ptr<OcrEngine> create_ocr(const std::string& id, const PipelineSettings& settings) const;
    std::unique_ptr<Translator> create_translator(const std::string& id, const PipelineSettings& settings) const;

    std::vector<std::string> detector_ids() const;
    std::vector<std::string> inpainter_ids() const;
    std::vector<std::string> ocr_ids() const;
    std::vector<std::string> translator_ids() const;

private:
    std::map<std::string, DetectorFactory> detectors_;
    std::map<std::string, InpainterFactory> inpainters_;
    std::map<std::string, OcrFactory> ocr_engines_;
    std::map<std::string, TranslatorFactory> translators_;
};

}  // namespace comic_mt
