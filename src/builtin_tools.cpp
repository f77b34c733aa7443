#include "builtin_tools.hpp"

#include "detectors.hpp"
#include "inpainter_opencv.hpp"
#include "ocr_tesseract.hpp"
#include "translator_llama.hpp"

#include <opencv2/photo.hpp>

#include <stdexcept>

namespace comic_mt {

void register_builtin_tools(ToolRegistry& registry) {
    registry.register_detector("contour", [](const PipelineSettings&) {
        return std::make_unique<ContourDetector>();
    });
    registry.register_detector("east", [](const PipelineSettings& settings) -> std::unique_ptr<Detector> {
        if (settings.detector_model.empty()) {
            throw std::invalid_argument("east detector needs --detector-model");
        }
        return std::make_unique<EastDetector>(settings.detector_model);
    });

    registry.register_ocr("tesseract", [](const PipelineSettings& settings) {
        return std::make_unique<TesseractOcr>(settings.tessdata_path, settings.ocr_expansion_percent);
    });

    // OpenCV inpainting runs on the CPU whatever device was requested.
    registry.register_inpainter("telea", [](const std::string&) {
        return std::make_unique<OpencvInpainter>(cv::INPAINT_TELEA);
    });
    registry.register_inpainter("ns", [](const std::string&) {
        return std::make_unique<OpencvInpainter>(cv::INPAINT_NS);
    });

    registry.register_translator("llama", [](const PipelineSettings& settings) {
        return std::make_unique<LlamaTranslator>(settings.translator_settings);
    });
}

}  // namespace comic_mt
