#pragma once

#include "languages.hpp"
#include "output_layout.hpp"
#include "renderer.hpp"
#include "run_context.hpp"
#include "stage_result.hpp"
#include "text_block.hpp"

#include <opencv2/core.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace comic_mt {

// One input page and the languages it is translated between.
struct ImageJob {
    std::filesystem::path path;
    LanguagePair languages;
};

inline constexpr const char* kStageImage = "Image";
inline constexpr const char* kStageDetection = "Detection";
inline constexpr const char* kStageTextBlocks = "Text Blocks";
inline constexpr const char* kStageOcr = "OCR";
inline constexpr const char* kStageInpainting = "Inpainting";
inline constexpr const char* kStageTranslator = "Translator";
inline constexpr const char* kStageRendering = "Rendering";

struct ImageProcessingRecord {
    std::filesystem::path image_path;
    std::size_t index = 0;
    OutputTarget target;

    std::vector<TextBlock> blk_list;
    cv::Mat image;
    cv::Mat cleaned_image;

    LanguagePair languages;
    std::string target_lang_code;

    bool skipped = false;
    std::string skip_stage;
    std::string error_message;
    bool skip_reported = false;

    std::vector<RenderState> render_states;
};

void mark_skipped(ImageProcessingRecord& record, const StageFailure& failure);

// Emits the skip exactly once: skip log line, skip event, and (when write_copy) the
// verbatim source bytes as the translated output.
void report_skip(RunContext& ctx, ImageProcessingRecord& record, bool write_copy = true);

}  // namespace comic_mt
