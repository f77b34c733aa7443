#pragma once

#include "record.hpp"
#include "resource_cache.hpp"
#include "run_context.hpp"
#include "stages.hpp"

#include <opencv2/core.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace comic_mt {

// Single-channel 8-bit mask, 255 over every block (rotated blocks as rotated boxes), dilated.
cv::Mat generate_mask(const cv::Mat& image, const std::vector<TextBlock>& blocks);

// Detection -> OCR -> inpainting for one page. Failures end as a reported skip for that
// page only; cancellation ends it silently.
class ImageProcessor {
public:
    ImageProcessor(RunContext& ctx, ResourceCache& cache, OcrEngine& ocr);

    // nullopt when the image was skipped or the run was cancelled.
    std::optional<ImageProcessingRecord> process(const ImageJob& job, std::size_t index, const OutputTarget& target);

private:
    std::optional<ImageProcessingRecord> skip(ImageProcessingRecord& record, const StageFailure& failure);
    void export_cleaned(const ImageProcessingRecord& record);

    RunContext& ctx_;
    ResourceCache& cache_;
    OcrEngine& ocr_;
};

}  // namespace comic_mt
