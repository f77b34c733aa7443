#include "image_processor.hpp"

#include "languages.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <exception>
#include <stdexcept>
#include <utility>

namespace comic_mt {
namespace {

constexpr int kMaskPadding = 2;

std::vector<TextBlock> clamp_blocks(std::vector<TextBlock> blocks, const cv::Size& size) {
    for (auto& blk : blocks) {
        blk.xyxy = clamp_to_image(blk.xyxy, size);
        if (blk.bubble_xyxy) {
            blk.bubble_xyxy = clamp_to_image(*blk.bubble_xyxy, size);
        }
    }
    return blocks;
}

}  // namespace

cv::Mat generate_mask(const cv::Mat& image, const std::vector<TextBlock>& blocks) {
    cv::Mat mask = cv::Mat::zeros(image.size(), CV_8UC1);
    const cv::Rect bounds(0, 0, image.cols, image.rows);

    for (const auto& blk : blocks) {
        if (blk.xyxy.empty()) {
            continue;
        }

        if (blk.angle != 0.0) {
            const cv::Point2f origin = blk.tr_origin_point.value_or(blk.center());
            const cv::RotatedRect rotated(
                origin,
                cv::Size2f(
                    static_cast<float>(blk.xyxy.width() + 2 * kMaskPadding),
                    static_cast<float>(blk.xyxy.height() + 2 * kMaskPadding)
                ),
                static_cast<float>(blk.angle)
            );
            cv::Point2f corners[4];
            rotated.points(corners);
            std::vector<cv::Point> polygon;
            for (const auto& p : corners) {
                polygon.emplace_back(cvRound(p.x), cvRound(p.y));
            }
            cv::fillConvexPoly(mask, polygon, cv::Scalar(255));
            continue;
        }

        cv::Rect rect = blk.xyxy.to_rect();
        rect.x -= kMaskPadding;
        rect.y -= kMaskPadding;
        rect.width += 2 * kMaskPadding;
        rect.height += 2 * kMaskPadding;
        rect &= bounds;
        mask(rect).setTo(cv::Scalar(255));
    }

    const cv::Mat kernel = cv::getStructuringElement(cv::MORPH_RECT, cv::Size(5, 5));
    cv::dilate(mask, mask, kernel);
    return mask;
}

ImageProcessor::ImageProcessor(RunContext& ctx, ResourceCache& cache, OcrEngine& ocr)
    : ctx_(ctx), cache_(cache), ocr_(ocr) {}

std::optional<ImageProcessingRecord> ImageProcessor::skip(ImageProcessingRecord& record, const StageFailure& failure) {
    mark_skipped(record, failure);
    report_skip(ctx_, record);
    return std::nullopt;
}

void ImageProcessor::export_cleaned(const ImageProcessingRecord& record) {
    try {
        const auto dir = output_subdir(record.target, kCleanedImagesDir);
        const auto path = dir / (record.target.base_name + "_cleaned" + record.target.extension);
        if (!cv::imwrite(path.string(), record.cleaned_image)) {
            ctx_.log("[error] could not write cleaned image " + path.string());
        }
    } catch (const std::exception& ex) {
        ctx_.log("[error] cleaned image export failed for " + record.image_path.string() + ": " + ex.what());
    }
}

std::optional<ImageProcessingRecord> ImageProcessor::process(
    const ImageJob& job,
    std::size_t index,
    const OutputTarget& target
) {
    const PipelineSettings& settings = ctx_.settings();

    ImageProcessingRecord record;
    record.image_path = job.path;
    record.index = index;
    record.target = target;
    record.languages = job.languages;
    record.target_lang_code = language_code(job.languages.target);

    try {
        record.image = cv::imread(job.path.string(), cv::IMREAD_COLOR);
    } catch (const cv::Exception&) {
        record.image.release();
    }
    if (record.image.empty()) {
        ++ctx_.stats().images_unreadable;
        mark_skipped(record, StageFailure{kStageImage, "unreadable image"});
        report_skip(ctx_, record, false);
        return std::nullopt;
    }

    ctx_.progress(index, 1);
    if (ctx_.cancelled()) {
        return std::nullopt;
    }

    auto detected = run_stage(kStageDetection, [&] {
        return cache_.get_detector(settings).detect(record.image);
    });

    ctx_.progress(index, 2);
    if (ctx_.cancelled()) {
        return std::nullopt;
    }

    if (!detected) {
        return skip(record, detected.error());
    }
    if (detected.value().empty()) {
        ++ctx_.stats().images_no_text;
        return skip(record, StageFailure{kStageTextBlocks, "no text blocks detected"});
    }

    std::vector<TextBlock> blocks = clamp_blocks(detected.take(), record.image.size());
    const std::size_t block_count = blocks.size();

    auto recognized = run_stage(kStageOcr, [&] {
        ocr_.initialize(record.languages.source);
        auto out = ocr_.process(record.image, std::move(blocks));
        if (out.size() != block_count) {
            throw std::runtime_error(
                "OCR returned " + std::to_string(out.size()) + " blocks for " + std::to_string(block_count)
            );
        }
        return sort_blk_list(std::move(out), is_right_to_left_source(record.languages.source));
    });
    if (!recognized) {
        return skip(record, recognized.error());
    }
    record.blk_list = recognized.take();

    ctx_.progress(index, 3);
    if (ctx_.cancelled()) {
        return std::nullopt;
    }

    const cv::Mat mask = generate_mask(record.image, record.blk_list);

    ctx_.progress(index, 4);
    if (ctx_.cancelled()) {
        return std::nullopt;
    }

    auto cleaned = run_stage(kStageInpainting, [&] {
        CachedInpainter cached = cache_.get_inpainter(settings);
        const cv::Mat raw = cached.inpainter.inpaint(record.image, mask, settings.inpaint);
        if (raw.empty() || raw.size() != record.image.size()) {
            throw std::runtime_error("inpainter " + cached.key + " returned an image of the wrong size");
        }
        cv::Mat out;
        cv::convertScaleAbs(raw, out);
        return out;
    });
    if (!cleaned) {
        return skip(record, cleaned.error());
    }
    record.cleaned_image = cleaned.take();

    ctx_.image_processed(index, record.cleaned_image, record.image_path.string());
    if (settings.export_cleaned_image) {
        export_cleaned(record);
    }

    ctx_.progress(index, 5);
    if (ctx_.cancelled()) {
        return std::nullopt;
    }

    return record;
}

}  // namespace comic_mt
