#include "finalizer.hpp"

#include "block_json.hpp"
#include "languages.hpp"
#include "text_format.hpp"
#include "writer_text.hpp"

#include <opencv2/imgcodecs.hpp>

#include <stdexcept>
#include <string>
#include <utility>

namespace comic_mt {

Finalizer::Finalizer(RunContext& ctx, Renderer& renderer) : ctx_(ctx), renderer_(renderer) {}

bool Finalizer::export_texts(ImageProcessingRecord& record) {
    const PipelineSettings& settings = ctx_.settings();

    auto serialized = run_stage(kStageTranslator, [&] {
        return std::make_pair(
            dump_block_texts(record.blk_list, BlockField::Text),
            dump_block_texts(record.blk_list, BlockField::Translation)
        );
    });
    if (!serialized) {
        mark_skipped(record, StageFailure{
            kStageTranslator,
            "translation text invalid: " + serialized.error().message
        });
        report_skip(ctx_, record);
        return false;
    }

    const auto& [raw_text, translated_text] = serialized.value();
    std::string error;

    if (settings.export_raw_text) {
        const auto path = output_subdir(record.target, kRawTextsDir) / (record.target.base_name + "_raw.txt");
        if (!write_text_output(path, raw_text, error)) {
            ctx_.log("[error] " + error);
        }
    }

    if (settings.export_translated_text) {
        const auto path = output_subdir(record.target, kTranslatedTextsDir) /
            (record.target.base_name + "_translated.txt");
        if (!write_text_output(path, translated_text, error)) {
            ctx_.log("[error] " + error);
        }
    }

    return true;
}

void Finalizer::build_render_states(ImageProcessingRecord& record) {
    const RenderSettings& render = ctx_.settings().render;

    format_translations(record.blk_list, record.target_lang_code, render.upper_case);
    const std::size_t count = record.blk_list.size();
    auto laid_out = renderer_.compute_layout(std::move(record.blk_list), record.image, record.cleaned_image);
    if (laid_out.size() != count) {
        throw std::runtime_error("layout changed the number of text blocks");
    }
    record.blk_list = std::move(laid_out);

    const bool strip_spaces = omits_word_spaces(record.target_lang_code);

    record.render_states.clear();
    for (const auto& blk : record.blk_list) {
        if (blk.translation.find_first_not_of(" \t\r\n") == std::string::npos) {
            continue;
        }

        const BoxXYXY& area = blk.render_xyxy.empty() ? blk.xyxy : blk.render_xyxy;
        WrappedText wrapped = renderer_.word_wrap(blk.translation, area.width(), area.height(), render);
        if (strip_spaces) {
            wrapped.text = collapse_spaces(wrapped.text);
        }

        RenderState state;
        state.text = std::move(wrapped.text);
        state.font_family = render.font_family;
        state.font_size = wrapped.font_size;
        state.text_color = render.color;
        state.alignment = render.alignment;
        state.line_spacing = render.line_spacing;
        state.outline = render.outline;
        state.outline_color = render.outline_color;
        state.outline_width = render.outline_width;
        state.bold = render.bold;
        state.italic = render.italic;
        state.underline = render.underline;
        state.position = cv::Point(area.x1, area.y1);
        state.rotation = blk.angle;
        if (blk.tr_origin_point) {
            state.transform_origin = cv::Point2f(
                blk.tr_origin_point->x - static_cast<float>(area.x1),
                blk.tr_origin_point->y - static_cast<float>(area.y1)
            );
        }
        state.width = area.width();
        state.direction = render.direction;
        record.render_states.push_back(std::move(state));
    }
}

bool Finalizer::write_final_image(ImageProcessingRecord& record) {
    auto written = run_stage(kStageRendering, [&] {
        const cv::Mat page = renderer_.composite(record.cleaned_image, record.render_states);
        const auto path = translated_image_path(record.target);
        if (!cv::imwrite(path.string(), page)) {
            throw std::runtime_error("could not encode " + path.string());
        }
        return path;
    });

    if (!written) {
        mark_skipped(record, written.error());
        report_skip(ctx_, record);
        return false;
    }
    return true;
}

bool Finalizer::finalize(ImageProcessingRecord& record) {
    const std::size_t index = record.index;

    if (record.skipped) {
        report_skip(ctx_, record);
        return false;
    }

    if (!export_texts(record)) {
        return false;
    }

    ctx_.progress(index, 7);
    if (ctx_.cancelled()) {
        return false;
    }

    auto laid_out = run_stage(kStageRendering, [&] {
        build_render_states(record);
        return record.render_states.size();
    });
    if (!laid_out) {
        mark_skipped(record, laid_out.error());
        report_skip(ctx_, record);
        return false;
    }

    ctx_.progress(index, 8);
    if (ctx_.cancelled()) {
        return false;
    }

    if (!write_final_image(record)) {
        return false;
    }

    ++ctx_.stats().images_completed;
    ctx_.progress(index, 9);
    return true;
}

}  // namespace comic_mt
