#include "record.hpp"

#include <exception>

namespace comic_mt {

void mark_skipped(ImageProcessingRecord& record, const StageFailure& failure) {
    if (record.skipped) {
        return;
    }
    record.skipped = true;
    record.skip_stage = failure.stage;
    record.error_message = failure.message;
}

void report_skip(RunContext& ctx, ImageProcessingRecord& record, bool write_copy) {
    if (record.skip_reported) {
        return;
    }
    record.skip_reported = true;

    if (write_copy) {
        try {
            save_verbatim(record.target, record.image_path);
        } catch (const std::exception& ex) {
            ctx.log("[error] could not copy skipped image " + record.image_path.string() + ": " + ex.what());
        }
    }

    try {
        append_skip_log(record.target, record.image_path);
    } catch (const std::exception& ex) {
        ctx.log("[error] " + std::string(ex.what()));
    }

    ++ctx.stats().images_skipped;
    ctx.image_skipped(record.image_path.string(), record.skip_stage, record.error_message);
}

}  // namespace comic_mt
