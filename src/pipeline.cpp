#include "pipeline.hpp"

#include "archiver.hpp"
#include "batch_translator.hpp"
#include "finalizer.hpp"
#include "image_processor.hpp"
#include "output_layout.hpp"
#include "resource_cache.hpp"
#include "writer_state.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace comic_mt {
namespace {

// Render state of every finished page, grouped by run root.
class RenderStateJournal {
public:
    void add(const ImageProcessingRecord& record) {
        images_[run_root(record.target)].push_back(ImageRenderState{record.image_path.string(), record.render_states});
        dirty_ = true;
    }

    void save(const RunContext& ctx) {
        if (!dirty_) {
            return;
        }
        for (const auto& [root, images] : images_) {
            std::string error;
            if (!write_render_state(root / kRenderStateName, images, error)) {
                ctx.log("[error] " + error);
            }
        }
        dirty_ = false;
    }

private:
    std::map<std::filesystem::path, std::vector<ImageRenderState>> images_;
    bool dirty_ = false;
};

}  // namespace

RunStats run_batch(
    const BatchRequest& request,
    Collaborators& stages,
    const CancellationToken& cancel,
    const ProgressCallback& callback
) {
    const auto started = std::chrono::steady_clock::now();
    const PipelineSettings& settings = request.settings;
    const std::string timestamp = settings.run_timestamp.empty() ? make_run_timestamp() : settings.run_timestamp;
    const std::size_t total_images = request.images.size();

    RunContext ctx(settings, timestamp, total_images, cancel, callback);
    ResourceCache cache(stages.tools);
    ImageProcessor processor(ctx, cache, stages.ocr);
    BatchTranslator batch(stages.translator, settings.batch_size, settings.extra_context);
    Finalizer finalizer(ctx, stages.renderer);
    RenderStateJournal journal;

    std::vector<std::filesystem::path> image_paths;
    image_paths.reserve(total_images);
    for (const auto& job : request.images) {
        image_paths.push_back(job.path);
    }
    const OutputPlan plan(image_paths, request.archives, settings.output_dir, timestamp);

    auto flush_batch = [&](std::size_t progress_index) {
        ctx.progress(progress_index, 6);
        if (ctx.cancelled()) {
            return;
        }

        std::vector<ImageProcessingRecord> records = batch.flush(ctx);
        for (auto& record : records) {
            if (ctx.cancelled()) {
                break;
            }
            if (finalizer.finalize(record)) {
                journal.add(record);
            }
        }
        journal.save(ctx);
    };

    for (std::size_t index = 0; index < total_images && !ctx.cancelled(); ++index) {
        const ImageJob& job = request.images[index];
        ctx.progress(index, 0, kImageSteps, true);

        const OutputTarget target = plan.image_target(job.path);
        std::optional<ImageProcessingRecord> record = processor.process(job, index, target);
        if (ctx.cancelled()) {
            break;
        }
        if (!record) {
            continue;
        }

        // Batches never mix language pairs.
        if (!batch.accepts(*record)) {
            flush_batch(index);
            if (ctx.cancelled()) {
                break;
            }
        }

        batch.add(std::move(*record));
        if (batch.full() || index + 1 == total_images) {
            flush_batch(index);
        }
    }

    // A trailing skipped image leaves the last batch unflushed.
    if (!ctx.cancelled() && !batch.empty()) {
        flush_batch(total_images == 0 ? 0 : total_images - 1);
    }

    if (!ctx.cancelled() && !request.archives.empty()) {
        run_archiver_pass(ctx, stages.packer, request.archives, plan);
    }

    RunStats stats = ctx.stats();
    stats.cancelled = ctx.cancelled();
    stats.wall_time = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started
    );

    ProgressEvent finished;
    finished.type = EventType::Finished;
    finished.success = !stats.cancelled && stats.archive_errors.empty();
    finished.total_images = static_cast<int>(total_images);
    finished.stats = stats;
    ctx.emit(finished);

    return stats;
}

}  // namespace comic_mt
