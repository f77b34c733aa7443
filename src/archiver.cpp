#include "archiver.hpp"

#include "output_layout.hpp"

#include <exception>
#include <stdexcept>
#include <system_error>

namespace comic_mt {
namespace {

void remove_temporary_dirs(RunContext& ctx, const std::filesystem::path& save_dir, const std::filesystem::path& root) {
    std::error_code ec;
    std::filesystem::remove_all(save_dir, ec);
    if (ec) {
        ctx.log("[error] could not remove " + save_dir.string() + ": " + ec.message());
        return;
    }

    if (std::filesystem::exists(root, ec) && is_directory_empty(root)) {
        std::filesystem::remove_all(root, ec);
        if (ec) {
            ctx.log("[error] could not remove " + root.string() + ": " + ec.message());
        }
    }
}

}  // namespace

void run_archiver_pass(
    RunContext& ctx,
    ArchivePacker& packer,
    const std::vector<ArchiveDescriptor>& archives,
    const OutputPlan& plan
) {
    const PipelineSettings& settings = ctx.settings();
    const std::size_t total_images = ctx.total_images();

    for (std::size_t i = 0; i < archives.size(); ++i) {
        const ArchiveDescriptor& archive = archives[i];
        const std::size_t progress_index = total_images + i;

        ctx.progress(progress_index, 1, kArchiveSteps, true);
        if (ctx.cancelled()) {
            return;
        }

        const std::filesystem::path archive_dir = archive.archive_path.parent_path();
        const OutputTarget target = plan.archive_target(archive);
        const std::filesystem::path root = run_root(target);
        const std::filesystem::path save_dir = translated_images_dir(target);

        ctx.progress(progress_index, 2, kArchiveSteps, true);
        if (ctx.cancelled()) {
            return;
        }

        try {
            if (!std::filesystem::is_directory(save_dir)) {
                throw std::runtime_error("no translated pages at " + save_dir.string());
            }
            const auto written = packer.make(save_as_extension(settings, archive.archive_path), save_dir, archive_dir, target.archive_bname);
            ++ctx.stats().archives_written;
            ctx.log("[archive] " + written.string());
        } catch (const std::exception& ex) {
            ctx.stats().archive_errors.push_back(ArchiveError{archive.archive_path.string(), ex.what()});
            ctx.archive_failed(archive.archive_path.string(), ex.what());
            continue;
        }

        ctx.progress(progress_index, 3, kArchiveSteps, true);
        if (ctx.cancelled()) {
            return;
        }

        remove_temporary_dirs(ctx, save_dir, root);
    }
}

}  // namespace comic_mt
