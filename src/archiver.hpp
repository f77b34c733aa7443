#pragma once

#include "archive.hpp"
#include "output_layout.hpp"
#include "run_context.hpp"

#include <vector>

namespace comic_mt {

// Repackages each archive's translated pages next to the source archive and removes the
// temporary per-run directories. One archive failing does not stop the others; failures
// land in ctx.stats().archive_errors.
void run_archiver_pass(
    RunContext& ctx,
    ArchivePacker& packer,
    const std::vector<ArchiveDescriptor>& archives,
    const OutputPlan& plan
);

}  // namespace comic_mt
