#pragma once

#include "archive.hpp"
#include "progress_event.hpp"
#include "record.hpp"
#include "renderer.hpp"
#include "run_context.hpp"
#include "settings.hpp"
#include "stages.hpp"
#include "tool_registry.hpp"
#include "translator.hpp"

#include <vector>

namespace comic_mt {

// Collaborators of one run. Detector and inpainter come from tools through the
// resource cache; the rest are used as given. All must outlive the run.
struct Collaborators {
    const ToolRegistry& tools;
    OcrEngine& ocr;
    Translator& translator;
    Renderer& renderer;
    ArchivePacker& packer;
};

struct BatchRequest {
    std::vector<ImageJob> images;
    std::vector<ArchiveDescriptor> archives;
    PipelineSettings settings;
};

// Runs every image through detect -> OCR -> inpaint -> batched translate -> finalize in
// input order, then repackages archives. Emits a Finished event last. Blocking; call it
// from a worker thread.
RunStats run_batch(
    const BatchRequest& request,
    Collaborators& stages,
    const CancellationToken& cancel,
    const ProgressCallback& callback = {}
);

}  // namespace comic_mt
