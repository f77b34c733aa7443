#pragma once

#include "record.hpp"
#include "renderer.hpp"
#include "run_context.hpp"

namespace comic_mt {

// Turns a translated record into exported texts, render state and the final page.
class Finalizer {
public:
    Finalizer(RunContext& ctx, Renderer& renderer);

    // True when the translated page was written. Skipped records (including ones that
    // fail here) are reported once and get a verbatim copy; false is also returned when
    // the run was cancelled part way through.
    bool finalize(ImageProcessingRecord& record);

private:
    bool export_texts(ImageProcessingRecord& record);
    void build_render_states(ImageProcessingRecord& record);
    bool write_final_image(ImageProcessingRecord& record);

    RunContext& ctx_;
    Renderer& renderer_;
};

}  // namespace comic_mt
