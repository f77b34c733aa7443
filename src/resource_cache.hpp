#pragma once

#include "settings.hpp"
#include "stages.hpp"
#include "tool_registry.hpp"

#include <memory>
#include <string>

namespace comic_mt {

struct CachedInpainter {
    Inpainter& inpainter;
    std::string key;
};

// Keeps model-backed detector and inpainter alive across the images of a run.
// Used from the run's worker thread only.
class ResourceCache {
public:
    explicit ResourceCache(const ToolRegistry& tools);

    // Built on first use, then reused for the whole run.
    Detector& get_detector(const PipelineSettings& settings);

    // Rebuilt whenever "<tool>:<device>" differs from the cached key.
    CachedInpainter get_inpainter(const PipelineSettings& settings);

    std::size_t inpainter_builds() const { return inpainter_builds_; }

private:
    const ToolRegistry& tools_;
    std::unique_ptr<Detector> detector_;
    std::unique_ptr<Inpainter> inpainter_;
    std::string inpainter_key_;
    std::size_t inpainter_builds_ = 0;
};

}  // namespace comic_mt
