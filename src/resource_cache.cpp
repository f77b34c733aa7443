#include "resource_cache.hpp"

namespace comic_mt {

ResourceCache::ResourceCache(const ToolRegistry& tools) : tools_(tools) {}

Detector& ResourceCache::get_detector(const PipelineSettings& settings) {
    if (!detector_) {
        detector_ = tools_.create_detector(settings.detector, settings);
    }
    return *detector_;
}

CachedInpainter ResourceCache::get_inpainter(const PipelineSettings& settings) {
    const std::string device = inpainter_device(settings);
    const std::string key = settings.inpainter + ":" + device;

    if (!inpainter_ || inpainter_key_ != key) {
        // Drop the old model first so two never sit in memory together.
        inpainter_.reset();
        inpainter_key_.clear();

        inpainter_ = tools_.create_inpainter(settings.inpainter, device);
        inpainter_key_ = key;
        ++inpainter_builds_;
    }

    return CachedInpainter{*inpainter_, inpainter_key_};
}

}  // namespace comic_mt
