#include "tool_registry.hpp"

#include <stdexcept>
#include <utility>

namespace comic_mt {
namespace {

template <typename Factory>
const Factory& find_factory(const std::map<std::string, Factory>& factories, const std::string& id, const char* kind) {
    const auto it = factories.find(id);
    if (it == factories.end()) {
        throw std::invalid_argument(std::string("Unknown ") + kind + ": " + id);
    }
    return it->second;
}

template <typename Factory>
std::vector<std::string> keys_of(const std::map<std::string, Factory>& factories) {
    std::vector<std::string> ids;
    ids.reserve(factories.size());
    for (const auto& [id, factory] : factories) {
        ids.push_back(id);
    }
    return ids;
}

template <typename T>
std::unique_ptr<T> require_instance(std::unique_ptr<T> instance, const std::string& id) {
    if (!instance) {
        throw std::runtime_error("Factory for " + id + " returned no instance");
    }
    return instance;
}

}  // namespace

void ToolRegistry::register_detector(const std::string& id, DetectorFactory factory) {
    detectors_[id] = std::move(factory);
}

void ToolRegistry::register_inpainter(const std::string& id, InpainterFactory factory) {
    inpainters_[id] = std::move(factory);
}

void ToolRegistry::register_ocr(const std::string& id, OcrFactory factory) {
    ocr_engines_[id] = std::move(factory);
}

void ToolRegistry::register_translator(const std::string& id, TranslatorFactory factory) {
    translators_[id] = std::move(factory);
}

std::unique_ptr<Detector> ToolRegistry::create_detector(const std::string& id, const PipelineSettings& settings) const {
    return require_instance(find_factory(detectors_, id, "detector")(settings), id);
}

std::unique_ptr<Inpainter> ToolRegistry::create_inpainter(const std::string& id, const std::string& device) const {
    return require_instance(find_factory(inpainters_, id, "inpainter")(device), id);
}

std::unique_ptr<OcrEngine> ToolRegistry::create_ocr(const std::string& id, const PipelineSettings& settings) const {
    return require_instance(find_factory(ocr_engines_, id, "OCR engine")(settings), id);
}

std::unique_ptr<Translator> ToolRegistry::create_translator(const std::string& id, const PipelineSettings& settings) const {
    return require_instance(find_factory(translators_, id, "translator")(settings), id);
}

std::vector<std::string> ToolRegistry::detector_ids() const {
    return keys_of(detectors_);
}

std::vector<std::string> ToolRegistry::inpainter_ids() const {
    return keys_of(inpainters_);
}

std::vector<std::string> ToolRegistry::ocr_ids() const {
    return keys_of(ocr_engines_);
}

std::vector<std::string> ToolRegistry::translator_ids() const {
    return keys_of(translators_);
}

}  // namespace comic_mt
