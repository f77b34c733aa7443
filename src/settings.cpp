#include "settings.hpp"

#include <algorithm>
#include <cctype>

namespace comic_mt {

std::string inpainter_device(const PipelineSettings& settings) {
    return settings.use_gpu ? "cuda" : "cpu";
}

std::string save_as_extension(const PipelineSettings& settings, const std::filesystem::path& archive_path) {
    if (!settings.save_as_override.empty()) {
        return settings.save_as_override;
    }

    std::string ext = archive_path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    const auto it = settings.save_as.find(ext);
    return it == settings.save_as.end() ? std::string("cbz") : it->second;
}

}  // namespace comic_mt
