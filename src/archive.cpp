#include "archive.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace comic_mt {
namespace {

std::string lowercase_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

}  // namespace

bool is_supported_archive(const std::filesystem::path& path) {
    static constexpr std::array<std::string_view, 2> kArchiveExts = {".zip", ".cbz"};
    const std::string ext = lowercase_extension(path);
    return std::find(kArchiveExts.begin(), kArchiveExts.end(), ext) != kArchiveExts.end();
}

bool is_supported_image(const std::filesystem::path& path) {
    static constexpr std::array<std::string_view, 5> kImageExts = {".png", ".jpg", ".jpeg", ".webp", ".bmp"};
    const std::string ext = lowercase_extension(path);
    return std::find(kImageExts.begin(), kImageExts.end(), ext) != kImageExts.end();
}

}  // namespace comic_mt
