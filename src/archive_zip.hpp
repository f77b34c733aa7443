#pragma once

#include "archive.hpp"

namespace comic_mt {

// zip and cbz containers through libzip.
class ZipArchivePacker final : public ArchivePacker {
public:
    std::filesystem::path make(
        const std::string& output_ext,
        const std::filesystem::path& input_dir,
        const std::filesystem::path& output_dir,
        const std::string& output_base_name
    ) override;

    std::vector<std::filesystem::path> extract(
        const std::filesystem::path& archive,
        const std::filesystem::path& destination
    ) override;
};

}  // namespace comic_mt
