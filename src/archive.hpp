#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace comic_mt {

struct ArchiveDescriptor {
    std::filesystem::path archive_path;
    std::vector<std::filesystem::path> extracted_images;
    std::filesystem::path extraction_dir;
};

class ArchivePacker {
public:
    virtual ~ArchivePacker() = default;

    // Packs every regular file under input_dir into output_dir/<output_base_name>_translated.<output_ext>.
    virtual std::filesystem::path make(
        const std::string& output_ext,
        const std::filesystem::path& input_dir,
        const std::filesystem::path& output_dir,
        const std::string& output_base_name
    ) = 0;

    // Unpacks the image entries of archive into destination, returned in entry-name order.
    virtual std::vector<std::filesystem::path> extract(
        const std::filesystem::path& archive,
        const std::filesystem::path& destination
    ) = 0;
};

bool is_supported_archive(const std::filesystem::path& path);
bool is_supported_image(const std::filesystem::path& path);

}  // namespace comic_mt
