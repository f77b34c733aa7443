#pragma once

#include "archive.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace comic_mt {

// Where one image's outputs go: <directory>/comic_translate_<timestamp>/<kind>/<subdir>/<archive_bname>/.
// subdir is empty unless an output directory override collects inputs from several folders.
struct OutputTarget {
    std::filesystem::path directory;
    std::string timestamp;
    std::filesystem::path subdir;
    std::string archive_bname;
    std::string base_name;
    std::string extension;
};

inline constexpr const char* kCleanedImagesDir = "cleaned_images";
inline constexpr const char* kRawTextsDir = "raw_texts";
inline constexpr const char* kTranslatedTextsDir = "translated_texts";
inline constexpr const char* kTranslatedImagesDir = "translated_images";
inline constexpr const char* kSkipLogName = "skipped_images.log";
inline constexpr const char* kRenderStateName = "render_state.xml";

// Output locations of every input of one run. With an override, each input keeps its folder
// relative to the deepest folder shared by all inputs, so equal file names from different
// folders stay apart. Archives whose pages would share a folder get distinct names.
class OutputPlan {
public:
    OutputPlan(
        const std::vector<std::filesystem::path>& images,
        const std::vector<ArchiveDescriptor>& archives,
        std::filesystem::path output_dir_override,
        std::string timestamp
    );

    OutputTarget image_target(const std::filesystem::path& image_path) const;
    OutputTarget archive_target(const ArchiveDescriptor& archive) const;

private:
    struct ArchiveSlot {
        std::filesystem::path archive_path;
        std::vector<std::filesystem::path> extracted_images;
        std::filesystem::path subdir;
        std::string bname;
    };

    std::filesystem::path directory_for(const std::filesystem::path& source_dir) const;
    std::filesystem::path subdir_for(const std::filesystem::path& source_dir) const;
    const ArchiveSlot& slot_for(const std::filesystem::path& archive_path) const;

    std::filesystem::path output_dir_override_;
    std::string timestamp_;
    std::filesystem::path input_root_;
    std::vector<ArchiveSlot> slots_;
};

std::filesystem::path run_root(const std::filesystem::path& directory, const std::string& timestamp);
std::filesystem::path run_root(const OutputTarget& target);

// Creates the directory when missing.
std::filesystem::path output_subdir(const OutputTarget& target, const char* kind);

// <run root>/translated_images/<subdir>/<archive_bname>, not created.
std::filesystem::path translated_images_dir(const OutputTarget& target);

std::filesystem::path translated_image_path(const OutputTarget& target);

// Copies the source bytes unchanged to the translated_images location of a skipped image.
void save_verbatim(const OutputTarget& target, const std::filesystem::path& source_image);

void append_skip_log(const OutputTarget& target, const std::filesystem::path& image_path);

// True when no regular file exists anywhere below dir.
bool is_directory_empty(const std::filesystem::path& dir);

}  // namespace comic_mt
