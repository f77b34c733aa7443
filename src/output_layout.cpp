#include "output_layout.hpp"

#include <algorithm>
#include <fstream>
#include <set>
#include <stdexcept>
#include <utility>

namespace comic_mt {
namespace {

std::filesystem::path normalized(const std::filesystem::path& path) {
    if (path.empty()) {
        return std::filesystem::current_path();
    }
    return std::filesystem::absolute(path).lexically_normal();
}

std::filesystem::path common_ancestor(const std::filesystem::path& a, const std::filesystem::path& b) {
    std::filesystem::path out;
    auto ia = a.begin();
    auto ib = b.begin();
    for (; ia != a.end() && ib != b.end() && *ia == *ib; ++ia, ++ib) {
        out /= *ia;
    }
    return out;
}

std::filesystem::path join(std::filesystem::path dir, const std::filesystem::path& subdir) {
    if (!subdir.empty()) {
        dir /= subdir;
    }
    return dir;
}

// Same folder, or a folder somewhere below it.
bool is_within(const std::string& path, const std::string& dir) {
    return path == dir || path.starts_with(dir + "/");
}

}  // namespace

OutputPlan::OutputPlan(
    const std::vector<std::filesystem::path>& images,
    const std::vector<ArchiveDescriptor>& archives,
    std::filesystem::path output_dir_override,
    std::string timestamp
)
    : output_dir_override_(std::move(output_dir_override)),
      timestamp_(std::move(timestamp)) {
    std::set<std::filesystem::path> extracted;
    for (const auto& archive : archives) {
        extracted.insert(archive.extracted_images.begin(), archive.extracted_images.end());
    }

    std::vector<std::filesystem::path> source_dirs;
    for (const auto& image : images) {
        if (extracted.count(image) == 0) {
            source_dirs.push_back(image.parent_path());
        }
    }
    for (const auto& archive : archives) {
        source_dirs.push_back(archive.archive_path.parent_path());
    }

    if (!output_dir_override_.empty()) {
        for (std::size_t i = 0; i < source_dirs.size(); ++i) {
            const auto dir = normalized(source_dirs[i]);
            input_root_ = i == 0 ? dir : common_ancestor(input_root_, dir);
        }
    }

    // Folders holding loose pages or other archives; an archive's page folder may not
    // contain any of them or the packer would pick up foreign pages.
    std::vector<std::string> occupied;
    for (const auto& dir : source_dirs) {
        occupied.push_back(join(run_root(directory_for(dir), timestamp_), subdir_for(dir)).lexically_normal().generic_string());
    }

    std::vector<std::string> taken;
    for (const auto& archive : archives) {
        ArchiveSlot slot;
        slot.archive_path = archive.archive_path;
        slot.extracted_images = archive.extracted_images;
        slot.subdir = subdir_for(archive.archive_path.parent_path());

        const auto parent = join(run_root(directory_for(archive.archive_path.parent_path()), timestamp_), slot.subdir);
        const std::string stem = archive.archive_path.stem().string();
        std::string ext = archive.archive_path.extension().string();
        if (!ext.empty() && ext.front() == '.') {
            ext.erase(0, 1);
        }

        for (int attempt = 0;; ++attempt) {
            std::string candidate = stem;
            if (attempt > 0 && !ext.empty()) {
                candidate += "_" + ext;
            }
            if (attempt > 1) {
                candidate += "_" + std::to_string(attempt);
            }

            const std::string key = (parent / candidate).lexically_normal().generic_string();
            const bool clash = std::any_of(occupied.begin(), occupied.end(), [&](const std::string& dir) {
                return is_within(dir, key);
            }) || std::any_of(taken.begin(), taken.end(), [&](const std::string& other) {
                return is_within(other, key) || is_within(key, other);
            });
            if (!clash) {
                slot.bname = candidate;
                taken.push_back(key);
                break;
            }
        }
        slots_.push_back(std::move(slot));
    }
}

OutputTarget OutputPlan::image_target(const std::filesystem::path& image_path) const {
    OutputTarget target;
    target.timestamp = timestamp_;
    target.base_name = image_path.stem().string();
    target.extension = image_path.extension().string();

    for (const auto& slot : slots_) {
        const auto& images = slot.extracted_images;
        if (std::find(images.begin(), images.end(), image_path) != images.end()) {
            target.directory = directory_for(slot.archive_path.parent_path());
            target.subdir = slot.subdir;
            target.archive_bname = slot.bname;
            return target;
        }
    }

    target.directory = directory_for(image_path.parent_path());
    target.subdir = subdir_for(image_path.parent_path());
    return target;
}

OutputTarget OutputPlan::archive_target(const ArchiveDescriptor& archive) const {
    const ArchiveSlot& slot = slot_for(archive.archive_path);

    OutputTarget target;
    target.timestamp = timestamp_;
    target.directory = directory_for(slot.archive_path.parent_path());
    target.subdir = slot.subdir;
    target.archive_bname = slot.bname;
    return target;
}

std::filesystem::path OutputPlan::directory_for(const std::filesystem::path& source_dir) const {
    return output_dir_override_.empty() ? source_dir : output_dir_override_;
}

std::filesystem::path OutputPlan::subdir_for(const std::filesystem::path& source_dir) const {
    if (output_dir_override_.empty()) {
        return {};
    }
    const auto rel = normalized(source_dir).lexically_relative(input_root_);
    if (rel.empty() || rel == ".") {
        return {};
    }
    return rel;
}

const OutputPlan::ArchiveSlot& OutputPlan::slot_for(const std::filesystem::path& archive_path) const {
    for (const auto& slot : slots_) {
        if (slot.archive_path == archive_path) {
            return slot;
        }
    }
    throw std::invalid_argument("archive is not part of this run: " + archive_path.string());
}

std::filesystem::path run_root(const std::filesystem::path& directory, const std::string& timestamp) {
    return directory / ("comic_translate_" + timestamp);
}

std::filesystem::path run_root(const OutputTarget& target) {
    return run_root(target.directory, target.timestamp);
}

std::filesystem::path output_subdir(const OutputTarget& target, const char* kind) {
    std::filesystem::path dir = join(run_root(target) / kind, target.subdir);
    if (!target.archive_bname.empty()) {
        dir /= target.archive_bname;
    }
    std::filesystem::create_directories(dir);
    return dir;
}

std::filesystem::path translated_images_dir(const OutputTarget& target) {
    std::filesystem::path dir = join(run_root(target) / kTranslatedImagesDir, target.subdir);
    if (!target.archive_bname.empty()) {
        dir /= target.archive_bname;
    }
    return dir;
}

std::filesystem::path translated_image_path(const OutputTarget& target) {
    return output_subdir(target, kTranslatedImagesDir) / (target.base_name + "_translated" + target.extension);
}

void save_verbatim(const OutputTarget& target, const std::filesystem::path& source_image) {
    std::filesystem::copy_file(
        source_image,
        translated_image_path(target),
        std::filesystem::copy_options::overwrite_existing
    );
}

void append_skip_log(const OutputTarget& target, const std::filesystem::path& image_path) {
    const auto root = run_root(target);
    std::filesystem::create_directories(root);

    std::ofstream out(root / kSkipLogName, std::ios::app);
    if (!out) {
        throw std::runtime_error("Failed to open skip log under: " + root.string());
    }
    out << image_path.string() << "\n";
}

bool is_directory_empty(const std::filesystem::path& dir) {
    std::error_code ec;
    for (auto it = std::filesystem::recursive_directory_iterator(dir, ec);
         !ec && it != std::filesystem::recursive_directory_iterator();
         it.increment(ec)) {
        if (it->is_regular_file()) {
            return false;
        }
    }
    return true;
}

}  // namespace comic_mt
