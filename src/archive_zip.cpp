#include "archive_zip.hpp"

#include <zip.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace comic_mt {
namespace {

constexpr zip_uint64_t kMaxEntrySize = 512ull * 1024ull * 1024ull;

struct ZipDiscard {
    void operator()(zip_t* archive) const {
        if (archive != nullptr) {
            zip_discard(archive);
        }
    }
};

using ZipHandle = std::unique_ptr<zip_t, ZipDiscard>;

std::string zip_open_error(int code) {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    return message;
}

ZipHandle open_zip(const std::filesystem::path& path, int flags) {
    int code = 0;
    zip_t* archive = zip_open(path.c_str(), flags, &code);
    if (archive == nullptr) {
        throw std::runtime_error("Failed to open archive " + path.string() + ": " + zip_open_error(code));
    }
    return ZipHandle(archive);
}

std::string normalize_ext(std::string ext) {
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(ext.begin());
    }
    std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return ext;
}

// Flattens "dir/page 01.png" to "dir_page 01.png"; empty for entries escaping the root.
std::string flatten_entry_name(const std::string& entry) {
    const std::filesystem::path entry_path(entry);
    for (const auto& part : entry_path) {
        if (part == "..") {
            return {};
        }
    }
    std::string flat = entry_path.relative_path().generic_string();
    std::replace(flat.begin(), flat.end(), '/', '_');
    return flat;
}

}  // namespace

std::filesystem::path ZipArchivePacker::make(
    const std::string& output_ext,
    const std::filesystem::path& input_dir,
    const std::filesystem::path& output_dir,
    const std::string& output_base_name
) {
    const std::string ext = normalize_ext(output_ext);
    if (ext != "zip" && ext != "cbz") {
        throw std::runtime_error("Unsupported output archive format: " + output_ext);
    }

    std::vector<std::filesystem::path> files;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(input_dir)) {
        if (entry.is_regular_file()) {
            files.push_back(entry.path());
        }
    }
    std::sort(files.begin(), files.end());

    if (files.empty()) {
        throw std::runtime_error("Nothing to archive in " + input_dir.string());
    }

    std::filesystem::create_directories(output_dir);
    const std::filesystem::path output = output_dir / (output_base_name + "_translated." + ext);

    ZipHandle archive = open_zip(output, ZIP_CREATE | ZIP_TRUNCATE);

    for (const auto& file : files) {
        const std::string name = std::filesystem::relative(file, input_dir).generic_string();

        zip_source_t* source = zip_source_file(archive.get(), file.c_str(), 0, -1);
        if (source == nullptr) {
            throw std::runtime_error("zip_source_file failed for " + file.string() + ": " + zip_strerror(archive.get()));
        }
        if (zip_file_add(archive.get(), name.c_str(), source, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8) < 0) {
            zip_source_free(source);
            throw std::runtime_error("zip_file_add failed for " + name + ": " + zip_strerror(archive.get()));
        }
    }

    if (zip_close(archive.get()) != 0) {
        throw std::runtime_error("Failed to write archive " + output.string() + ": " + zip_strerror(archive.get()));
    }
    archive.release();

    return output;
}

std::vector<std::filesystem::path> ZipArchivePacker::extract(
    const std::filesystem::path& archive_path,
    const std::filesystem::path& destination
) {
    ZipHandle archive = open_zip(archive_path, ZIP_RDONLY);
    std::filesystem::create_directories(destination);

    std::vector<std::filesystem::path> images;
    const zip_int64_t total_entries = zip_get_num_entries(archive.get(), 0);

    for (zip_int64_t index = 0; index < total_entries; ++index) {
        const char* raw_name = zip_get_name(archive.get(), static_cast<zip_uint64_t>(index), 0);
        if (raw_name == nullptr) {
            continue;
        }

        const std::string entry_name(raw_name);
        if (entry_name.empty() || entry_name.back() == '/' || !is_supported_image(entry_name)) {
            continue;
        }

        const std::string flat_name = flatten_entry_name(entry_name);
        if (flat_name.empty()) {
            continue;
        }

        zip_stat_t entry_stat;
        zip_stat_init(&entry_stat);
        if (zip_stat_index(archive.get(), static_cast<zip_uint64_t>(index), 0, &entry_stat) != 0 ||
            !(entry_stat.valid & ZIP_STAT_SIZE) || entry_stat.size > kMaxEntrySize) {
            throw std::runtime_error("Unreadable entry " + entry_name + " in " + archive_path.string());
        }

        zip_file_t* handle = zip_fopen_index(archive.get(), static_cast<zip_uint64_t>(index), 0);
        if (handle == nullptr) {
            throw std::runtime_error("Failed to open entry " + entry_name + ": " + zip_strerror(archive.get()));
        }

        std::vector<char> data(static_cast<std::size_t>(entry_stat.size));
        const zip_int64_t bytes_read = zip_fread(handle, data.data(), entry_stat.size);
        zip_fclose(handle);

        if (bytes_read < 0 || static_cast<zip_uint64_t>(bytes_read) != entry_stat.size) {
            throw std::runtime_error("Short read for entry " + entry_name + " in " + archive_path.string());
        }

        const std::filesystem::path out_path = destination / flat_name;
        std::ofstream out(out_path, std::ios::binary);
        if (!out) {
            throw std::runtime_error("Failed to create " + out_path.string());
        }
        out.write(data.data(), static_cast<std::streamsize>(data.size()));
        images.push_back(out_path);
    }

    std::sort(images.begin(), images.end());
    return images;
}

}  // namespace comic_mt
