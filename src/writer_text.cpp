#include "writer_text.hpp"

#include <fstream>

namespace comic_mt {

bool write_text_output(const std::filesystem::path& out_path, const std::string& content, std::string& error) {
    std::error_code ec;
    std::filesystem::create_directories(out_path.parent_path(), ec);
    if (ec) {
        error = "Failed to create directory " + out_path.parent_path().string() + ": " + ec.message();
        return false;
    }

    std::ofstream out(out_path, std::ios::binary);
    if (!out) {
        error = "Failed to open text output: " + out_path.string();
        return false;
    }

    out << content;
    if (!out) {
        error = "Failed to write text output: " + out_path.string();
        return false;
    }

    return true;
}

}  // namespace comic_mt
