#pragma once

#include <filesystem>
#include <string>

namespace comic_mt {

bool write_text_output(const std::filesystem::path& out_path, const std::string& content, std::string& error);

}  // namespace comic_mt
