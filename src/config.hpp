#pragma once

#include "settings.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace comic_mt {

struct AppConfig {
    std::vector<std::filesystem::path> inputs;
    std::string source_lang = "Japanese";
    std::string target_lang = "English";
    PipelineSettings settings;
    bool show_progress = true;
};

void print_usage(const char* program_name);
bool parse_args(int argc, char** argv, AppConfig& config, std::string& error);

}  // namespace comic_mt
