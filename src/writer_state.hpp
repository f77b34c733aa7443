#pragma once

#include "renderer.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace comic_mt {

struct ImageRenderState {
    std::string image_path;
    std::vector<RenderState> text_items;
};

// <render_state><image path="..."><text_item .../>...</image>...</render_state>
bool write_render_state(
    const std::filesystem::path& out_path,
    const std::vector<ImageRenderState>& images,
    std::string& error
);

bool read_render_state(
    const std::filesystem::path& path,
    std::vector<ImageRenderState>& out_images,
    std::string& error
);

}  // namespace comic_mt
