#include "writer_state.hpp"

#include <pugixml.hpp>

#include <cstring>
#include <utility>

namespace comic_mt {
namespace {

TextAlignment parse_alignment(const char* value) {
    if (std::strcmp(value, "left") == 0) {
        return TextAlignment::Left;
    }
    if (std::strcmp(value, "right") == 0) {
        return TextAlignment::Right;
    }
    return TextAlignment::Center;
}

void write_item(pugi::xml_node parent, const RenderState& state) {
    auto item = parent.append_child("text_item");
    item.append_attribute("font_family") = state.font_family.c_str();
    item.append_attribute("font_size") = state.font_size;
    item.append_attribute("text_color") = state.text_color.c_str();
    item.append_attribute("alignment") = to_string(state.alignment);
    item.append_attribute("line_spacing") = state.line_spacing;
    item.append_attribute("outline") = state.outline;
    item.append_attribute("outline_color") = state.outline_color.c_str();
    item.append_attribute("outline_width") = state.outline_width;
    item.append_attribute("bold") = state.bold;
    item.append_attribute("italic") = state.italic;
    item.append_attribute("underline") = state.underline;
    item.append_attribute("x") = state.position.x;
    item.append_attribute("y") = state.position.y;
    item.append_attribute("rotation") = state.rotation;
    item.append_attribute("scale") = state.scale;
    if (state.transform_origin) {
        item.append_attribute("origin_x") = state.transform_origin->x;
        item.append_attribute("origin_y") = state.transform_origin->y;
    }
    item.append_attribute("width") = state.width;
    item.append_attribute("direction") = to_string(state.direction);
    item.text().set(state.text.c_str());
}

RenderState read_item(const pugi::xml_node& item) {
    RenderState state;
    state.text = item.text().get();
    state.font_family = item.attribute("font_family").value();
    state.font_size = item.attribute("font_size").as_int();
    state.text_color = item.attribute("text_color").value();
    state.alignment = parse_alignment(item.attribute("alignment").value());
    state.line_spacing = item.attribute("line_spacing").as_double(1.0);
    state.outline = item.attribute("outline").as_bool();
    state.outline_color = item.attribute("outline_color").value();
    state.outline_width = item.attribute("outline_width").as_double();
    state.bold = item.attribute("bold").as_bool();
    state.italic = item.attribute("italic").as_bool();
    state.underline = item.attribute("underline").as_bool();
    state.position = cv::Point(item.attribute("x").as_int(), item.attribute("y").as_int());
    state.rotation = item.attribute("rotation").as_double();
    state.scale = item.attribute("scale").as_double(1.0);
    if (item.attribute("origin_x") && item.attribute("origin_y")) {
        state.transform_origin = cv::Point2f(item.attribute("origin_x").as_float(), item.attribute("origin_y").as_float());
    }
    state.width = item.attribute("width").as_int();
    state.direction = std::strcmp(item.attribute("direction").value(), "vertical") == 0
        ? TextDirection::Vertical
        : TextDirection::Horizontal;
    return state;
}

}  // namespace

bool write_render_state(
    const std::filesystem::path& out_path,
    const std::vector<ImageRenderState>& images,
    std::string& error
) {
    pugi::xml_document doc;
    auto decl = doc.append_child(pugi::node_declaration);
    decl.append_attribute("version") = "1.0";
    decl.append_attribute("encoding") = "UTF-8";

    auto root = doc.append_child("render_state");
    for (const auto& image : images) {
        auto node = root.append_child("image");
        node.append_attribute("path") = image.image_path.c_str();
        for (const auto& state : image.text_items) {
            write_item(node, state);
        }
    }

    if (!doc.save_file(out_path.c_str(), "  ", pugi::format_default, pugi::encoding_utf8)) {
        error = "Failed to write render state XML: " + out_path.string();
        return false;
    }

    return true;
}

bool read_render_state(
    const std::filesystem::path& path,
    std::vector<ImageRenderState>& out_images,
    std::string& error
) {
    out_images.clear();

    pugi::xml_document doc;
    const pugi::xml_parse_result parse = doc.load_file(path.c_str(), pugi::parse_default | pugi::parse_ws_pcdata);
    if (!parse) {
        error = "Failed to parse render state XML " + path.string() + ": " + parse.description();
        return false;
    }

    const auto root = doc.child("render_state");
    if (!root) {
        error = "No render_state element in: " + path.string();
        return false;
    }

    for (const auto& node : root.children("image")) {
        ImageRenderState image;
        image.image_path = node.attribute("path").value();
        for (const auto& item : node.children("text_item")) {
            image.text_items.push_back(read_item(item));
        }
        out_images.push_back(std::move(image));
    }

    return true;
}

}  // namespace comic_mt
