#include "block_json.hpp"

#include <stdexcept>

namespace comic_mt {
namespace {

std::string block_key(std::size_t index) {
    return "block_" + std::to_string(index);
}

}  // namespace

nlohmann::ordered_json blocks_to_json(const std::vector<TextBlock>& blocks, BlockField field) {
    nlohmann::ordered_json out = nlohmann::ordered_json::object();
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        out[block_key(i)] = field == BlockField::Text ? blocks[i].text : blocks[i].translation;
    }
    return out;
}

std::string dump_block_texts(const std::vector<TextBlock>& blocks, BlockField field) {
    return blocks_to_json(blocks, field).dump(4, ' ', false, nlohmann::json::error_handler_t::strict);
}

nlohmann::json extract_json_object(const std::string& text) {
    const auto open = text.find('{');
    const auto close = text.rfind('}');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        throw std::runtime_error("No JSON object found in translation output");
    }

    nlohmann::json parsed = nlohmann::json::parse(text.substr(open, close - open + 1));
    if (!parsed.is_object()) {
        throw std::runtime_error("Translation output is not a JSON object");
    }
    return parsed;
}

void set_translations_from_json(std::vector<TextBlock>& blocks, const nlohmann::json& translations) {
    for (std::size_t i = 0; i < blocks.size(); ++i) {
        const auto it = translations.find(block_key(i));
        if (it != translations.end() && it->is_string()) {
            blocks[i].translation = it->get<std::string>();
        } else {
            blocks[i].translation.clear();
        }
    }
}

}  // namespace comic_mt
