#pragma once

#include "text_block.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace comic_mt {

enum class BlockField {
    Text,
    Translation
};

// {"block_0": "...", "block_1": "...", ...} in list order.
nlohmann::ordered_json blocks_to_json(const std::vector<TextBlock>& blocks, BlockField field);

// Pretty-printed blocks_to_json; throws nlohmann::json::type_error on invalid UTF-8.
std::string dump_block_texts(const std::vector<TextBlock>& blocks, BlockField field);

// Parses the first {...} object embedded in free-form model output.
nlohmann::json extract_json_object(const std::string& text);

// Assigns translation from "block_<i>" keys; blocks without a key keep an empty translation.
void set_translations_from_json(std::vector<TextBlock>& blocks, const nlohmann::json& translations);

}  // namespace comic_mt
