#pragma once

#include "text_block.hpp"

#include <string>
#include <vector>

namespace comic_mt {

// Case folding for target languages that have letter case: everything upper-case when
// upper_case is set, otherwise shouting translations are turned into sentence case.
void format_translations(std::vector<TextBlock>& blocks, const std::string& target_lang_code, bool upper_case);

// Drops the spaces wrapping leaves between glyphs of scripts written without word spaces.
std::string collapse_spaces(const std::string& text);

// Splits UTF-8 text into code points (invalid bytes become single-byte pieces).
std::vector<std::string> utf8_code_points(const std::string& text);

}  // namespace comic_mt
