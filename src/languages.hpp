#pragma once

#include <string>

namespace comic_mt {

struct LanguagePair {
    std::string source;
    std::string target;

    friend bool operator==(const LanguagePair&, const LanguagePair&) = default;
};

// ISO-style code for a language display name ("English" -> "en"); empty when unknown.
std::string language_code(const std::string& language_name);

// Blocks of a right-to-left source are read from the right edge of a row first.
bool is_right_to_left_source(const std::string& language_name);

// Scripts written without spaces between words; wrapping must not leave spaces behind.
bool omits_word_spaces(const std::string& language_code);

// Scripts without letter case are left alone by case formatting.
bool has_letter_case(const std::string& language_code);

// Tesseract traineddata name for a language display name, "eng" when unknown.
std::string tesseract_language(const std::string& language_name);

}  // namespace comic_mt
