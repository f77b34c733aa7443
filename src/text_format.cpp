#include "text_format.hpp"

#include "languages.hpp"

#include <cctype>
#include <utility>

namespace comic_mt {
namespace {

bool is_all_upper(const std::string& text) {
    bool has_cased = false;
    for (unsigned char c : text) {
        if (std::islower(c)) {
            return false;
        }
        if (std::isupper(c)) {
            has_cased = true;
        }
    }
    return has_cased;
}

std::string to_upper(std::string text) {
    for (char& c : text) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    return text;
}

std::string capitalize(std::string text) {
    bool first = true;
    for (char& c : text) {
        const auto uc = static_cast<unsigned char>(c);
        if (first && std::isalpha(uc)) {
            c = static_cast<char>(std::toupper(uc));
            first = false;
        } else {
            c = static_cast<char>(std::tolower(uc));
        }
    }
    return text;
}

}  // namespace

void format_translations(std::vector<TextBlock>& blocks, const std::string& target_lang_code, bool upper_case) {
    if (!has_letter_case(target_lang_code)) {
        return;
    }

    for (auto& blk : blocks) {
        if (upper_case && !is_all_upper(blk.translation)) {
            blk.translation = to_upper(std::move(blk.translation));
        } else if (!upper_case && is_all_upper(blk.translation)) {
            blk.translation = capitalize(std::move(blk.translation));
        }
    }
}

std::string collapse_spaces(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        if (c != ' ') {
            out.push_back(c);
        }
    }
    return out;
}

std::vector<std::string> utf8_code_points(const std::string& text) {
    std::vector<std::string> points;
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t len = 1;
        if ((lead & 0xE0) == 0xC0) {
            len = 2;
        } else if ((lead & 0xF0) == 0xE0) {
            len = 3;
        } else if ((lead & 0xF8) == 0xF0) {
            len = 4;
        }
        if (i + len > text.size()) {
            len = 1;
        }
        points.push_back(text.substr(i, len));
        i += len;
    }
    return points;
}

}  // namespace comic_mt
