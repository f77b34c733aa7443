#include "languages.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string_view>

namespace comic_mt {
namespace {

struct LanguageInfo {
    std::string_view name;
    std::string_view code;
    std::string_view tesseract;
};

constexpr std::array<LanguageInfo, 17> kLanguages = {{
    {"English", "en", "eng"},
    {"Korean", "ko", "kor"},
    {"Japanese", "ja", "jpn"},
    {"French", "fr", "fra"},
    {"Simplified Chinese", "zh-CN", "chi_sim"},
    {"Traditional Chinese", "zh-TW", "chi_tra"},
    {"Chinese", "zh", "chi_sim"},
    {"Russian", "ru", "rus"},
    {"German", "de", "deu"},
    {"Dutch", "nl", "nld"},
    {"Spanish", "es", "spa"},
    {"Italian", "it", "ita"},
    {"Turkish", "tr", "tur"},
    {"Polish", "pl", "pol"},
    {"Portuguese", "pt", "por"},
    {"Brazilian Portuguese", "pt-br", "por"},
    {"Thai", "th", "tha"},
}};

const LanguageInfo* find_language(const std::string& name) {
    const auto it = std::find_if(kLanguages.begin(), kLanguages.end(), [&](const LanguageInfo& info) {
        return info.name == name;
    });
    return it == kLanguages.end() ? nullptr : &*it;
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

}  // namespace

std::string language_code(const std::string& language_name) {
    const auto* info = find_language(language_name);
    return info == nullptr ? std::string{} : std::string(info->code);
}

bool is_right_to_left_source(const std::string& language_name) {
    return language_name == "Japanese";
}

bool omits_word_spaces(const std::string& language_code) {
    const std::string code = lowercase(language_code);
    for (const std::string_view lang : {"zh", "ja", "th"}) {
        if (code.find(lang) != std::string::npos) {
            return true;
        }
    }
    return false;
}

bool has_letter_case(const std::string& language_code) {
    const std::string code = lowercase(language_code);
    for (const std::string_view lang : {"zh", "ja", "th", "ko"}) {
        if (code.find(lang) != std::string::npos) {
            return false;
        }
    }
    return true;
}

std::string tesseract_language(const std::string& language_name) {
    const auto* info = find_language(language_name);
    return info == nullptr ? std::string("eng") : std::string(info->tesseract);
}

}  // namespace comic_mt
