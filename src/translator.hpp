#pragma once

#include "languages.hpp"
#include "text_block.hpp"

#include <opencv2/core.hpp>

#include <string>
#include <vector>

namespace comic_mt {

class Translator {
public:
    virtual ~Translator() = default;

    // The returned list has the length and order of blocks; only translation changes.
    // context_image is a representative page some backends send along with the text.
    virtual std::vector<TextBlock> translate(
        std::vector<TextBlock> blocks,
        const LanguagePair& languages,
        const cv::Mat& context_image,
        const std::string& extra_context
    ) = 0;
};

}  // namespace comic_mt
