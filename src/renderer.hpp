#pragma once

#include "text_block.hpp"

#include <opencv2/core.hpp>

#include <optional>
#include <string>
#include <vector>

namespace comic_mt {

enum class TextAlignment {
    Left,
    Center,
    Right
};

enum class TextDirection {
    Horizontal,
    Vertical
};

struct RenderSettings {
    std::string font_family = "hershey-simplex";
    int min_font_size = 12;
    int max_font_size = 40;
    double line_spacing = 1.2;
    std::string color = "#000000";
    bool outline = true;
    std::string outline_color = "#ffffff";
    double outline_width = 1.0;
    bool bold = false;
    bool italic = false;
    bool underline = false;
    TextAlignment alignment = TextAlignment::Center;
    TextDirection direction = TextDirection::Horizontal;
    bool upper_case = false;
};

// One drawable text item, kept so a page can be redisplayed without re-running the pipeline.
struct RenderState {
    std::string text;
    std::string font_family;
    int font_size = 0;
    std::string text_color;
    TextAlignment alignment = TextAlignment::Center;
    double line_spacing = 1.0;
    bool outline = false;
    std::string outline_color;
    double outline_width = 0.0;
    bool bold = false;
    bool italic = false;
    bool underline = false;
    cv::Point position;
    double rotation = 0.0;
    double scale = 1.0;
    std::optional<cv::Point2f> transform_origin;
    int width = 0;
    TextDirection direction = TextDirection::Horizontal;
};

struct WrappedText {
    std::string text;
    int font_size = 0;
};

class Renderer {
public:
    virtual ~Renderer() = default;

    // Sets render_xyxy on every block; same length and order as the input.
    virtual std::vector<TextBlock> compute_layout(
        std::vector<TextBlock> blocks,
        const cv::Mat& original_image,
        const cv::Mat& cleaned_image
    ) = 0;

    virtual WrappedText word_wrap(
        const std::string& text,
        int width,
        int height,
        const RenderSettings& settings
    ) = 0;

    virtual cv::Mat composite(const cv::Mat& cleaned_image, const std::vector<RenderState>& states) = 0;
};

const char* to_string(TextAlignment alignment);
const char* to_string(TextDirection direction);

}  // namespace comic_mt
