#include "renderer_opencv.hpp"

#include "text_format.hpp"

#include <opencv2/imgproc.hpp>

#include <algorithm>
#include <cmath>
#include <sstream>
#include <stdexcept>

namespace comic_mt {
namespace {

constexpr int kGrowStep = 4;
constexpr double kMaxGrowRatio = 0.15;
constexpr double kFlatStdDev = 12.0;
constexpr double kBubbleInset = 0.08;

struct FontSpec {
    int face = cv::FONT_HERSHEY_SIMPLEX;
    int thickness = 1;
    double scale = 1.0;
    int outline_extra = 0;
};

int font_face_for(const std::string& family, bool italic) {
    int face = cv::FONT_HERSHEY_SIMPLEX;
    if (family == "hershey-plain") {
        face = cv::FONT_HERSHEY_PLAIN;
    } else if (family == "hershey-duplex") {
        face = cv::FONT_HERSHEY_DUPLEX;
    } else if (family == "hershey-complex") {
        face = cv::FONT_HERSHEY_COMPLEX;
    } else if (family == "hershey-triplex") {
        face = cv::FONT_HERSHEY_TRIPLEX;
    } else if (family == "hershey-script") {
        face = cv::FONT_HERSHEY_SCRIPT_SIMPLEX;
    }
    return italic ? (face | cv::FONT_ITALIC) : face;
}

FontSpec make_font(const std::string& family, int size, bool bold, bool italic, bool outline, double outline_width) {
    FontSpec font;
    font.face = font_face_for(family, italic);
    font.thickness = std::max(1, size / 16) + (bold ? 1 : 0);
    font.scale = cv::getFontScaleFromHeight(font.face, std::max(1, size), font.thickness);
    font.outline_extra = outline && outline_width > 0.0 ? static_cast<int>(std::ceil(outline_width)) : 0;
    return font;
}

int text_width(const std::string& text, const FontSpec& font) {
    int baseline = 0;
    const cv::Size size = cv::getTextSize(text, font.face, font.scale, font.thickness, &baseline);
    return size.width + 2 * font.outline_extra;
}

std::vector<std::string> split(const std::string& text, char sep) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, sep)) {
        parts.push_back(part);
    }
    return parts;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += parts[i];
    }
    return out;
}

// Greedy wrap; words wider than the box are broken between code points.
std::vector<std::string> wrap_lines(const std::string& text, int width, const FontSpec& font) {
    std::vector<std::string> lines;
    std::string current;

    auto push_word = [&](const std::string& word) {
        const std::string candidate = current.empty() ? word : current + " " + word;
        if (text_width(candidate, font) <= width) {
            current = candidate;
            return;
        }
        if (!current.empty()) {
            lines.push_back(current);
            current.clear();
        }
        if (text_width(word, font) <= width) {
            current = word;
            return;
        }
        for (const auto& point : utf8_code_points(word)) {
            if (!current.empty() && text_width(current + point, font) > width) {
                lines.push_back(current);
                current.clear();
            }
            current += point;
        }
    };

    for (const auto& word : split(text, ' ')) {
        if (!word.empty()) {
            push_word(word);
        }
    }
    if (!current.empty()) {
        lines.push_back(current);
    }
    return lines;
}

// Columns of code points, read top to bottom.
std::vector<std::string> wrap_columns(const std::string& text, int height, int font_size, double line_spacing) {
    const double pitch = font_size * line_spacing;
    const int per_column = pitch > 0.0 ? std::max(1, static_cast<int>(std::min(height / pitch, static_cast<double>(height)))) : 1;
    std::vector<std::string> columns;
    std::string current;
    int count = 0;
    for (const auto& point : utf8_code_points(text)) {
        if (point == " ") {
            continue;
        }
        if (count == per_column) {
            columns.push_back(current);
            current.clear();
            count = 0;
        }
        current += point;
        ++count;
    }
    if (!current.empty()) {
        columns.push_back(current);
    }
    return columns;
}

bool fits(const std::vector<std::string>& lines, int width, int height, int font_size, double line_spacing, const FontSpec& font) {
    const double total_height = static_cast<double>(lines.size()) * font_size * line_spacing;
    if (total_height > height) {
        return false;
    }
    return std::all_of(lines.begin(), lines.end(), [&](const std::string& line) {
        return text_width(line, font) <= width;
    });
}

double strip_stddev(const cv::Mat& gray, const cv::Rect& strip) {
    const cv::Rect bounded = strip & cv::Rect(0, 0, gray.cols, gray.rows);
    if (bounded.area() == 0 || bounded != strip) {
        return kFlatStdDev + 1.0;
    }
    cv::Scalar mean;
    cv::Scalar stddev;
    cv::meanStdDev(gray(bounded), mean, stddev);
    return stddev[0];
}

BoxXYXY grow_into_background(const BoxXYXY& box, const cv::Mat& gray) {
    BoxXYXY area = box;
    const int max_dx = static_cast<int>(box.width() * kMaxGrowRatio);
    const int max_dy = static_cast<int>(box.height() * kMaxGrowRatio);

    for (int grown = kGrowStep; grown <= max_dx; grown += kGrowStep) {
        const cv::Rect left(area.x1 - kGrowStep, area.y1, kGrowStep, area.height());
        const cv::Rect right(area.x2, area.y1, kGrowStep, area.height());
        if (strip_stddev(gray, left) > kFlatStdDev || strip_stddev(gray, right) > kFlatStdDev) {
            break;
        }
        area.x1 -= kGrowStep;
        area.x2 += kGrowStep;
    }
    for (int grown = kGrowStep; grown <= max_dy; grown += kGrowStep) {
        const cv::Rect top(area.x1, area.y1 - kGrowStep, area.width(), kGrowStep);
        const cv::Rect bottom(area.x1, area.y2, area.width(), kGrowStep);
        if (strip_stddev(gray, top) > kFlatStdDev || strip_stddev(gray, bottom) > kFlatStdDev) {
            break;
        }
        area.y1 -= kGrowStep;
        area.y2 += kGrowStep;
    }
    return area;
}

void draw_line(cv::Mat& canvas, cv::Mat& mask, const std::string& text, cv::Point origin,
               const FontSpec& font, const cv::Scalar& color, const cv::Scalar& outline_color) {
    if (font.outline_extra > 0) {
        const int outline_thickness = font.thickness + 2 * font.outline_extra;
        cv::putText(canvas, text, origin, font.face, font.scale, outline_color, outline_thickness, cv::LINE_AA);
        cv::putText(mask, text, origin, font.face, font.scale, cv::Scalar(255), outline_thickness, cv::LINE_AA);
    }
    cv::putText(canvas, text, origin, font.face, font.scale, color, font.thickness, cv::LINE_AA);
    cv::putText(mask, text, origin, font.face, font.scale, cv::Scalar(255), font.thickness, cv::LINE_AA);
}

}  // namespace

cv::Scalar parse_color(const std::string& hex) {
    if (hex.size() != 7 || hex[0] != '#') {
        return cv::Scalar(0, 0, 0);
    }
    try {
        const unsigned long value = std::stoul(hex.substr(1), nullptr, 16);
        const double r = static_cast<double>((value >> 16) & 0xFF);
        const double g = static_cast<double>((value >> 8) & 0xFF);
        const double b = static_cast<double>(value & 0xFF);
        return cv::Scalar(b, g, r);
    } catch (const std::logic_error&) {
        return cv::Scalar(0, 0, 0);
    }
}

const char* to_string(TextAlignment alignment) {
    switch (alignment) {
        case TextAlignment::Left:
            return "left";
        case TextAlignment::Right:
            return "right";
        case TextAlignment::Center:
            break;
    }
    return "center";
}

const char* to_string(TextDirection direction) {
    return direction == TextDirection::Vertical ? "vertical" : "horizontal";
}

std::vector<TextBlock> OpencvRenderer::compute_layout(
    std::vector<TextBlock> blocks,
    const cv::Mat& /*original_image*/,
    const cv::Mat& cleaned_image
) {
    cv::Mat gray;
    if (cleaned_image.channels() == 1) {
        gray = cleaned_image;
    } else {
        cv::cvtColor(cleaned_image, gray, cv::COLOR_BGR2GRAY);
    }

    for (auto& blk : blocks) {
        if (blk.bubble_xyxy && !blk.bubble_xyxy->empty()) {
            const BoxXYXY& bubble = *blk.bubble_xyxy;
            const int dx = static_cast<int>(bubble.width() * kBubbleInset);
            const int dy = static_cast<int>(bubble.height() * kBubbleInset);
            blk.render_xyxy = BoxXYXY{bubble.x1 + dx, bubble.y1 + dy, bubble.x2 - dx, bubble.y2 - dy};
        } else {
            blk.render_xyxy = grow_into_background(blk.xyxy, gray);
        }
        blk.render_xyxy = clamp_to_image(blk.render_xyxy, cleaned_image.size());
    }

    return blocks;
}

WrappedText OpencvRenderer::word_wrap(
    const std::string& text,
    int width,
    int height,
    const RenderSettings& settings
) {
    const int max_size = std::max(settings.min_font_size, settings.max_font_size);
    const int min_size = std::max(1, settings.min_font_size);

    WrappedText result;
    for (int size = max_size; size >= min_size; --size) {
        const FontSpec font = make_font(
            settings.font_family, size, settings.bold, settings.italic, settings.outline, settings.outline_width
        );

        std::vector<std::string> lines;
        bool ok = false;
        if (settings.direction == TextDirection::Vertical) {
            lines = wrap_columns(text, height, size, settings.line_spacing);
            ok = static_cast<double>(lines.size()) * size * settings.line_spacing <= width;
        } else {
            lines = wrap_lines(text, width, font);
            ok = fits(lines, width, height, size, settings.line_spacing, font);
        }

        result.text = join(lines, "\n");
        result.font_size = size;
        if (ok) {
            break;
        }
    }

    return result;
}

cv::Mat OpencvRenderer::composite(const cv::Mat& cleaned_image, const std::vector<RenderState>& states) {
    cv::Mat out = cleaned_image.clone();

    for (const auto& state : states) {
        if (state.text.empty()) {
            continue;
        }

        const FontSpec font = make_font(
            state.font_family, state.font_size, state.bold, state.italic, state.outline, state.outline_width
        );
        const cv::Scalar color = parse_color(state.text_color);
        const cv::Scalar outline_color = parse_color(state.outline_color);
        const int line_height = std::max(1, static_cast<int>(std::lround(state.font_size * state.line_spacing)));

        cv::Mat canvas = cv::Mat::zeros(out.size(), out.type());
        cv::Mat mask = cv::Mat::zeros(out.size(), CV_8UC1);

        const std::vector<std::string> lines = split(state.text, '\n');
        int drawn_height = 0;

        if (state.direction == TextDirection::Vertical) {
            int x = state.position.x + state.width - line_height;
            for (const auto& column : lines) {
                int y = state.position.y + state.font_size;
                for (const auto& point : utf8_code_points(column)) {
                    draw_line(canvas, mask, point, cv::Point(x, y), font, color, outline_color);
                    y += line_height;
                }
                drawn_height = std::max(drawn_height, y - state.position.y);
                x -= line_height;
            }
        } else {
            int y = state.position.y + state.font_size;
            for (const auto& line : lines) {
                const int w = text_width(line, font);
                int x = state.position.x + font.outline_extra;
                if (state.alignment == TextAlignment::Center) {
                    x = state.position.x + (state.width - w) / 2 + font.outline_extra;
                } else if (state.alignment == TextAlignment::Right) {
                    x = state.position.x + state.width - w + font.outline_extra;
                }
                draw_line(canvas, mask, line, cv::Point(x, y), font, color, outline_color);
                if (state.underline) {
                    const int uy = y + std::max(2, state.font_size / 8);
                    const int content_w = w - 2 * font.outline_extra;
                    cv::line(canvas, cv::Point(x, uy), cv::Point(x + content_w, uy), color, font.thickness);
                    cv::line(mask, cv::Point(x, uy), cv::Point(x + content_w, uy), cv::Scalar(255), font.thickness);
                }
                y += line_height;
            }
            drawn_height = y - state.position.y;
        }

        if (state.rotation != 0.0 || state.scale != 1.0) {
            const cv::Point2f origin = state.transform_origin
                ? cv::Point2f(state.position.x + state.transform_origin->x, state.position.y + state.transform_origin->y)
                : cv::Point2f(state.position.x + state.width / 2.0f, state.position.y + drawn_height / 2.0f);
            // Positive angles turn clockwise on screen, OpenCV's are counter-clockwise.
            const cv::Mat rotation = cv::getRotationMatrix2D(origin, -state.rotation, state.scale);
            cv::warpAffine(canvas, canvas, rotation, canvas.size());
            cv::warpAffine(mask, mask, rotation, mask.size());
        }

        canvas.copyTo(out, mask);
    }

    return out;
}

}  // namespace comic_mt
