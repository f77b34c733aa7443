#include "config.hpp"

#include "languages.hpp"

#include <cctype>
#include <cmath>
#include <exception>
#include <iostream>
#include <stdexcept>

namespace comic_mt {
namespace {

bool parse_int_arg(const std::string& key, const std::string& value, int& out, std::string& error) {
    try {
        std::size_t used = 0;
        out = std::stoi(value, &used);
        if (used != value.size()) {
            throw std::invalid_argument(value);
        }
        return true;
    } catch (const std::exception&) {
        error = "Invalid integer for " + key + ": " + value;
        return false;
    }
}

bool parse_size_arg(const std::string& key, const std::string& value, std::size_t& out, std::string& error) {
    try {
        std::size_t used = 0;
        const long long parsed = std::stoll(value, &used);
        if (used != value.size() || parsed < 1) {
            throw std::invalid_argument(value);
        }
        out = static_cast<std::size_t>(parsed);
        return true;
    } catch (const std::exception&) {
        error = "Invalid positive integer for " + key + ": " + value;
        return false;
    }
}

bool parse_double_arg(const std::string& key, const std::string& value, double& out, std::string& error) {
    try {
        std::size_t used = 0;
        out = std::stod(value, &used);
        if (used != value.size() || !std::isfinite(out)) {
            throw std::invalid_argument(value);
        }
        return true;
    } catch (const std::exception&) {
        error = "Invalid number for " + key + ": " + value;
        return false;
    }
}

bool is_hex_color(const std::string& value) {
    if (value.size() != 7 || value.front() != '#') {
        return false;
    }
    for (std::size_t i = 1; i < value.size(); ++i) {
        if (!std::isxdigit(static_cast<unsigned char>(value[i]))) {
            return false;
        }
    }
    return true;
}

}  // namespace

void print_usage(const char* program_name) {
    std::cout
        << "Usage:\n"
        << "  " << program_name << " --input <image|archive|dir> [--input ...] [options]\n\n"
        << "Input and output:\n"
        << "  --output <dir>             Put run folders here instead of next to each input\n"
        << "  --source-lang <name>       Source language (default: Japanese)\n"
        << "  --target-lang <name>       Target language (default: English)\n"
        << "  --save-as <ext>            Output archive format: zip or cbz (default: by source)\n"
        << "  --export-raw-text          Write OCR text as JSON to raw_texts/\n"
        << "  --export-translated-text   Write translations as JSON to translated_texts/\n"
        << "  --export-cleaned           Write inpainted pages to cleaned_images/\n\n"
        << "Pipeline:\n"
        << "  --batch-size <n>           Images per translation call (default: 10)\n"
        << "  --detector <id>            contour | east (default: contour)\n"
        << "  --detector-model <path>    EAST model file (.pb)\n"
        << "  --ocr <id>                 tesseract (default)\n"
        << "  --tessdata <dir>           Tesseract language data directory\n"
        << "  --inpainter <id>           telea | ns (default: telea)\n"
        << "  --gpu                      Request GPU device for the inpainter\n"
        << "  --hd-strategy <s>          original | resize | crop (default: resize)\n"
        << "  --resize-limit <px>        Longest side for resize strategy (default: 960)\n"
        << "  --crop-margin <px>         Margin around masked regions for crop strategy (default: 512)\n"
        << "  --crop-trigger <px>        Longest side that enables crop strategy (default: 512)\n\n"
        << "Translator:\n"
        << "  --translator <id>          llama (default)\n"
        << "  --model <gguf-path>        Model for the llama translator\n"
        << "  --ctx <n>                  Context size (default: 4096)\n"
        << "  --max-tokens <n>           Max generated tokens per batch (default: 1024)\n"
        << "  --n-gpu-layers <n>         llama.cpp GPU layers (default: -1)\n"
        << "  --threads <n>              llama.cpp CPU threads (default: 8)\n"
        << "  --extra-context <text>     Extra instructions sent with every batch\n\n"
        << "Rendering:\n"
        << "  --font <name>              hershey-simplex | hershey-duplex | hershey-complex | hershey-triplex\n"
        << "  --min-font-size <n>        (default: 12)\n"
        << "  --max-font-size <n>        (default: 40)\n"
        << "  --line-spacing <x>         (default: 1.2)\n"
        << "  --color <#rrggbb>          Text color (default: #000000)\n"
        << "  --outline-color <#rrggbb>  (default: #ffffff)\n"
        << "  --outline-width <x>        (default: 1.0)\n"
        << "  --no-outline               Draw text without outline\n"
        << "  --bold, --italic, --underline\n"
        << "  --align <a>                left | center | right (default: center)\n"
        << "  --direction <d>            horizontal | vertical (default: horizontal)\n"
        << "  --upper-case               Render translations in capitals\n\n"
        << "  --no-progress              Disable progress bar output\n"
        << "  -h, --help                 Show this help\n";
}

bool parse_args(int argc, char** argv, AppConfig& config, std::string& error) {
    if (argc <= 1) {
        error = "No arguments provided";
        return false;
    }

    PipelineSettings& settings = config.settings;
    RenderSettings& render = settings.render;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-h" || arg == "--help") {
            error = "help";
            return false;
        }

        auto require_value = [&](const std::string& key) -> std::string {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return {};
            }
            ++i;
            return argv[i];
        };

        if (arg == "--input") {
            const std::string value = require_value(arg);
            if (!value.empty()) {
                config.inputs.emplace_back(value);
            }
        } else if (arg == "--output") {
            settings.output_dir = require_value(arg);
        } else if (arg == "--source-lang") {
            config.source_lang = require_value(arg);
        } else if (arg == "--target-lang") {
            config.target_lang = require_value(arg);
        } else if (arg == "--batch-size") {
            if (!parse_size_arg(arg, require_value(arg), settings.batch_size, error)) {
                return false;
            }
        } else if (arg == "--detector") {
            settings.detector = require_value(arg);
        } else if (arg == "--detector-model") {
            settings.detector_model = require_value(arg);
        } else if (arg == "--ocr") {
            settings.ocr = require_value(arg);
        } else if (arg == "--tessdata") {
            settings.tessdata_path = require_value(arg);
        } else if (arg == "--inpainter") {
            settings.inpainter = require_value(arg);
        } else if (arg == "--gpu") {
            settings.use_gpu = true;
        } else if (arg == "--hd-strategy") {
            const std::string value = require_value(arg);
            if (value == "original") {
                settings.inpaint.strategy = HdStrategy::Original;
            } else if (value == "resize") {
                settings.inpaint.strategy = HdStrategy::Resize;
            } else if (value == "crop") {
                settings.inpaint.strategy = HdStrategy::Crop;
            } else if (error.empty()) {
                error = "Unsupported --hd-strategy: " + value + " (supported: original, resize, crop)";
            }
        } else if (arg == "--resize-limit") {
            if (!parse_int_arg(arg, require_value(arg), settings.inpaint.resize_limit, error)) {
                return false;
            }
        } else if (arg == "--crop-margin") {
            if (!parse_int_arg(arg, require_value(arg), settings.inpaint.crop_margin, error)) {
                return false;
            }
        } else if (arg == "--crop-trigger") {
            if (!parse_int_arg(arg, require_value(arg), settings.inpaint.crop_trigger_size, error)) {
                return false;
            }
        } else if (arg == "--translator") {
            settings.translator = require_value(arg);
        } else if (arg == "--model") {
            settings.translator_settings.model_path = require_value(arg);
        } else if (arg == "--ctx") {
            if (!parse_int_arg(arg, require_value(arg), settings.translator_settings.n_ctx, error)) {
                return false;
            }
        } else if (arg == "--max-tokens") {
            if (!parse_int_arg(arg, require_value(arg), settings.translator_settings.max_tokens, error)) {
                return false;
            }
        } else if (arg == "--n-gpu-layers") {
            if (!parse_int_arg(arg, require_value(arg), settings.translator_settings.n_gpu_layers, error)) {
                return false;
            }
        } else if (arg == "--threads") {
            if (!parse_int_arg(arg, require_value(arg), settings.translator_settings.n_threads, error)) {
                return false;
            }
        } else if (arg == "--extra-context") {
            settings.extra_context = require_value(arg);
        } else if (arg == "--export-raw-text") {
            settings.export_raw_text = true;
        } else if (arg == "--export-translated-text") {
            settings.export_translated_text = true;
        } else if (arg == "--export-cleaned") {
            settings.export_cleaned_image = true;
        } else if (arg == "--save-as") {
            std::string value = require_value(arg);
            if (!value.empty() && value.front() == '.') {
                value.erase(value.begin());
            }
            if (value != "zip" && value != "cbz" && error.empty()) {
                error = "Unsupported --save-as: " + value + " (supported: zip, cbz)";
            }
            settings.save_as_override = value;
        } else if (arg == "--font") {
            render.font_family = require_value(arg);
        } else if (arg == "--min-font-size") {
            if (!parse_int_arg(arg, require_value(arg), render.min_font_size, error)) {
                return false;
            }
        } else if (arg == "--max-font-size") {
            if (!parse_int_arg(arg, require_value(arg), render.max_font_size, error)) {
                return false;
            }
        } else if (arg == "--line-spacing") {
            if (!parse_double_arg(arg, require_value(arg), render.line_spacing, error)) {
                return false;
            }
        } else if (arg == "--color") {
            render.color = require_value(arg);
        } else if (arg == "--outline-color") {
            render.outline_color = require_value(arg);
        } else if (arg == "--outline-width") {
            if (!parse_double_arg(arg, require_value(arg), render.outline_width, error)) {
                return false;
            }
        } else if (arg == "--no-outline") {
            render.outline = false;
        } else if (arg == "--bold") {
            render.bold = true;
        } else if (arg == "--italic") {
            render.italic = true;
        } else if (arg == "--underline") {
            render.underline = true;
        } else if (arg == "--align") {
            const std::string value = require_value(arg);
            if (value == "left") {
                render.alignment = TextAlignment::Left;
            } else if (value == "center") {
                render.alignment = TextAlignment::Center;
            } else if (value == "right") {
                render.alignment = TextAlignment::Right;
            } else if (error.empty()) {
                error = "Unsupported --align: " + value + " (supported: left, center, right)";
            }
        } else if (arg == "--direction") {
            const std::string value = require_value(arg);
            if (value == "horizontal") {
                render.direction = TextDirection::Horizontal;
            } else if (value == "vertical") {
                render.direction = TextDirection::Vertical;
            } else if (error.empty()) {
                error = "Unsupported --direction: " + value + " (supported: horizontal, vertical)";
            }
        } else if (arg == "--upper-case") {
            render.upper_case = true;
        } else if (arg == "--no-progress") {
            config.show_progress = false;
        } else {
            error = "Unknown argument: " + arg;
            return false;
        }

        if (!error.empty()) {
            return false;
        }
    }

    if (config.inputs.empty()) {
        error = "--input is required";
        return false;
    }
    if (language_code(config.source_lang).empty()) {
        error = "Unsupported --source-lang: " + config.source_lang;
        return false;
    }
    if (language_code(config.target_lang).empty()) {
        error = "Unsupported --target-lang: " + config.target_lang;
        return false;
    }
    if (render.min_font_size < 1 || render.max_font_size < render.min_font_size) {
        error = "--min-font-size must be at least 1 and not above --max-font-size";
        return false;
    }
    if (render.line_spacing <= 0.0) {
        error = "--line-spacing must be positive";
        return false;
    }
    if (render.outline_width < 0.0) {
        error = "--outline-width must not be negative";
        return false;
    }
    if (!is_hex_color(render.color) || !is_hex_color(render.outline_color)) {
        error = "Colors must be given as #rrggbb";
        return false;
    }
    if (settings.inpaint.resize_limit < 1 || settings.inpaint.crop_margin < 0 || settings.inpaint.crop_trigger_size < 1) {
        error = "--resize-limit and --crop-trigger must be positive, --crop-margin non-negative";
        return false;
    }

    return true;
}

}  // namespace comic_mt
