#include "config.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace comic_mt;

namespace {

bool parse(std::vector<std::string> args, AppConfig& config, std::string& error) {
    args.insert(args.begin(), "comic_mt");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parse_args(static_cast<int>(argv.size()), argv.data(), config, error);
}

}  // namespace

TEST(ParseArgs, DefaultsWithSingleInput) {
    AppConfig config;
    std::string error;

    ASSERT_TRUE(parse({"--input", "pages"}, config, error)) << error;

    ASSERT_EQ(config.inputs.size(), 1u);
    EXPECT_EQ(config.source_lang, "Japanese");
    EXPECT_EQ(config.target_lang, "English");
    EXPECT_EQ(config.settings.batch_size, 10u);
    EXPECT_EQ(config.settings.detector, "contour");
    EXPECT_EQ(config.settings.inpaint.strategy, HdStrategy::Resize);
    EXPECT_FALSE(config.settings.render.upper_case);
    EXPECT_TRUE(config.show_progress);
}

TEST(ParseArgs, FullCommandLine) {
    AppConfig config;
    std::string error;

    ASSERT_TRUE(parse({
        "--input", "a.cbz", "--input", "b.png", "--output", "out",
        "--source-lang", "Korean", "--target-lang", "French",
        "--batch-size", "4", "--detector", "east", "--detector-model", "east.pb",
        "--tessdata", "/usr/share/tessdata", "--inpainter", "ns", "--gpu",
        "--hd-strategy", "crop", "--crop-margin", "64", "--crop-trigger", "800",
        "--model", "model.gguf", "--ctx", "8192", "--max-tokens", "512",
        "--extra-context", "names: Aki", "--export-raw-text", "--export-translated-text", "--export-cleaned",
        "--save-as", ".zip", "--font", "hershey-duplex", "--min-font-size", "10", "--max-font-size", "30",
        "--line-spacing", "1.4", "--color", "#112233", "--no-outline", "--bold",
        "--align", "left", "--direction", "vertical", "--upper-case", "--no-progress",
    }, config, error)) << error;

    EXPECT_EQ(config.inputs.size(), 2u);
    EXPECT_EQ(config.settings.output_dir, "out");
    EXPECT_EQ(config.source_lang, "Korean");
    EXPECT_EQ(config.settings.batch_size, 4u);
    EXPECT_EQ(config.settings.detector_model, "east.pb");
    EXPECT_TRUE(config.settings.use_gpu);
    EXPECT_EQ(config.settings.inpaint.strategy, HdStrategy::Crop);
    EXPECT_EQ(config.settings.inpaint.crop_margin, 64);
    EXPECT_EQ(config.settings.inpaint.crop_trigger_size, 800);
    EXPECT_EQ(config.settings.translator_settings.model_path, "model.gguf");
    EXPECT_EQ(config.settings.translator_settings.n_ctx, 8192);
    EXPECT_EQ(config.settings.extra_context, "names: Aki");
    EXPECT_TRUE(config.settings.export_cleaned_image);
    EXPECT_EQ(config.settings.save_as_override, "zip");
    EXPECT_EQ(config.settings.render.max_font_size, 30);
    EXPECT_DOUBLE_EQ(config.settings.render.line_spacing, 1.4);
    EXPECT_FALSE(config.settings.render.outline);
    EXPECT_EQ(config.settings.render.alignment, TextAlignment::Left);
    EXPECT_EQ(config.settings.render.direction, TextDirection::Vertical);
    EXPECT_TRUE(config.settings.render.upper_case);
    EXPECT_FALSE(config.show_progress);
}

TEST(ParseArgs, Rejections) {
    const std::vector<std::vector<std::string>> bad = {
        {"--output", "out"},
        {"--input", "a", "--batch-size", "0"},
        {"--input", "a", "--batch-size", "ten"},
        {"--input", "a", "--hd-strategy", "tile"},
        {"--input", "a", "--align", "justify"},
        {"--input", "a", "--source-lang", "Klingon"},
        {"--input", "a", "--color", "red"},
        {"--input", "a", "--min-font-size", "50"},
        {"--input", "a", "--save-as", "rar"},
        {"--input", "a", "--line-spacing", "0"},
        {"--input", "a", "--line-spacing", "-1.5"},
        {"--input", "a", "--line-spacing", "nan"},
        {"--input", "a", "--line-spacing", "inf"},
        {"--input", "a", "--outline-width", "-1"},
        {"--input", "a", "--outline-width", "nan"},
        {"--input", "a", "--frobnicate"},
        {"--input"},
    };

    for (const auto& args : bad) {
        AppConfig config;
        std::string error;
        EXPECT_FALSE(parse(args, config, error)) << args.back();
        EXPECT_FALSE(error.empty()) << args.back();
    }
}

TEST(ParseArgs, HelpIsNotAnError) {
    AppConfig config;
    std::string error;

    EXPECT_FALSE(parse({"--help"}, config, error));
    EXPECT_EQ(error, "help");
}
