#include "finalizer.hpp"

#include "output_layout.hpp"
#include "test_support.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <opencv2/imgcodecs.hpp>

using namespace comic_mt;
using namespace comic_mt::testing;
using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {

class FinalizerTest : public ::testing::Test {
protected:
    FinalizerTest()
        : ctx_(settings_, "test", 1, cancel_, events_.callback()),
          finalizer_(ctx_, renderer_) {
        settings_.output_dir = tmp_.path() / "out";
    }

    ImageProcessingRecord translated_record(const std::string& translation, const std::string& lang_code = "en") {
        const auto path = write_page(tmp_.path() / "in" / "page.png");

        ImageProcessingRecord record;
        record.image_path = path;
        record.target = OutputPlan({path}, {}, settings_.output_dir, "test").image_target(path);
        record.image = cv::imread(path.string(), cv::IMREAD_COLOR);
        record.cleaned_image = cv::Mat(record.image.size(), record.image.type(), cv::Scalar(255, 255, 255));
        record.languages = LanguagePair{"Japanese", "English"};
        record.target_lang_code = lang_code;

        TextBlock blk;
        blk.xyxy = BoxXYXY{4, 4, 60, 44};
        blk.text = "source";
        blk.translation = translation;
        record.blk_list.push_back(blk);
        return record;
    }

    std::filesystem::path run_dir() const { return settings_.output_dir / "comic_translate_test"; }

    TempDir tmp_;
    PipelineSettings settings_;
    CancellationToken cancel_;
    EventLog events_;
    RunContext ctx_;
    OpencvRenderer renderer_;
    Finalizer finalizer_;
};

}  // namespace

TEST_F(FinalizerTest, WritesTranslatedPage) {
    auto record = translated_record("Hello there");

    EXPECT_TRUE(finalizer_.finalize(record));

    EXPECT_EQ(ctx_.stats().images_completed, 1u);
    EXPECT_TRUE(std::filesystem::exists(run_dir() / kTranslatedImagesDir / "page_translated.png"));
    ASSERT_EQ(record.render_states.size(), 1u);
    EXPECT_EQ(record.render_states[0].text_color, settings_.render.color);
    EXPECT_GE(record.render_states[0].font_size, settings_.render.min_font_size);
    EXPECT_LE(record.render_states[0].font_size, settings_.render.max_font_size);
}

TEST_F(FinalizerTest, InvalidUtf8TranslationIsSkipped) {
    auto record = translated_record("bad \xff\xfe bytes");

    EXPECT_FALSE(finalizer_.finalize(record));

    EXPECT_TRUE(record.skipped);
    EXPECT_THAT(record.error_message, StartsWith("translation text invalid"));
    const auto skipped = events_.of_type(EventType::ImageSkipped);
    ASSERT_EQ(skipped.size(), 1u);
    EXPECT_THAT(skipped.front().message, StartsWith("translation text invalid"));

    EXPECT_EQ(
        read_file(run_dir() / kTranslatedImagesDir / "page_translated.png"),
        read_file(record.image_path)
    );
    EXPECT_EQ(read_lines(run_dir() / kSkipLogName).size(), 1u);
    EXPECT_EQ(ctx_.stats().images_completed, 0u);
}

TEST_F(FinalizerTest, SkippedRecordReportedOnce) {
    auto record = translated_record("unused");
    mark_skipped(record, StageFailure{kStageTranslator, "model unavailable"});

    EXPECT_FALSE(finalizer_.finalize(record));
    EXPECT_FALSE(finalizer_.finalize(record));

    EXPECT_EQ(events_.of_type(EventType::ImageSkipped).size(), 1u);
    EXPECT_EQ(read_lines(run_dir() / kSkipLogName).size(), 1u);
    EXPECT_EQ(ctx_.stats().images_skipped, 1u);
}

TEST_F(FinalizerTest, ExportsTextsWhenEnabled) {
    settings_.export_raw_text = true;
    settings_.export_translated_text = true;
    auto record = translated_record("Hi");

    ASSERT_TRUE(finalizer_.finalize(record));

    EXPECT_THAT(read_file(run_dir() / kRawTextsDir / "page_raw.txt"), HasSubstr("\"block_0\": \"source\""));
    EXPECT_THAT(read_file(run_dir() / kTranslatedTextsDir / "page_translated.txt"), HasSubstr("\"block_0\": \"Hi\""));
}

TEST_F(FinalizerTest, UpperCaseSetting) {
    settings_.render.upper_case = true;
    auto record = translated_record("quiet");

    ASSERT_TRUE(finalizer_.finalize(record));

    EXPECT_EQ(record.blk_list[0].translation, "QUIET");
}

TEST_F(FinalizerTest, NoSpaceTargetsLoseWrapSpaces) {
    auto record = translated_record("a b c", "ja");

    ASSERT_TRUE(finalizer_.finalize(record));

    ASSERT_EQ(record.render_states.size(), 1u);
    EXPECT_EQ(record.render_states[0].text.find(' '), std::string::npos);
}

TEST_F(FinalizerTest, BlankTranslationsGetNoRenderState) {
    auto record = translated_record("   ");

    ASSERT_TRUE(finalizer_.finalize(record));

    EXPECT_TRUE(record.render_states.empty());
}
