#include "archive_zip.hpp"

#include "archiver.hpp"
#include "output_layout.hpp"
#include "pipeline.hpp"
#include "test_support.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <zip.h>

#include <set>
#include <stdexcept>
#include <string>
#include <utility>

using namespace comic_mt;
using namespace comic_mt::testing;
using ::testing::ElementsAre;
using ::testing::UnorderedElementsAre;

namespace {

std::set<std::string> zip_entry_names(const std::filesystem::path& path) {
    int code = 0;
    zip_t* archive = zip_open(path.c_str(), ZIP_RDONLY, &code);
    if (archive == nullptr) {
        throw std::runtime_error("cannot open " + path.string());
    }
    std::set<std::string> names;
    const zip_int64_t count = zip_get_num_entries(archive, 0);
    for (zip_int64_t i = 0; i < count; ++i) {
        names.insert(zip_get_name(archive, static_cast<zip_uint64_t>(i), 0));
    }
    zip_discard(archive);
    return names;
}

// Builds <dir>/<name>.<ext> holding the given pages and returns its path.
std::filesystem::path make_source_archive(
    ZipArchivePacker& packer,
    const std::filesystem::path& dir,
    const std::string& name,
    const std::string& ext,
    const std::vector<std::string>& pages
) {
    const auto staging = dir / ("staging_" + name);
    for (const auto& page : pages) {
        write_page(staging / page);
    }
    const auto packed = packer.make(ext, staging, dir, name);
    const auto final_path = dir / (name + "." + ext);
    std::filesystem::rename(packed, final_path);
    std::filesystem::remove_all(staging);
    return final_path;
}

// Packer that refuses one base name and delegates the rest.
class SelectiveFailPacker final : public ArchivePacker {
public:
    explicit SelectiveFailPacker(std::string failing) : failing_(std::move(failing)) {}

    std::filesystem::path make(
        const std::string& output_ext,
        const std::filesystem::path& input_dir,
        const std::filesystem::path& output_dir,
        const std::string& output_base_name
    ) override {
        if (output_base_name == failing_) {
            throw std::runtime_error("disk full");
        }
        return inner_.make(output_ext, input_dir, output_dir, output_base_name);
    }

    std::vector<std::filesystem::path> extract(
        const std::filesystem::path& archive,
        const std::filesystem::path& destination
    ) override {
        return inner_.extract(archive, destination);
    }

private:
    std::string failing_;
    ZipArchivePacker inner_;
};

}  // namespace

TEST(ArchiveFormats, SupportedExtensions) {
    EXPECT_TRUE(is_supported_archive("book.cbz"));
    EXPECT_TRUE(is_supported_archive("book.ZIP"));
    EXPECT_FALSE(is_supported_archive("book.cbr"));
    EXPECT_TRUE(is_supported_image("page.JPG"));
    EXPECT_TRUE(is_supported_image("page.webp"));
    EXPECT_FALSE(is_supported_image("notes.txt"));
}

TEST(ArchiveFormats, SaveAsCoversExactlyTheReadableArchives) {
    const PipelineSettings settings;
    for (const auto& [ext, container] : settings.save_as) {
        EXPECT_TRUE(is_supported_archive("book" + ext)) << ext;
    }
    EXPECT_EQ(save_as_extension(settings, "book.CBZ"), "cbz");
    EXPECT_EQ(save_as_extension(settings, "book.zip"), "zip");

    PipelineSettings forced;
    forced.save_as_override = "zip";
    EXPECT_EQ(save_as_extension(forced, "book.cbz"), "zip");
}

TEST(ZipArchivePacker, MakeThenExtractKeepsImagesInNameOrder) {
    TempDir tmp;
    ZipArchivePacker packer;
    const auto input = tmp.path() / "pages";
    write_page(input / "b.png");
    write_page(input / "a.png");
    {
        std::ofstream notes(input / "notes.txt");
        notes << "credits";
    }

    const auto packed = packer.make("cbz", input, tmp.path() / "out", "book");

    EXPECT_EQ(packed, tmp.path() / "out" / "book_translated.cbz");
    EXPECT_THAT(zip_entry_names(packed), UnorderedElementsAre("a.png", "b.png", "notes.txt"));

    const auto extracted = packer.extract(packed, tmp.path() / "extracted");
    ASSERT_EQ(extracted.size(), 2u);
    EXPECT_EQ(extracted[0].filename(), "a.png");
    EXPECT_EQ(extracted[1].filename(), "b.png");
    EXPECT_EQ(read_file(extracted[0]), read_file(input / "a.png"));
}

TEST(ZipArchivePacker, RejectsUnknownFormatAndEmptyInput) {
    TempDir tmp;
    ZipArchivePacker packer;
    write_page(tmp.path() / "pages" / "a.png");
    std::filesystem::create_directories(tmp.path() / "empty");

    EXPECT_THROW(packer.make("rar", tmp.path() / "pages", tmp.path(), "book"), std::runtime_error);
    EXPECT_THROW(packer.make("zip", tmp.path() / "empty", tmp.path(), "book"), std::runtime_error);
    EXPECT_THROW(packer.extract(tmp.path() / "missing.zip", tmp.path() / "x"), std::runtime_error);
}

TEST(ArchiverScenario, RepackagesTranslatedPagesAndRemovesTemporaryDirs) {
    TempDir tmp;
    FakeStages stages;
    const auto library = tmp.path() / "library";
    const auto source = make_source_archive(stages.packer, library, "book", "cbz", {"A.png", "B.png"});

    ArchiveDescriptor descriptor;
    descriptor.archive_path = source;
    descriptor.extraction_dir = tmp.path() / "extract";
    descriptor.extracted_images = stages.packer.extract(source, descriptor.extraction_dir);
    ASSERT_EQ(descriptor.extracted_images.size(), 2u);

    BatchRequest request;
    request.settings = fake_settings();
    request.archives.push_back(descriptor);
    request.images = make_jobs(descriptor.extracted_images);

    CancellationToken cancel;
    EventLog events;
    Collaborators collaborators = stages.collaborators();
    const RunStats stats = run_batch(request, collaborators, cancel, events.callback());

    EXPECT_EQ(stats.archives_written, 1u);
    EXPECT_TRUE(stats.archive_errors.empty());

    const auto repacked = library / "book_translated.cbz";
    ASSERT_TRUE(std::filesystem::exists(repacked));
    EXPECT_THAT(zip_entry_names(repacked), UnorderedElementsAre("A_translated.png", "B_translated.png"));

    const auto run_dir = library / "comic_translate_test";
    EXPECT_FALSE(std::filesystem::exists(run_dir / kTranslatedImagesDir / "book"));

    std::vector<int> archive_steps;
    for (const auto& e : events.of_type(EventType::Progress)) {
        if (e.image_index >= e.total_images) {
            EXPECT_EQ(e.image_index, 2);
            EXPECT_EQ(e.total_steps, kArchiveSteps);
            EXPECT_TRUE(e.major_step);
            archive_steps.push_back(e.step);
        }
    }
    EXPECT_THAT(archive_steps, ElementsAre(1, 2, 3));

    const auto finished = events.of_type(EventType::Finished);
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_TRUE(finished.front().success);
}

TEST(ArchiverScenario, SaveAsOverrideChoosesContainer) {
    TempDir tmp;
    FakeStages stages;
    const auto library = tmp.path() / "library";
    const auto source = make_source_archive(stages.packer, library, "book", "zip", {"A.png"});

    ArchiveDescriptor descriptor;
    descriptor.archive_path = source;
    descriptor.extracted_images = stages.packer.extract(source, tmp.path() / "extract");

    BatchRequest request;
    request.settings = fake_settings();
    request.settings.save_as_override = "cbz";
    request.archives.push_back(descriptor);
    request.images = make_jobs(descriptor.extracted_images);

    CancellationToken cancel;
    Collaborators collaborators = stages.collaborators();
    run_batch(request, collaborators, cancel);

    EXPECT_TRUE(std::filesystem::exists(library / "book_translated.cbz"));
    EXPECT_FALSE(std::filesystem::exists(library / "book_translated.zip"));
}

TEST(ArchiverScenario, OneFailingArchiveDoesNotStopTheOthers) {
    TempDir tmp;
    FakeStages stages;
    SelectiveFailPacker packer("first");
    const auto library = tmp.path() / "library";

    BatchRequest request;
    request.settings = fake_settings();
    for (const std::string name : {"first", "second"}) {
        const auto source = make_source_archive(stages.packer, library, name, "cbz", {"P.png"});
        ArchiveDescriptor descriptor;
        descriptor.archive_path = source;
        descriptor.extracted_images = stages.packer.extract(source, tmp.path() / ("extract_" + name));
        for (const auto& job : make_jobs(descriptor.extracted_images)) {
            request.images.push_back(job);
        }
        request.archives.push_back(descriptor);
    }

    CancellationToken cancel;
    EventLog events;
    Collaborators collaborators{stages.tools, stages.ocr, stages.translator, stages.renderer, packer};
    const RunStats stats = run_batch(request, collaborators, cancel, events.callback());

    ASSERT_EQ(stats.archive_errors.size(), 1u);
    EXPECT_EQ(stats.archive_errors[0].archive_path, (library / "first.cbz").string());
    EXPECT_EQ(stats.archive_errors[0].message, "disk full");
    EXPECT_EQ(stats.archives_written, 1u);
    EXPECT_TRUE(std::filesystem::exists(library / "second_translated.cbz"));

    const auto failed = events.of_type(EventType::ArchiveFailed);
    ASSERT_EQ(failed.size(), 1u);
    const auto finished = events.of_type(EventType::Finished);
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_FALSE(finished.front().success);
}

TEST(ArchiverScenario, SameNamedArchivesUnderOutputDirKeepTheirOwnPages) {
    TempDir tmp;
    FakeStages stages;
    const auto library = tmp.path() / "library";

    BatchRequest request;
    request.settings = fake_settings(tmp.path() / "out");
    const std::vector<std::pair<std::string, std::string>> volumes = {{"ch1", "A.png"}, {"ch2", "B.png"}};
    for (const auto& [folder, page] : volumes) {
        const auto source = make_source_archive(stages.packer, library / folder, "book", "cbz", {page});
        ArchiveDescriptor descriptor;
        descriptor.archive_path = source;
        descriptor.extracted_images = stages.packer.extract(source, tmp.path() / ("extract_" + folder));
        for (const auto& job : make_jobs(descriptor.extracted_images)) {
            request.images.push_back(job);
        }
        request.archives.push_back(descriptor);
    }

    CancellationToken cancel;
    Collaborators collaborators = stages.collaborators();
    const RunStats stats = run_batch(request, collaborators, cancel);

    EXPECT_TRUE(stats.archive_errors.empty());
    EXPECT_EQ(stats.archives_written, 2u);
    EXPECT_THAT(zip_entry_names(library / "ch1" / "book_translated.cbz"), ElementsAre("A_translated.png"));
    EXPECT_THAT(zip_entry_names(library / "ch2" / "book_translated.cbz"), ElementsAre("B_translated.png"));
}

TEST(ArchiverScenario, CancelBetweenArchivesLeavesTheRestUnpacked) {
    TempDir tmp;
    FakeStages stages;
    const auto library = tmp.path() / "library";

    BatchRequest request;
    request.settings = fake_settings();
    for (const std::string name : {"first", "second"}) {
        const auto source = make_source_archive(stages.packer, library, name, "cbz", {"P.png"});
        ArchiveDescriptor descriptor;
        descriptor.archive_path = source;
        descriptor.extracted_images = stages.packer.extract(source, tmp.path() / ("extract_" + name));
        for (const auto& job : make_jobs(descriptor.extracted_images)) {
            request.images.push_back(job);
        }
        request.archives.push_back(descriptor);
    }

    CancellationToken cancel;
    EventLog events;
    Collaborators collaborators = stages.collaborators();
    const RunStats stats = run_batch(request, collaborators, cancel, [&](const ProgressEvent& e) {
        events.events.push_back(e);
        if (e.type == EventType::Progress && e.image_index == e.total_images && e.step == kArchiveSteps) {
            cancel.request_cancel();
        }
    });

    EXPECT_TRUE(stats.cancelled);
    EXPECT_EQ(stats.archives_written, 1u);
    EXPECT_TRUE(std::filesystem::exists(library / "first_translated.cbz"));
    EXPECT_FALSE(std::filesystem::exists(library / "second_translated.cbz"));

    for (const auto& e : events.of_type(EventType::Progress)) {
        EXPECT_LE(e.image_index, e.total_images) << "second archive was started";
    }
    const auto finished = events.of_type(EventType::Finished);
    ASSERT_EQ(finished.size(), 1u);
    EXPECT_FALSE(finished.front().success);
}
