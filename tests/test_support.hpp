#pragma once

#include "archive_zip.hpp"
#include "pipeline.hpp"
#include "renderer_opencv.hpp"
#include "tool_registry.hpp"

#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>

#include <unistd.h>

#include <atomic>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace comic_mt::testing {

// Unique directory under the system temp dir, removed on destruction.
class TempDir {
public:
    TempDir() {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
            ("comic_mt_test_" + std::to_string(::getpid()) + "_" + std::to_string(counter++));
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

// White page with a dark band the fake detector reports as one text block.
inline std::filesystem::path write_page(const std::filesystem::path& path) {
    std::filesystem::create_directories(path.parent_path());
    cv::Mat page(48, 64, CV_8UC3, cv::Scalar(255, 255, 255));
    cv::rectangle(page, cv::Rect(12, 12, 40, 10), cv::Scalar(0, 0, 0), cv::FILLED);
    if (!cv::imwrite(path.string(), page)) {
        throw std::runtime_error("could not write " + path.string());
    }
    return path;
}

// All-black page; the fake detector finds nothing on it.
inline std::filesystem::path write_blank_page(const std::filesystem::path& path) {
    std::filesystem::create_directories(path.parent_path());
    const cv::Mat page(48, 64, CV_8UC3, cv::Scalar(0, 0, 0));
    if (!cv::imwrite(path.string(), page)) {
        throw std::runtime_error("could not write " + path.string());
    }
    return path;
}

inline std::filesystem::path write_garbage(const std::filesystem::path& path) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << "this is not an image";
    return path;
}

inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline std::vector<std::string> read_lines(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(line);
    }
    return lines;
}

inline std::set<std::string> file_names_in(const std::filesystem::path& dir) {
    std::set<std::string> names;
    if (!std::filesystem::exists(dir)) {
        return names;
    }
    for (const auto& entry : std::filesystem::recursive_directory_iterator(dir)) {
        if (entry.is_regular_file()) {
            names.insert(entry.path().filename().string());
        }
    }
    return names;
}

class FakeDetector final : public Detector {
public:
    explicit FakeDetector(int fail_on_call = 0) : fail_on_call_(fail_on_call) {}

    std::vector<TextBlock> detect(const cv::Mat& image) override {
        if (++calls_ == fail_on_call_) {
            throw std::runtime_error("detector crashed");
        }
        const cv::Vec3b corner = image.at<cv::Vec3b>(0, 0);
        if (corner == cv::Vec3b(0, 0, 0)) {
            return {};
        }
        TextBlock blk;
        blk.xyxy = BoxXYXY{10, 10, 54, 24};
        return {blk};
    }

private:
    int calls_ = 0;
    int fail_on_call_ = 0;
};

class FakeInpainter final : public Inpainter {
public:
    FakeInpainter(int fail_on_call = 0, int wrong_size_on_call = 0)
        : fail_on_call_(fail_on_call), wrong_size_on_call_(wrong_size_on_call) {}

    cv::Mat inpaint(const cv::Mat& image, const cv::Mat& mask, const InpaintConfig& /*config*/) override {
        ++calls_;
        if (calls_ == fail_on_call_) {
            throw std::runtime_error("inpainter out of memory");
        }
        if (calls_ == wrong_size_on_call_) {
            return cv::Mat(image.rows / 2, image.cols / 2, image.type(), cv::Scalar(255, 255, 255));
        }
        cv::Mat out = image.clone();
        out.setTo(cv::Scalar(255, 255, 255), mask);
        return out;
    }

private:
    int calls_ = 0;
    int fail_on_call_ = 0;
    int wrong_size_on_call_ = 0;
};

// OpenCV renderer whose compositing can be made to fail for one page.
class FakeRenderer final : public Renderer {
public:
    std::vector<TextBlock> compute_layout(
        std::vector<TextBlock> blocks,
        const cv::Mat& original_image,
        const cv::Mat& cleaned_image
    ) override {
        return inner_.compute_layout(std::move(blocks), original_image, cleaned_image);
    }

    WrappedText word_wrap(const std::string& text, int width, int height, const RenderSettings& settings) override {
        return inner_.word_wrap(text, width, height, settings);
    }

    cv::Mat composite(const cv::Mat& cleaned_image, const std::vector<RenderState>& states) override {
        if (++composite_calls == fail_composite_on_call) {
            throw std::runtime_error("font rasterizer failed");
        }
        return inner_.composite(cleaned_image, states);
    }

    int composite_calls = 0;
    int fail_composite_on_call = 0;

private:
    OpencvRenderer inner_;
};

class FakeOcr final : public OcrEngine {
public:
    void initialize(const std::string& source_lang) override {
        languages.push_back(source_lang);
    }

    std::vector<TextBlock> process(const cv::Mat& /*image*/, std::vector<TextBlock> blocks) override {
        ++calls;
        if (on_process) {
            on_process();
        }
        if (calls == fail_on_call) {
            throw std::runtime_error("ocr engine crashed");
        }
        for (std::size_t i = 0; i < blocks.size(); ++i) {
            blocks[i].text = "line " + std::to_string(i);
        }
        return blocks;
    }

    int calls = 0;
    int fail_on_call = 0;
    std::vector<std::string> languages;
    std::function<void()> on_process;
};

class FakeTranslator final : public Translator {
public:
    std::vector<TextBlock> translate(
        std::vector<TextBlock> blocks,
        const LanguagePair& languages,
        const cv::Mat& /*context_image*/,
        const std::string& extra_context
    ) override {
        ++calls;
        call_sizes.push_back(blocks.size());
        call_languages.push_back(languages);
        last_extra_context = extra_context;

        if (fail_on_calls.count(calls) != 0) {
            throw std::runtime_error("model unavailable");
        }
        for (auto& blk : blocks) {
            blk.translation = translation_override.empty() ? "T: " + blk.text : translation_override;
        }
        if (drop_last_block && !blocks.empty()) {
            blocks.pop_back();
        }
        return blocks;
    }

    int calls = 0;
    std::vector<std::size_t> call_sizes;
    std::vector<LanguagePair> call_languages;
    std::string last_extra_context;
    std::set<int> fail_on_calls;
    bool drop_last_block = false;
    std::string translation_override;
};

// Registry with "fake" detector and inpainter plus the other in-memory stages.
struct FakeStages {
    FakeStages() {
        tools.register_detector("fake", [this](const PipelineSettings&) {
            ++detectors_built;
            return std::make_unique<FakeDetector>(detector_fail_on_call);
        });
        tools.register_inpainter("fake", [this](const std::string& device) {
            ++inpainters_built;
            last_device = device;
            return std::make_unique<FakeInpainter>(inpainter_fail_on_call, inpainter_wrong_size_on_call);
        });
    }

    FakeStages(const FakeStages&) = delete;
    FakeStages& operator=(const FakeStages&) = delete;

    Collaborators collaborators() {
        return Collaborators{tools, ocr, translator, renderer, packer};
    }

    ToolRegistry tools;
    FakeOcr ocr;
    FakeTranslator translator;
    FakeRenderer renderer;
    ZipArchivePacker packer;
    int detector_fail_on_call = 0;
    int inpainter_fail_on_call = 0;
    int inpainter_wrong_size_on_call = 0;
    int detectors_built = 0;
    int inpainters_built = 0;
    std::string last_device;
};

inline PipelineSettings fake_settings(const std::filesystem::path& output_dir = {}) {
    PipelineSettings settings;
    settings.detector = "fake";
    settings.inpainter = "fake";
    settings.ocr = "fake";
    settings.translator = "fake";
    settings.run_timestamp = "test";
    settings.output_dir = output_dir;
    return settings;
}

inline std::vector<ImageJob> make_jobs(
    const std::vector<std::filesystem::path>& paths,
    const LanguagePair& languages = {"Japanese", "English"}
) {
    std::vector<ImageJob> jobs;
    for (const auto& path : paths) {
        jobs.push_back(ImageJob{path, languages});
    }
    return jobs;
}

// Collects every event a run emits.
struct EventLog {
    ProgressCallback callback() {
        return [this](const ProgressEvent& e) { events.push_back(e); };
    }

    std::vector<ProgressEvent> of_type(EventType type) const {
        std::vector<ProgressEvent> out;
        for (const auto& e : events) {
            if (e.type == type) {
                out.push_back(e);
            }
        }
        return out;
    }

    std::vector<ProgressEvent> events;
};

}  // namespace comic_mt::testing
