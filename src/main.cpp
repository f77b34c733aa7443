#include "archive_zip.hpp"
#include "builtin_tools.hpp"
#include "config.hpp"
#include "job_controller.hpp"
#include "renderer_opencv.hpp"

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void handle_sigint(int /*signal*/) {
    g_interrupted = 1;
}

struct CollectedInputs {
    std::vector<std::filesystem::path> images;
    std::vector<std::filesystem::path> archives;
};

bool collect_input_files(
    const std::vector<std::filesystem::path>& inputs,
    CollectedInputs& out,
    std::string& error
) {
    for (const auto& input : inputs) {
        if (!std::filesystem::exists(input)) {
            error = "Input path does not exist: " + input.string();
            return false;
        }

        if (std::filesystem::is_regular_file(input)) {
            if (comic_mt::is_supported_image(input)) {
                out.images.push_back(input);
            } else if (comic_mt::is_supported_archive(input)) {
                out.archives.push_back(input);
            } else {
                error = "Input file is neither an image nor a zip/cbz archive: " + input.string();
                return false;
            }
            continue;
        }

        if (!std::filesystem::is_directory(input)) {
            error = "Input path is neither file nor directory: " + input.string();
            return false;
        }

        std::vector<std::filesystem::path> images;
        std::vector<std::filesystem::path> archives;
        for (const auto& entry : std::filesystem::recursive_directory_iterator(input)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            if (comic_mt::is_supported_image(entry.path())) {
                images.push_back(entry.path());
            } else if (comic_mt::is_supported_archive(entry.path())) {
                archives.push_back(entry.path());
            }
        }
        std::sort(images.begin(), images.end());
        std::sort(archives.begin(), archives.end());
        out.images.insert(out.images.end(), images.begin(), images.end());
        out.archives.insert(out.archives.end(), archives.begin(), archives.end());
    }

    if (out.images.empty() && out.archives.empty()) {
        error = "No images or archives found in the given inputs";
        return false;
    }
    return true;
}

bool extract_archives(
    const std::vector<std::filesystem::path>& archives,
    const std::filesystem::path& temp_root,
    comic_mt::ArchivePacker& packer,
    std::vector<comic_mt::ArchiveDescriptor>& out,
    std::string& error
) {
    for (std::size_t i = 0; i < archives.size(); ++i) {
        comic_mt::ArchiveDescriptor descriptor;
        descriptor.archive_path = archives[i];
        descriptor.extraction_dir = temp_root / ("archive_" + std::to_string(i));

        try {
            descriptor.extracted_images = packer.extract(archives[i], descriptor.extraction_dir);
        } catch (const std::exception& ex) {
            error = "Failed to extract " + archives[i].string() + ": " + ex.what();
            return false;
        }

        if (descriptor.extracted_images.empty()) {
            std::cerr << "[archive] no images in " << archives[i].filename().string() << "\n";
        }
        out.push_back(std::move(descriptor));
    }
    return true;
}

std::string format_progress_bar(double ratio, std::size_t width) {
    ratio = std::clamp(ratio, 0.0, 1.0);
    const std::size_t filled = static_cast<std::size_t>(ratio * static_cast<double>(width));
    std::string bar(width, '-');
    for (std::size_t i = 0; i < filled && i < width; ++i) {
        bar[i] = '=';
    }
    if (filled < width) {
        bar[filled] = '>';
    }
    return bar;
}

void print_progress(const comic_mt::ProgressEvent& event, const std::string& current_file) {
    const int total = event.total_images;
    const bool archive_pass = event.image_index >= total;

    double fraction = 1.0;
    if (!archive_pass && total > 0 && event.total_steps > 0) {
        fraction = (static_cast<double>(event.image_index) +
                    static_cast<double>(event.step) / static_cast<double>(event.total_steps)) /
                   static_cast<double>(total);
    }
    fraction = std::clamp(fraction, 0.0, 1.0);
    const auto pct = static_cast<int>(fraction * 100.0);

    std::ostringstream line;
    line << "\r[" << format_progress_bar(fraction, 30) << "] " << std::setw(3) << pct << "% ";
    if (archive_pass) {
        line << "archive " << (event.image_index - total + 1);
    } else {
        line << "images " << (event.image_index + 1) << "/" << total;
    }
    line << " step " << event.step << "/" << event.total_steps << " " << current_file;

    std::cerr << line.str() << "\033[K";
    std::cerr.flush();
}

void print_summary(const comic_mt::RunStats& stats) {
    std::cout
        << "[summary] images=" << stats.images_total
        << " completed=" << stats.images_completed
        << " skipped=" << stats.images_skipped
        << " no_text=" << stats.images_no_text
        << " unreadable=" << stats.images_unreadable
        << " translation_calls=" << stats.translation_calls
        << " archives=" << stats.archives_written
        << " archive_errors=" << stats.archive_errors.size()
        << " cancelled=" << (stats.cancelled ? "yes" : "no")
        << " time_ms=" << stats.wall_time.count()
        << "\n";
}

}  // namespace

int main(int argc, char** argv) {
    comic_mt::AppConfig config;
    std::string error;

    if (!comic_mt::parse_args(argc, argv, config, error)) {
        if (error != "help") {
            std::cerr << "Argument error: " << error << "\n\n";
        }
        comic_mt::print_usage(argv[0]);
        return error == "help" ? 0 : 1;
    }

    CollectedInputs inputs;
    if (!collect_input_files(config.inputs, inputs, error)) {
        std::cerr << error << "\n";
        return 1;
    }

    comic_mt::ToolRegistry registry;
    comic_mt::register_builtin_tools(registry);

    const auto detectors = registry.detector_ids();
    const auto inpainters = registry.inpainter_ids();
    if (std::find(detectors.begin(), detectors.end(), config.settings.detector) == detectors.end()) {
        std::cerr << "[fatal] unknown detector: " << config.settings.detector << "\n";
        return 1;
    }
    if (std::find(inpainters.begin(), inpainters.end(), config.settings.inpainter) == inpainters.end()) {
        std::cerr << "[fatal] unknown inpainter: " << config.settings.inpainter << "\n";
        return 1;
    }

    std::unique_ptr<comic_mt::OcrEngine> ocr;
    std::unique_ptr<comic_mt::Translator> translator;
    try {
        ocr = registry.create_ocr(config.settings.ocr, config.settings);
        translator = registry.create_translator(config.settings.translator, config.settings);
    } catch (const std::exception& ex) {
        std::cerr << "[fatal] failed to initialize pipeline: " << ex.what() << "\n";
        return 1;
    }

    comic_mt::OpencvRenderer renderer;
    comic_mt::ZipArchivePacker packer;

    const std::filesystem::path temp_root =
        std::filesystem::temp_directory_path() / ("comic_mt_" + std::to_string(::getpid()));

    comic_mt::BatchRequest request;
    request.settings = config.settings;

    if (!extract_archives(inputs.archives, temp_root, packer, request.archives, error)) {
        std::cerr << "[fatal] " << error << "\n";
        std::error_code ec;
        std::filesystem::remove_all(temp_root, ec);
        return 1;
    }

    const comic_mt::LanguagePair languages{config.source_lang, config.target_lang};
    for (const auto& image : inputs.images) {
        request.images.push_back(comic_mt::ImageJob{image, languages});
    }
    for (const auto& archive : request.archives) {
        for (const auto& image : archive.extracted_images) {
            request.images.push_back(comic_mt::ImageJob{image, languages});
        }
    }

    std::vector<std::string> display_names;
    for (const auto& job : request.images) {
        display_names.push_back(job.path.filename().string());
    }
    for (const auto& archive : request.archives) {
        display_names.push_back(archive.archive_path.filename().string());
    }

    comic_mt::Collaborators stages{registry, *ocr, *translator, renderer, packer};
    comic_mt::JobController controller(stages);

    std::signal(SIGINT, handle_sigint);

    if (!controller.start(std::move(request))) {
        std::cerr << "[fatal] a run is already in progress\n";
        return 1;
    }

    comic_mt::RunStats final_stats;
    bool success = false;
    bool cancel_sent = false;
    bool finished = false;

    while (!finished) {
        if (g_interrupted != 0 && !cancel_sent) {
            controller.cancel();
            cancel_sent = true;
            std::cerr << "\n[cancel] stopping after the current step\n";
        }

        for (const auto& event : controller.poll_events()) {
            switch (event.type) {
            case comic_mt::EventType::Progress: {
                const auto idx = static_cast<std::size_t>(event.image_index);
                const std::string name = idx < display_names.size() ? display_names[idx] : std::string();
                if (config.show_progress) {
                    print_progress(event, name);
                }
                if (event.image_index < event.total_images && event.step == comic_mt::kImageSteps - 1) {
                    if (config.show_progress) {
                        std::cerr << "\n";
                    }
                    std::cout << "[ok] " << name << "\n";
                }
                break;
            }
            case comic_mt::EventType::ImageSkipped:
                if (config.show_progress) {
                    std::cerr << "\n";
                }
                std::cout << "[skip] " << std::filesystem::path(event.path).filename().string() << " "
                          << event.stage << ": " << event.message << "\n";
                break;
            case comic_mt::EventType::ArchiveFailed:
                if (config.show_progress) {
                    std::cerr << "\n";
                }
                std::cerr << "[archive] failed " << event.path << ": " << event.message << "\n";
                break;
            case comic_mt::EventType::Log:
                if (config.show_progress) {
                    std::cerr << "\n";
                }
                std::cerr << event.message << "\n";
                break;
            case comic_mt::EventType::ImageProcessed:
                break;
            case comic_mt::EventType::Finished:
                final_stats = event.stats;
                success = event.success;
                finished = true;
                break;
            }
        }

        if (!finished) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    }

    if (config.show_progress) {
        std::cerr << "\n";
    }
    print_summary(final_stats);

    std::error_code ec;
    std::filesystem::remove_all(temp_root, ec);
    if (ec) {
        std::cerr << "[error] could not remove " << temp_root.string() << ": " << ec.message() << "\n";
    }

    if (final_stats.cancelled) {
        return 130;
    }
    return success ? 0 : 1;
}
