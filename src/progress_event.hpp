#pragma once

#include <opencv2/core.hpp>

#include <chrono>
#include <cstddef>
#include <functional>
#include <string>
#include <vector>

namespace comic_mt {

enum class EventType {
    Progress,
    ImageSkipped,
    ImageProcessed,
    ArchiveFailed,
    Log,
    Finished
};

struct ArchiveError {
    std::string archive_path;
    std::string message;
};

struct RunStats {
    std::size_t images_total = 0;
    std::size_t images_completed = 0;
    std::size_t images_skipped = 0;
    std::size_t images_no_text = 0;
    std::size_t images_unreadable = 0;
    std::size_t translation_calls = 0;
    std::size_t archives_written = 0;
    std::vector<ArchiveError> archive_errors;
    bool cancelled = false;
    std::chrono::milliseconds wall_time{0};
};

struct ProgressEvent {
    EventType type = EventType::Log;
    std::string message;
    std::string path;
    std::string stage;

    int image_index = 0;
    int total_images = 0;
    int step = 0;
    int total_steps = 0;
    bool major_step = false;

    // ImageProcessed only; a copy the host may keep.
    cv::Mat cleaned_image;

    // Finished only.
    bool success = false;
    RunStats stats;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

}  // namespace comic_mt
