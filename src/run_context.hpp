#pragma once

#include "progress_event.hpp"
#include "settings.hpp"

#include <atomic>
#include <cstddef>
#include <string>

namespace comic_mt {

class CancellationToken {
public:
    void request_cancel() { cancel_requested_.store(true, std::memory_order_relaxed); }
    void reset() { cancel_requested_.store(false, std::memory_order_relaxed); }
    bool is_cancelled() const { return cancel_requested_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> cancel_requested_{false};
};

constexpr int kImageSteps = 10;
constexpr int kArchiveSteps = 3;

// Everything one batch run shares between stages; owned by the orchestrator.
class RunContext {
public:
    RunContext(
        const PipelineSettings& settings,
        std::string timestamp,
        std::size_t total_images,
        const CancellationToken& cancel,
        ProgressCallback callback
    );

    const PipelineSettings& settings() const { return settings_; }
    const std::string& timestamp() const { return timestamp_; }
    std::size_t total_images() const { return total_images_; }

    bool cancelled() const { return cancel_.is_cancelled(); }

    RunStats& stats() { return stats_; }
    const RunStats& stats() const { return stats_; }

    void progress(std::size_t index, int step, int total_steps = kImageSteps, bool major = false) const;
    void image_skipped(const std::string& path, const std::string& stage, const std::string& message) const;
    void image_processed(std::size_t index, const cv::Mat& cleaned_image, const std::string& path) const;
    void archive_failed(const std::string& archive_path, const std::string& message) const;
    void log(const std::string& message) const;
    void emit(const ProgressEvent& event) const;

private:
    const PipelineSettings& settings_;
    std::string timestamp_;
    std::size_t total_images_ = 0;
    const CancellationToken& cancel_;
    ProgressCallback callback_;
    RunStats stats_;
};

// "Oct-19-2026_03-04-05PM"
std::string make_run_timestamp();

}  // namespace comic_mt
