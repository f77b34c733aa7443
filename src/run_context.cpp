#include "run_context.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace comic_mt {

RunContext::RunContext(
    const PipelineSettings& settings,
    std::string timestamp,
    std::size_t total_images,
    const CancellationToken& cancel,
    ProgressCallback callback
)
    : settings_(settings),
      timestamp_(std::move(timestamp)),
      total_images_(total_images),
      cancel_(cancel),
      callback_(std::move(callback)) {
    stats_.images_total = total_images;
}

void RunContext::emit(const ProgressEvent& event) const {
    if (callback_) {
        callback_(event);
    }
}

void RunContext::progress(std::size_t index, int step, int total_steps, bool major) const {
    ProgressEvent e;
    e.type = EventType::Progress;
    e.image_index = static_cast<int>(index);
    e.total_images = static_cast<int>(total_images_);
    e.step = step;
    e.total_steps = total_steps;
    e.major_step = major;
    emit(e);
}

void RunContext::image_skipped(const std::string& path, const std::string& stage, const std::string& message) const {
    ProgressEvent e;
    e.type = EventType::ImageSkipped;
    e.path = path;
    e.stage = stage;
    e.message = message;
    emit(e);
}

void RunContext::image_processed(std::size_t index, const cv::Mat& cleaned_image, const std::string& path) const {
    if (!callback_) {
        return;
    }
    ProgressEvent e;
    e.type = EventType::ImageProcessed;
    e.image_index = static_cast<int>(index);
    e.total_images = static_cast<int>(total_images_);
    e.path = path;
    e.cleaned_image = cleaned_image.clone();
    emit(e);
}

void RunContext::archive_failed(const std::string& archive_path, const std::string& message) const {
    ProgressEvent e;
    e.type = EventType::ArchiveFailed;
    e.path = archive_path;
    e.message = message;
    emit(e);
}

void RunContext::log(const std::string& message) const {
    ProgressEvent e;
    e.type = EventType::Log;
    e.message = message;
    emit(e);
}

std::string make_run_timestamp() {
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::ostringstream oss;
    oss << std::put_time(&local, "%b-%d-%Y_%I-%M-%S%p");
    return oss.str();
}

}  // namespace comic_mt
