#include "job_controller.hpp"

#include <exception>
#include <utility>

namespace comic_mt {

JobController::JobController(Collaborators& stages)
    : stages_(stages) {}

JobController::~JobController() {
    cancel();
    if (worker_.joinable()) {
        worker_.join();
    }
}

bool JobController::start(BatchRequest request) {
    if (running_.load(std::memory_order_relaxed)) {
        return false;
    }
    if (worker_.joinable()) {
        worker_.join();
    }

    cancel_.reset();
    running_.store(true, std::memory_order_relaxed);

    worker_ = std::thread(&JobController::run_worker, this, std::move(request));
    return true;
}

void JobController::cancel() {
    cancel_.request_cancel();
}

bool JobController::is_running() const {
    return running_.load(std::memory_order_relaxed);
}

std::vector<ProgressEvent> JobController::poll_events() {
    auto events = events_.pop_all();
    bool saw_finished = false;
    for (const auto& e : events) {
        if (e.type == EventType::Finished) {
            saw_finished = true;
        }
    }

    if (saw_finished) {
        if (worker_.joinable()) {
            worker_.join();
        }
        running_.store(false, std::memory_order_relaxed);
    }

    return events;
}

void JobController::run_worker(BatchRequest request) {
    auto cb = [&](const ProgressEvent& e) { events_.push(e); };

    try {
        run_batch(request, stages_, cancel_, cb);
    } catch (const std::exception& ex) {
        // run_batch only throws before its Finished event; the host still needs one.
        ProgressEvent log;
        log.type = EventType::Log;
        log.message = std::string("[fatal] ") + ex.what();
        events_.push(log);

        ProgressEvent finished;
        finished.type = EventType::Finished;
        finished.success = false;
        finished.stats.cancelled = cancel_.is_cancelled();
        events_.push(finished);
    }
}

}  // namespace comic_mt
