#pragma once

#include "event_queue.hpp"
#include "pipeline.hpp"

#include <atomic>
#include <thread>
#include <vector>

namespace comic_mt {

// Runs one batch at a time on a worker thread. Events are queued and handed to
// the caller's thread through poll_events.
class JobController {
public:
    explicit JobController(Collaborators& stages);
    ~JobController();

    JobController(const JobController&) = delete;
    JobController& operator=(const JobController&) = delete;

    // False when a run is already in flight.
    bool start(BatchRequest request);
    void cancel();

    bool is_running() const;

    // Joins the worker once the Finished event has been drained.
    std::vector<ProgressEvent> poll_events();

private:
    void run_worker(BatchRequest request);

    Collaborators& stages_;
    EventQueue events_;
    CancellationToken cancel_;
    std::thread worker_;
    std::atomic<bool> running_{false};
};

}  // namespace comic_mt
