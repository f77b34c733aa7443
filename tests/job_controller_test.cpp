#include "job_controller.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <thread>

using namespace comic_mt;
using namespace comic_mt::testing;

namespace {

// Polls until the Finished event shows up or the deadline passes.
std::vector<ProgressEvent> drain(JobController& controller) {
    std::vector<ProgressEvent> all;
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(30);
    while (std::chrono::steady_clock::now() < deadline) {
        for (auto& e : controller.poll_events()) {
            all.push_back(std::move(e));
        }
        if (!all.empty() && all.back().type == EventType::Finished) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return all;
}

}  // namespace

TEST(JobController, RunsOneBatchAtATime) {
    TempDir tmp;
    FakeStages stages;
    Collaborators collaborators = stages.collaborators();
    JobController controller(collaborators);

    BatchRequest request;
    request.settings = fake_settings(tmp.path() / "out");
    request.images = make_jobs({write_page(tmp.path() / "p1.png"), write_page(tmp.path() / "p2.png")});

    ASSERT_TRUE(controller.start(request));
    EXPECT_FALSE(controller.start(request));

    const auto events = drain(controller);
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back().type, EventType::Finished);
    EXPECT_TRUE(events.back().success);
    EXPECT_EQ(events.back().stats.images_completed, 2u);
    EXPECT_FALSE(controller.is_running());

    // Finished joins the worker; the controller accepts the next run.
    ASSERT_TRUE(controller.start(request));
    EXPECT_EQ(drain(controller).back().type, EventType::Finished);
}

TEST(JobController, CancelStopsTheRun) {
    TempDir tmp;
    FakeStages stages;
    Collaborators collaborators = stages.collaborators();
    JobController controller(collaborators);
    stages.ocr.on_process = [&controller] { controller.cancel(); };

    BatchRequest request;
    request.settings = fake_settings(tmp.path() / "out");
    request.images = make_jobs({write_page(tmp.path() / "p1.png"), write_page(tmp.path() / "p2.png")});

    ASSERT_TRUE(controller.start(request));
    const auto events = drain(controller);

    ASSERT_FALSE(events.empty());
    const ProgressEvent& finished = events.back();
    EXPECT_EQ(finished.type, EventType::Finished);
    EXPECT_FALSE(finished.success);
    EXPECT_TRUE(finished.stats.cancelled);
    EXPECT_EQ(finished.stats.images_completed, 0u);
    EXPECT_EQ(stages.translator.calls, 0);
}
