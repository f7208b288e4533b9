/**
 * @file test_gesture_worker.cpp
 * @brief Threaded GestureWorker tests with a scripted landmark source
 *
 * Validates:
 * - Start/stop lifecycle and source open/close
 * - Chords dispatched from the worker thread
 * - Active chord stopped when the session is cancelled
 * - Invalid settings rejected before the thread starts
 */

#include <gtest/gtest.h>
#include <airchord/gesture/GestureWorker.hpp>
#include <airchord/core/exception.h>
#include <airchord/core/Logger.hpp>
#include "test_helpers.hpp"

using namespace airchord::gesture;
using namespace airchord::test;

namespace {

std::vector<HandFrame> frames_with_fingers(int fingers, int n) {
    std::vector<HandFrame> frames;
    for (int i = 0; i < n; ++i) {
        frames.push_back(make_frame_with_fingers(fingers));
    }
    return frames;
}

} // anonymous namespace

class GestureWorkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        airchord::core::Logger::getInstance().setLevel(airchord::core::LogLevel::ERROR);
        sink_ = std::make_shared<RecordingChordSink>();
        observer_ = std::make_shared<RecordingObserver>();
    }

    void TearDown() override {
        if (worker_) {
            worker_->stop();
        }
    }

    void create_worker(std::vector<HandFrame> frames) {
        source_ = std::make_shared<ScriptedLandmarkSource>(std::move(frames));
        worker_ = std::make_unique<GestureWorker>(source_, sink_, observer_);
    }

    std::shared_ptr<RecordingChordSink> sink_;
    std::shared_ptr<RecordingObserver> observer_;
    std::shared_ptr<ScriptedLandmarkSource> source_;
    std::unique_ptr<GestureWorker> worker_;
};

TEST_F(GestureWorkerTest, StartOpensSourceAndStopClosesIt) {
    create_worker({});
    EXPECT_FALSE(worker_->is_running());

    ASSERT_TRUE(worker_->start(GestureSettings{}));
    EXPECT_TRUE(worker_->is_running());
    EXPECT_TRUE(source_->is_open());
    EXPECT_EQ(source_->open_count(), 1);

    worker_->stop();
    EXPECT_FALSE(worker_->is_running());
    EXPECT_FALSE(source_->is_open());
}

TEST_F(GestureWorkerTest, PlaysChordFromWorkerThread) {
    create_worker(frames_with_fingers(3, 10));
    ASSERT_TRUE(worker_->start(GestureSettings{}));

    EXPECT_TRUE(wait_for([this]() { return sink_->contains("start 3"); }));
    EXPECT_TRUE(wait_for([this]() { return worker_->get_stats().frames_skipped > 0; }));

    worker_->stop();
    SessionStats stats = worker_->get_stats();
    EXPECT_EQ(stats.frames_processed, 10u);
    EXPECT_EQ(stats.chord_starts, 1u);
    EXPECT_GT(stats.frames_skipped, 0u);
}

TEST_F(GestureWorkerTest, StopEndsActiveChord) {
    create_worker(frames_with_fingers(4, 6));
    ASSERT_TRUE(worker_->start(GestureSettings{}));
    ASSERT_TRUE(wait_for([this]() { return sink_->contains("start 4"); }));

    worker_->stop();

    std::vector<std::string> events = sink_->events();
    ASSERT_FALSE(events.empty());
    EXPECT_EQ(events.back(), "stop 4");
    EXPECT_EQ(observer_->highlights().back(), NO_CHORD);
    EXPECT_EQ(observer_->counts().back(), 0);
}

TEST_F(GestureWorkerTest, HandRemovalStopsChord) {
    std::vector<HandFrame> frames = frames_with_fingers(2, 5);
    for (int i = 0; i < 5; ++i) {
        frames.push_back(make_empty_frame());
    }
    create_worker(frames);
    ASSERT_TRUE(worker_->start(GestureSettings{}));

    EXPECT_TRUE(wait_for([this]() { return sink_->contains("stop 2"); }));
    worker_->stop();
    EXPECT_EQ(sink_->events(), (std::vector<std::string>{"start 2", "stop 2"}));
}

TEST_F(GestureWorkerTest, InvalidSettingsThrowBeforeStart) {
    create_worker({});
    GestureSettings bad;
    bad.stability_threshold = 1.2;

    EXPECT_THROW(worker_->start(bad), airchord::core::ConfigurationException);
    EXPECT_FALSE(worker_->is_running());
    EXPECT_FALSE(source_->is_open());
}

TEST_F(GestureWorkerTest, SecondStartRejected) {
    create_worker({});
    ASSERT_TRUE(worker_->start(GestureSettings{}));
    EXPECT_FALSE(worker_->start(GestureSettings{}));
    EXPECT_FALSE(worker_->get_last_error().empty());
}

TEST_F(GestureWorkerTest, SourceOpenFailureReported) {
    create_worker({});
    source_->set_open_succeeds(false);

    EXPECT_FALSE(worker_->start(GestureSettings{}));
    EXPECT_FALSE(worker_->is_running());
    EXPECT_NE(worker_->get_last_error().find("scripted open failure"), std::string::npos);
}

TEST_F(GestureWorkerTest, RestartAfterStop) {
    create_worker(frames_with_fingers(1, 4));
    ASSERT_TRUE(worker_->start(GestureSettings{}));
    ASSERT_TRUE(wait_for([this]() { return sink_->contains("start 1"); }));
    worker_->stop();

    ASSERT_TRUE(worker_->start(GestureSettings{}));
    EXPECT_EQ(source_->open_count(), 2);
    worker_->stop();
    EXPECT_EQ(worker_->get_stats().frames_processed, 0u);
}

TEST(GestureWorkerNoSourceTest, StartWithoutSourceFails) {
    GestureWorker worker(nullptr, nullptr, nullptr);
    EXPECT_FALSE(worker.start(GestureSettings{}));
    EXPECT_FALSE(worker.is_running());
}
