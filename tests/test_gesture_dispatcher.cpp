/**
 * @file test_gesture_dispatcher.cpp
 * @brief Unit tests for GestureDispatcher
 *
 * Validates:
 * - Edge triggering: commands only when the stable gesture changes
 * - Stop-before-start ordering on chord switches
 * - Session end stops the active chord exactly once
 * - Missing or disconnected sinks reported without losing chord state
 * - Commands rejected by a connected sink kept apart from connectivity
 */

#include <gtest/gtest.h>
#include <airchord/gesture/GestureDispatcher.hpp>
#include <airchord/core/Logger.hpp>
#include "test_helpers.hpp"

using namespace airchord::gesture;
using airchord::test::RecordingChordSink;

using Events = std::vector<std::string>;

class GestureDispatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        airchord::core::Logger::getInstance().setLevel(airchord::core::LogLevel::WARNING);
        sink_ = std::make_shared<RecordingChordSink>();
        dispatcher_ = std::make_unique<GestureDispatcher>(sink_);
    }

    std::shared_ptr<RecordingChordSink> sink_;
    std::unique_ptr<GestureDispatcher> dispatcher_;
};

TEST_F(GestureDispatcherTest, InitialState) {
    EXPECT_EQ(dispatcher_->active_chord(), NO_CHORD);
    EXPECT_EQ(dispatcher_->previous_gesture(), 0);
    EXPECT_TRUE(dispatcher_->sink_connected());
}

TEST_F(GestureDispatcherTest, ZeroAtStartIsNotAChange) {
    DispatchResult result = dispatcher_->dispatch(0);
    EXPECT_FALSE(result.changed);
    EXPECT_TRUE(sink_->events().empty());
}

TEST_F(GestureDispatcherTest, StartsChordOnChange) {
    DispatchResult result = dispatcher_->dispatch(3);

    EXPECT_TRUE(result.changed);
    EXPECT_EQ(result.started_chord, 3);
    EXPECT_EQ(result.stopped_chord, NO_CHORD);
    EXPECT_EQ(result.highlight, 3);
    EXPECT_TRUE(result.sink_available);
    EXPECT_EQ(dispatcher_->active_chord(), 3);
    EXPECT_EQ(sink_->events(), (Events{"start 3"}));
}

TEST_F(GestureDispatcherTest, SameGestureIssuesNothing) {
    dispatcher_->dispatch(2);
    DispatchResult result = dispatcher_->dispatch(2);
    dispatcher_->dispatch(2);

    EXPECT_FALSE(result.changed);
    EXPECT_EQ(result.highlight, 2);
    EXPECT_EQ(sink_->events(), (Events{"start 2"}));
}

TEST_F(GestureDispatcherTest, SwitchStopsBeforeStarting) {
    dispatcher_->dispatch(3);
    DispatchResult result = dispatcher_->dispatch(5);

    EXPECT_EQ(result.stopped_chord, 3);
    EXPECT_EQ(result.started_chord, 5);
    EXPECT_EQ(dispatcher_->active_chord(), 5);
    EXPECT_EQ(sink_->events(), (Events{"start 3", "stop 3", "start 5"}));
}

TEST_F(GestureDispatcherTest, ZeroStopsAndClearsHighlight) {
    dispatcher_->dispatch(4);
    DispatchResult result = dispatcher_->dispatch(0);

    EXPECT_TRUE(result.changed);
    EXPECT_EQ(result.stopped_chord, 4);
    EXPECT_EQ(result.started_chord, NO_CHORD);
    EXPECT_EQ(result.highlight, NO_CHORD);
    EXPECT_EQ(dispatcher_->active_chord(), NO_CHORD);
    EXPECT_EQ(sink_->events(), (Events{"start 4", "stop 4"}));
}

TEST_F(GestureDispatcherTest, AtMostOneChordActive) {
    for (int g : {1, 2, 0, 5, 5, 3, 0, 0, 4}) {
        dispatcher_->dispatch(g);
    }
    int active = 0;
    for (const auto& e : sink_->events()) {
        active += (e.rfind("start", 0) == 0) ? 1 : -1;
        EXPECT_GE(active, 0);
        EXPECT_LE(active, 1);
    }
    EXPECT_EQ(active, 1);
    EXPECT_EQ(dispatcher_->active_chord(), 4);
}

TEST_F(GestureDispatcherTest, EndSessionStopsActiveChord) {
    dispatcher_->dispatch(4);
    DispatchResult result = dispatcher_->end_session();

    EXPECT_TRUE(result.changed);
    EXPECT_EQ(result.stopped_chord, 4);
    EXPECT_EQ(result.highlight, NO_CHORD);
    EXPECT_EQ(dispatcher_->active_chord(), NO_CHORD);
    EXPECT_EQ(dispatcher_->previous_gesture(), 0);
    EXPECT_EQ(sink_->events(), (Events{"start 4", "stop 4"}));
}

TEST_F(GestureDispatcherTest, EndSessionTwiceIsHarmless) {
    dispatcher_->dispatch(1);
    dispatcher_->end_session();
    DispatchResult second = dispatcher_->end_session();

    EXPECT_FALSE(second.changed);
    EXPECT_EQ(sink_->events(), (Events{"start 1", "stop 1"}));
}

TEST_F(GestureDispatcherTest, EndSessionWithoutChordIssuesNothing) {
    DispatchResult result = dispatcher_->end_session();
    EXPECT_FALSE(result.changed);
    EXPECT_TRUE(sink_->events().empty());
}

TEST_F(GestureDispatcherTest, RestartsAfterEndSession) {
    dispatcher_->dispatch(2);
    dispatcher_->end_session();
    dispatcher_->dispatch(2);
    EXPECT_EQ(sink_->events(), (Events{"start 2", "stop 2", "start 2"}));
}

TEST_F(GestureDispatcherTest, DisconnectedSinkKeepsChordState) {
    sink_->setConnected(false);

    DispatchResult result = dispatcher_->dispatch(3);
    EXPECT_TRUE(result.changed);
    EXPECT_FALSE(result.sink_available);
    EXPECT_EQ(dispatcher_->active_chord(), 3);
    EXPECT_EQ(result.highlight, 3);

    sink_->setConnected(true);
    result = dispatcher_->dispatch(0);
    EXPECT_TRUE(result.sink_available);
    EXPECT_EQ(sink_->events(), (Events{"start 3", "stop 3"}));
}

TEST_F(GestureDispatcherTest, RejectedStartOnConnectedSinkIsNotAConnectivityProblem) {
    sink_->setChordEmpty(2);

    DispatchResult result = dispatcher_->dispatch(2);
    EXPECT_TRUE(result.changed);
    EXPECT_TRUE(result.sink_available);
    EXPECT_TRUE(result.command_failed);
    EXPECT_EQ(result.command_error, "Chord 2 not configured");
    EXPECT_EQ(dispatcher_->active_chord(), 2);

    result = dispatcher_->dispatch(4);
    EXPECT_TRUE(result.sink_available);
    EXPECT_FALSE(result.command_failed);
    EXPECT_EQ(sink_->events(), (Events{"start 2", "stop 2", "start 4"}));
}

TEST_F(GestureDispatcherTest, DisconnectedSinkIsNotACommandFailure) {
    sink_->setConnected(false);
    DispatchResult result = dispatcher_->dispatch(1);
    EXPECT_FALSE(result.sink_available);
    EXPECT_FALSE(result.command_failed);
    EXPECT_TRUE(result.command_error.empty());
}

TEST(GestureDispatcherNoSinkTest, NullSinkReportsUnavailable) {
    GestureDispatcher dispatcher(nullptr);
    EXPECT_FALSE(dispatcher.sink_connected());

    DispatchResult result = dispatcher.dispatch(2);
    EXPECT_TRUE(result.changed);
    EXPECT_FALSE(result.sink_available);
    EXPECT_EQ(dispatcher.active_chord(), 2);

    result = dispatcher.end_session();
    EXPECT_EQ(result.stopped_chord, 2);
    EXPECT_FALSE(result.sink_available);
}
