/**
 * @file GestureDispatcher.cpp
 * @brief Chord state machine implementation
 */

#include "airchord/gesture/GestureDispatcher.hpp"
#include "airchord/midi/ChordSink.hpp"
#include "airchord/core/Logger.hpp"

namespace airchord {
namespace gesture {

GestureDispatcher::GestureDispatcher(std::shared_ptr<midi::ChordSink> sink)
    : sink_(std::move(sink))
{
}

bool GestureDispatcher::sink_connected() const {
    return sink_ && sink_->isConnected();
}

void GestureDispatcher::record_failure(DispatchResult& result) const {
    // A disconnected sink is reported through sink_available alone
    if (sink_ && sink_->isConnected()) {
        result.command_failed = true;
        result.command_error = sink_->getLastError();
    }
}

DispatchResult GestureDispatcher::dispatch(int stable_gesture) {
    DispatchResult result;
    result.highlight = chord_state_;
    result.sink_available = sink_connected();

    if (stable_gesture == previous_gesture_) {
        return result;
    }

    previous_gesture_ = stable_gesture;
    result.changed = true;

    if (chord_state_ != NO_CHORD) {
        if (sink_ && !sink_->stopChord(chord_state_)) {
            record_failure(result);
        }
        AIRCHORD_LOG_DEBUG("Dispatcher") << "Stop chord " << chord_state_;
        result.stopped_chord = chord_state_;
        chord_state_ = NO_CHORD;
    }

    if (stable_gesture >= 1 && stable_gesture <= MAX_GESTURE) {
        if (sink_ && !sink_->startChord(stable_gesture)) {
            record_failure(result);
        }
        AIRCHORD_LOG_DEBUG("Dispatcher") << "Start chord " << stable_gesture;
        result.started_chord = stable_gesture;
        chord_state_ = stable_gesture;
    }

    result.highlight = chord_state_;
    result.sink_available = sink_connected();
    return result;
}

DispatchResult GestureDispatcher::end_session() {
    DispatchResult result;

    if (chord_state_ != NO_CHORD) {
        if (sink_ && !sink_->stopChord(chord_state_)) {
            record_failure(result);
        }
        AIRCHORD_LOG_INFO("Dispatcher") << "Session end, stopped chord " << chord_state_;
        result.changed = true;
        result.stopped_chord = chord_state_;
        chord_state_ = NO_CHORD;
    }

    previous_gesture_ = MIN_GESTURE;
    result.highlight = NO_CHORD;
    result.sink_available = sink_connected();
    return result;
}

} // namespace gesture
} // namespace airchord
