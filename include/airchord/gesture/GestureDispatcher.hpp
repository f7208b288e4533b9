/**
 * @file GestureDispatcher.hpp
 * @brief Edge-triggered mapping of stable gestures to chord commands
 *
 * @copyright 2025 AirChord Project
 * @license MIT License
 */

#ifndef AIRCHORD_GESTURE_DISPATCHER_HPP
#define AIRCHORD_GESTURE_DISPATCHER_HPP

#include "GestureTypes.hpp"
#include <memory>

namespace airchord {
namespace midi {
class ChordSink;
}

namespace gesture {

/**
 * @brief Chord state machine driven by stable gesture transitions
 *
 * Commands are only issued when the stable gesture differs from the one
 * seen on the previous frame. At most one chord is active at any time: a
 * stop for the active chord always precedes a start for the next one.
 *
 * A disconnected sink does not block transitions. The state still moves
 * and DispatchResult::sink_available reports the condition. Commands that
 * fail on a connected sink (e.g. an empty chord) are reported separately
 * through DispatchResult::command_failed.
 *
 * Thread-safety: Not thread-safe. Owned by the gesture worker thread.
 */
class GestureDispatcher {
public:
    /**
     * @param sink Chord output (may be null; commands are then dropped)
     */
    explicit GestureDispatcher(std::shared_ptr<midi::ChordSink> sink);

    /**
     * @brief Process one stable gesture
     * @param stable_gesture Output of the stability filter [0, 5]
     * @return Commands issued; changed == false when nothing happened
     */
    DispatchResult dispatch(int stable_gesture);

    /**
     * @brief Session end: stop the active chord and return to idle
     */
    DispatchResult end_session();

    /// Active chord id, NO_CHORD when idle
    int active_chord() const { return chord_state_; }

    int previous_gesture() const { return previous_gesture_; }

    /// Sink present and connected
    bool sink_connected() const;

private:
    void record_failure(DispatchResult& result) const;

    std::shared_ptr<midi::ChordSink> sink_;
    int chord_state_ = NO_CHORD;
    int previous_gesture_ = MIN_GESTURE;
};

} // namespace gesture
} // namespace airchord

#endif // AIRCHORD_GESTURE_DISPATCHER_HPP
