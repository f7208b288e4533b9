/**
 * @file GestureSession.hpp
 * @brief Per-frame orchestration of selector, classifier, filter and dispatcher
 *
 * @copyright 2025 AirChord Project
 * @license MIT License
 */

#ifndef AIRCHORD_GESTURE_SESSION_HPP
#define AIRCHORD_GESTURE_SESSION_HPP

#include "GestureTypes.hpp"
#include "PalmCircleClassifier.hpp"
#include "StabilityFilter.hpp"
#include "GestureDispatcher.hpp"
#include <memory>

namespace airchord {
namespace midi {
class ChordSink;
}

namespace gesture {

class GestureObserver;

/**
 * @brief One gesture session
 *
 * Owns the stability filter and the dispatcher, so all pipeline state lives
 * and dies with the session. Settings are validated at construction.
 *
 * Observer notifications:
 * - on_gesture_count_changed when the stable gesture changes
 * - on_highlight_changed when the dispatcher reports a transition
 * - on_status_changed when a transition happens without a connected sink
 *
 * Thread-safety: Not thread-safe. Driven by a single worker thread.
 */
class GestureSession {
public:
    /**
     * @throws core::ConfigurationException if settings are out of domain
     */
    GestureSession(const GestureSettings& settings,
                   std::shared_ptr<midi::ChordSink> sink,
                   std::shared_ptr<GestureObserver> observer = nullptr);

    /**
     * @brief Run one tick through the pipeline
     *
     * A frame with frame_available == false is counted and skipped. A
     * malformed selected hand is treated as no hand (raw count 0).
     */
    FrameReport process(const HandFrame& frame);

    /**
     * @brief Stop any active chord and clear the filter state
     *
     * Safe to call more than once.
     */
    DispatchResult end();

    int stable_gesture() const { return filter_.stable_gesture(); }
    int active_chord() const { return dispatcher_.active_chord(); }
    const SessionStats& stats() const { return stats_; }
    const GestureSettings& settings() const { return filter_.settings(); }

private:
    void notify_transition(const DispatchResult& result);

    PalmCircleClassifier classifier_;
    StabilityFilter filter_;
    GestureDispatcher dispatcher_;
    std::shared_ptr<GestureObserver> observer_;

    SessionStats stats_;
    int notified_count_ = MIN_GESTURE;
};

} // namespace gesture
} // namespace airchord

#endif // AIRCHORD_GESTURE_SESSION_HPP
