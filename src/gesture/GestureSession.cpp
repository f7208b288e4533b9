/**
 * @file GestureSession.cpp
 * @brief Gesture session implementation
 */

#include "airchord/gesture/GestureSession.hpp"
#include "airchord/gesture/GestureObserver.hpp"
#include "airchord/gesture/HandSelector.hpp"
#include "airchord/core/Logger.hpp"

namespace airchord {
namespace gesture {

namespace {
constexpr const char* SINK_UNAVAILABLE_STATUS = "MIDI output not connected";
}

GestureSession::GestureSession(const GestureSettings& settings,
                               std::shared_ptr<midi::ChordSink> sink,
                               std::shared_ptr<GestureObserver> observer)
    : filter_(settings)
    , dispatcher_(std::move(sink))
    , observer_(std::move(observer))
{
    AIRCHORD_LOG_INFO("GestureSession") << "Session started (history_length="
                                        << settings.history_length
                                        << ", stability_threshold="
                                        << settings.stability_threshold << ")";
}

FrameReport GestureSession::process(const HandFrame& frame) {
    FrameReport report;

    if (!frame.frame_available) {
        ++stats_.frames_skipped;
        report.stable_gesture = filter_.stable_gesture();
        report.active_chord = dispatcher_.active_chord();
        return report;
    }

    report.processed = true;
    ++stats_.frames_processed;

    int raw = MIN_GESTURE;
    const HandLandmarks* hand = HandSelector::select(frame.hands);
    if (hand == nullptr) {
        ++stats_.frames_without_hand;
    } else if (!classifier_.classify(*hand, report.classification)) {
        ++stats_.malformed_frames;
        report.malformed = true;
        AIRCHORD_LOG_WARNING("GestureSession") << "Malformed landmark set ("
                                               << hand->points.size()
                                               << " points), treated as no hand";
    } else {
        report.hand_present = true;
        report.hand = *hand;
        raw = report.classification.count();
    }

    report.raw_count = raw;
    report.stable_gesture = filter_.feed(raw);

    if (report.stable_gesture != notified_count_) {
        notified_count_ = report.stable_gesture;
        ++stats_.gesture_changes;
        if (observer_) {
            observer_->on_gesture_count_changed(report.stable_gesture);
        }
    }

    report.dispatch = dispatcher_.dispatch(report.stable_gesture);
    report.active_chord = dispatcher_.active_chord();
    notify_transition(report.dispatch);

    // First frames and then every 100th, to keep DEBUG logs readable
    if (stats_.frames_processed <= 5 || stats_.frames_processed % 100 == 0) {
        AIRCHORD_LOG_DEBUG("GestureSession") << "Frame " << stats_.frames_processed
                                             << ": raw=" << raw
                                             << " stable=" << report.stable_gesture
                                             << " ratio=" << filter_.last_ratio()
                                             << " chord=" << report.active_chord;
    }

    return report;
}

DispatchResult GestureSession::end() {
    DispatchResult result = dispatcher_.end_session();
    filter_.reset();
    notify_transition(result);

    if (notified_count_ != MIN_GESTURE) {
        notified_count_ = MIN_GESTURE;
        if (observer_) {
            observer_->on_gesture_count_changed(MIN_GESTURE);
        }
    }

    AIRCHORD_LOG_INFO("GestureSession") << "Session ended: frames=" << stats_.frames_processed
                                        << " skipped=" << stats_.frames_skipped
                                        << " malformed=" << stats_.malformed_frames
                                        << " chords=" << stats_.chord_starts;
    return result;
}

void GestureSession::notify_transition(const DispatchResult& result) {
    if (!result.changed) {
        return;
    }

    if (result.stopped_chord != NO_CHORD) {
        ++stats_.chord_stops;
    }
    if (result.started_chord != NO_CHORD) {
        ++stats_.chord_starts;
    }

    if (observer_) {
        observer_->on_highlight_changed(result.highlight);
    }

    if (!result.sink_available) {
        ++stats_.sink_unavailable_events;
        AIRCHORD_LOG_WARNING("GestureSession") << SINK_UNAVAILABLE_STATUS;
        if (observer_) {
            observer_->on_status_changed(SINK_UNAVAILABLE_STATUS);
        }
    } else if (result.command_failed) {
        ++stats_.command_failures;
        AIRCHORD_LOG_WARNING("GestureSession") << "Chord command failed: " << result.command_error;
        if (observer_) {
            observer_->on_status_changed(result.command_error);
        }
    }
}

} // namespace gesture
} // namespace airchord
