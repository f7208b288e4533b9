/**
 * @file GestureObserver.hpp
 * @brief Presentation-side notifications from the gesture worker
 *
 * @copyright 2025 AirChord Project
 * @license MIT License
 */

#ifndef AIRCHORD_GESTURE_OBSERVER_HPP
#define AIRCHORD_GESTURE_OBSERVER_HPP

#include <string>
#include <opencv2/core.hpp>

namespace airchord {
namespace gesture {

/**
 * @brief Receiver of gesture display updates
 *
 * Every method is called on the gesture worker thread and must not block.
 * GUI implementations hand the value over to their own thread and return.
 */
class GestureObserver {
public:
    virtual ~GestureObserver() = default;

    /// Stable finger count changed [0, 5]
    virtual void on_gesture_count_changed(int count) = 0;

    /// Chord to highlight, 0 clears the highlight
    virtual void on_highlight_changed(int chord_id) = 0;

    /// Annotated camera frame (BGR); the observer owns the passed copy
    virtual void on_frame_rendered(const cv::Mat& image) = 0;

    /// Non-blocking status line (e.g. MIDI output not connected)
    virtual void on_status_changed(const std::string& status) = 0;
};

} // namespace gesture
} // namespace airchord

#endif // AIRCHORD_GESTURE_OBSERVER_HPP
