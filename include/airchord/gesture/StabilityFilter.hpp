/**
 * @file StabilityFilter.hpp
 * @brief Temporal debounce of raw finger counts
 *
 * Majority vote over a fixed window of recent raw counts. The stable value
 * only moves once the window is full and its mode holds at least
 * stability_threshold of the window.
 *
 * @copyright 2025 AirChord Project
 * @license MIT License
 */

#ifndef AIRCHORD_GESTURE_STABILITY_FILTER_HPP
#define AIRCHORD_GESTURE_STABILITY_FILTER_HPP

#include "GestureTypes.hpp"
#include "GestureHistory.hpp"

namespace airchord {
namespace gesture {

/**
 * @brief Stateful stability filter
 *
 * Thread-safety: Not thread-safe. Owned by the gesture worker thread.
 */
class StabilityFilter {
public:
    /**
     * @brief Construct for one gesture session
     * @param settings Window size and threshold
     * @throws core::ConfigurationException if settings are out of domain
     */
    explicit StabilityFilter(const GestureSettings& settings);

    /**
     * @brief Feed one raw count and get the stable gesture
     *
     * While the window is not yet full the current stable value is returned
     * unchanged.
     */
    int feed(int raw_count);

    /**
     * @brief Current stable gesture (0 at session start)
     */
    int stable_gesture() const { return stable_; }

    /**
     * @brief Mode ratio computed by the last full-window feed (0 if none)
     */
    double last_ratio() const { return last_ratio_; }

    /**
     * @brief Discard history and return the stable gesture to 0
     */
    void reset();

    const GestureSettings& settings() const { return settings_; }
    const GestureHistory& history() const { return history_; }

private:
    GestureSettings settings_;
    GestureHistory history_;
    int stable_ = MIN_GESTURE;
    double last_ratio_ = 0.0;
};

} // namespace gesture
} // namespace airchord

#endif // AIRCHORD_GESTURE_STABILITY_FILTER_HPP
