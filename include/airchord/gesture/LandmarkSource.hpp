/**
 * @file LandmarkSource.hpp
 * @brief Abstract producer of per-frame hand landmarks
 *
 * @copyright 2025 AirChord Project
 * @license MIT License
 */

#ifndef AIRCHORD_GESTURE_LANDMARK_SOURCE_HPP
#define AIRCHORD_GESTURE_LANDMARK_SOURCE_HPP

#include "GestureTypes.hpp"
#include <string>

namespace airchord {
namespace gesture {

/**
 * @brief Source of hand landmark frames
 *
 * acquire() blocks until the next tick and is only called from the
 * gesture worker thread. open() and close() are called from the thread that
 * starts and stops the worker.
 */
class LandmarkSource {
public:
    virtual ~LandmarkSource() = default;

    /**
     * @brief Prepare the source for acquisition
     * @return false on failure; details in get_last_error()
     */
    virtual bool open() = 0;

    virtual void close() = 0;

    virtual bool is_open() const = 0;

    /**
     * @brief Next tick
     * @return Frame with frame_available == false when nothing was produced
     */
    virtual HandFrame acquire() = 0;

    virtual std::string get_last_error() const = 0;
};

} // namespace gesture
} // namespace airchord

#endif // AIRCHORD_GESTURE_LANDMARK_SOURCE_HPP
