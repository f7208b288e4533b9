/**
 * @file HandSelector.hpp
 * @brief Chooses the hand that drives the gesture pipeline
 *
 * @copyright 2025 AirChord Project
 * @license MIT License
 */

#ifndef AIRCHORD_GESTURE_HAND_SELECTOR_HPP
#define AIRCHORD_GESTURE_HAND_SELECTOR_HPP

#include "GestureTypes.hpp"
#include <vector>

namespace airchord {
namespace gesture {

/**
 * @brief Stateless hand selection
 *
 * Prefers the first hand flagged right in input order, otherwise falls back
 * to the first hand of any handedness. Zero hands select nothing; several
 * hands are not an error.
 */
class HandSelector {
public:
    /// Returned by select_index() when no hand is selected
    static constexpr int NO_HAND = -1;

    /**
     * @brief Index of the selected hand
     * @return Index into hands, or NO_HAND for empty input
     */
    static int select_index(const std::vector<HandLandmarks>& hands);

    /**
     * @brief Selected hand
     * @return Pointer into hands (valid while hands lives), nullptr for none
     */
    static const HandLandmarks* select(const std::vector<HandLandmarks>& hands);
};

} // namespace gesture
} // namespace airchord

#endif // AIRCHORD_GESTURE_HAND_SELECTOR_HPP
