/**
 * @file PalmCircleClassifier.hpp
 * @brief Geometric finger-extension classifier
 *
 * Builds a circle around the palm from six base landmarks and counts the
 * fingertips lying outside it. Rotation and scale invariant, no training.
 *
 * Algorithm:
 * - center = mean of landmarks {0, 1, 5, 9, 13, 17}
 * - radius = max distance from center to those landmarks x 1.3
 * - fingertip {4, 8, 12, 16, 20} is extended iff its distance to the center
 *   exceeds radius x 0.85 (thumb) or radius x 1.0 (other fingers)
 *
 * @copyright 2025 AirChord Project
 * @license MIT License
 */

#ifndef AIRCHORD_GESTURE_PALM_CIRCLE_CLASSIFIER_HPP
#define AIRCHORD_GESTURE_PALM_CIRCLE_CLASSIFIER_HPP

#include "GestureTypes.hpp"

namespace airchord {
namespace gesture {

/**
 * @brief Stateless palm-circle finger counter
 *
 * Thread-safety: all methods are const and reentrant.
 */
class PalmCircleClassifier {
public:
    /// Palm circle is 30% larger than the farthest palm landmark
    static constexpr double PALM_RADIUS_MULTIPLIER = 1.3;

    /// Thumb tip rests closer to the palm when extended
    static constexpr double THUMB_RADIUS_MULTIPLIER = 0.85;

    static constexpr double FINGER_RADIUS_MULTIPLIER = 1.0;

    /**
     * @brief Compute the palm circle of a landmark set
     * @param landmarks Hand landmarks (must be complete)
     * @param[out] circle Palm center and radius
     * @return false if the set is malformed (wrong size or non-finite points)
     */
    static bool compute_palm_circle(const HandLandmarks& landmarks, PalmCircle& circle);

    /**
     * @brief Classify every finger of one hand
     * @param landmarks Hand landmarks
     * @param[out] result Per-finger extension flags and the palm circle used
     * @return false if the set is malformed; result is left untouched
     */
    bool classify(const HandLandmarks& landmarks, FingerClassification& result) const;

    /**
     * @brief Count extended fingers
     * @param landmarks Hand landmarks
     * @param[out] count Extended fingers in [0, 5]
     * @return false if the set is malformed; the caller treats it as no hand
     */
    bool count_extended_fingers(const HandLandmarks& landmarks, int& count) const;

private:
    static bool is_well_formed(const HandLandmarks& landmarks);
};

} // namespace gesture
} // namespace airchord

#endif // AIRCHORD_GESTURE_PALM_CIRCLE_CLASSIFIER_HPP
