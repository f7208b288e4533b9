/**
 * @file GestureTypes.hpp
 * @brief Core data types for the finger-count gesture pipeline
 *
 * Landmark sets, palm circle, per-frame classification, session settings
 * and the result records passed between the pipeline stages.
 *
 * @copyright 2025 AirChord Project
 * @license MIT License
 */

#ifndef AIRCHORD_GESTURE_TYPES_HPP
#define AIRCHORD_GESTURE_TYPES_HPP

#include <array>
#include <vector>
#include <string>
#include <cstdint>
#include <opencv2/core.hpp>

namespace airchord {
namespace gesture {

/**
 * @brief MediaPipe hand landmark indices used by the classifier
 */
namespace landmark {
constexpr int WRIST = 0;
constexpr int THUMB_CMC = 1;
constexpr int THUMB_TIP = 4;
constexpr int INDEX_MCP = 5;
constexpr int INDEX_TIP = 8;
constexpr int MIDDLE_MCP = 9;
constexpr int MIDDLE_TIP = 12;
constexpr int RING_MCP = 13;
constexpr int RING_TIP = 16;
constexpr int PINKY_MCP = 17;
constexpr int PINKY_TIP = 20;

/// Number of landmarks in a well-formed set
constexpr int COUNT = 21;

/// Landmarks whose centroid defines the palm center
constexpr std::array<int, 6> PALM = {WRIST, THUMB_CMC, INDEX_MCP, MIDDLE_MCP, RING_MCP, PINKY_MCP};

/// Fingertips in thumb..pinky order
constexpr std::array<int, 5> FINGERTIPS = {THUMB_TIP, INDEX_TIP, MIDDLE_TIP, RING_TIP, PINKY_TIP};
} // namespace landmark

/// Gesture values are finger counts in [MIN_GESTURE, MAX_GESTURE]
constexpr int MIN_GESTURE = 0;
constexpr int MAX_GESTURE = 5;

/// Chord state / highlight value meaning "no chord"
constexpr int NO_CHORD = 0;

/**
 * @brief Hand landmark set for one detected hand
 *
 * Points are normalized image coordinates. A set is only usable by the
 * classifier when it holds exactly landmark::COUNT points; anything else
 * is reported as malformed rather than indexed.
 */
struct HandLandmarks {
    /// Landmark points (x, y normalized to [0, 1])
    std::vector<cv::Point2d> points;

    /// Handedness hint: true = right hand (as seen in the mirrored image)
    bool is_right_hand = false;

    /// Detection confidence [0, 1]
    float confidence = 0.0f;

    /**
     * @brief Check that all 21 landmarks are present
     */
    bool is_complete() const {
        return points.size() == static_cast<size_t>(landmark::COUNT);
    }

    /**
     * @brief Derive handedness from landmark geometry
     *
     * In the mirrored camera image a right hand has its thumb tip to the
     * right of the pinky tip.
     * @return true for right hand, false for left or incomplete sets
     */
    bool infer_handedness() const {
        if (!is_complete()) {
            return false;
        }
        return points[landmark::THUMB_TIP].x > points[landmark::PINKY_TIP].x;
    }

    /**
     * @brief Denormalized landmark position
     * @return Pixel coordinates, or (-1, -1) for an out-of-range index
     */
    cv::Point2d get_pixel_position(int index, const cv::Size& image_size) const {
        if (index < 0 || index >= static_cast<int>(points.size())) {
            return cv::Point2d(-1, -1);
        }
        return cv::Point2d(points[index].x * image_size.width,
                           points[index].y * image_size.height);
    }
};

/**
 * @brief Palm circle derived from one landmark set
 */
struct PalmCircle {
    cv::Point2d center;
    double radius = 0.0;
};

/**
 * @brief Per-frame finger extension result
 */
struct FingerClassification {
    /// Extension flag per finger, thumb..pinky
    std::array<bool, 5> extended{};

    /// Palm circle the fingertips were tested against
    PalmCircle palm;

    /// Number of extended fingers [0, 5]
    int count() const {
        int n = 0;
        for (bool e : extended) {
            n += e ? 1 : 0;
        }
        return n;
    }
};

/**
 * @brief Gesture session settings
 *
 * Fixed for the lifetime of a session and validated once at session start.
 */
struct GestureSettings {
    /// Ten seconds of frames at 30 fps
    static constexpr int MAX_HISTORY_LENGTH = 300;

    /// Stability window capacity (frames)
    int history_length = 4;

    /// Minimum share of the window the mode must hold [0, 1]
    double stability_threshold = 0.75;

    /**
     * @brief Validate configuration
     * @return true if history_length is in [1, MAX_HISTORY_LENGTH] and
     *         threshold is in [0, 1]
     */
    bool is_valid() const {
        return history_length >= 1 && history_length <= MAX_HISTORY_LENGTH &&
               stability_threshold >= 0.0 &&
               stability_threshold <= 1.0;
    }

    /**
     * @brief Describe the first invalid field (empty when valid)
     */
    std::string validation_error() const {
        if (history_length < 1 || history_length > MAX_HISTORY_LENGTH) {
            return "history_length must be within [1, " + std::to_string(MAX_HISTORY_LENGTH) +
                   "] (got " + std::to_string(history_length) + ")";
        }
        if (!(stability_threshold >= 0.0 && stability_threshold <= 1.0)) {
            return "stability_threshold must be within [0, 1] (got " +
                   std::to_string(stability_threshold) + ")";
        }
        return "";
    }
};

/**
 * @brief One tick from a landmark source
 */
struct HandFrame {
    /// false = source had nothing this tick; the tick is skipped entirely
    bool frame_available = false;

    /// Zero or more detected hands, in detector order
    std::vector<HandLandmarks> hands;

    /// Mirrored BGR camera image (may be empty for synthetic sources)
    cv::Mat image;
};

/**
 * @brief Commands issued by one dispatcher step
 */
struct DispatchResult {
    /// Stable gesture differed from the previous frame
    bool changed = false;

    /// Chord stopped this step (NO_CHORD if none)
    int stopped_chord = NO_CHORD;

    /// Chord started this step (NO_CHORD if none)
    int started_chord = NO_CHORD;

    /// Chord to highlight after this step (NO_CHORD clears)
    int highlight = NO_CHORD;

    /// Sink connected after the commands were issued
    bool sink_available = true;

    /// A command was rejected by a connected sink
    bool command_failed = false;

    /// Sink's reason for the rejection (valid when command_failed)
    std::string command_error;
};

/**
 * @brief Result of processing one frame through the session
 */
struct FrameReport {
    /// false when the tick was skipped (no frame)
    bool processed = false;

    /// A hand was selected and classified
    bool hand_present = false;

    /// Selected hand was malformed and counted as "no hand"
    bool malformed = false;

    /// Selected hand (valid when hand_present)
    HandLandmarks hand;

    /// Classification of the selected hand (valid when hand_present)
    FingerClassification classification;

    int raw_count = 0;
    int stable_gesture = 0;

    /// Active chord after dispatch
    int active_chord = NO_CHORD;

    DispatchResult dispatch;
};

/**
 * @brief Session counters
 */
struct SessionStats {
    uint64_t frames_processed = 0;
    uint64_t frames_skipped = 0;
    uint64_t frames_without_hand = 0;
    uint64_t malformed_frames = 0;
    uint64_t frame_errors = 0;
    uint64_t gesture_changes = 0;
    uint64_t chord_starts = 0;
    uint64_t chord_stops = 0;
    uint64_t sink_unavailable_events = 0;
    uint64_t command_failures = 0;
};

} // namespace gesture
} // namespace airchord

#endif // AIRCHORD_GESTURE_TYPES_HPP
