/**
 * @file HandOverlayRenderer.hpp
 * @brief Camera preview annotation (heart, finger count, chord label)
 *
 * Presentation only: reads a FrameReport and draws onto the frame, never
 * feeds anything back into the pipeline.
 *
 * @copyright 2025 AirChord Project
 * @license MIT License
 */

#ifndef AIRCHORD_GESTURE_HAND_OVERLAY_RENDERER_HPP
#define AIRCHORD_GESTURE_HAND_OVERLAY_RENDERER_HPP

#include "GestureTypes.hpp"
#include <opencv2/core.hpp>

namespace airchord {
namespace gesture {

/**
 * @brief Overlay drawing options
 */
struct OverlayConfig {
    bool draw_heart = true;
    bool draw_labels = true;

    /// Debug aid: palm circle and fingertip markers
    bool draw_palm_circle = false;

    /// Heart size clamp (pixels) before the finger-count growth
    int min_heart_size = 60;
    int max_heart_size = 120;

    /// Heart size fraction of the wrist-to-middle-tip span
    double span_scale = 0.6;

    /// Growth per stable finger (1.0 + count x growth)
    double growth_per_finger = 0.3;

    /// Heart is lifted this many pixels above the palm midpoint
    int vertical_offset = 40;
};

/**
 * @brief Draws the gesture overlay onto BGR frames
 */
class HandOverlayRenderer {
public:
    HandOverlayRenderer() = default;
    explicit HandOverlayRenderer(const OverlayConfig& config);

    /**
     * @brief Annotate a frame in place
     * @param image BGR image the report was computed from
     * @param report Result of GestureSession::process() for that frame
     */
    void render(cv::Mat& image, const FrameReport& report) const;

    /**
     * @brief Heart size in pixels for a hand span and stable count
     */
    int heart_size(double hand_span_px, int stable_count) const;

    void set_config(const OverlayConfig& config) { config_ = config; }
    const OverlayConfig& get_config() const { return config_; }

private:
    void draw_heart(cv::Mat& image, const cv::Point& center, int size) const;
    void draw_palm_circle(cv::Mat& image, const FrameReport& report) const;

    OverlayConfig config_;
};

} // namespace gesture
} // namespace airchord

#endif // AIRCHORD_GESTURE_HAND_OVERLAY_RENDERER_HPP
