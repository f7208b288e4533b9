/**
 * @file HandOverlayRenderer.cpp
 * @brief Overlay drawing implementation
 */

#include "airchord/gesture/HandOverlayRenderer.hpp"
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>
#include <vector>

namespace airchord {
namespace gesture {

namespace {
const cv::Scalar HEART_COLOR(203, 192, 255);   // light pink (BGR)
const cv::Scalar LABEL_COLOR(0, 255, 0);
const cv::Scalar CHORD_COLOR(255, 0, 0);
const cv::Scalar PALM_COLOR(255, 255, 0);
constexpr int HEART_THICKNESS = 3;
constexpr int HEART_SEGMENTS = 360;
}

HandOverlayRenderer::HandOverlayRenderer(const OverlayConfig& config)
    : config_(config)
{
}

int HandOverlayRenderer::heart_size(double hand_span_px, int stable_count) const {
    int base = static_cast<int>(hand_span_px * config_.span_scale);
    base = std::max(config_.min_heart_size, std::min(config_.max_heart_size, base));
    double multiplier = 1.0 + stable_count * config_.growth_per_finger;
    return static_cast<int>(base * multiplier);
}

void HandOverlayRenderer::render(cv::Mat& image, const FrameReport& report) const {
    if (image.empty() || !report.hand_present) {
        return;
    }

    const cv::Size size = image.size();
    const HandLandmarks& hand = report.hand;

    if (config_.draw_palm_circle) {
        draw_palm_circle(image, report);
    }

    if (config_.draw_heart) {
        cv::Point2d wrist = hand.get_pixel_position(landmark::WRIST, size);
        cv::Point2d middle_mcp = hand.get_pixel_position(landmark::MIDDLE_MCP, size);
        cv::Point2d middle_tip = hand.get_pixel_position(landmark::MIDDLE_TIP, size);

        cv::Point center(static_cast<int>((wrist.x + middle_mcp.x) / 2.0),
                         static_cast<int>((wrist.y + middle_mcp.y) / 2.0) - config_.vertical_offset);
        double span = std::hypot(middle_tip.x - wrist.x, middle_tip.y - wrist.y);

        draw_heart(image, center, heart_size(span, report.stable_gesture));
    }

    if (config_.draw_labels) {
        std::string hand_type = hand.is_right_hand ? "Right Hand" : "Left Hand";
        cv::putText(image, hand_type + " - Fingers: " + std::to_string(report.stable_gesture),
                    cv::Point(10, 50), cv::FONT_HERSHEY_SIMPLEX, 1.0, LABEL_COLOR, 2);

        if (report.stable_gesture > 0) {
            cv::putText(image, "Chord " + std::to_string(report.stable_gesture),
                        cv::Point(10, 100), cv::FONT_HERSHEY_SIMPLEX, 1.0, CHORD_COLOR, 2);
        }
    }
}

void HandOverlayRenderer::draw_heart(cv::Mat& image, const cv::Point& center, int size) const {
    // x = 16 sin^3(t), y = -(13 cos t - 5 cos 2t - 2 cos 3t - cos 4t), scaled by size/40
    std::vector<cv::Point> outline;
    outline.reserve(HEART_SEGMENTS);

    const double scale = size / 40.0;
    for (int i = 0; i < HEART_SEGMENTS; ++i) {
        double t = i * CV_PI / 180.0;
        double x = 16.0 * std::pow(std::sin(t), 3);
        double y = -(13.0 * std::cos(t) - 5.0 * std::cos(2 * t)
                     - 2.0 * std::cos(3 * t) - std::cos(4 * t));
        outline.emplace_back(center.x + static_cast<int>(x * scale),
                             center.y + static_cast<int>(y * scale));
    }

    cv::polylines(image, outline, true, HEART_COLOR, HEART_THICKNESS, cv::LINE_AA);
}

void HandOverlayRenderer::draw_palm_circle(cv::Mat& image, const FrameReport& report) const {
    const cv::Size size = image.size();
    const PalmCircle& palm = report.classification.palm;

    cv::Point center(static_cast<int>(palm.center.x * size.width),
                     static_cast<int>(palm.center.y * size.height));
    // Landmarks are normalized per axis; width gives the on-screen radius
    int radius = static_cast<int>(palm.radius * size.width);
    cv::circle(image, center, radius, PALM_COLOR, 2);

    for (size_t finger = 0; finger < landmark::FINGERTIPS.size(); ++finger) {
        cv::Point2d tip = report.hand.get_pixel_position(landmark::FINGERTIPS[finger], size);
        cv::Scalar color = report.classification.extended[finger] ? LABEL_COLOR : cv::Scalar(0, 0, 255);
        cv::circle(image, cv::Point(static_cast<int>(tip.x), static_cast<int>(tip.y)), 6, color, cv::FILLED);
    }
}

} // namespace gesture
} // namespace airchord
