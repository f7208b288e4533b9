/**
 * @file test_overlay_renderer.cpp
 * @brief Unit tests for HandOverlayRenderer
 */

#include <gtest/gtest.h>
#include <airchord/gesture/HandOverlayRenderer.hpp>
#include <airchord/gesture/PalmCircleClassifier.hpp>
#include "test_helpers.hpp"

#include <opencv2/core.hpp>

using namespace airchord::gesture;
using airchord::test::make_hand;

namespace {

FrameReport report_for(int fingers) {
    FrameReport report;
    report.processed = true;
    report.hand_present = true;
    report.hand = make_hand(fingers);
    PalmCircleClassifier classifier;
    classifier.classify(report.hand, report.classification);
    report.raw_count = fingers;
    report.stable_gesture = fingers;
    return report;
}

} // anonymous namespace

TEST(HandOverlayRendererTest, HeartSizeClampedThenScaled) {
    HandOverlayRenderer renderer;
    // 0.6 x 50 = 30 -> clamped to 60
    EXPECT_EQ(renderer.heart_size(50.0, 0), 60);
    // 0.6 x 150 = 90
    EXPECT_EQ(renderer.heart_size(150.0, 0), 90);
    // 0.6 x 400 = 240 -> clamped to 120
    EXPECT_EQ(renderer.heart_size(400.0, 0), 120);
    // Growth: 120 x (1 + 5 x 0.3) = 300
    EXPECT_EQ(renderer.heart_size(400.0, 5), 300);
    EXPECT_NEAR(renderer.heart_size(150.0, 2), 144, 1);
}

TEST(HandOverlayRendererTest, DrawsOnFrameWithHand) {
    HandOverlayRenderer renderer;
    cv::Mat image = cv::Mat::zeros(480, 640, CV_8UC3);

    renderer.render(image, report_for(3));
    EXPECT_GT(cv::countNonZero(image.reshape(1)), 0);
}

TEST(HandOverlayRendererTest, LeavesFrameWithoutHandUntouched) {
    HandOverlayRenderer renderer;
    cv::Mat image = cv::Mat::zeros(480, 640, CV_8UC3);

    FrameReport report;
    report.processed = true;
    renderer.render(image, report);
    EXPECT_EQ(cv::countNonZero(image.reshape(1)), 0);
}

TEST(HandOverlayRendererTest, EmptyImageIgnored) {
    HandOverlayRenderer renderer;
    cv::Mat image;
    renderer.render(image, report_for(2));
    EXPECT_TRUE(image.empty());
}

TEST(HandOverlayRendererTest, EverythingDisabledDrawsNothing) {
    OverlayConfig config;
    config.draw_heart = false;
    config.draw_labels = false;
    config.draw_palm_circle = false;
    HandOverlayRenderer renderer(config);

    cv::Mat image = cv::Mat::zeros(480, 640, CV_8UC3);
    renderer.render(image, report_for(4));
    EXPECT_EQ(cv::countNonZero(image.reshape(1)), 0);
    EXPECT_FALSE(renderer.get_config().draw_heart);
}
