/**
 * @file PalmCircleClassifier.cpp
 * @brief Palm-circle finger classification
 */

#include "airchord/gesture/PalmCircleClassifier.hpp"
#include <algorithm>
#include <cmath>

namespace airchord {
namespace gesture {

namespace {

double distance(const cv::Point2d& a, const cv::Point2d& b) {
    return std::hypot(a.x - b.x, a.y - b.y);
}

} // anonymous namespace

bool PalmCircleClassifier::is_well_formed(const HandLandmarks& landmarks) {
    if (!landmarks.is_complete()) {
        return false;
    }
    return std::all_of(landmarks.points.begin(), landmarks.points.end(),
                       [](const cv::Point2d& p) {
                           return std::isfinite(p.x) && std::isfinite(p.y);
                       });
}

bool PalmCircleClassifier::compute_palm_circle(const HandLandmarks& landmarks, PalmCircle& circle) {
    if (!is_well_formed(landmarks)) {
        return false;
    }

    cv::Point2d center(0.0, 0.0);
    for (int index : landmark::PALM) {
        center += landmarks.points[index];
    }
    center *= 1.0 / static_cast<double>(landmark::PALM.size());

    double max_distance = 0.0;
    for (int index : landmark::PALM) {
        max_distance = std::max(max_distance, distance(landmarks.points[index], center));
    }

    circle.center = center;
    circle.radius = max_distance * PALM_RADIUS_MULTIPLIER;
    return true;
}

bool PalmCircleClassifier::classify(const HandLandmarks& landmarks, FingerClassification& result) const {
    PalmCircle palm;
    if (!compute_palm_circle(landmarks, palm)) {
        return false;
    }

    FingerClassification classification;
    classification.palm = palm;

    for (size_t finger = 0; finger < landmark::FINGERTIPS.size(); ++finger) {
        const cv::Point2d& tip = landmarks.points[landmark::FINGERTIPS[finger]];
        double multiplier = (finger == 0) ? THUMB_RADIUS_MULTIPLIER : FINGER_RADIUS_MULTIPLIER;
        // Strictly outside the scaled circle
        classification.extended[finger] = distance(tip, palm.center) > palm.radius * multiplier;
    }

    result = classification;
    return true;
}

bool PalmCircleClassifier::count_extended_fingers(const HandLandmarks& landmarks, int& count) const {
    FingerClassification classification;
    if (!classify(landmarks, classification)) {
        return false;
    }
    count = classification.count();
    return true;
}

} // namespace gesture
} // namespace airchord
