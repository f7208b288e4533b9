#pragma once

/**
 * @file CameraLandmarkSource.hpp
 * @brief Webcam + MediaPipe Hands landmark source using pybind11
 *
 * Architecture:
 * - cv::VideoCapture -> mirror -> BGR to RGB -> numpy array
 * - pybind11 embedded interpreter -> mediapipe.solutions.hands.Hands
 * - MediaPipe landmarks -> HandLandmarks (x, y normalized)
 *
 * The Python interpreter is process wide. It is created by the first
 * CameraLandmarkSource constructor, which must therefore run on the main
 * thread; acquire() may then be called from any thread.
 */

#include "LandmarkSource.hpp"
#include <memory>
#include <string>
#include <vector>

namespace airchord {
namespace gesture {

/**
 * @brief Camera and detector parameters
 */
struct CameraSourceConfig {
    int camera_index = 0;
    int frame_width = 640;
    int frame_height = 480;
    int fps = 30;

    /// Flip horizontally so the preview behaves like a mirror
    bool mirror = true;

    int max_num_hands = 1;
    float min_detection_confidence = 0.8f;
    float min_tracking_confidence = 0.7f;

    /// Prepended to sys.path before importing mediapipe
    std::vector<std::string> python_paths;

    bool is_valid() const {
        return camera_index >= 0 &&
               frame_width > 0 && frame_height > 0 && fps > 0 &&
               max_num_hands >= 1 && max_num_hands <= 2 &&
               min_detection_confidence > 0.0f && min_detection_confidence <= 1.0f &&
               min_tracking_confidence > 0.0f && min_tracking_confidence <= 1.0f;
    }
};

/**
 * @brief Landmark source backed by a webcam and MediaPipe Hands
 *
 * Usage example:
 * @code
 * auto source = std::make_shared<CameraLandmarkSource>(config);
 * if (source->open()) {
 *     HandFrame frame = source->acquire();
 * }
 * @endcode
 */
class CameraLandmarkSource : public LandmarkSource {
public:
    /**
     * @brief Import MediaPipe and create the hand detector
     * @throws core::ConfigurationException if config is invalid
     * @throws core::DetectorException if mediapipe cannot be loaded
     */
    explicit CameraLandmarkSource(const CameraSourceConfig& config = CameraSourceConfig());

    ~CameraLandmarkSource() override;

    // Disable copy
    CameraLandmarkSource(const CameraLandmarkSource&) = delete;
    CameraLandmarkSource& operator=(const CameraLandmarkSource&) = delete;

    /**
     * @brief Open the camera at config.camera_index
     */
    bool open() override;

    void close() override;

    bool is_open() const override;

    /**
     * @brief Grab one frame and detect hands
     *
     * A failed camera read yields frame_available == false.
     * @throws core::DetectorException on a MediaPipe error for this frame
     */
    HandFrame acquire() override;

    std::string get_last_error() const override;

    /**
     * @brief Switch camera; takes effect on the next open()
     */
    void set_camera_index(int index);

    const CameraSourceConfig& get_config() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace gesture
} // namespace airchord
