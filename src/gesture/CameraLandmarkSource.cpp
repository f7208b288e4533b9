/**
 * @file CameraLandmarkSource.cpp
 * @brief Webcam capture and MediaPipe Hands detection via pybind11
 */

#include "airchord/gesture/CameraLandmarkSource.hpp"
#include "airchord/core/Logger.hpp"
#include "airchord/core/exception.h"

#include <pybind11/embed.h>
#include <pybind11/numpy.h>
#include <opencv2/imgproc.hpp>
#include <opencv2/videoio.hpp>
#include <cstdint>
#include <cstring>
#include <mutex>

namespace py = pybind11;
using namespace pybind11::literals;

namespace airchord {
namespace gesture {

namespace {

/**
 * @brief Process-wide Python runtime
 *
 * Only one interpreter can exist per process. The GIL is released right
 * after start-up so that any thread can take it with gil_scoped_acquire;
 * member order makes the release end (GIL re-taken) before finalization.
 */
struct PythonRuntime {
    py::scoped_interpreter interpreter{};
    py::gil_scoped_release release{};
};

PythonRuntime& python_runtime() {
    static PythonRuntime runtime;
    return runtime;
}

} // anonymous namespace

/**
 * @brief PIMPL implementation class
 *
 * Keeps pybind11 and videoio out of the public header.
 */
class CameraLandmarkSource::Impl {
public:
    explicit Impl(const CameraSourceConfig& config)
        : config_(config)
    {
        if (!config_.is_valid()) {
            AIRCHORD_THROW(core::ConfigurationException, "Invalid camera source configuration");
        }

        LOG_INFO("CameraLandmarkSource: Initializing MediaPipe Hands...");
        python_runtime();

        std::string error;
        {
            py::gil_scoped_acquire gil;
            try {
                py::module_ sys = py::module_::import("sys");
                py::list path = sys.attr("path");
                for (const auto& extra : config_.python_paths) {
                    path.insert(0, extra);
                    LOG_INFO("CameraLandmarkSource: Added Python path: " + extra);
                }

                py::module_ mp = py::module_::import("mediapipe");
                LOG_INFO("CameraLandmarkSource: mediapipe version " +
                         mp.attr("__version__").cast<std::string>());

                hands_ = mp.attr("solutions").attr("hands").attr("Hands")(
                    "static_image_mode"_a = false,
                    "max_num_hands"_a = config_.max_num_hands,
                    "min_detection_confidence"_a = config_.min_detection_confidence,
                    "min_tracking_confidence"_a = config_.min_tracking_confidence
                );
            } catch (const py::error_already_set& e) {
                error = std::string("Python error: ") + e.what();
            }
        }

        if (!error.empty()) {
            set_last_error(error);
            LOG_ERROR("CameraLandmarkSource: " + error);
            AIRCHORD_THROW(core::DetectorException, error);
        }

        LOG_INFO("CameraLandmarkSource: Initialization complete");
    }

    ~Impl() {
        close();

        py::gil_scoped_acquire gil;
        try {
            if (hands_ && !hands_.is_none()) {
                hands_.attr("close")();
            }
        } catch (const py::error_already_set& e) {
            LOG_WARNING(std::string("CameraLandmarkSource: Error closing detector: ") + e.what());
        }
        hands_ = py::object();
    }

    bool open() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (capture_.isOpened()) {
            return true;
        }

        if (!capture_.open(config_.camera_index)) {
            last_error_ = "Cannot open camera " + std::to_string(config_.camera_index);
            LOG_ERROR("CameraLandmarkSource: " + last_error_);
            return false;
        }

        capture_.set(cv::CAP_PROP_FRAME_WIDTH, config_.frame_width);
        capture_.set(cv::CAP_PROP_FRAME_HEIGHT, config_.frame_height);
        capture_.set(cv::CAP_PROP_FPS, config_.fps);

        LOG_INFO("CameraLandmarkSource: Camera " + std::to_string(config_.camera_index) + " opened (" +
                 std::to_string(static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_WIDTH))) + "x" +
                 std::to_string(static_cast<int>(capture_.get(cv::CAP_PROP_FRAME_HEIGHT))) + ")");
        return true;
    }

    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (capture_.isOpened()) {
            capture_.release();
            LOG_INFO("CameraLandmarkSource: Camera released");
        }
    }

    bool is_open() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return capture_.isOpened();
    }

    HandFrame acquire() {
        HandFrame frame;
        cv::Mat bgr;

        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!capture_.isOpened()) {
                last_error_ = "Camera not open";
                return frame;
            }
            if (!capture_.read(bgr) || bgr.empty()) {
                last_error_ = "Camera read failed";
                return frame;
            }
        }

        if (config_.mirror) {
            cv::flip(bgr, bgr, 1);
        }

        cv::Mat rgb;
        cv::cvtColor(bgr, rgb, cv::COLOR_BGR2RGB);
        if (!rgb.isContinuous()) {
            rgb = rgb.clone();
        }

        frame.frame_available = true;
        frame.image = bgr;

        std::string error;
        {
            py::gil_scoped_acquire gil;
            try {
                std::vector<py::ssize_t> shape{rgb.rows, rgb.cols, 3};
                py::array_t<uint8_t> np_frame(shape);
                std::memcpy(np_frame.mutable_data(), rgb.data, rgb.total() * rgb.elemSize());

                py::object results = hands_.attr("process")(np_frame);
                extract_hands(results, frame.hands);
            } catch (const py::error_already_set& e) {
                error = std::string("Python error in process(): ") + e.what();
            }
        }

        if (!error.empty()) {
            set_last_error(error);
            AIRCHORD_THROW(core::DetectorException, error);
        }
        return frame;
    }

    std::string get_last_error() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return last_error_;
    }

    void set_camera_index(int index) {
        std::lock_guard<std::mutex> lock(mutex_);
        config_.camera_index = index;
    }

    const CameraSourceConfig& get_config() const {
        return config_;
    }

private:
    void set_last_error(const std::string& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        last_error_ = error;
    }

    /**
     * @brief Convert MediaPipe results to HandLandmarks (GIL held by caller)
     */
    static void extract_hands(const py::object& results, std::vector<HandLandmarks>& hands) {
        py::object multi_landmarks = results.attr("multi_hand_landmarks");
        if (multi_landmarks.is_none()) {
            return;
        }
        py::object multi_handedness = results.attr("multi_handedness");

        size_t index = 0;
        for (auto hand : multi_landmarks) {
            HandLandmarks landmarks;
            for (auto point : hand.attr("landmark")) {
                landmarks.points.emplace_back(point.attr("x").cast<double>(),
                                              point.attr("y").cast<double>());
            }

            landmarks.confidence = 1.0f;
            if (!multi_handedness.is_none() && index < py::len(multi_handedness)) {
                py::object classification = multi_handedness[py::int_(index)].attr("classification");
                landmarks.confidence = classification[py::int_(0)].attr("score").cast<float>();
            }

            // Geometry-based hint; MediaPipe's own label is inverted on mirrored input
            landmarks.is_right_hand = landmarks.infer_handedness();
            hands.push_back(std::move(landmarks));
            ++index;
        }
    }

    CameraSourceConfig config_;
    cv::VideoCapture capture_;
    py::object hands_;
    mutable std::mutex mutex_;      ///< guards capture_, config_.camera_index and last_error_
    std::string last_error_;
};

// ============================================================================
// CameraLandmarkSource Public API Implementation
// ============================================================================

CameraLandmarkSource::CameraLandmarkSource(const CameraSourceConfig& config)
    : pImpl(std::make_unique<Impl>(config))
{
}

CameraLandmarkSource::~CameraLandmarkSource() = default;

bool CameraLandmarkSource::open() {
    return pImpl->open();
}

void CameraLandmarkSource::close() {
    pImpl->close();
}

bool CameraLandmarkSource::is_open() const {
    return pImpl->is_open();
}

HandFrame CameraLandmarkSource::acquire() {
    return pImpl->acquire();
}

std::string CameraLandmarkSource::get_last_error() const {
    return pImpl->get_last_error();
}

void CameraLandmarkSource::set_camera_index(int index) {
    pImpl->set_camera_index(index);
}

const CameraSourceConfig& CameraLandmarkSource::get_config() const {
    return pImpl->get_config();
}

} // namespace gesture
} // namespace airchord
