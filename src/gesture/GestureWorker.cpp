/**
 * @file GestureWorker.cpp
 * @brief Gesture worker thread implementation
 */

#include "airchord/gesture/GestureWorker.hpp"
#include "airchord/gesture/GestureSession.hpp"
#include "airchord/gesture/GestureObserver.hpp"
#include "airchord/gesture/LandmarkSource.hpp"
#include "airchord/core/Logger.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <system_error>
#include <thread>
#include <pthread.h>

namespace airchord {
namespace gesture {

namespace {
/// Back-off after an empty tick so a dead source does not spin the CPU
constexpr auto FRAME_MISS_BACKOFF = std::chrono::milliseconds(10);
}

/**
 * @brief PIMPL implementation for GestureWorker
 */
class GestureWorker::Impl {
public:
    Impl(std::shared_ptr<LandmarkSource> source,
         std::shared_ptr<midi::ChordSink> sink,
         std::shared_ptr<GestureObserver> observer)
        : source_(std::move(source))
        , sink_(std::move(sink))
        , observer_(std::move(observer))
    {
    }

    ~Impl() {
        stop();
    }

    bool start(const GestureSettings& settings) {
        if (running_) {
            set_error("Gesture session already running");
            return false;
        }

        if (!source_) {
            set_error("No landmark source");
            return false;
        }

        // Validates settings; throws before any resource is touched
        auto session = std::make_unique<GestureSession>(settings, sink_, observer_);

        if (!source_->is_open() && !source_->open()) {
            set_error("Failed to open landmark source: " + source_->get_last_error());
            return false;
        }

        if (thread_.joinable()) {
            thread_.join();
        }

        session_ = std::move(session);
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_ = SessionStats{};
        }

        running_ = true;
        try {
            thread_ = std::thread(&Impl::run, this);
        } catch (const std::system_error& e) {
            running_ = false;
            session_.reset();
            set_error(std::string("Failed to start gesture thread: ") + e.what());
            return false;
        }

        LOG_INFO("GestureWorker: Gesture session started");
        return true;
    }

    void stop() {
        running_ = false;
        if (thread_.joinable()) {
            thread_.join();
            LOG_INFO("GestureWorker: Gesture session stopped");
        }
        session_.reset();
        if (source_ && source_->is_open()) {
            source_->close();
        }
    }

    bool is_running() const {
        return running_;
    }

    SessionStats get_stats() const {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        return stats_;
    }

    void set_overlay_config(const OverlayConfig& config) {
        std::lock_guard<std::mutex> lock(overlay_mutex_);
        renderer_.set_config(config);
    }

    std::string get_last_error() const {
        std::lock_guard<std::mutex> lock(error_mutex_);
        return last_error_;
    }

private:
    void run() {
        pthread_setname_np(pthread_self(), "gesture_worker");

        uint64_t frame_errors = 0;

        while (running_) {
            try {
                HandFrame frame = source_->acquire();
                FrameReport report = session_->process(frame);

                if (!report.processed) {
                    publish_stats(frame_errors);
                    std::this_thread::sleep_for(FRAME_MISS_BACKOFF);
                    continue;
                }

                if (observer_ && !frame.image.empty()) {
                    {
                        std::lock_guard<std::mutex> lock(overlay_mutex_);
                        renderer_.render(frame.image, report);
                    }
                    observer_->on_frame_rendered(frame.image);
                }
            } catch (const std::exception& e) {
                ++frame_errors;
                LOG_ERROR(std::string("GestureWorker: Frame failed: ") + e.what());
            }

            publish_stats(frame_errors);
        }

        // Session end rule: never skipped, even after frame errors
        try {
            session_->end();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string("GestureWorker: Session end failed: ") + e.what());
        }
        publish_stats(frame_errors);
    }

    void publish_stats(uint64_t frame_errors) {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_ = session_->stats();
        stats_.frame_errors = frame_errors;
    }

    void set_error(const std::string& message) {
        {
            std::lock_guard<std::mutex> lock(error_mutex_);
            last_error_ = message;
        }
        LOG_ERROR("GestureWorker: " + message);
    }

    std::shared_ptr<LandmarkSource> source_;
    std::shared_ptr<midi::ChordSink> sink_;
    std::shared_ptr<GestureObserver> observer_;

    std::unique_ptr<GestureSession> session_;
    HandOverlayRenderer renderer_;
    std::mutex overlay_mutex_;

    std::thread thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex stats_mutex_;
    SessionStats stats_;

    mutable std::mutex error_mutex_;
    std::string last_error_;
};

// ============================================================================
// GestureWorker Public API Implementation
// ============================================================================

GestureWorker::GestureWorker(std::shared_ptr<LandmarkSource> source,
                             std::shared_ptr<midi::ChordSink> sink,
                             std::shared_ptr<GestureObserver> observer)
    : pImpl(std::make_unique<Impl>(std::move(source), std::move(sink), std::move(observer)))
{
}

GestureWorker::~GestureWorker() = default;

bool GestureWorker::start(const GestureSettings& settings) {
    return pImpl->start(settings);
}

void GestureWorker::stop() {
    pImpl->stop();
}

bool GestureWorker::is_running() const {
    return pImpl->is_running();
}

SessionStats GestureWorker::get_stats() const {
    return pImpl->get_stats();
}

void GestureWorker::set_overlay_config(const OverlayConfig& config) {
    pImpl->set_overlay_config(config);
}

std::string GestureWorker::get_last_error() const {
    return pImpl->get_last_error();
}

} // namespace gesture
} // namespace airchord
