/**
 * @file GestureWorker.hpp
 * @brief Dedicated thread running the gesture pipeline
 *
 * Pull-frame -> classify -> filter -> dispatch, strictly sequential on one
 * thread. Display results leave the thread only through GestureObserver.
 *
 * Usage example:
 * @code
 * auto worker = std::make_unique<GestureWorker>(source, midi_sink, presenter);
 * worker->start(settings);   // throws core::ConfigurationException if invalid
 * ...
 * worker->stop();            // active chord is stopped before this returns
 * @endcode
 *
 * @copyright 2025 AirChord Project
 * @license MIT License
 */

#ifndef AIRCHORD_GESTURE_WORKER_HPP
#define AIRCHORD_GESTURE_WORKER_HPP

#include "GestureTypes.hpp"
#include "HandOverlayRenderer.hpp"
#include <memory>
#include <string>

namespace airchord {
namespace midi {
class ChordSink;
}

namespace gesture {

class LandmarkSource;
class GestureObserver;

/**
 * @brief Background gesture session runner
 *
 * Cancellation is cooperative: stop() clears the running flag, the frame in
 * flight completes, then the session end rule stops any active chord before
 * the thread exits. Exceptions thrown while handling one frame are logged and
 * counted and never end the loop.
 *
 * Thread-safety: start()/stop() from one controlling thread; get_stats() and
 * is_running() from any thread.
 */
class GestureWorker {
public:
    /**
     * @param source Landmark producer (required)
     * @param sink Chord output (may be null)
     * @param observer Display receiver (may be null)
     */
    GestureWorker(std::shared_ptr<LandmarkSource> source,
                  std::shared_ptr<midi::ChordSink> sink,
                  std::shared_ptr<GestureObserver> observer);

    /**
     * @brief Destructor - stops the session if still running
     */
    ~GestureWorker();

    // Disable copy
    GestureWorker(const GestureWorker&) = delete;
    GestureWorker& operator=(const GestureWorker&) = delete;

    /**
     * @brief Open the source and launch the session thread
     * @param settings Session settings, fixed until stop()
     * @return false if already running or the source failed to open
     * @throws core::ConfigurationException if settings are out of domain
     */
    bool start(const GestureSettings& settings);

    /**
     * @brief Stop the session and wait for the thread to exit
     */
    void stop();

    bool is_running() const;

    /**
     * @brief Snapshot of the current (or last) session counters
     */
    SessionStats get_stats() const;

    /**
     * @brief Overlay options used for rendered frames
     */
    void set_overlay_config(const OverlayConfig& config);

    std::string get_last_error() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace gesture
} // namespace airchord

#endif // AIRCHORD_GESTURE_WORKER_HPP
