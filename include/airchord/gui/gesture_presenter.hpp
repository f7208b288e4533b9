#pragma once

#include <QObject>
#include <QImage>
#include <QString>

#include "airchord/gesture/GestureObserver.hpp"

#include <atomic>
#include <mutex>

namespace airchord {
namespace gui {

/**
 * @brief Bridges gesture worker notifications onto the GUI thread
 *
 * GestureObserver methods run on the worker thread. Each one converts its
 * payload to a Qt value type and queues the matching signal emission on this
 * object's thread, so connected widgets are only touched from the GUI thread.
 *
 * Notifications belong to the session open when they were posted; those still
 * queued when endSession() runs are dropped on delivery. Frames are coalesced
 * into a single pending slot, so a stalled GUI only ever sees the latest one.
 */
class GesturePresenter : public QObject, public gesture::GestureObserver {
    Q_OBJECT

public:
    explicit GesturePresenter(QObject* parent = nullptr);
    ~GesturePresenter() override;

    /**
     * @brief Accept notifications from a new session (GUI thread)
     */
    void beginSession();

    /**
     * @brief Drop everything still queued from the current session (GUI thread)
     *
     * Call after the worker has stopped so its final notifications are
     * discarded too.
     */
    void endSession();

    bool isSessionActive() const { return active_; }

    // gesture::GestureObserver (worker thread)
    void on_gesture_count_changed(int count) override;
    void on_highlight_changed(int chord_id) override;
    void on_frame_rendered(const cv::Mat& image) override;
    void on_status_changed(const std::string& status) override;

    /**
     * @brief Convert a BGR/gray/BGRA frame to a deep-copied RGB QImage
     */
    static QImage matToQImage(const cv::Mat& mat);

signals:
    void gestureCountChanged(int count);
    void highlightChanged(int chordId);
    void frameRendered(const QImage& image);
    void statusChanged(const QString& status);

private:
    /**
     * @brief Queue fn on the GUI thread, dropped if the session changes first
     */
    template<typename Fn>
    void post(Fn fn);

    void deliverFrame();

    std::atomic<int> generation_{0};
    std::atomic<bool> active_{false};

    std::mutex frame_mutex_;
    QImage pending_frame_;
    int pending_generation_ = 0;
    bool frame_posted_ = false;
};

} // namespace gui
} // namespace airchord
