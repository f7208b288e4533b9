#include "airchord/gui/gesture_presenter.hpp"

#include <QMetaObject>
#include <QDebug>
#include <opencv2/imgproc.hpp>

namespace airchord {
namespace gui {

GesturePresenter::GesturePresenter(QObject* parent)
    : QObject(parent)
{
    qDebug() << "[GesturePresenter] Initialized";
}

GesturePresenter::~GesturePresenter() = default;

void GesturePresenter::beginSession() {
    ++generation_;
    active_ = true;
}

void GesturePresenter::endSession() {
    ++generation_;
    active_ = false;

    std::lock_guard<std::mutex> lock(frame_mutex_);
    pending_frame_ = QImage();
}

template<typename Fn>
void GesturePresenter::post(Fn fn) {
    const int generation = generation_;
    QMetaObject::invokeMethod(this, [this, generation, fn]() {
        if (active_ && generation == generation_) {
            fn();
        }
    }, Qt::QueuedConnection);
}

void GesturePresenter::on_gesture_count_changed(int count) {
    post([this, count]() {
        emit gestureCountChanged(count);
    });
}

void GesturePresenter::on_highlight_changed(int chord_id) {
    post([this, chord_id]() {
        emit highlightChanged(chord_id);
    });
}

void GesturePresenter::on_frame_rendered(const cv::Mat& image) {
    // Convert on the worker thread; QImage is safe to hand across threads
    QImage frame = matToQImage(image);
    if (frame.isNull()) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(frame_mutex_);
        pending_frame_ = frame;
        pending_generation_ = generation_;
        if (frame_posted_) {
            return;
        }
        frame_posted_ = true;
    }
    QMetaObject::invokeMethod(this, [this]() {
        deliverFrame();
    }, Qt::QueuedConnection);
}

void GesturePresenter::deliverFrame() {
    QImage frame;
    int generation = 0;
    {
        std::lock_guard<std::mutex> lock(frame_mutex_);
        frame = pending_frame_;
        generation = pending_generation_;
        pending_frame_ = QImage();
        frame_posted_ = false;
    }
    if (!frame.isNull() && active_ && generation == generation_) {
        emit frameRendered(frame);
    }
}

void GesturePresenter::on_status_changed(const std::string& status) {
    QString text = QString::fromStdString(status);
    post([this, text]() {
        emit statusChanged(text);
    });
}

QImage GesturePresenter::matToQImage(const cv::Mat& mat) {
    if (mat.empty()) {
        return QImage();
    }

    cv::Mat rgb;
    if (mat.channels() == 1) {
        cv::cvtColor(mat, rgb, cv::COLOR_GRAY2RGB);
    } else if (mat.channels() == 3) {
        cv::cvtColor(mat, rgb, cv::COLOR_BGR2RGB);
    } else if (mat.channels() == 4) {
        cv::cvtColor(mat, rgb, cv::COLOR_BGRA2RGB);
    } else {
        return QImage();
    }

    // Deep copy: rgb goes out of scope
    QImage view(rgb.data, rgb.cols, rgb.rows, static_cast<int>(rgb.step), QImage::Format_RGB888);
    return view.copy();
}

} // namespace gui
} // namespace airchord
