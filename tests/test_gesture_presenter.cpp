/**
 * @file test_gesture_presenter.cpp
 * @brief Queued delivery of gesture notifications to the GUI thread
 *
 * Validates:
 * - Notifications arrive only once the event loop runs
 * - Notifications still queued when a session ends are dropped
 * - Frames coalesce into one pending slot holding the latest image
 */

#include <gtest/gtest.h>
#include <airchord/gui/gesture_presenter.hpp>
#include <airchord/core/Logger.hpp>

#include <QCoreApplication>
#include <opencv2/core.hpp>

#include <memory>
#include <vector>

using airchord::gui::GesturePresenter;

class GesturePresenterTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        if (QCoreApplication::instance() == nullptr) {
            static int argc = 1;
            static char name[] = "test_gesture_presenter";
            static char* argv[] = {name, nullptr};
            app_ = new QCoreApplication(argc, argv);
        }
    }

    void SetUp() override {
        airchord::core::Logger::getInstance().setLevel(airchord::core::LogLevel::ERROR);
        presenter_ = std::make_unique<GesturePresenter>();

        QObject::connect(presenter_.get(), &GesturePresenter::gestureCountChanged,
                         [this](int count) { counts_.push_back(count); });
        QObject::connect(presenter_.get(), &GesturePresenter::highlightChanged,
                         [this](int chordId) { highlights_.push_back(chordId); });
        QObject::connect(presenter_.get(), &GesturePresenter::statusChanged,
                         [this](const QString& status) { statuses_.push_back(status); });
        QObject::connect(presenter_.get(), &GesturePresenter::frameRendered,
                         [this](const QImage& image) { frames_.push_back(image); });
    }

    static void drain() {
        QCoreApplication::processEvents();
        QCoreApplication::processEvents();
    }

    static cv::Mat solidFrame(unsigned char blue) {
        return cv::Mat(4, 6, CV_8UC3, cv::Scalar(blue, 0, 0));
    }

    static QCoreApplication* app_;

    std::unique_ptr<GesturePresenter> presenter_;
    std::vector<int> counts_;
    std::vector<int> highlights_;
    std::vector<QString> statuses_;
    std::vector<QImage> frames_;
};

QCoreApplication* GesturePresenterTest::app_ = nullptr;

TEST_F(GesturePresenterTest, DeliversQueuedNotifications) {
    presenter_->beginSession();
    presenter_->on_gesture_count_changed(3);
    presenter_->on_highlight_changed(3);
    presenter_->on_status_changed("MIDI output not connected");

    EXPECT_TRUE(counts_.empty());
    drain();

    EXPECT_EQ(counts_, (std::vector<int>{3}));
    EXPECT_EQ(highlights_, (std::vector<int>{3}));
    ASSERT_EQ(statuses_.size(), 1u);
    EXPECT_EQ(statuses_[0], QString("MIDI output not connected"));
}

TEST_F(GesturePresenterTest, SessionEndDropsPendingNotifications) {
    presenter_->beginSession();
    presenter_->on_highlight_changed(4);
    drain();
    ASSERT_EQ(highlights_, (std::vector<int>{4}));

    // What a worker posts while stopping: chord cleared, count back to 0
    presenter_->on_highlight_changed(0);
    presenter_->on_gesture_count_changed(0);
    presenter_->on_frame_rendered(solidFrame(10));
    presenter_->endSession();
    drain();

    EXPECT_EQ(highlights_, (std::vector<int>{4}));
    EXPECT_TRUE(counts_.empty());
    EXPECT_TRUE(frames_.empty());
    EXPECT_FALSE(presenter_->isSessionActive());
}

TEST_F(GesturePresenterTest, NextSessionDeliversAgain) {
    presenter_->beginSession();
    presenter_->on_gesture_count_changed(2);
    presenter_->endSession();

    presenter_->beginSession();
    presenter_->on_gesture_count_changed(5);
    presenter_->on_frame_rendered(solidFrame(20));
    drain();

    EXPECT_EQ(counts_, (std::vector<int>{5}));
    EXPECT_EQ(frames_.size(), 1u);
}

TEST_F(GesturePresenterTest, FramesCoalesceToLatest) {
    presenter_->beginSession();
    for (int i = 1; i <= 10; ++i) {
        presenter_->on_frame_rendered(solidFrame(static_cast<unsigned char>(i * 20)));
    }
    drain();

    ASSERT_EQ(frames_.size(), 1u);
    EXPECT_EQ(frames_[0].size(), QSize(6, 4));
    // BGR blue channel ends up in the RGB blue component
    EXPECT_EQ(qBlue(frames_[0].pixel(0, 0)), 200);

    presenter_->on_frame_rendered(solidFrame(30));
    drain();
    EXPECT_EQ(frames_.size(), 2u);
}

TEST_F(GesturePresenterTest, NothingDeliveredBeforeSessionStarts) {
    presenter_->on_gesture_count_changed(1);
    presenter_->on_frame_rendered(solidFrame(40));
    drain();

    EXPECT_TRUE(counts_.empty());
    EXPECT_TRUE(frames_.empty());
}

TEST(GesturePresenterImageTest, MatToQImageConvertsAndCopies) {
    cv::Mat gray(3, 5, CV_8UC1, cv::Scalar(77));
    QImage image = GesturePresenter::matToQImage(gray);
    ASSERT_FALSE(image.isNull());
    EXPECT_EQ(image.format(), QImage::Format_RGB888);
    EXPECT_EQ(qRed(image.pixel(2, 1)), 77);

    EXPECT_TRUE(GesturePresenter::matToQImage(cv::Mat()).isNull());
    EXPECT_TRUE(GesturePresenter::matToQImage(cv::Mat(2, 2, CV_8UC2)).isNull());
}
