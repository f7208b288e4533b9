#pragma once

#include <QMainWindow>
#include <QTimer>
#include <QImage>
#include <QSet>
#include <memory>

QT_BEGIN_NAMESPACE
namespace Ui { class AirChordMainWindow; }
class QCloseEvent;
class QPushButton;
QT_END_NAMESPACE

namespace airchord {

namespace midi {
class ChordBank;
class MidiChordSink;
}

namespace gesture {
class CameraLandmarkSource;
class GestureWorker;
}

namespace gui {

class GesturePresenter;
class PianoKeyboardWidget;

/**
 * @brief Chord editor and gesture controller window
 *
 * Features:
 * - Chord selection 1..5 and note editing on the piano keyboard
 * - MIDI output selection, velocity, auto-connect to the first device
 * - Play / clear / test-all chord preview (timed with QTimer)
 * - Gesture mode: camera preview with overlay, highlighted chord keys
 * - File menu: save configuration, import/export chords, reset defaults
 */
class AirChordMainWindow : public QMainWindow {
    Q_OBJECT

public:
    explicit AirChordMainWindow(QWidget* parent = nullptr);
    ~AirChordMainWindow();

protected:
    /**
     * @brief Stop gesture mode, disconnect MIDI and save configuration
     */
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onChordSelected(int chordId);
    void onPianoNotesChanged(const QSet<int>& notes);
    void onRefreshDevices();
    void onDeviceSelected(int index);
    void onVelocityChanged(int velocity);

    void onPlayChord();
    void onClearChord();
    void onTestAllChords();

    void onToggleGestureMode();
    void onGestureCountChanged(int count);
    void onHighlightChanged(int chordId);
    void onFrameRendered(const QImage& image);
    void onGestureStatus(const QString& status);

    void onSaveConfiguration();
    void onExportChords();
    void onImportChords();
    void onResetDefaults();
    void onAbout();

private:
    void connectSignals();
    void loadSettings();
    void updateChordDisplay();
    void updateChordButtons();
    void autoConnectMidi();
    void startGestureMode();
    void stopGestureMode();
    void stopPreviewChord();
    void showStatus(const QString& message, int timeoutMs = 5000);
    static QSet<int> toNoteSet(const std::vector<int>& notes);

    Ui::AirChordMainWindow* ui;

    std::shared_ptr<midi::ChordBank> chord_bank_;
    std::shared_ptr<midi::MidiChordSink> midi_sink_;
    std::shared_ptr<GesturePresenter> presenter_;
    std::shared_ptr<gesture::CameraLandmarkSource> landmark_source_;
    std::unique_ptr<gesture::GestureWorker> gesture_worker_;

    QPushButton* chord_buttons_[5];
    int current_chord_;
    int preview_chord_;              ///< Chord sounding from Play/Test, 0 = none
    int test_next_chord_;            ///< Next chord of a running Test All, 0 = idle
    QTimer* preview_stop_timer_;
    QTimer* test_step_timer_;
};

} // namespace gui
} // namespace airchord
