#include "airchord/gui/main_window.hpp"
#include "ui_main_window.h"

#include "airchord/gui/gesture_presenter.hpp"
#include "airchord/gui/piano_keyboard_widget.hpp"
#include "airchord/core/Configuration.hpp"
#include "airchord/core/Logger.hpp"
#include "airchord/core/exception.h"
#include "airchord/gesture/CameraLandmarkSource.hpp"
#include "airchord/gesture/GestureWorker.hpp"
#include "airchord/midi/ChordBank.hpp"
#include "airchord/midi/MidiChordSink.hpp"

#include <QCloseEvent>
#include <QDebug>
#include <QFileDialog>
#include <QMessageBox>
#include <QPixmap>
#include <QStatusBar>
#include <QStringList>
#include <algorithm>

namespace airchord {
namespace gui {

namespace {
constexpr int PLAY_CHORD_DURATION_MS = 2000;
constexpr int TEST_CHORD_DURATION_MS = 1500;
constexpr int TEST_CHORD_INTERVAL_MS = 2000;
constexpr int NUM_CHORDS = 5;
}

AirChordMainWindow::AirChordMainWindow(QWidget* parent)
    : QMainWindow(parent)
    , ui(new Ui::AirChordMainWindow)
    , current_chord_(1)
    , preview_chord_(0)
    , test_next_chord_(0)
    , preview_stop_timer_(new QTimer(this))
    , test_step_timer_(new QTimer(this))
{
    ui->setupUi(this);

    chord_buttons_[0] = ui->chordButton1;
    chord_buttons_[1] = ui->chordButton2;
    chord_buttons_[2] = ui->chordButton3;
    chord_buttons_[3] = ui->chordButton4;
    chord_buttons_[4] = ui->chordButton5;

    preview_stop_timer_->setSingleShot(true);
    test_step_timer_->setSingleShot(true);

    auto& config = core::Configuration::getInstance();
    chord_bank_ = std::make_shared<midi::ChordBank>(config.getChords());
    midi_sink_ = std::make_shared<midi::MidiChordSink>(chord_bank_);
    presenter_ = std::make_shared<GesturePresenter>();

    loadSettings();
    connectSignals();

    onRefreshDevices();
    autoConnectMidi();
    onChordSelected(1);

    qDebug() << "[MainWindow] Initialized";
}

AirChordMainWindow::~AirChordMainWindow() {
    // Worker posts to the presenter; it must be gone first
    if (gesture_worker_) {
        gesture_worker_->stop();
        gesture_worker_.reset();
    }
    delete ui;
}

void AirChordMainWindow::loadSettings() {
    auto& config = core::Configuration::getInstance();

    auto ui_settings = config.getUiSettings();
    resize(ui_settings.windowWidth, ui_settings.windowHeight);
    ui->pianoKeyboard->setMinimumSize(std::min(ui_settings.pianoWidth, 600), ui_settings.pianoHeight);

    auto midi_settings = config.getMidiSettings();
    midi_sink_->setVelocity(midi_settings.velocity);
    midi_sink_->setChannel(midi_settings.channel);

    ui->velocitySpinBox->blockSignals(true);
    ui->velocitySpinBox->setValue(midi_sink_->getVelocity());
    ui->velocitySpinBox->blockSignals(false);
}

void AirChordMainWindow::connectSignals() {
    for (int i = 0; i < NUM_CHORDS; ++i) {
        connect(chord_buttons_[i], &QPushButton::clicked, this, [this, i]() {
            onChordSelected(i + 1);
        });
    }

    connect(ui->pianoKeyboard, &PianoKeyboardWidget::notesChanged,
            this, &AirChordMainWindow::onPianoNotesChanged);

    connect(ui->refreshDevicesButton, &QPushButton::clicked, this, &AirChordMainWindow::onRefreshDevices);
    connect(ui->midiDeviceCombo, QOverload<int>::of(&QComboBox::activated),
            this, &AirChordMainWindow::onDeviceSelected);
    connect(ui->velocitySpinBox, QOverload<int>::of(&QSpinBox::valueChanged),
            this, &AirChordMainWindow::onVelocityChanged);

    connect(ui->playChordButton, &QPushButton::clicked, this, &AirChordMainWindow::onPlayChord);
    connect(ui->clearChordButton, &QPushButton::clicked, this, &AirChordMainWindow::onClearChord);
    connect(ui->testAllButton, &QPushButton::clicked, this, &AirChordMainWindow::onTestAllChords);
    connect(ui->gestureModeButton, &QPushButton::clicked, this, &AirChordMainWindow::onToggleGestureMode);

    connect(preview_stop_timer_, &QTimer::timeout, this, &AirChordMainWindow::stopPreviewChord);
    connect(test_step_timer_, &QTimer::timeout, this, [this]() {
        if (test_next_chord_ == 0) {
            return;
        }
        int chord = test_next_chord_;
        stopPreviewChord();

        if (midi_sink_->startChord(chord)) {
            preview_chord_ = chord;
            ui->pianoKeyboard->setHighlightedNotes(toNoteSet(chord_bank_->getChord(chord)));
            preview_stop_timer_->start(TEST_CHORD_DURATION_MS);
            showStatus(QString("Testing chord %1").arg(chord));
        } else {
            LOG_WARNING("Test chord " + std::to_string(chord) + " not sent: " + midi_sink_->getLastError());
        }

        test_next_chord_ = (chord < NUM_CHORDS) ? chord + 1 : 0;
        if (test_next_chord_ != 0) {
            test_step_timer_->start(TEST_CHORD_INTERVAL_MS);
        } else {
            showStatus("Chord test complete");
        }
    });

    connect(presenter_.get(), &GesturePresenter::gestureCountChanged,
            this, &AirChordMainWindow::onGestureCountChanged);
    connect(presenter_.get(), &GesturePresenter::highlightChanged,
            this, &AirChordMainWindow::onHighlightChanged);
    connect(presenter_.get(), &GesturePresenter::frameRendered,
            this, &AirChordMainWindow::onFrameRendered);
    connect(presenter_.get(), &GesturePresenter::statusChanged,
            this, &AirChordMainWindow::onGestureStatus);

    connect(ui->actionSaveConfig, &QAction::triggered, this, &AirChordMainWindow::onSaveConfiguration);
    connect(ui->actionExportChords, &QAction::triggered, this, &AirChordMainWindow::onExportChords);
    connect(ui->actionImportChords, &QAction::triggered, this, &AirChordMainWindow::onImportChords);
    connect(ui->actionResetDefaults, &QAction::triggered, this, &AirChordMainWindow::onResetDefaults);
    connect(ui->actionExit, &QAction::triggered, this, &QWidget::close);
    connect(ui->actionAbout, &QAction::triggered, this, &AirChordMainWindow::onAbout);
}

// ============================================================================
// Chord editing
// ============================================================================

void AirChordMainWindow::onChordSelected(int chordId) {
    current_chord_ = chordId;
    updateChordButtons();
    ui->pianoKeyboard->setSelectedNotes(toNoteSet(chord_bank_->getChord(chordId)));
    updateChordDisplay();
}

void AirChordMainWindow::onPianoNotesChanged(const QSet<int>& notes) {
    std::vector<int> sorted(notes.begin(), notes.end());
    std::sort(sorted.begin(), sorted.end());

    chord_bank_->setChord(current_chord_, sorted);
    core::Configuration::getInstance().setChord(current_chord_, sorted);
    updateChordDisplay();
}

void AirChordMainWindow::updateChordButtons() {
    for (int i = 0; i < NUM_CHORDS; ++i) {
        chord_buttons_[i]->setChecked(i + 1 == current_chord_);
    }
}

void AirChordMainWindow::updateChordDisplay() {
    std::vector<int> notes = chord_bank_->getChord(current_chord_);
    QString text = QString("Chord %1: ").arg(current_chord_);
    if (notes.empty()) {
        text += "No notes selected";
    } else {
        QStringList numbers;
        for (int note : notes) {
            numbers << QString::number(note);
        }
        text += QString::fromStdString(midi::ChordBank::describe(notes)) +
                " (MIDI: " + numbers.join(", ") + ")";
    }
    ui->chordInfoLabel->setText(text);
}

void AirChordMainWindow::onClearChord() {
    ui->pianoKeyboard->setSelectedNotes(QSet<int>(), true);
    showStatus(QString("Chord %1 cleared").arg(current_chord_));
}

// ============================================================================
// MIDI output
// ============================================================================

void AirChordMainWindow::onRefreshDevices() {
    std::vector<std::string> devices = midi_sink_->listDevices();

    ui->midiDeviceCombo->blockSignals(true);
    ui->midiDeviceCombo->clear();
    for (size_t i = 0; i < devices.size(); ++i) {
        ui->midiDeviceCombo->addItem(QString("%1: %2").arg(i).arg(QString::fromStdString(devices[i])),
                                     static_cast<int>(i));
    }
    int connected = midi_sink_->getConnectedPort();
    if (connected >= 0) {
        ui->midiDeviceCombo->setCurrentIndex(ui->midiDeviceCombo->findData(connected));
    }
    ui->midiDeviceCombo->blockSignals(false);

    if (devices.empty()) {
        showStatus("No MIDI output devices found");
    }
}

void AirChordMainWindow::autoConnectMidi() {
    auto& config = core::Configuration::getInstance();
    auto midi_settings = config.getMidiSettings();

    bool connected = false;
    if (midi_settings.deviceId >= 0) {
        connected = midi_sink_->connect(midi_settings.deviceId);
    }
    if (!connected) {
        connected = midi_sink_->connect(midi::MidiChordSink::AUTO_SELECT_PORT);
    }

    if (!connected) {
        showStatus("MIDI not connected: " + QString::fromStdString(midi_sink_->getLastError()));
        return;
    }

    midi_settings.deviceId = midi_sink_->getConnectedPort();
    config.setMidiSettings(midi_settings);
    ui->midiDeviceCombo->setCurrentIndex(ui->midiDeviceCombo->findData(midi_settings.deviceId));
    showStatus("Auto-connected to " + QString::fromStdString(midi_sink_->getConnectedDeviceName()));
}

void AirChordMainWindow::onDeviceSelected(int index) {
    if (index < 0) {
        return;
    }
    int port = ui->midiDeviceCombo->itemData(index).toInt();
    if (port == midi_sink_->getConnectedPort()) {
        return;
    }

    if (!midi_sink_->connect(port)) {
        QMessageBox::warning(this, "MIDI",
                             "Failed to connect to MIDI device:\n" +
                             QString::fromStdString(midi_sink_->getLastError()));
        return;
    }

    auto& config = core::Configuration::getInstance();
    auto midi_settings = config.getMidiSettings();
    midi_settings.deviceId = port;
    config.setMidiSettings(midi_settings);
    showStatus("Connected to " + QString::fromStdString(midi_sink_->getConnectedDeviceName()));
}

void AirChordMainWindow::onVelocityChanged(int velocity) {
    midi_sink_->setVelocity(velocity);

    auto& config = core::Configuration::getInstance();
    auto midi_settings = config.getMidiSettings();
    midi_settings.velocity = midi_sink_->getVelocity();
    config.setMidiSettings(midi_settings);
}

// ============================================================================
// Chord preview
// ============================================================================

void AirChordMainWindow::onPlayChord() {
    if (!midi_sink_->isConnected()) {
        QMessageBox::warning(this, "MIDI", "MIDI output is not connected.");
        return;
    }

    stopPreviewChord();
    if (!midi_sink_->startChord(current_chord_)) {
        showStatus("Chord not played: " + QString::fromStdString(midi_sink_->getLastError()));
        return;
    }

    preview_chord_ = current_chord_;
    ui->pianoKeyboard->setHighlightedNotes(toNoteSet(chord_bank_->getChord(current_chord_)));
    preview_stop_timer_->start(PLAY_CHORD_DURATION_MS);
}

void AirChordMainWindow::onTestAllChords() {
    if (gesture_worker_ && gesture_worker_->is_running()) {
        QMessageBox::information(this, "Test Chords", "Stop gesture mode before testing chords.");
        return;
    }
    if (!midi_sink_->isConnected()) {
        QMessageBox::warning(this, "MIDI", "MIDI output is not connected.");
        return;
    }

    test_next_chord_ = 1;
    test_step_timer_->start(0);
}

void AirChordMainWindow::stopPreviewChord() {
    preview_stop_timer_->stop();
    if (preview_chord_ == 0) {
        return;
    }
    if (!midi_sink_->stopChord(preview_chord_)) {
        LOG_WARNING("Preview chord " + std::to_string(preview_chord_) + " stop not sent: " +
                    midi_sink_->getLastError());
    }
    preview_chord_ = 0;
    ui->pianoKeyboard->clearHighlight();
}

// ============================================================================
// Gesture mode
// ============================================================================

void AirChordMainWindow::onToggleGestureMode() {
    if (gesture_worker_ && gesture_worker_->is_running()) {
        stopGestureMode();
    } else {
        startGestureMode();
    }
}

void AirChordMainWindow::startGestureMode() {
    test_next_chord_ = 0;
    test_step_timer_->stop();
    stopPreviewChord();

    auto gesture_config = core::Configuration::getInstance().getGestureSettings();

    if (!landmark_source_) {
        gesture::CameraSourceConfig source_config;
        source_config.camera_index = gesture_config.cameraIndex;
        try {
            landmark_source_ = std::make_shared<gesture::CameraLandmarkSource>(source_config);
        } catch (const core::Exception& e) {
            LOG_ERROR(std::string("Hand detector unavailable: ") + e.what());
            QMessageBox::critical(this, "Gesture Mode",
                                  "Hand detector could not be started:\n" +
                                  QString::fromStdString(e.getMessage()));
            return;
        }
    } else {
        landmark_source_->set_camera_index(gesture_config.cameraIndex);
    }

    if (!gesture_worker_) {
        gesture_worker_ = std::make_unique<gesture::GestureWorker>(landmark_source_, midi_sink_, presenter_);
    }

    gesture::GestureSettings settings;
    settings.history_length = gesture_config.historyLength;
    settings.stability_threshold = gesture_config.stabilityThreshold;

    presenter_->beginSession();
    try {
        if (!gesture_worker_->start(settings)) {
            presenter_->endSession();
            QMessageBox::warning(this, "Gesture Mode",
                                 QString::fromStdString(gesture_worker_->get_last_error()));
            return;
        }
    } catch (const core::ConfigurationException& e) {
        presenter_->endSession();
        LOG_ERROR(std::string("Gesture mode not started: ") + e.what());
        QMessageBox::critical(this, "Gesture Mode",
                              "Invalid gesture settings:\n" + QString::fromStdString(e.getMessage()));
        return;
    }

    ui->gestureModeButton->setText("Stop Gesture Mode");
    ui->gestureStatusLabel->setText("Gesture mode active - show 1 to 5 fingers");
    ui->testAllButton->setEnabled(false);
    ui->playChordButton->setEnabled(false);

    if (!midi_sink_->isConnected()) {
        showStatus("MIDI output not connected, gestures are shown but not played");
    }
}

void AirChordMainWindow::stopGestureMode() {
    if (!gesture_worker_) {
        return;
    }
    gesture_worker_->stop();
    // Drops the session-end notifications still queued
    presenter_->endSession();

    auto stats = gesture_worker_->get_stats();
    AIRCHORD_LOG_INFO("MainWindow") << "Gesture mode stopped: " << stats.frames_processed
                                    << " frames, " << stats.chord_starts << " chords, "
                                    << stats.malformed_frames << " malformed";

    ui->gestureModeButton->setText("Start Gesture Mode");
    ui->gestureStatusLabel->setText("Gesture mode off");
    ui->fingerCountLabel->setText("Fingers: -");
    ui->cameraPreviewLabel->clear();
    ui->cameraPreviewLabel->setText("Camera preview appears when gesture mode is active");
    ui->pianoKeyboard->clearHighlight();
    ui->testAllButton->setEnabled(true);
    ui->playChordButton->setEnabled(true);
}

void AirChordMainWindow::onGestureCountChanged(int count) {
    ui->fingerCountLabel->setText(QString("Fingers: %1").arg(count));
}

void AirChordMainWindow::onHighlightChanged(int chordId) {
    if (chordId == 0) {
        ui->pianoKeyboard->clearHighlight();
        ui->gestureStatusLabel->setText("Gesture mode active - no chord");
        return;
    }
    ui->pianoKeyboard->setHighlightedNotes(toNoteSet(chord_bank_->getChord(chordId)));
    ui->gestureStatusLabel->setText(QString("Playing chord %1").arg(chordId));
}

void AirChordMainWindow::onFrameRendered(const QImage& image) {
    if (!gesture_worker_ || !gesture_worker_->is_running()) {
        return;
    }
    QPixmap pixmap = QPixmap::fromImage(image);
    ui->cameraPreviewLabel->setPixmap(pixmap.scaled(ui->cameraPreviewLabel->size(),
                                                    Qt::KeepAspectRatio,
                                                    Qt::SmoothTransformation));
}

void AirChordMainWindow::onGestureStatus(const QString& status) {
    showStatus(status);
}

// ============================================================================
// File menu
// ============================================================================

void AirChordMainWindow::onSaveConfiguration() {
    auto& config = core::Configuration::getInstance();
    if (config.save()) {
        showStatus("Configuration saved to " + QString::fromStdString(config.getFilename()));
    } else {
        QMessageBox::warning(this, "Save Configuration",
                             QString::fromStdString(config.getLastError()));
    }
}

void AirChordMainWindow::onExportChords() {
    QString filename = QFileDialog::getSaveFileName(this, "Export Chords", "chords.yaml",
                                                    "YAML files (*.yaml *.yml);;All files (*)");
    if (filename.isEmpty()) {
        return;
    }

    auto& config = core::Configuration::getInstance();
    if (config.exportChords(filename.toStdString())) {
        showStatus("Chords exported to " + filename);
    } else {
        QMessageBox::warning(this, "Export Chords", QString::fromStdString(config.getLastError()));
    }
}

void AirChordMainWindow::onImportChords() {
    QString filename = QFileDialog::getOpenFileName(this, "Import Chords", QString(),
                                                    "YAML files (*.yaml *.yml);;All files (*)");
    if (filename.isEmpty()) {
        return;
    }

    auto& config = core::Configuration::getInstance();
    if (!config.importChords(filename.toStdString())) {
        QMessageBox::warning(this, "Import Chords", QString::fromStdString(config.getLastError()));
        return;
    }

    chord_bank_->setAllChords(config.getChords());
    onChordSelected(current_chord_);
    showStatus("Chords imported from " + filename);
}

void AirChordMainWindow::onResetDefaults() {
    auto answer = QMessageBox::question(this, "Reset to Defaults",
                                        "Reset all chords and settings to their defaults?");
    if (answer != QMessageBox::Yes) {
        return;
    }

    auto& config = core::Configuration::getInstance();
    config.resetToDefaults();
    chord_bank_->setAllChords(config.getChords());
    loadSettings();
    onChordSelected(current_chord_);
    showStatus("Configuration reset to defaults");
}

void AirChordMainWindow::onAbout() {
    QString text =
        "<b>AirChord</b><br>"
        "Play chords with hand gestures: show 1 to 5 fingers to the camera "
        "to start the matching chord, close the hand to stop it.<br><br>"
        "<pre>" + QString::fromStdString(core::Configuration::getInstance().getSummary()).toHtmlEscaped() +
        "</pre>";
    QMessageBox::about(this, "About AirChord", text);
}

// ============================================================================
// Lifecycle
// ============================================================================

void AirChordMainWindow::closeEvent(QCloseEvent* event) {
    stopGestureMode();
    test_next_chord_ = 0;
    test_step_timer_->stop();
    stopPreviewChord();
    midi_sink_->disconnect();

    auto& config = core::Configuration::getInstance();
    auto ui_settings = config.getUiSettings();
    ui_settings.windowWidth = width();
    ui_settings.windowHeight = height();
    config.setUiSettings(ui_settings);

    if (!config.save()) {
        LOG_WARNING("Configuration not saved on exit: " + config.getLastError());
    }

    event->accept();
}

void AirChordMainWindow::showStatus(const QString& message, int timeoutMs) {
    statusBar()->showMessage(message, timeoutMs);
    qDebug() << "[MainWindow]" << message;
}

QSet<int> AirChordMainWindow::toNoteSet(const std::vector<int>& notes) {
    QSet<int> set;
    for (int note : notes) {
        set.insert(note);
    }
    return set;
}

} // namespace gui
} // namespace airchord
