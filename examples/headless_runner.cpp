/**
 * @file headless_runner.cpp
 * @brief Gesture chord control without the GUI
 *
 * Webcam + MediaPipe Hands drive the MIDI output directly; finger counts
 * and chord changes are printed to the console. Chords and settings come
 * from the same YAML configuration the GUI writes.
 */

#include <airchord/gesture/CameraLandmarkSource.hpp>
#include <airchord/gesture/GestureObserver.hpp>
#include <airchord/gesture/GestureWorker.hpp>
#include <airchord/midi/ChordBank.hpp>
#include <airchord/midi/MidiChordSink.hpp>
#include <airchord/core/Configuration.hpp>
#include <airchord/core/Logger.hpp>
#include <airchord/core/exception.h>

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iostream>
#include <signal.h>
#include <thread>

using namespace airchord;

// Global flag for clean shutdown
std::atomic<bool> should_exit(false);

void signal_handler(int signal) {
    std::cout << "\n\nReceived signal " << signal << ", shutting down..." << std::endl;
    should_exit = true;
}

/**
 * @brief Prints pipeline notifications (called from the worker thread)
 */
class ConsoleObserver : public gesture::GestureObserver {
public:
    explicit ConsoleObserver(std::shared_ptr<midi::ChordBank> bank)
        : bank_(std::move(bank)) {}

    void on_gesture_count_changed(int count) override {
        std::cout << "Fingers: " << count << std::endl;
    }

    void on_highlight_changed(int chord_id) override {
        if (chord_id == gesture::NO_CHORD) {
            std::cout << "  chord off" << std::endl;
        } else {
            std::cout << "  chord " << chord_id << ": "
                      << midi::ChordBank::describe(bank_->getChord(chord_id)) << std::endl;
        }
    }

    void on_frame_rendered(const cv::Mat&) override {}

    void on_status_changed(const std::string& status) override {
        std::cout << "  [status] " << status << std::endl;
    }

private:
    std::shared_ptr<midi::ChordBank> bank_;
};

void print_usage(const char* prog_name) {
    std::cout << "Usage: " << prog_name << " [options]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -h, --help           Show this help" << std::endl;
    std::cout << "  --config <file>      Configuration file (default: " << core::Configuration::DEFAULT_FILENAME << ")" << std::endl;
    std::cout << "  -c, --camera <n>     Camera index (overrides configuration)" << std::endl;
    std::cout << "  -p, --port <n>       MIDI output port (default: configured or first)" << std::endl;
    std::cout << "  -l, --list           List MIDI output ports and exit" << std::endl;
    std::cout << "  -v, --verbose        Verbose logging" << std::endl;
    std::cout << "  --log-file <file>    Also append the log to <file>" << std::endl;
}

int main(int argc, char** argv) {
    std::string config_file = core::Configuration::DEFAULT_FILENAME;
    int camera_index = -1;
    int midi_port = -2;
    bool list_only = false;
    bool verbose = false;
    std::string log_file;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            config_file = argv[++i];
        } else if ((arg == "-c" || arg == "--camera") && i + 1 < argc) {
            camera_index = std::atoi(argv[++i]);
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            midi_port = std::atoi(argv[++i]);
        } else if (arg == "-l" || arg == "--list") {
            list_only = true;
        } else if (arg == "-v" || arg == "--verbose") {
            verbose = true;
        } else if (arg == "--log-file" && i + 1 < argc) {
            log_file = argv[++i];
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            print_usage(argv[0]);
            return 1;
        }
    }

    signal(SIGINT, signal_handler);
    signal(SIGTERM, signal_handler);

    auto& logger = core::Logger::getInstance();
    logger.setLevel(verbose ? core::LogLevel::DEBUG : core::LogLevel::INFO);
    if (!log_file.empty() && !logger.setLogFile(log_file)) {
        std::cerr << "WARNING: cannot open log file " << log_file << ", logging to console only" << std::endl;
    }

    auto& config = core::Configuration::getInstance();
    if (!config.load(config_file)) {
        std::cerr << "WARNING: " << config.getLastError() << ", using defaults" << std::endl;
    }

    auto bank = std::make_shared<midi::ChordBank>(config.getChords());
    auto sink = std::make_shared<midi::MidiChordSink>(bank);
    sink->setVelocity(config.getMidiSettings().velocity);
    sink->setChannel(config.getMidiSettings().channel);

    if (list_only) {
        auto devices = sink->listDevices();
        std::cout << devices.size() << " MIDI output port(s)" << std::endl;
        for (size_t i = 0; i < devices.size(); ++i) {
            std::cout << "  " << i << ": " << devices[i] << std::endl;
        }
        return 0;
    }

    std::cout << "\n=== AirChord - Headless Gesture Chords ===" << std::endl;

    // 1. MIDI output
    std::cout << "\n[1/3] Connecting MIDI output..." << std::endl;
    if (midi_port == -2) {
        midi_port = config.getMidiSettings().deviceId;
    }
    if (!sink->connect(midi_port) && !sink->connect(midi::MidiChordSink::AUTO_SELECT_PORT)) {
        std::cerr << "WARNING: " << sink->getLastError() << " - gestures will not sound" << std::endl;
    } else {
        std::cout << "✓ MIDI: " << sink->getConnectedDeviceName() << std::endl;
    }

    // 2. Camera + hand detector
    std::cout << "\n[2/3] Initializing camera and hand detector..." << std::endl;
    gesture::CameraSourceConfig source_config;
    source_config.camera_index = camera_index >= 0 ? camera_index : config.getGestureSettings().cameraIndex;

    std::shared_ptr<gesture::CameraLandmarkSource> source;
    try {
        source = std::make_shared<gesture::CameraLandmarkSource>(source_config);
    } catch (const core::Exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "✓ Hand detector ready (camera " << source_config.camera_index << ")" << std::endl;

    // 3. Gesture session
    std::cout << "\n[3/3] Starting gesture session..." << std::endl;
    gesture::GestureSettings settings;
    settings.history_length = config.getGestureSettings().historyLength;
    settings.stability_threshold = config.getGestureSettings().stabilityThreshold;

    auto observer = std::make_shared<ConsoleObserver>(bank);
    gesture::GestureWorker worker(source, sink, observer);

    try {
        if (!worker.start(settings)) {
            std::cerr << "ERROR: " << worker.get_last_error() << std::endl;
            return 1;
        }
    } catch (const core::ConfigurationException& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    std::cout << "\nShow 1-5 fingers to play chords 1-5, close the hand to stop." << std::endl;
    std::cout << "Press CTRL+C to stop\n" << std::endl;

    auto last_report = std::chrono::steady_clock::now();
    while (!should_exit) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        auto now = std::chrono::steady_clock::now();
        if (verbose && now - last_report >= std::chrono::seconds(5)) {
            last_report = now;
            gesture::SessionStats stats = worker.get_stats();
            std::cout << "Frames: " << stats.frames_processed
                      << " | No hand: " << stats.frames_without_hand
                      << " | Chords: " << stats.chord_starts << std::endl;
        }
    }

    worker.stop();
    sink->disconnect();
    logger.flush();

    gesture::SessionStats stats = worker.get_stats();
    std::cout << "\n=== Session Summary ===" << std::endl;
    std::cout << "Frames processed: " << stats.frames_processed << std::endl;
    std::cout << "Malformed frames: " << stats.malformed_frames << std::endl;
    std::cout << "Chords played:    " << stats.chord_starts << std::endl;

    return 0;
}
