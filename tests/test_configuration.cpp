/**
 * @file test_configuration.cpp
 * @brief Unit tests for the YAML-backed Configuration singleton
 *
 * Every test works on its own file under the system temp directory and
 * resets the singleton afterwards.
 */

#include <gtest/gtest.h>
#include <airchord/core/Configuration.hpp>
#include <airchord/core/Logger.hpp>

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;
using airchord::core::Configuration;

class ConfigurationTest : public ::testing::Test {
protected:
    void SetUp() override {
        airchord::core::Logger::getInstance().setLevel(airchord::core::LogLevel::ERROR);
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / ("airchord_config_test_" + std::string(info->name()));
        fs::create_directories(dir_);
        config().resetToDefaults();
    }

    void TearDown() override {
        config().resetToDefaults();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    static Configuration& config() {
        return Configuration::getInstance();
    }

    std::string path(const std::string& name) const {
        return (dir_ / name).string();
    }

    std::string write(const std::string& name, const std::string& content) const {
        std::ofstream out(path(name));
        out << content;
        return path(name);
    }

    fs::path dir_;
};

TEST_F(ConfigurationTest, MissingFileUsesDefaults) {
    EXPECT_TRUE(config().load(path("does_not_exist.yaml")));
    EXPECT_EQ(config().getChords(), Configuration::defaultChords());
    EXPECT_EQ(config().getMidiSettings().velocity, 100);
    EXPECT_EQ(config().getMidiSettings().deviceId, -1);
    EXPECT_EQ(config().getGestureSettings().historyLength, 4);
    EXPECT_DOUBLE_EQ(config().getGestureSettings().stabilityThreshold, 0.75);
    EXPECT_EQ(config().getUiSettings().windowWidth, 1000);
    EXPECT_FALSE(config().isModified());
}

TEST_F(ConfigurationTest, LoadsAllSections) {
    std::string file = write("full.yaml",
        "chords:\n"
        "  1: [48, 52, 55]\n"
        "  3: [57, 60, 64]\n"
        "midi_settings:\n"
        "  device_id: 2\n"
        "  velocity: 90\n"
        "  channel: 9\n"
        "gesture_settings:\n"
        "  history_length: 6\n"
        "  stability_threshold: 0.5\n"
        "  camera_index: 1\n"
        "ui_settings:\n"
        "  window_width: 1280\n"
        "  window_height: 800\n");

    ASSERT_TRUE(config().load(file));

    EXPECT_EQ(config().getChord(1), (std::vector<int>{48, 52, 55}));
    EXPECT_EQ(config().getChord(3), (std::vector<int>{57, 60, 64}));
    // Missing chords keep their defaults
    EXPECT_EQ(config().getChord(2), (std::vector<int>{62, 66, 69}));

    EXPECT_EQ(config().getMidiSettings().deviceId, 2);
    EXPECT_EQ(config().getMidiSettings().velocity, 90);
    EXPECT_EQ(config().getMidiSettings().channel, 9);
    EXPECT_EQ(config().getGestureSettings().historyLength, 6);
    EXPECT_DOUBLE_EQ(config().getGestureSettings().stabilityThreshold, 0.5);
    EXPECT_EQ(config().getGestureSettings().cameraIndex, 1);
    EXPECT_EQ(config().getUiSettings().windowWidth, 1280);
    EXPECT_EQ(config().getUiSettings().windowHeight, 800);
    EXPECT_EQ(config().getUiSettings().pianoHeight, 200);
    EXPECT_EQ(config().getFilename(), file);
}

TEST_F(ConfigurationTest, InvalidChordEntriesIgnored) {
    std::string file = write("chords.yaml",
        "chords:\n"
        "  0: [60]\n"
        "  6: [61]\n"
        "  2: [50, 300, -4, 51]\n"
        "  oops: [1]\n");

    ASSERT_TRUE(config().load(file));
    EXPECT_EQ(config().getChord(2), (std::vector<int>{50, 51}));
    EXPECT_TRUE(config().getChord(0).empty());
    EXPECT_TRUE(config().getChord(6).empty());
}

TEST_F(ConfigurationTest, WrongTypeKeepsDefault) {
    std::string file = write("types.yaml",
        "midi_settings:\n"
        "  velocity: loud\n"
        "  channel: 3\n");

    ASSERT_TRUE(config().load(file));
    EXPECT_EQ(config().getMidiSettings().velocity, 100);
    EXPECT_EQ(config().getMidiSettings().channel, 3);
}

TEST_F(ConfigurationTest, ParseErrorFallsBackToDefaults) {
    config().setChord(1, {10});
    std::string file = write("broken.yaml", "chords: [1, 2\nmidi_settings: {");

    EXPECT_FALSE(config().load(file));
    EXPECT_FALSE(config().getLastError().empty());
    EXPECT_EQ(config().getChords(), Configuration::defaultChords());
}

TEST_F(ConfigurationTest, NonMappingRootRejected) {
    std::string file = write("list.yaml", "- 1\n- 2\n");
    EXPECT_FALSE(config().load(file));
}

TEST_F(ConfigurationTest, SaveAndReload) {
    std::string file = path("saved.yaml");
    ASSERT_TRUE(config().load(file));

    config().setChord(4, {41, 45, 48});
    auto midi = config().getMidiSettings();
    midi.velocity = 64;
    config().setMidiSettings(midi);
    auto gesture = config().getGestureSettings();
    gesture.historyLength = 8;
    config().setGestureSettings(gesture);
    EXPECT_TRUE(config().isModified());

    ASSERT_TRUE(config().save());
    EXPECT_FALSE(config().isModified());
    ASSERT_TRUE(fs::exists(file));

    config().resetToDefaults();
    ASSERT_TRUE(config().reload());
    EXPECT_EQ(config().getChord(4), (std::vector<int>{41, 45, 48}));
    EXPECT_EQ(config().getMidiSettings().velocity, 64);
    EXPECT_EQ(config().getGestureSettings().historyLength, 8);
}

TEST_F(ConfigurationTest, SavedFileUsesDocumentedKeys) {
    std::string file = path("keys.yaml");
    ASSERT_TRUE(config().save(file));

    YAML::Node root = YAML::LoadFile(file);
    EXPECT_TRUE(root["chords"]["1"].IsSequence());
    EXPECT_EQ(root["chords"]["1"].size(), 3u);
    EXPECT_EQ(root["midi_settings"]["velocity"].as<int>(), 100);
    EXPECT_EQ(root["gesture_settings"]["history_length"].as<int>(), 4);
    EXPECT_DOUBLE_EQ(root["gesture_settings"]["stability_threshold"].as<double>(), 0.75);
    EXPECT_EQ(root["ui_settings"]["piano_width"].as<int>(), 900);
}

TEST_F(ConfigurationTest, SaveToUnwritablePathFails) {
    EXPECT_FALSE(config().save(path("missing_dir/config.yaml")));
    EXPECT_FALSE(config().getLastError().empty());
}

TEST_F(ConfigurationTest, ExportWritesChordsAndOrigin) {
    config().setChord(5, {43, 47, 50});
    std::string file = path("export.yaml");
    ASSERT_TRUE(config().exportChords(file));

    YAML::Node root = YAML::LoadFile(file);
    EXPECT_EQ(root["exported_from"].as<std::string>(), "AirChord");
    EXPECT_EQ(root["chords"]["5"].as<std::vector<int>>(), (std::vector<int>{43, 47, 50}));
    EXPECT_FALSE(root["midi_settings"]);
}

TEST_F(ConfigurationTest, ImportMergesValidChords) {
    std::string file = write("import.yaml",
        "chords:\n"
        "  2: [38, 42, 45]\n"
        "  9: [1]\n");

    ASSERT_TRUE(config().importChords(file));
    EXPECT_EQ(config().getChord(2), (std::vector<int>{38, 42, 45}));
    EXPECT_EQ(config().getChord(1), (std::vector<int>{60, 64, 67}));
    EXPECT_TRUE(config().getChord(9).empty());
    EXPECT_TRUE(config().isModified());
}

TEST_F(ConfigurationTest, ImportRejectsFilesWithoutChords) {
    std::string file = write("nochords.yaml", "midi_settings:\n  velocity: 1\n");
    EXPECT_FALSE(config().importChords(file));
    EXPECT_EQ(config().getChords(), Configuration::defaultChords());

    EXPECT_FALSE(config().importChords(path("absent.yaml")));
}

TEST_F(ConfigurationTest, ExportThenImportRestoresChords) {
    config().setChord(3, {52, 55, 59});
    std::string file = path("roundtrip.yaml");
    ASSERT_TRUE(config().exportChords(file));

    config().resetToDefaults();
    ASSERT_TRUE(config().importChords(file));
    EXPECT_EQ(config().getChord(3), (std::vector<int>{52, 55, 59}));
}

TEST_F(ConfigurationTest, SummaryListsChords) {
    config().setChord(2, {});
    std::string summary = config().getSummary();
    EXPECT_NE(summary.find("Chord 1: [60, 64, 67]"), std::string::npos);
    EXPECT_NE(summary.find("Chord 2: Not set"), std::string::npos);
    EXPECT_NE(summary.find("Velocity: 100"), std::string::npos);
}
