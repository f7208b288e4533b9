#include <QApplication>
#include <QDir>
#include <QDebug>
#include <QMessageBox>
#include <QStandardPaths>

#include "airchord/gui/main_window.hpp"
#include "airchord/core/Configuration.hpp"
#include "airchord/core/Logger.hpp"
#include "airchord/core/QtLogHandler.hpp"

#include <iostream>
#include <exception>

using namespace airchord::gui;

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);

    app.setApplicationName("AirChord");
    app.setApplicationVersion("1.0");
    app.setOrganizationName("AirChord Project");

    // File logging comes up before anything else can log
    auto& logger = airchord::core::Logger::getInstance();

    QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    QString logDir = dataDir + "/logs";
    bool logInitSuccess = logger.initializeWithTimestamp(logDir.toStdString(), airchord::core::LogLevel::DEBUG);

    if (logInitSuccess) {
        std::cout << "[LOGGING] File logging initialized: " << logger.getCurrentLogFile() << std::endl;
        logger.info("Log file: " + logger.getCurrentLogFile());
    } else {
        std::cerr << "[LOGGING] Warning: File logging initialization failed, using console only" << std::endl;
    }

    airchord::core::QtLogHandler::install();

    try {
        logger.info("=== AirChord v1.0 ===");

        // Optional first argument overrides the configuration file
        QString configPath = app.arguments().value(1);
        if (configPath.isEmpty()) {
            QString configDir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
            QDir().mkpath(configDir);
            configPath = configDir + "/" + airchord::core::Configuration::DEFAULT_FILENAME;
        }

        auto& config = airchord::core::Configuration::getInstance();
        if (!config.load(configPath.toStdString())) {
            logger.warning("Configuration unreadable, continuing with defaults: " + config.getLastError());
            config.resetToDefaults();
        }

        AirChordMainWindow main_window;
        main_window.show();

        logger.info("Application started successfully");

        int result = app.exec();

        logger.info("=== Application Shutdown ===");
        logger.info("Exit code: " + std::to_string(result));
        logger.flush();

        airchord::core::QtLogHandler::uninstall();
        return result;

    } catch (const std::exception& e) {
        logger.critical("FATAL ERROR: " + std::string(e.what()));
        logger.flush();

        std::cerr << "FATAL ERROR: " << e.what() << std::endl;

        QMessageBox error_dialog;
        error_dialog.setIcon(QMessageBox::Critical);
        error_dialog.setWindowTitle("Fatal Error");
        error_dialog.setText("A critical error occurred during startup:");
        error_dialog.setDetailedText(QString::fromStdString(e.what()));
        error_dialog.setStandardButtons(QMessageBox::Ok);
        error_dialog.exec();

        airchord::core::QtLogHandler::uninstall();
        return 1;
    }
}
