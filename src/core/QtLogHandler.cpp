#include "airchord/core/QtLogHandler.hpp"
#include "airchord/core/Logger.hpp"
#include <cstdlib>

namespace airchord {
namespace core {

QtMessageHandler QtLogHandler::previousHandler_ = nullptr;
bool QtLogHandler::installed_ = false;

void QtLogHandler::install() {
    if (installed_) {
        return;
    }
    previousHandler_ = qInstallMessageHandler(messageHandler);
    installed_ = true;
}

void QtLogHandler::uninstall() {
    if (!installed_) {
        return;
    }
    // nullptr restores Qt's default handler
    qInstallMessageHandler(previousHandler_);
    previousHandler_ = nullptr;
    installed_ = false;
}

void QtLogHandler::messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg) {
    auto& logger = Logger::getInstance();

    LogLevel level;
    switch (type) {
        case QtDebugMsg:
            level = LogLevel::DEBUG;
            break;
        case QtInfoMsg:
            level = LogLevel::INFO;
            break;
        case QtWarningMsg:
            level = LogLevel::WARNING;
            break;
        case QtCriticalMsg:
            level = LogLevel::ERROR;
            break;
        case QtFatalMsg:
            level = LogLevel::CRITICAL;
            break;
        default:
            level = LogLevel::INFO;
            break;
    }

    // Logger already echoes to the console, so no extra fprintf here
    std::string message = "[Qt] " + msg.toStdString();
    if (context.file && context.line > 0) {
        logger.log(level, message, context.file, context.line);
    } else {
        logger.log(level, message);
    }

    if (type == QtFatalMsg) {
        logger.flush();
        std::abort();
    }
}

} // namespace core
} // namespace airchord
