#pragma once

#include <QString>
#include <QMessageLogContext>

namespace airchord {
namespace core {

/**
 * Qt Message Handler for redirecting Qt logging to the AirChord Logger
 *
 * Intercepts qDebug, qInfo, qWarning and qCritical from the GUI layer and
 * forwards them to Logger, so widget and worker messages share one log file.
 */
class QtLogHandler {
public:
    /**
     * Install Qt message handler
     * Call this AFTER Logger::initializeWithTimestamp()
     */
    static void install();

    /**
     * Restore the handler that was active before install()
     */
    static void uninstall();

    static bool isInstalled() { return installed_; }

private:
    static void messageHandler(QtMsgType type, const QMessageLogContext& context, const QString& msg);

    static QtMessageHandler previousHandler_;
    static bool installed_;
};

} // namespace core
} // namespace airchord
