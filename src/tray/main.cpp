#include <QApplication>
#include <QDebug>
#include <QProcessEnvironment>
#include <QSystemTrayIcon>

#include <cstdio>

#include <nlohmann/json.hpp>

#include "common/config.hpp"
#include "common/errors.hpp"
#include "common/logging.hpp"
#include "common/sessionwatch_version.hpp"
#include "tray/TrayApp.hpp"

int main(int argc, char *argv[])
{
    QApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("sessionwatch-tray"));
    QCoreApplication::setApplicationVersion(QStringLiteral(SESSIONWATCH_VERSION));
    app.setQuitOnLastWindowClosed(false);

    sessionwatch::TrayConfig config;
    QString configError;
    if (!sessionwatch::loadConfig(QCoreApplication::arguments(),
                                  QProcessEnvironment::systemEnvironment(),
                                  &config, &configError)) {
        std::fprintf(stderr, "%s\n\n%s", qPrintable(configError),
                     qPrintable(sessionwatch::configHelpText()));
        return 2;
    }
    if (config.showHelp) {
        std::fprintf(stdout, "%s", qPrintable(sessionwatch::configHelpText()));
        return 0;
    }

    sessionwatch::logging::initLogging(QStringLiteral("sessionwatch-tray"),
                                       config.traceEnabled);
    SWLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("process_start"),
               QStringLiteral("user_start"),
               (nlohmann::json{{"version", SESSIONWATCH_VERSION}}));

    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        qWarning() << "System tray not available. Exiting.";
        SWLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("tray_unavailable"),
                    QStringLiteral("startup_check"),
                    nlohmann::json::object());
        return 1;
    }

    try {
        sessionwatch::TrayApp tray(config);
        // Queued: a stop during the first tick happens before exec() runs.
        QObject::connect(&tray, &sessionwatch::TrayApp::finished,
                         &app, &QCoreApplication::exit, Qt::QueuedConnection);
        tray.start();
        return app.exec();
    } catch (const sessionwatch::TrayUnavailableError &ex) {
        qWarning() << "System tray not available:" << ex.what();
        SWLOG_ERROR(QStringLiteral("main"),
                    QStringLiteral("main"),
                    QStringLiteral("tray_unavailable"),
                    QStringLiteral("presenter_init"),
                    (nlohmann::json{{"error", ex.what()}}));
        return 1;
    }
}
