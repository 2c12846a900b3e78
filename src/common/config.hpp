#pragma once

#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

namespace sessionwatch {

constexpr int kDefaultPollIntervalMs = 5000;
constexpr int kMinPollIntervalMs = 250;

struct TrayConfig {
    int pollIntervalMs = kDefaultPollIntervalMs;
    QString utmpPath = QStringLiteral("/var/run/utmp");
    bool watchUtmp = true;
    // Sessions from these hosts never count (display manager greeters).
    QStringList ignoredHosts = {QStringLiteral("login screen")};
    // Line of the session this process runs in, usually $DISPLAY.
    QString currentLine;
    bool traceEnabled = false;
    bool showHelp = false;
};

// Builds the configuration from defaults, then the environment, then the
// command line. arguments includes the program name. Returns false and sets
// errorMessage on invalid input.
bool loadConfig(const QStringList &arguments,
                const QProcessEnvironment &environment,
                TrayConfig *config,
                QString *errorMessage);

QString configHelpText();

} // namespace sessionwatch
