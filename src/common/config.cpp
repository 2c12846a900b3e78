#include "common/config.hpp"

#include <QCommandLineOption>
#include <QCommandLineParser>

namespace sessionwatch {

namespace {

struct Options {
    QCommandLineOption interval{QStringList() << "interval",
                                QStringLiteral("Poll interval in milliseconds."),
                                QStringLiteral("ms")};
    QCommandLineOption utmp{QStringList() << "utmp",
                            QStringLiteral("Login record file to read."),
                            QStringLiteral("path")};
    QCommandLineOption noWatch{QStringList() << "no-watch",
                               QStringLiteral("Poll only; do not watch the login record for changes.")};
    QCommandLineOption ignoreHost{QStringList() << "ignore-host",
                                  QStringLiteral("Do not count sessions from this host (repeatable)."),
                                  QStringLiteral("host")};
    QCommandLineOption trace{QStringList() << "trace",
                             QStringLiteral("Enable debug trace logging.")};
};

void setupParser(QCommandLineParser &parser, const Options &options)
{
    parser.setApplicationDescription(
        QStringLiteral("Tray indicator that warns when more than one login session is active."));
    parser.addHelpOption();
    parser.addOption(options.interval);
    parser.addOption(options.utmp);
    parser.addOption(options.noWatch);
    parser.addOption(options.ignoreHost);
    parser.addOption(options.trace);
}

bool parseInterval(const QString &value, const QString &origin, int *intervalMs,
                   QString *errorMessage)
{
    bool ok = false;
    const int parsed = value.trimmed().toInt(&ok);
    if (!ok || parsed < kMinPollIntervalMs) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Invalid %1 '%2': expected an integer >= %3")
                .arg(origin, value)
                .arg(kMinPollIntervalMs);
        }
        return false;
    }
    *intervalMs = parsed;
    return true;
}

} // namespace

bool loadConfig(const QStringList &arguments,
                const QProcessEnvironment &environment,
                TrayConfig *config,
                QString *errorMessage)
{
    TrayConfig result;
    result.currentLine = environment.value(QStringLiteral("DISPLAY"));
    result.traceEnabled =
        environment.value(QStringLiteral("SESSIONWATCH_TRACE")) == QStringLiteral("1");

    const QString envUtmp = environment.value(QStringLiteral("SESSIONWATCH_UTMP"));
    if (!envUtmp.isEmpty()) {
        result.utmpPath = envUtmp;
    }
    const QString envInterval = environment.value(QStringLiteral("SESSIONWATCH_INTERVAL_MS"));
    if (!envInterval.isEmpty()
        && !parseInterval(envInterval, QStringLiteral("SESSIONWATCH_INTERVAL_MS"),
                          &result.pollIntervalMs, errorMessage)) {
        return false;
    }

    Options options;
    QCommandLineParser parser;
    setupParser(parser, options);
    if (!parser.parse(arguments)) {
        if (errorMessage) {
            *errorMessage = parser.errorText();
        }
        return false;
    }
    if (!parser.positionalArguments().isEmpty()) {
        if (errorMessage) {
            *errorMessage = QStringLiteral("Unexpected argument '%1'")
                .arg(parser.positionalArguments().first());
        }
        return false;
    }

    result.showHelp = parser.isSet(QStringLiteral("help"));
    if (parser.isSet(options.interval)
        && !parseInterval(parser.value(options.interval), QStringLiteral("--interval"),
                          &result.pollIntervalMs, errorMessage)) {
        return false;
    }
    if (parser.isSet(options.utmp)) {
        result.utmpPath = parser.value(options.utmp);
    }
    if (parser.isSet(options.noWatch)) {
        result.watchUtmp = false;
    }
    for (const QString &host : parser.values(options.ignoreHost)) {
        if (!result.ignoredHosts.contains(host)) {
            result.ignoredHosts.push_back(host);
        }
    }
    if (parser.isSet(options.trace)) {
        result.traceEnabled = true;
    }

    *config = result;
    return true;
}

QString configHelpText()
{
    Options options;
    QCommandLineParser parser;
    setupParser(parser, options);
    return parser.helpText();
}

} // namespace sessionwatch
