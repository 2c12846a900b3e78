#include "sessions/session_format.hpp"

#include <QDateTime>
#include <QStringList>

#include <chrono>
#include <cstddef>

#include "sessions/indicator_resolver.hpp"

namespace sessionwatch {

QString sessionLabel(const Session &session)
{
    const qint64 secs = std::chrono::duration_cast<std::chrono::seconds>(
        session.loginTime.time_since_epoch()).count();
    const QString when = QDateTime::fromSecsSinceEpoch(secs)
        .toLocalTime()
        .toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"));

    QString label = QStringLiteral("%1 - %2 / %3")
        .arg(when,
             QString::fromStdString(session.user),
             QString::fromStdString(session.line));
    if (!session.host.empty()) {
        label += QStringLiteral(" @ ") + QString::fromStdString(session.host);
    }
    return label;
}

QString tooltipText(IndicatorState state, const SessionSet &sessions)
{
    const std::size_t counted = countedSessions(sessions).size();
    QString header;
    if (counted == 0) {
        header = QStringLiteral("SessionWatch - no active sessions");
    } else if (counted == 1) {
        header = QStringLiteral("SessionWatch - 1 active session");
    } else {
        header = QStringLiteral("SessionWatch - %1 active sessions")
            .arg(static_cast<qulonglong>(counted));
    }
    if (state == IndicatorState::Warning) {
        header += QStringLiteral(" (other sessions present)");
    }

    QStringList lines;
    lines << header;
    for (const auto &session : sessions) {
        lines << sessionLabel(session);
    }
    return lines.join(QLatin1Char('\n'));
}

} // namespace sessionwatch
