#include "sessions/utmp_session_source.hpp"

#include <QFile>

#include <cerrno>
#include <chrono>
#include <cstring>
#include <ctime>
#include <string>
#include <utility>

#include <signal.h>
#include <utmp.h>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace sessionwatch {

namespace {

template <std::size_t N>
std::string fixedField(const char (&field)[N])
{
    return std::string(field, strnlen(field, N));
}

} // namespace

ProcessStatus probeProcess(pid_t pid)
{
    if (pid <= 0) {
        return ProcessStatus::Gone;
    }
    if (::kill(pid, 0) == 0) {
        return ProcessStatus::Alive;
    }
    if (errno == EPERM) {
        return ProcessStatus::AliveNotPermitted;
    }
    return ProcessStatus::Gone;
}

UtmpSessionSource::UtmpSessionSource(QString utmpPath,
                                     QStringList ignoredHosts,
                                     QString currentLine,
                                     ProcessProbe probe)
    : m_utmpPath(std::move(utmpPath))
    , m_ignoredHosts(std::move(ignoredHosts))
    , m_currentLine(std::move(currentLine))
    , m_probe(std::move(probe))
{
}

SessionSet UtmpSessionSource::listSessions()
{
    QFile file(m_utmpPath);
    if (!file.open(QIODevice::ReadOnly)) {
        throw SessionQueryError("failed to open " + m_utmpPath.toStdString()
                                + ": " + file.errorString().toStdString());
    }

    const QByteArray data = file.readAll();
    if (file.error() != QFileDevice::NoError) {
        throw SessionQueryError("failed to read " + m_utmpPath.toStdString()
                                + ": " + file.errorString().toStdString());
    }
    if (data.size() % static_cast<int>(sizeof(struct utmp)) != 0) {
        throw SessionQueryError("truncated utmp record in " + m_utmpPath.toStdString());
    }

    SessionSet sessions;
    const std::size_t recordCount = static_cast<std::size_t>(data.size()) / sizeof(struct utmp);
    for (std::size_t i = 0; i < recordCount; ++i) {
        struct utmp record;
        std::memcpy(&record, data.constData() + i * sizeof(struct utmp), sizeof(record));
        if (record.ut_type != USER_PROCESS) {
            continue;
        }

        Session session;
        session.user = fixedField(record.ut_user);
        session.line = fixedField(record.ut_line);
        session.host = fixedField(record.ut_host);
        session.pid = record.ut_pid;
        session.loginTime = std::chrono::system_clock::from_time_t(
            static_cast<std::time_t>(record.ut_tv.tv_sec));
        if (session.user.empty()) {
            continue;
        }
        session.ignored = m_ignoredHosts.contains(QString::fromStdString(session.host));

        const ProcessStatus status = m_probe(session.pid);
        if (status == ProcessStatus::Gone) {
            // Stale record left behind by a session that did not log out cleanly.
            continue;
        }
        session.canTerminate = status == ProcessStatus::Alive;
        session.isCurrent = !m_currentLine.isEmpty()
            && QString::fromStdString(session.line) == m_currentLine;
        session.id = session.line + "#" + std::to_string(session.pid);

        if (!sessions.insert(session)) {
            SWLOG_DEBUG(QStringLiteral("UtmpSessionSource"),
                        QStringLiteral("listSessions"),
                        QStringLiteral("duplicate_record"),
                        QStringLiteral("id_already_seen"),
                        sessionToJson(session));
        }
    }
    return sessions;
}

} // namespace sessionwatch
