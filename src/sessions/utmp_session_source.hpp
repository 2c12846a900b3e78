#pragma once

#include <sys/types.h>

#include <functional>

#include <QString>
#include <QStringList>

#include "sessions/session_source.hpp"

namespace sessionwatch {

enum class ProcessStatus {
    Alive,
    AliveNotPermitted,
    Gone
};

using ProcessProbe = std::function<ProcessStatus(pid_t)>;

// kill(pid, 0) based liveness check.
ProcessStatus probeProcess(pid_t pid);

/**
 * UtmpSessionSource reads USER_PROCESS records from a utmp file.
 * - records whose leader process has exited are dropped
 * - records from ignored hosts (display manager greeters) are kept but
 *   flagged so they never count towards the warning
 * - the record on currentLine is flagged as the caller's own session
 */
class UtmpSessionSource : public SessionSource
{
public:
    UtmpSessionSource(QString utmpPath,
                      QStringList ignoredHosts,
                      QString currentLine,
                      ProcessProbe probe = probeProcess);

    SessionSet listSessions() override;

    const QString &path() const { return m_utmpPath; }

private:
    QString m_utmpPath;
    QStringList m_ignoredHosts;
    QString m_currentLine;
    ProcessProbe m_probe;
};

} // namespace sessionwatch
