#pragma once

#include <optional>

#include <QFileSystemWatcher>
#include <QObject>
#include <QString>
#include <QTimer>

#include "common/enums.hpp"
#include "common/models.hpp"
#include "sessions/session_source.hpp"
#include "sessions/tray_sink.hpp"

namespace sessionwatch {

/**
 * SessionMonitor drives the refresh cycle on the Qt event loop:
 * - a fixed interval timer
 * - optional change notifications for the login record file
 * Each tick lists sessions, resolves the indicator state and forwards both
 * to the sink. Query failures keep the last good state; a missing tray
 * stops the monitor for good and emits stopped().
 */
class SessionMonitor : public QObject
{
    Q_OBJECT
public:
    enum class State {
        Running,
        Stopped
    };

    SessionMonitor(SessionSource &source, TraySink &sink, int intervalMs,
                   QObject *parent = nullptr);
    ~SessionMonitor() override;

    // Refresh whenever this file is rewritten, in addition to the timer.
    void watchFile(const QString &path);

    // Arms the timer (and watcher) and runs the first tick immediately.
    void start();

    State state() const { return m_state; }
    bool isTimerActive() const { return m_timer.isActive(); }
    int consecutiveFailures() const { return m_consecutiveFailures; }
    std::optional<IndicatorState> lastState() const { return m_lastState; }
    const SessionSet &lastSessions() const { return m_lastSessions; }

public slots:
    // Runs a tick right away.
    void refreshNow();
    // Queues one tick; further requests before it runs are folded into it.
    void scheduleRefresh();

signals:
    void indicatorChanged(sessionwatch::IndicatorState state);
    void stopped(int exitCode);

private slots:
    void tick();
    void onWatchedFileChanged(const QString &path);

private:
    void armWatcher();
    void stop(int exitCode);

    SessionSource &m_source;
    TraySink &m_sink;
    QTimer m_timer;
    QFileSystemWatcher m_watcher;
    QString m_watchedPath;

    State m_state = State::Running;
    bool m_refreshPending = false;
    int m_consecutiveFailures = 0;
    std::optional<IndicatorState> m_lastState;
    SessionSet m_lastSessions;
};

} // namespace sessionwatch
