#include "sessions/session_monitor.hpp"

#include <QFileInfo>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "sessions/indicator_resolver.hpp"

namespace sessionwatch {

namespace {

constexpr int kTrayUnavailableExitCode = 1;

} // namespace

SessionMonitor::SessionMonitor(SessionSource &source, TraySink &sink, int intervalMs,
                               QObject *parent)
    : QObject(parent)
    , m_source(source)
    , m_sink(sink)
{
    m_timer.setInterval(intervalMs);
    connect(&m_timer, &QTimer::timeout, this, &SessionMonitor::tick);
    connect(&m_watcher, &QFileSystemWatcher::fileChanged,
            this, &SessionMonitor::onWatchedFileChanged);
}

SessionMonitor::~SessionMonitor()
{
    m_timer.stop();
    if (!m_watcher.files().isEmpty()) {
        m_watcher.removePaths(m_watcher.files());
    }
}

void SessionMonitor::watchFile(const QString &path)
{
    m_watchedPath = path;
    if (m_timer.isActive()) {
        armWatcher();
    }
}

void SessionMonitor::start()
{
    if (m_state == State::Stopped) {
        return;
    }

    SWLOG_INFO(QStringLiteral("SessionMonitor"),
               QStringLiteral("start"),
               QStringLiteral("monitor_start"),
               QStringLiteral("app_start"),
               (nlohmann::json{{"intervalMs", m_timer.interval()},
                               {"watchedPath", m_watchedPath.toStdString()}}));
    m_timer.start();
    armWatcher();
    tick();
}

void SessionMonitor::refreshNow()
{
    tick();
}

void SessionMonitor::scheduleRefresh()
{
    if (m_refreshPending || m_state == State::Stopped) {
        return;
    }
    m_refreshPending = true;
    QTimer::singleShot(0, this, [this]() {
        m_refreshPending = false;
        tick();
    });
}

void SessionMonitor::tick()
{
    if (m_state == State::Stopped) {
        return;
    }
    armWatcher();

    SessionSet sessions;
    try {
        sessions = m_source.listSessions();
    } catch (const SessionQueryError &ex) {
        ++m_consecutiveFailures;
        SWLOG_WARN(QStringLiteral("SessionMonitor"),
                   QStringLiteral("tick"),
                   QStringLiteral("session_query_failed"),
                   QStringLiteral("retry_next_tick"),
                   (nlohmann::json{{"error", ex.what()},
                                   {"consecutiveFailures", m_consecutiveFailures}}));
        return;
    }
    m_consecutiveFailures = 0;

    const IndicatorState state = resolveIndicatorState(countedSessions(sessions));
    SWLOG_DEBUG(QStringLiteral("SessionMonitor"),
                QStringLiteral("tick"),
                QStringLiteral("sessions_listed"),
                QStringLiteral("timer_tick"),
                (nlohmann::json{{"state", toIndicatorString(state)},
                                {"sessions", sessionSetSummary(sessions)}}));

    try {
        m_sink.update(state, sessions);
    } catch (const TrayUnavailableError &ex) {
        SWLOG_ERROR(QStringLiteral("SessionMonitor"),
                    QStringLiteral("tick"),
                    QStringLiteral("tray_unavailable"),
                    QStringLiteral("presenter_failed"),
                    (nlohmann::json{{"error", ex.what()}}));
        stop(kTrayUnavailableExitCode);
        return;
    }

    const bool changed = !m_lastState || *m_lastState != state;
    m_lastState = state;
    m_lastSessions = sessions;
    if (changed) {
        SWLOG_INFO(QStringLiteral("SessionMonitor"),
                   QStringLiteral("tick"),
                   QStringLiteral("indicator_changed"),
                   QStringLiteral("session_count"),
                   (nlohmann::json{{"state", toIndicatorString(state)},
                                   {"sessions", sessionSetSummary(sessions)}}));
        emit indicatorChanged(state);
    }
}

void SessionMonitor::onWatchedFileChanged(const QString &path)
{
    SWLOG_DEBUG(QStringLiteral("SessionMonitor"),
                QStringLiteral("onWatchedFileChanged"),
                QStringLiteral("login_record_changed"),
                QStringLiteral("file_watch"),
                (nlohmann::json{{"path", path.toStdString()}}));
    scheduleRefresh();
}

void SessionMonitor::armWatcher()
{
    // The watch is dropped when the file is replaced rather than rewritten.
    if (m_watchedPath.isEmpty() || m_watcher.files().contains(m_watchedPath)) {
        return;
    }
    if (!QFileInfo::exists(m_watchedPath)) {
        return;
    }
    if (!m_watcher.addPath(m_watchedPath)) {
        SWLOG_WARN(QStringLiteral("SessionMonitor"),
                   QStringLiteral("armWatcher"),
                   QStringLiteral("watch_failed"),
                   QStringLiteral("polling_only"),
                   (nlohmann::json{{"path", m_watchedPath.toStdString()}}));
    }
}

void SessionMonitor::stop(int exitCode)
{
    m_state = State::Stopped;
    m_timer.stop();
    if (!m_watcher.files().isEmpty()) {
        m_watcher.removePaths(m_watcher.files());
    }
    SWLOG_INFO(QStringLiteral("SessionMonitor"),
               QStringLiteral("stop"),
               QStringLiteral("monitor_stopped"),
               QStringLiteral("tray_unavailable"),
               (nlohmann::json{{"exitCode", exitCode}}));
    emit stopped(exitCode);
}

} // namespace sessionwatch
