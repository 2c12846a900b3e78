#include "tray/TrayPresenter.hpp"

#include <QAction>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "sessions/session_format.hpp"
#include "sessions/session_terminator.hpp"
#include "tray/session_menu.hpp"

namespace sessionwatch {

namespace {

void requireSystemTray()
{
    if (!QSystemTrayIcon::isSystemTrayAvailable()) {
        throw TrayUnavailableError("no system tray available on this desktop");
    }
}

} // namespace

TrayPresenter::TrayPresenter(QObject *parent)
    : QObject(parent)
    , m_normalIcon(indicatorIconPath(IndicatorState::Normal))
    , m_warningIcon(indicatorIconPath(IndicatorState::Warning))
{
    requireSystemTray();

    connect(&m_trayIcon, &QSystemTrayIcon::activated,
            this, &TrayPresenter::onTrayActivated);

    m_trayIcon.setIcon(m_normalIcon);
    m_trayIcon.setToolTip(tooltipText(IndicatorState::Normal, SessionSet()));
    rebuildMenu(SessionSet());
    m_trayIcon.setContextMenu(&m_menu);
    m_trayIcon.show();
}

TrayPresenter::~TrayPresenter()
{
    m_trayIcon.hide();
}

void TrayPresenter::ensureAvailable()
{
    requireSystemTray();
}

void TrayPresenter::update(IndicatorState state, const SessionSet &sessions)
{
    requireSystemTray();

    SWLOG_DEBUG(QStringLiteral("TrayPresenter"),
                QStringLiteral("update"),
                QStringLiteral("render_indicator"),
                QStringLiteral("state_or_sessions_changed"),
                (nlohmann::json{{"state", toIndicatorString(state)},
                                {"sessions", sessionSetSummary(sessions)}}));

    m_trayIcon.setIcon(state == IndicatorState::Warning ? m_warningIcon : m_normalIcon);
    m_trayIcon.setToolTip(tooltipText(state, sessions));
    rebuildMenu(sessions);

    if (!m_trayIcon.isVisible()) {
        m_trayIcon.show();
    }
}

void TrayPresenter::rebuildMenu(const SessionSet &sessions)
{
    const SessionMenuActions actions = populateSessionMenu(m_menu, sessions);

    for (const auto &entry : actions.terminate) {
        const Session session = entry.second;
        connect(entry.first, &QAction::triggered, this, [this, session]() {
            if (terminateSession(session)) {
                emit refreshRequested();
            }
        });
    }
    connect(actions.refresh, &QAction::triggered, this, &TrayPresenter::refreshRequested);
    connect(actions.quit, &QAction::triggered, this, &TrayPresenter::quitRequested);
}

void TrayPresenter::onTrayActivated(QSystemTrayIcon::ActivationReason reason)
{
    if (reason == QSystemTrayIcon::Trigger) {
        SWLOG_DEBUG(QStringLiteral("TrayPresenter"),
                    QStringLiteral("onTrayActivated"),
                    QStringLiteral("refresh_requested"),
                    QStringLiteral("tray_click"),
                    nlohmann::json::object());
        emit refreshRequested();
    }
}

} // namespace sessionwatch
