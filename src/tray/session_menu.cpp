#include "tray/session_menu.hpp"

#include <QAction>

#include "sessions/session_format.hpp"

namespace sessionwatch {

SessionMenuActions populateSessionMenu(QMenu &menu, const SessionSet &sessions)
{
    SessionMenuActions actions;

    // clear() deletes the actions owned by the menu.
    menu.clear();

    if (sessions.empty()) {
        QAction *none = menu.addAction(QStringLiteral("No active sessions"));
        none->setEnabled(false);
    }

    for (const auto &session : sessions) {
        QAction *action = menu.addAction(sessionLabel(session));
        if (session.isCurrent) {
            action->setCheckable(true);
            action->setChecked(true);
            action->setEnabled(false);
            continue;
        }

        action->setEnabled(session.canTerminate);
        action->setToolTip(QStringLiteral("Kill this session"));
        if (session.canTerminate) {
            actions.terminate.emplace_back(action, session);
        }
    }

    menu.addSeparator();
    actions.refresh = menu.addAction(QStringLiteral("Refresh Now"));
    actions.quit = menu.addAction(QStringLiteral("Quit"));
    return actions;
}

QString indicatorIconPath(IndicatorState state)
{
    switch (state) {
    case IndicatorState::Normal:
        return QStringLiteral(":/icons/normal.svg");
    case IndicatorState::Warning:
        return QStringLiteral(":/icons/warning.svg");
    }
    return QStringLiteral(":/icons/normal.svg");
}

} // namespace sessionwatch
