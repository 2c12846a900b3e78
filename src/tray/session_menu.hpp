#pragma once

#include <utility>
#include <vector>

#include <QMenu>
#include <QString>

#include "common/enums.hpp"
#include "common/models.hpp"

class QAction;

namespace sessionwatch {

struct SessionMenuActions {
    QAction *refresh = nullptr;
    QAction *quit = nullptr;
    // Enabled entries that kill the paired session when triggered.
    std::vector<std::pair<QAction *, Session>> terminate;
};

// Replaces the menu contents with one entry per session, then Refresh Now and Quit.
// The caller's own session is shown checked and disabled.
SessionMenuActions populateSessionMenu(QMenu &menu, const SessionSet &sessions);

// Resource path of the tray icon for a state.
QString indicatorIconPath(IndicatorState state);

} // namespace sessionwatch
