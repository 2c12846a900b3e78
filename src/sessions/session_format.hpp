#pragma once

#include <QString>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace sessionwatch {

// "2024-05-01 09:30:00 - alice / pts/0 @ 10.0.0.5", login time in local time.
QString sessionLabel(const Session &session);

// Header line with the counted sessions, plus one sessionLabel() per session.
QString tooltipText(IndicatorState state, const SessionSet &sessions);

} // namespace sessionwatch
