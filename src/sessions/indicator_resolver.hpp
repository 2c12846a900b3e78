#pragma once

#include "common/enums.hpp"
#include "common/models.hpp"

namespace sessionwatch {

// Warning as soon as anyone besides a single session is logged in.
IndicatorState resolveIndicatorState(const SessionSet &sessions);

// The sessions that count towards the indicator: all but the ignored ones.
SessionSet countedSessions(const SessionSet &sessions);

} // namespace sessionwatch
