#include "sessions/indicator_resolver.hpp"

namespace sessionwatch {

IndicatorState resolveIndicatorState(const SessionSet &sessions)
{
    return sessions.size() > 1 ? IndicatorState::Warning : IndicatorState::Normal;
}

SessionSet countedSessions(const SessionSet &sessions)
{
    SessionSet counted;
    for (const auto &session : sessions) {
        if (!session.ignored) {
            counted.insert(session);
        }
    }
    return counted;
}

} // namespace sessionwatch
