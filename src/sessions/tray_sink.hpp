#pragma once

#include <optional>
#include <utility>

#include "common/enums.hpp"
#include "common/models.hpp"

namespace sessionwatch {

// Capability for showing the indicator state somewhere on screen.
class TraySink
{
public:
    virtual ~TraySink() = default;

    // Throws TrayUnavailableError when the presentation surface is gone.
    virtual void update(IndicatorState state, const SessionSet &sessions) = 0;

    // Checked on every tick, including ticks with nothing to redraw.
    virtual void ensureAvailable() {}
};

// Forwards an update only when it differs from the last forwarded one.
class ChangeFilterSink : public TraySink
{
public:
    explicit ChangeFilterSink(TraySink &target)
        : m_target(target)
    {
    }

    void update(IndicatorState state, const SessionSet &sessions) override
    {
        if (m_last && m_last->first == state && m_last->second == sessions) {
            m_target.ensureAvailable();
            return;
        }
        m_target.update(state, sessions);
        // Only remembered after a successful render so a failed one is retried.
        m_last = std::make_pair(state, sessions);
    }

    void ensureAvailable() override { m_target.ensureAvailable(); }

private:
    TraySink &m_target;
    std::optional<std::pair<IndicatorState, SessionSet>> m_last;
};

} // namespace sessionwatch
