#pragma once

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace sessionwatch {

inline std::string toIso8601Utc(std::chrono::system_clock::time_point timestamp)
{
    std::time_t time = std::chrono::system_clock::to_time_t(timestamp);
    std::tm tm{};
    gmtime_r(&time, &tm);
    std::ostringstream out;
    out << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return out.str();
}

inline std::string toIndicatorString(IndicatorState state)
{
    switch (state) {
    case IndicatorState::Normal:
        return "normal";
    case IndicatorState::Warning:
        return "warning";
    }
    return "normal";
}

inline nlohmann::json sessionToJson(const Session &session)
{
    return nlohmann::json{
        {"id", session.id},
        {"user", session.user},
        {"line", session.line},
        {"host", session.host},
        {"pid", static_cast<long long>(session.pid)},
        {"loginTime", toIso8601Utc(session.loginTime)},
        {"isCurrent", session.isCurrent},
        {"canTerminate", session.canTerminate},
        {"ignored", session.ignored}
    };
}

// Log context for a query result; users only, no hosts.
inline nlohmann::json sessionSetSummary(const SessionSet &sessions)
{
    nlohmann::json users = nlohmann::json::array();
    for (const auto &session : sessions) {
        users.push_back(session.user);
    }
    return nlohmann::json{
        {"count", sessions.size()},
        {"users", users}
    };
}

} // namespace sessionwatch
