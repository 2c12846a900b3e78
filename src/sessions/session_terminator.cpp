#include "sessions/session_terminator.hpp"

#include <cerrno>
#include <cstring>

#include <signal.h>

#include <nlohmann/json.hpp>

#include "common/json_utils.hpp"
#include "common/logging.hpp"

namespace sessionwatch {

bool terminateSession(const Session &session)
{
    if (session.isCurrent || session.pid <= 0) {
        SWLOG_WARN(QStringLiteral("SessionTerminator"),
                   QStringLiteral("terminateSession"),
                   QStringLiteral("terminate_refused"),
                   session.isCurrent ? QStringLiteral("current_session")
                                     : QStringLiteral("invalid_pid"),
                   sessionToJson(session));
        return false;
    }

    SWLOG_INFO(QStringLiteral("SessionTerminator"),
               QStringLiteral("terminateSession"),
               QStringLiteral("terminate_session"),
               QStringLiteral("user_action"),
               sessionToJson(session));

    if (::kill(session.pid, SIGKILL) != 0) {
        const int error = errno;
        nlohmann::json context = sessionToJson(session);
        context["error"] = std::strerror(error);
        SWLOG_WARN(QStringLiteral("SessionTerminator"),
                   QStringLiteral("terminateSession"),
                   QStringLiteral("terminate_failed"),
                   QStringLiteral("kill_error"),
                   context);
        return false;
    }
    return true;
}

} // namespace sessionwatch
