#include "common/models.hpp"

#include <algorithm>
#include <utility>

namespace sessionwatch {

bool Session::operator==(const Session &other) const
{
    return id == other.id
        && user == other.user
        && line == other.line
        && host == other.host
        && pid == other.pid
        && loginTime == other.loginTime
        && isCurrent == other.isCurrent
        && canTerminate == other.canTerminate
        && ignored == other.ignored;
}

bool SessionSet::insert(Session session)
{
    if (contains(session.id)) {
        return false;
    }
    m_sessions.push_back(std::move(session));
    return true;
}

bool SessionSet::contains(const std::string &id) const
{
    return find(id) != nullptr;
}

const Session *SessionSet::find(const std::string &id) const
{
    const auto it = std::find_if(m_sessions.begin(), m_sessions.end(),
                                 [&id](const Session &session) {
                                     return session.id == id;
                                 });
    return it == m_sessions.end() ? nullptr : &*it;
}

bool SessionSet::operator==(const SessionSet &other) const
{
    if (size() != other.size()) {
        return false;
    }
    for (const auto &session : m_sessions) {
        const Session *match = other.find(session.id);
        if (!match || *match != session) {
            return false;
        }
    }
    return true;
}

} // namespace sessionwatch
