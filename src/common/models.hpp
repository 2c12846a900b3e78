#pragma once

#include <sys/types.h>

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

#include "common/enums.hpp"

namespace sessionwatch {

struct Session {
    std::string id;
    std::string user;
    // Terminal or display line, e.g. "tty2", "pts/0", ":0". May be empty.
    std::string line;
    std::string host;
    pid_t pid = 0;
    std::chrono::system_clock::time_point loginTime;

    bool isCurrent = false;
    bool canTerminate = true;
    // Greeter and similar sessions: listed, but never counted.
    bool ignored = false;

    bool operator==(const Session &other) const;
    bool operator!=(const Session &other) const { return !(*this == other); }
};

/**
 * SessionSet is the snapshot of sessions seen by one query.
 * Session ids are unique within a set; iteration keeps insertion order so
 * menus stay stable between refreshes, while equality ignores order.
 */
class SessionSet {
public:
    using const_iterator = std::vector<Session>::const_iterator;

    SessionSet() = default;

    // Returns false and leaves the set unchanged when the id is already present.
    bool insert(Session session);
    bool contains(const std::string &id) const;
    const Session *find(const std::string &id) const;

    std::size_t size() const { return m_sessions.size(); }
    bool empty() const { return m_sessions.empty(); }

    const_iterator begin() const { return m_sessions.begin(); }
    const_iterator end() const { return m_sessions.end(); }

    bool operator==(const SessionSet &other) const;
    bool operator!=(const SessionSet &other) const { return !(*this == other); }

private:
    std::vector<Session> m_sessions;
};

} // namespace sessionwatch
