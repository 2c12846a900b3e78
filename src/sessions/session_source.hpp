#pragma once

#include "common/models.hpp"

namespace sessionwatch {

// Capability for reading the live set of login sessions.
class SessionSource
{
public:
    virtual ~SessionSource() = default;

    // Always queries live state. Throws SessionQueryError on failure.
    virtual SessionSet listSessions() = 0;
};

} // namespace sessionwatch
