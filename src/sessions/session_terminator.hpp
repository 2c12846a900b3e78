#pragma once

#include "common/models.hpp"

namespace sessionwatch {

// Sends SIGKILL to the session leader. The caller's own session is never
// signalled. Returns false when nothing was sent.
bool terminateSession(const Session &session);

} // namespace sessionwatch
