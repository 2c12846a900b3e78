#pragma once

#include <stdexcept>
#include <string>

namespace sessionwatch {

// The login record could not be read or parsed. Transient: retried next tick.
class SessionQueryError : public std::runtime_error
{
public:
    explicit SessionQueryError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

// The desktop has no usable system tray. Fatal for the presenter.
class TrayUnavailableError : public std::runtime_error
{
public:
    explicit TrayUnavailableError(const std::string &message)
        : std::runtime_error(message)
    {
    }
};

} // namespace sessionwatch
