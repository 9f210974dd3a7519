#pragma once

#include <cstring>
#include <stdexcept>
#include <string>

/** Failure of a system call, carries the `errno` value it failed with. */
class IOError : public std::runtime_error
{
public:
    explicit IOError(int errno_, const std::string &msg)
        : std::runtime_error(msg + ": errno `" + std::to_string(errno_) + "` - `" +
                             strerror(errno_) + "`")
    {}
};

/** The display server could not be reached; nothing was frozen. */
class DisplayConnectError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/** The display server refused to freeze; no child was spawned. */
class FreezeError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * The resume command failed. Only ever reported as a warning,
 * as the process is exiting anyway.
 */
class ReleaseError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/** The child process could not be started (missing or non-executable binary, fork failure). */
class SpawnError : public std::runtime_error
{
private:
    const int _errno_;

public:
    SpawnError(int errno_, const std::string &executable)
        : std::runtime_error("Failed to execute `" + executable + "`: " + strerror(errno_))
        , _errno_(errno_)
    {}

    [[nodiscard]] int errno_() const {
        return _errno_;
    }
};

/** Waiting for the child process ended without observing its termination. */
class WaitError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};
