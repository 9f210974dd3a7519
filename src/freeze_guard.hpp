#pragma once

#include "display.hpp"

/**
 * Scoped display freeze. The constructor suspends the display,
 * the destructor resumes it.
 *
 * Resuming never throws: a failed resume is logged as a warning,
 * because the guard is typically destroyed while xfreeze is exiting
 * (possibly during stack unwinding) and nothing better can be done.
 */
class FreezeGuard
{
public:
    /** Throws FreezeError if the display cannot be frozen; nothing is released then. */
    explicit FreezeGuard(DisplayConnection &display);
    ~FreezeGuard();

    FreezeGuard(const FreezeGuard &) = delete;
    FreezeGuard &operator=(const FreezeGuard &) = delete;
    FreezeGuard(FreezeGuard &&) = delete;
    FreezeGuard &operator=(FreezeGuard &&) = delete;

    /** Resumes the display. Calling it again has no effect. */
    void release() noexcept;

    [[nodiscard]] bool is_frozen() const;

private:
    DisplayConnection &display;
    bool frozen = false;
};
