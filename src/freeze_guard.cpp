#include "freeze_guard.hpp"
#include "lib/errors.hpp"
#include "log.hpp"

FreezeGuard::FreezeGuard(DisplayConnection &display)
    : display(display)
{
    logger->debug("Freezing display");
    display.suspend();
    frozen = true;
    logger->debug("Display frozen");
}

FreezeGuard::~FreezeGuard()
{
    release();
}

void FreezeGuard::release() noexcept
{
    if (!frozen) return;
    // clear the flag first, a failed resume must not be retried from the destructor
    frozen = false;
    try {
        display.resume();
        logger->debug("Display resumed");
    } catch (const ReleaseError &e) {
        logger->warn("Failed to resume display: {}", e.what());
    } catch (const std::exception &e) {
        logger->warn("Unexpected error while resuming display: {}", e.what());
    }
}

bool FreezeGuard::is_frozen() const
{
    return frozen;
}
