#pragma once

#include "display.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

using DisplayOpener = std::function<std::unique_ptr<DisplayConnection>()>;

/**
 * Opens the display, runs `command` while it is frozen and converts
 * the outcome into the exit code of xfreeze (see exit_codes.hpp).
 * Errors are logged, never thrown.
 *
 * @param open_display - connects to the display server, throws DisplayConnectError on failure
 */
int run_frozen(const DisplayOpener &open_display, const std::vector<std::string> &command);
