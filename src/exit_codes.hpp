#pragma once

/**
 * Exit codes of xfreeze itself. They are kept out of the range commonly used
 * by programs, so that scripts can tell a failure of xfreeze from a failure
 * of the wrapped command. 128 + N is used when the command is killed by signal N.
 */
enum ExitCode : int
{
    EXIT_USAGE = 2,
    EXIT_DISPLAY_CONNECT = 122,
    EXIT_FREEZE = 123,
    EXIT_WAIT = 124,
    EXIT_INTERNAL = 125,
    EXIT_SPAWN = 127,
};
