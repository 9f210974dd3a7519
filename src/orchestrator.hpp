#pragma once

#include "child_process.hpp"
#include "display.hpp"
#include <ev++.h>
#include <string>
#include <sys/types.h>
#include <vector>

/**
 * Returns true if `signum` was most likely sent by the terminal to the whole
 * foreground process group, i.e. the command (which shares our group) got
 * it too and forwarding would deliver it twice.
 *
 * Only SIGINT is treated this way; `terminal_pgrp` is -1 without a terminal.
 */
bool delivered_by_terminal(int signum, pid_t terminal_pgrp, pid_t own_pgrp);

/**
 * Runs a command while the display is frozen.
 *
 * SIGINT, SIGTERM and SIGHUP are caught for the whole lifetime of this object
 * and forwarded to the running command, so xfreeze itself is never killed
 * by them while the screen is frozen; it exits only after the command does.
 */
class Orchestrator
{
public:
    Orchestrator(ev::loop_ref loop, DisplayConnection &display);

    Orchestrator(const Orchestrator &) = delete;
    Orchestrator &operator=(const Orchestrator &) = delete;

    /**
     * Freezes the display, runs `argv` and waits until it terminates,
     * then resumes the display.
     *
     * Returns the exit code of the command, or 128 + N if the command
     * was terminated by signal N. The display is always resumed before
     * this function returns or throws (as long as freezing succeeded).
     *
     * @throws FreezeError, SpawnError, WaitError
     */
    int run(const std::vector<std::string> &argv);

private:
    ev::loop_ref loop;
    DisplayConnection &display;
    ev::sig sigint{ loop };
    ev::sig sigterm{ loop };
    ev::sig sighup{ loop };
    /** Currently running command, only set inside `run()`. */
    ChildProcess *child = nullptr;

    void wait_for(ChildProcess &proc);
    void signal_cb(ev::sig &w, [[maybe_unused]] int revents);
};
