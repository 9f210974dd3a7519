#include "orchestrator.hpp"
#include "freeze_guard.hpp"
#include "lib/assert.hpp"
#include "lib/errors.hpp"
#include "log.hpp"
#include <csignal>
#include <cstring>
#include <unistd.h>

Orchestrator::Orchestrator(ev::loop_ref loop, DisplayConnection &display)
    : loop(loop)
    , display(display)
{
    sigint.set<Orchestrator, &Orchestrator::signal_cb>(this);
    sigterm.set<Orchestrator, &Orchestrator::signal_cb>(this);
    sighup.set<Orchestrator, &Orchestrator::signal_cb>(this);

    // installed before anything is frozen; a signal received before the command
    //  is spawned stays pending in the loop and is forwarded once we start waiting
    sigint.start(SIGINT);
    sigterm.start(SIGTERM);
    sighup.start(SIGHUP);
}

int Orchestrator::run(const std::vector<std::string> &argv)
{
    // NOTE: `guard` must be declared before `proc`, so that the command is
    //  dealt with before the display is resumed on every path out of here
    FreezeGuard guard(display);

    ChildProcess proc(loop, argv);
    proc.set_exit_cb([this](int) { loop.break_loop(ev::ALL); });
    proc.spawn();

    wait_for(proc);

    ASSERT(proc.has_exited());
    guard.release();

    int exit_code = wait_status_to_exit_code(*proc.get_wait_status());
    logger->debug("Command finished with exit code {}", exit_code);
    return exit_code;
}

void Orchestrator::wait_for(ChildProcess &proc)
{
    child = &proc;
    try {
        logger->debug("Waiting for PID '{}'", proc.get_pid());
        loop.run();
    } catch (const std::exception &) {
        child = nullptr;
        proc.kill();
        std::throw_with_nested(WaitError("Failed while waiting for '" + proc.get_argv()[0] + "'"));
    }
    child = nullptr;

    if (!proc.has_exited()) {
        proc.kill();
        throw WaitError("Event loop stopped before '" + proc.get_argv()[0] + "' exited");
    }
}

/** Called when our process receives SIGINT, SIGTERM or SIGHUP. */
void Orchestrator::signal_cb(ev::sig &w, [[maybe_unused]] int revents)
{
    if (!child || !child->is_running()) {
        logger->debug("Received signal {} ({}) with no running command, ignoring",
                      w.signum,
                      strsignal(w.signum));
        return;
    }
    if (delivered_by_terminal(w.signum, tcgetpgrp(STDIN_FILENO), getpgrp())) {
        logger->info("Received {} from the terminal, PID '{}' got it as well",
                     strsignal(w.signum),
                     child->get_pid());
        return;
    }
    logger->info("Received {}, forwarding it to PID '{}'", strsignal(w.signum), child->get_pid());
    child->send_signal(w.signum);
}

bool delivered_by_terminal(int signum, pid_t terminal_pgrp, pid_t own_pgrp)
{
    // Ctrl-C goes to the foreground process group, which the command is part of
    return signum == SIGINT && terminal_pgrp != -1 && terminal_pgrp == own_pgrp;
}
