#pragma once

#include <ev++.h>
#include <functional>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

/**
 * The wrapped user command, started with `execvp` and sharing our
 * stdin/stdout/stderr, so it behaves exactly as if run directly from the shell.
 *
 * Termination is observed with a libev child watcher, so `ev::default_loop`
 * must be used for the loop passed in.
 */
class ChildProcess
{
public:
    /** Called once, with the raw wait status, after the child terminates. */
    using ExitCb = std::function<void(int)>;

    /** @param argv - executable (looked up in PATH) followed by its arguments */
    ChildProcess(ev::loop_ref loop, std::vector<std::string> argv);
    ~ChildProcess();

    ChildProcess(const ChildProcess &) = delete;
    ChildProcess &operator=(const ChildProcess &) = delete;

    void set_exit_cb(ExitCb cb);

    /**
     * Spawns the underlying system process.
     *
     * Returns only after the child either successfully called `exec`,
     * or reported why it could not; in the second case, SpawnError is thrown
     * and the (already reaped) child never ran the command.
     */
    void spawn();

    /** Sends `signum` to the child; does nothing if it's not running. */
    void send_signal(int signum);

    /**
     * Kills the child with SIGKILL and reaps it, without the event loop.
     * Used when the loop cannot be relied on anymore.
     */
    void kill();

    [[nodiscard]] pid_t get_pid() const;
    [[nodiscard]] bool is_running() const;
    [[nodiscard]] bool has_exited() const;
    /** Raw wait status (see waitpid(2)), set once `has_exited()`. */
    [[nodiscard]] std::optional<int> get_wait_status() const;
    [[nodiscard]] const std::vector<std::string> &get_argv() const;

private:
    ev::child child_w;
    const std::vector<std::string> argv;
    ExitCb exit_cb = nullptr;
    pid_t pid = -1;
    std::optional<int> wait_status{};

    [[noreturn]] void exec_in_child(int error_fd);
    void child_terminated_cb(ev::child &w, [[maybe_unused]] int revents);
};

/** Converts a wait status into a shell-style exit code (128 + N for signal N). */
int wait_status_to_exit_code(int wstatus);
