#include "child_process.hpp"
#include "lib/check_lib.hpp"
#include "log.hpp"
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

static std::string command_line(const std::vector<std::string> &argv)
{
    std::string cmd;
    for (const auto &arg : argv) {
        if (!cmd.empty()) cmd += ' ';
        cmd += arg;
    }
    return cmd;
}

ChildProcess::ChildProcess(ev::loop_ref loop, std::vector<std::string> argv)
    : child_w(loop)
    , argv(std::move(argv))
{
    if (this->argv.empty()) {
        throw std::invalid_argument("Cannot spawn a process without an executable");
    }
    child_w.set<ChildProcess, &ChildProcess::child_terminated_cb>(this);
}

ChildProcess::~ChildProcess()
{
    child_w.stop();
}

void ChildProcess::set_exit_cb(ExitCb cb)
{
    exit_cb = std::move(cb);
}

void ChildProcess::spawn()
{
    if (pid != -1) {
        throw std::logic_error("Process '" + argv[0] + "' was already spawned");
    }

    // the child writes errno into this pipe if exec fails; on success,
    //  the write end is closed by exec and the parent reads EOF
    int pipefd[2];
    CHECK(pipe2(pipefd, O_CLOEXEC));

    pid_t new_pid = fork();
    if (new_pid == -1) {
        int fork_errno = errno;
        close(pipefd[0]);
        close(pipefd[1]);
        throw SpawnError(fork_errno, argv[0]);
    }

    if (new_pid == 0) {
        // CHILD PROCESS
        close(pipefd[0]);
        exec_in_child(pipefd[1]);
        // END CHILD PROCESS
    }

    // PARENT PROCESS
    close(pipefd[1]);
    int child_errno = 0;
    ssize_t n;
    do {
        n = read(pipefd[0], &child_errno, sizeof(child_errno));
    } while (n == -1 && errno == EINTR);
    close(pipefd[0]);

    if (n > 0) {
        // exec failed, the child already exited; reap it so that it doesn't reach the child watcher
        int wstatus;
        while (waitpid(new_pid, &wstatus, 0) == -1 && errno == EINTR) {}
        throw SpawnError(child_errno, argv[0]);
    }

    pid = new_pid;
    child_w.start(pid, 0);
    logger_process->debug("Running '{}' as PID '{}'", command_line(argv), pid);
}

void ChildProcess::exec_in_child(int error_fd)
{
    // libev may block signals it watches; the command must start with a clean mask
    sigset_t empty;
    sigemptyset(&empty);
    sigprocmask(SIG_SETMASK, &empty, nullptr);

    std::vector<char *> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto &arg : argv) {
        c_argv.push_back(const_cast<char *>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    execvp(c_argv[0], c_argv.data());

    int exec_errno = errno;
    // nothing sensible can be done if this write fails, the parent sees EOF then
    [[maybe_unused]] ssize_t ret = write(error_fd, &exec_errno, sizeof(exec_errno));
    // don't run atexit handlers and destructors inherited from the parent
    _exit(127);
}

void ChildProcess::send_signal(int signum)
{
    if (!is_running()) return;
    logger_process->debug("Sending signal {} ({}) to PID '{}'", signum, strsignal(signum), pid);
    CHECK(::kill(pid, signum));
}

void ChildProcess::kill()
{
    if (!is_running()) return;
    child_w.stop();
    logger_process->warn("Killing PID '{}' (cmd: '{}')", pid, argv[0]);
    CHECK(::kill(pid, SIGKILL));

    int wstatus;
    while (waitpid(pid, &wstatus, 0) == -1) {
        if (errno != EINTR) throw IOError(errno, "Failed to wait for PID " + std::to_string(pid));
    }
    wait_status = wstatus;
}

pid_t ChildProcess::get_pid() const
{
    return pid;
}

bool ChildProcess::is_running() const
{
    return pid != -1 && !wait_status;
}

bool ChildProcess::has_exited() const
{
    return wait_status.has_value();
}

std::optional<int> ChildProcess::get_wait_status() const
{
    return wait_status;
}

const std::vector<std::string> &ChildProcess::get_argv() const
{
    return argv;
}

/** Called when our spawned child process terminates. */
void ChildProcess::child_terminated_cb(ev::child &w, [[maybe_unused]] int revents)
{
    w.stop();
    int wstatus = w.rstatus;
    wait_status = wstatus;
    // clang-format off
    if (WIFEXITED(wstatus) && WEXITSTATUS(wstatus) != 0) {
        logger_process->info("Process '{}' exited with status {} (cmd: '{}')",
                             pid, WEXITSTATUS(wstatus), argv[0]);
    } else if (WIFSIGNALED(wstatus)) {
        logger_process->info("Process '{}' terminated by signal {} (cmd: '{}')",
                             pid, WTERMSIG(wstatus), argv[0]);
    } else {
        logger_process->debug("Process '{}' exited (cmd: '{}')", pid, argv[0]);
    }
    // clang-format on

    if (exit_cb) exit_cb(wstatus);
}

int wait_status_to_exit_code(int wstatus)
{
    if (WIFEXITED(wstatus)) {
        return WEXITSTATUS(wstatus);
    }
    if (WIFSIGNALED(wstatus)) {
        return 128 + WTERMSIG(wstatus);
    }
    throw std::invalid_argument("Wait status " + std::to_string(wstatus) +
                                " is neither an exit nor a termination");
}
