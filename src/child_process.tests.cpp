#include <acutest.h>

#include "child_process.hpp"
#include "lib/errors.hpp"
#include "tests/temp_dir.hpp"
#include "tests/test_log.hpp"
#include <csignal>
#include <fstream>
#include <sys/stat.h>
#include <sys/wait.h>

using namespace std;

static int run_to_completion(ev::loop_ref loop, ChildProcess &proc)
{
    int status = -1;
    proc.set_exit_cb([&](int wstatus) {
        status = wstatus;
        loop.break_loop(ev::ALL);
    });
    proc.spawn();
    loop.run();
    return status;
}

static void exit_code_is_reported()
{
    init_test_logger();
    ev::default_loop loop;
    ChildProcess proc(loop, { "sh", "-c", "exit 42" });

    int wstatus = run_to_completion(loop, proc);

    TEST_CHECK(proc.has_exited());
    TEST_CHECK(!proc.is_running());
    TEST_CHECK(proc.get_wait_status() == wstatus);
    TEST_CHECK(WIFEXITED(wstatus) && WEXITSTATUS(wstatus) == 42);
    TEST_CHECK(wait_status_to_exit_code(wstatus) == 42);
}

static void arguments_are_passed_verbatim()
{
    init_test_logger();
    TempDir dir;
    ev::default_loop loop;
    // "$0" is the first argument after the script for `sh -c`
    ChildProcess proc(loop, { "sh", "-c", "printf '%s|%s' \"$1\" \"$2\" > \"$0\"",
                              dir.file("args"), "with space", "--flag" });

    int wstatus = run_to_completion(loop, proc);
    TEST_CHECK(wait_status_to_exit_code(wstatus) == 0);

    ifstream f(dir.file("args"));
    string content((istreambuf_iterator<char>(f)), istreambuf_iterator<char>());
    TEST_CHECK(content == "with space|--flag");
    TEST_MSG("got '%s'", content.c_str());
}

static void missing_executable()
{
    init_test_logger();
    ev::default_loop loop;
    ChildProcess proc(loop, { "xfreeze-test-nonexistent-binary" });

    try {
        proc.spawn();
        TEST_CHECK_(false, "spawn() should have thrown");
    } catch (const SpawnError &e) {
        TEST_CHECK(e.errno_() == ENOENT);
        TEST_MSG("errno %d", e.errno_());
    }
    TEST_CHECK(!proc.is_running());
    TEST_CHECK(!proc.has_exited());
}

static void non_executable_file()
{
    init_test_logger();
    TempDir dir;
    ofstream(dir.file("script")) << "#!/bin/sh\nexit 0\n";
    chmod(dir.file("script").c_str(), 0644);

    ev::default_loop loop;
    ChildProcess proc(loop, { dir.file("script") });
    try {
        proc.spawn();
        TEST_CHECK_(false, "spawn() should have thrown");
    } catch (const SpawnError &e) {
        TEST_CHECK(e.errno_() == EACCES);
        TEST_MSG("errno %d", e.errno_());
    }
}

static void signal_termination()
{
    init_test_logger();
    ev::default_loop loop;
    ChildProcess proc(loop, { "sleep", "10" });
    proc.set_exit_cb([&](int) { loop.break_loop(ev::ALL); });
    proc.spawn();
    TEST_CHECK(proc.is_running());
    TEST_CHECK(proc.get_pid() > 0);

    proc.send_signal(SIGTERM);
    loop.run();

    int wstatus = *proc.get_wait_status();
    TEST_CHECK(WIFSIGNALED(wstatus) && WTERMSIG(wstatus) == SIGTERM);
    TEST_CHECK(wait_status_to_exit_code(wstatus) == 128 + SIGTERM);

    // no-op once the process is gone
    proc.send_signal(SIGTERM);
}

static void kill_reaps_without_loop()
{
    init_test_logger();
    ev::default_loop loop;
    ChildProcess proc(loop, { "sleep", "10" });
    proc.spawn();

    proc.kill();

    TEST_CHECK(proc.has_exited());
    TEST_CHECK(wait_status_to_exit_code(*proc.get_wait_status()) == 128 + SIGKILL);
}

static void empty_argv_is_rejected()
{
    ev::default_loop loop;
    TEST_EXCEPTION(ChildProcess proc(loop, std::vector<std::string>{}), std::invalid_argument);
}

TEST_LIST = {
    { "exit code is reported", exit_code_is_reported },
    { "arguments are passed verbatim", arguments_are_passed_verbatim },
    { "missing executable", missing_executable },
    { "non-executable file", non_executable_file },
    { "signal termination", signal_termination },
    { "kill reaps without loop", kill_reaps_without_loop },
    { "empty argv is rejected", empty_argv_is_rejected },
    { 0 }
};
