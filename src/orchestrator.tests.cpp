#include <acutest.h>

#include "orchestrator.hpp"
#include "tests/fake_display.hpp"
#include "tests/temp_dir.hpp"
#include "tests/test_log.hpp"
#include <cerrno>
#include <csignal>
#include <fstream>
#include <unistd.h>

using namespace std;

/**
 * SIGINT sent by a terminal is not forwarded; the tests send it with kill(),
 * so make sure we never look like the foreground of a terminal.
 */
static void detach_stdin_from_terminal()
{
    TEST_ASSERT(freopen("/dev/null", "r", stdin) != nullptr);
}

static void command_runs_while_frozen()
{
    init_test_logger();
    TempDir dir;
    FakeDisplay display;
    ev::default_loop loop;
    Orchestrator orchestrator(loop, display);

    display.on_suspend = [&] { TEST_CHECK_(!dir.exists("out"), "command did not run before freeze"); };
    display.on_resume = [&] { TEST_CHECK_(dir.exists("out"), "command finished before resume"); };

    int ret = orchestrator.run({ "sh", "-c", "echo hello > \"$0\"", dir.file("out") });

    TEST_CHECK(ret == 0);
    TEST_CHECK(display.calls == (vector<string>{ "suspend", "resume" }));
    TEST_CHECK(!display.frozen);
}

static void echo_hello()
{
    init_test_logger();
    FakeDisplay display;
    ev::default_loop loop;
    Orchestrator orchestrator(loop, display);

    TEST_CHECK(orchestrator.run({ "echo", "hello" }) == 0);
    TEST_CHECK(display.calls == (vector<string>{ "suspend", "resume" }));
}

static void exit_code_is_passed_through()
{
    init_test_logger();
    FakeDisplay display;
    ev::default_loop loop;
    Orchestrator orchestrator(loop, display);

    int ret = orchestrator.run({ "sh", "-c", "exit 42" });
    TEST_CHECK(ret == 42);
    TEST_MSG("exit code %d", ret);
    TEST_CHECK(!display.frozen);
}

static void spawn_failure_releases_freeze()
{
    init_test_logger();
    FakeDisplay display;
    ev::default_loop loop;
    Orchestrator orchestrator(loop, display);

    TEST_EXCEPTION(orchestrator.run({ "xfreeze-test-nonexistent-binary" }), SpawnError);
    TEST_CHECK(display.calls == (vector<string>{ "suspend", "resume" }));
    TEST_CHECK(!display.frozen);
}

static void freeze_failure_spawns_nothing()
{
    init_test_logger();
    TempDir dir;
    FakeDisplay display;
    display.fail_suspend = true;
    ev::default_loop loop;
    Orchestrator orchestrator(loop, display);

    TEST_EXCEPTION(orchestrator.run({ "touch", dir.file("out") }), FreezeError);
    TEST_CHECK(display.calls == vector<string>{ "suspend" });
    TEST_CHECK(!dir.exists("out"));
}

static void release_failure_keeps_exit_code()
{
    init_test_logger();
    FakeDisplay display;
    display.fail_resume = true;
    ev::default_loop loop;
    Orchestrator orchestrator(loop, display);

    TEST_CHECK(orchestrator.run({ "sh", "-c", "exit 3" }) == 3);
    TEST_CHECK(display.count("resume") == 1);
}

static void interrupt_when_ready(ev::timer &w, [[maybe_unused]] int revents)
{
    auto *ready_file = static_cast<const string *>(w.data);
    if (access(ready_file->c_str(), F_OK) == 0) {
        w.stop();
        kill(getpid(), SIGINT);
    }
}

static void interrupt_now(ev::timer &w, [[maybe_unused]] int revents)
{
    w.stop();
    kill(getpid(), SIGINT);
}

static void interrupt_is_forwarded()
{
    init_test_logger();
    detach_stdin_from_terminal();
    FakeDisplay display;
    ev::default_loop loop;
    Orchestrator orchestrator(loop, display);

    TempDir dir;
    string ready = dir.file("ready");
    ev::timer interrupt_w(loop);
    interrupt_w.set<interrupt_when_ready>(&ready);
    interrupt_w.start(0.01, 0.01);

    display.on_resume = [&] {
        TEST_CHECK_(dir.exists("interrupted"), "command handled SIGINT before resume");
    };

    // the trap handler runs only when SIGINT reaches the shell
    int ret = orchestrator.run({ "sh",
                                 "-c",
                                 "trap 'touch \"$0/interrupted\"; exit 3' INT; "
                                 "touch \"$0/ready\"; "
                                 "while :; do sleep 0.05; done",
                                 dir.file("") });

    TEST_CHECK(ret == 3);
    TEST_MSG("exit code %d", ret);
    TEST_CHECK(display.calls == (vector<string>{ "suspend", "resume" }));
}

static void interrupted_command_exit_code()
{
    init_test_logger();
    detach_stdin_from_terminal();
    FakeDisplay display;
    ev::default_loop loop;
    Orchestrator orchestrator(loop, display);

    // `sleep` needs no setup, interrupt it right away
    ev::timer interrupt_w(loop);
    interrupt_w.set<interrupt_now>();
    interrupt_w.start(0.05);

    int ret = orchestrator.run({ "sleep", "10" });

    TEST_CHECK(ret == 128 + SIGINT);
    TEST_MSG("exit code %d", ret);
    TEST_CHECK(!display.frozen);
}

static void signal_during_freeze_is_forwarded()
{
    init_test_logger();
    FakeDisplay display;
    ev::default_loop loop;
    Orchestrator orchestrator(loop, display);

    // arrives before the command exists; must be kept until it can be forwarded
    display.on_suspend = [] { kill(getpid(), SIGTERM); };

    int ret = orchestrator.run({ "sleep", "10" });

    TEST_CHECK(ret == 128 + SIGTERM);
    TEST_MSG("exit code %d", ret);
    TEST_CHECK(display.calls == (vector<string>{ "suspend", "resume" }));
}

static void sighup_is_forwarded()
{
    init_test_logger();
    FakeDisplay display;
    ev::default_loop loop;
    Orchestrator orchestrator(loop, display);

    display.on_suspend = [] { kill(getpid(), SIGHUP); };

    int ret = orchestrator.run({ "sleep", "10" });

    TEST_CHECK(ret == 128 + SIGHUP);
    TEST_MSG("exit code %d", ret);
    TEST_CHECK(display.calls == (vector<string>{ "suspend", "resume" }));
}

static void terminal_sigint_is_not_forwarded_twice()
{
    TEST_CHECK(delivered_by_terminal(SIGINT, 100, 100));
    TEST_CHECK(!delivered_by_terminal(SIGINT, 100, 200)); // we are in the background
    TEST_CHECK(!delivered_by_terminal(SIGINT, -1, 100));  // no terminal
    TEST_CHECK(!delivered_by_terminal(SIGTERM, 100, 100));
    TEST_CHECK(!delivered_by_terminal(SIGHUP, 100, 100));
}

/** Shell script writing its PID into the file passed as $0, then sleeping. */
static vector<string> sleeper(const string &pid_file)
{
    return { "sh", "-c", "echo $$ > \"$0\"; exec sleep 10", pid_file };
}

static pid_t read_pid(const string &pid_file)
{
    pid_t pid = -1;
    ifstream(pid_file) >> pid;
    return pid;
}

static void stop_loop_when_started(ev::timer &w, [[maybe_unused]] int revents)
{
    auto *pid_file = static_cast<const string *>(w.data);
    if (access(pid_file->c_str(), F_OK) == 0) {
        w.stop();
        w.loop.break_loop(ev::ALL);
    }
}

static void throw_when_started(ev::timer &w, [[maybe_unused]] int revents)
{
    auto *pid_file = static_cast<const string *>(w.data);
    if (access(pid_file->c_str(), F_OK) == 0) {
        w.stop();
        throw runtime_error("watcher failed");
    }
}

static void expect_reaped_on_resume(FakeDisplay &display, const string &pid_file)
{
    display.on_resume = [&display, pid_file] {
        pid_t pid = read_pid(pid_file);
        TEST_CHECK(pid > 0);
        TEST_CHECK_(kill(pid, 0) == -1 && errno == ESRCH,
                    "PID %d is reaped before the display is resumed",
                    pid);
        TEST_CHECK(display.frozen);
    };
}

static void stopped_loop_is_wait_error()
{
    init_test_logger();
    TempDir dir;
    string pid_file = dir.file("pid");
    FakeDisplay display;
    expect_reaped_on_resume(display, pid_file);
    ev::default_loop loop;
    Orchestrator orchestrator(loop, display);

    ev::timer stop_w(loop);
    stop_w.set<stop_loop_when_started>(&pid_file);
    stop_w.start(0.01, 0.01);

    TEST_EXCEPTION(orchestrator.run(sleeper(pid_file)), WaitError);
    TEST_CHECK(display.calls == (vector<string>{ "suspend", "resume" }));
    TEST_CHECK(!display.frozen);
}

static void failure_in_loop_is_wait_error()
{
    init_test_logger();
    TempDir dir;
    string pid_file = dir.file("pid");
    FakeDisplay display;
    expect_reaped_on_resume(display, pid_file);
    ev::default_loop loop;
    Orchestrator orchestrator(loop, display);

    ev::timer throw_w(loop);
    throw_w.set<throw_when_started>(&pid_file);
    throw_w.start(0.01, 0.01);

    try {
        orchestrator.run(sleeper(pid_file));
        TEST_CHECK_(false, "run() should have thrown");
    } catch (const WaitError &e) {
        try {
            std::rethrow_if_nested(e);
            TEST_CHECK_(false, "WaitError should carry the original error");
        } catch (const runtime_error &cause) {
            TEST_CHECK(string(cause.what()) == "watcher failed");
        }
    }
    TEST_CHECK(display.calls == (vector<string>{ "suspend", "resume" }));
}

TEST_LIST = {
    { "command runs while frozen", command_runs_while_frozen },
    { "echo hello", echo_hello },
    { "exit code is passed through", exit_code_is_passed_through },
    { "spawn failure releases freeze", spawn_failure_releases_freeze },
    { "freeze failure spawns nothing", freeze_failure_spawns_nothing },
    { "release failure keeps exit code", release_failure_keeps_exit_code },
    { "interrupt is forwarded", interrupt_is_forwarded },
    { "interrupted command exit code", interrupted_command_exit_code },
    { "signal during freeze is forwarded", signal_during_freeze_is_forwarded },
    { "sighup is forwarded", sighup_is_forwarded },
    { "terminal sigint is not forwarded twice", terminal_sigint_is_not_forwarded_twice },
    { "stopped loop is wait error", stopped_loop_is_wait_error },
    { "failure in loop is wait error", failure_in_loop_is_wait_error },
    { 0 }
};
