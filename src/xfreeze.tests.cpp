#include <acutest.h>

#include "exit_codes.hpp"
#include "tests/fake_display.hpp"
#include "tests/test_log.hpp"
#include "x11_display.hpp"
#include "xfreeze.hpp"

using namespace std;

static DisplayOpener borrow(FakeDisplay &display)
{
    return [&display] { return make_unique<BorrowedDisplay>(display); };
}

static void command_exit_code()
{
    init_test_logger();
    FakeDisplay display;
    TEST_CHECK(run_frozen(borrow(display), { "sh", "-c", "exit 7" }) == 7);
    TEST_CHECK(display.calls == (vector<string>{ "suspend", "resume" }));
}

static void unreachable_display()
{
    init_test_logger();
    // nothing listens on display 65000
    int ret = run_frozen([] { return XDisplay::connect(string(":65000"), false); },
                         { "true" });
    TEST_CHECK(ret == EXIT_DISPLAY_CONNECT);
    TEST_MSG("exit code %d", ret);
}

static void connect_error_does_not_freeze()
{
    init_test_logger();
    FakeDisplay display;
    bool opened = false;
    int ret = run_frozen(
      [&]() -> unique_ptr<DisplayConnection> {
          opened = true;
          throw DisplayConnectError("no server");
      },
      { "true" });
    TEST_CHECK(opened);
    TEST_CHECK(ret == EXIT_DISPLAY_CONNECT);
    TEST_CHECK(display.calls.empty());
}

static void freeze_error()
{
    init_test_logger();
    FakeDisplay display;
    display.fail_suspend = true;
    TEST_CHECK(run_frozen(borrow(display), { "true" }) == EXIT_FREEZE);
    TEST_CHECK(display.calls == vector<string>{ "suspend" });
}

static void spawn_error()
{
    init_test_logger();
    FakeDisplay display;
    int ret = run_frozen(borrow(display), { "xfreeze-test-nonexistent-binary" });
    TEST_CHECK(ret == EXIT_SPAWN);
    TEST_MSG("exit code %d", ret);
    TEST_CHECK(display.calls == (vector<string>{ "suspend", "resume" }));
}

static void internal_error()
{
    init_test_logger();
    int ret = run_frozen([]() -> unique_ptr<DisplayConnection> { throw std::runtime_error("boom"); },
                         { "true" });
    TEST_CHECK(ret == EXIT_INTERNAL);
}

TEST_LIST = {
    { "command exit code", command_exit_code },
    { "unreachable display", unreachable_display },
    { "connect error does not freeze", connect_error_does_not_freeze },
    { "freeze error", freeze_error },
    { "spawn error", spawn_error },
    { "internal error", internal_error },
    { 0 }
};
