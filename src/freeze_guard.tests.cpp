#include <acutest.h>

#include "freeze_guard.hpp"
#include "tests/fake_display.hpp"
#include "tests/test_log.hpp"

static void freezes_for_its_lifetime()
{
    init_test_logger();
    FakeDisplay display;
    {
        FreezeGuard guard(display);
        TEST_CHECK(display.frozen);
        TEST_CHECK(guard.is_frozen());
        TEST_CHECK(display.count("resume") == 0);
    }
    TEST_CHECK(!display.frozen);
    TEST_CHECK(display.calls == (std::vector<std::string>{ "suspend", "resume" }));
}

static void release_is_idempotent()
{
    init_test_logger();
    FakeDisplay display;
    {
        FreezeGuard guard(display);
        guard.release();
        TEST_CHECK(!guard.is_frozen());
        TEST_CHECK(!display.frozen);
        guard.release();
        TEST_CHECK(!display.frozen);
    }
    // neither the second release() nor the destructor may touch the display again
    TEST_CHECK(display.count("resume") == 1);
    TEST_MSG("resume called %ld times", display.count("resume"));
}

static void failed_freeze_is_not_released()
{
    init_test_logger();
    FakeDisplay display;
    display.fail_suspend = true;
    TEST_EXCEPTION(FreezeGuard guard(display), FreezeError);
    TEST_CHECK(display.calls == std::vector<std::string>{ "suspend" });
}

static void failed_release_does_not_throw()
{
    init_test_logger();
    FakeDisplay display;
    display.fail_resume = true;
    {
        FreezeGuard guard(display);
        guard.release();
        TEST_CHECK(!guard.is_frozen());
    }
    TEST_CHECK(display.count("resume") == 1);
}

static void released_during_unwinding()
{
    init_test_logger();
    FakeDisplay display;
    try {
        FreezeGuard guard(display);
        throw std::runtime_error("boom");
    } catch (const std::runtime_error &) {
        TEST_CHECK(!display.frozen);
    }
    TEST_CHECK(display.count("resume") == 1);
}

TEST_LIST = {
    { "freezes for its lifetime", freezes_for_its_lifetime },
    { "release is idempotent", release_is_idempotent },
    { "failed freeze is not released", failed_freeze_is_not_released },
    { "failed release does not throw", failed_release_does_not_throw },
    { "released during unwinding", released_during_unwinding },
    { 0 }
};
