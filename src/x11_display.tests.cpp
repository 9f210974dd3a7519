#include <acutest.h>

#include "lib/errors.hpp"
#include "tests/test_log.hpp"
#include "x11_display.hpp"

static void connect_to_missing_server()
{
    init_test_logger();
    // nothing listens on display 65000, no X server is needed for this test
    TEST_EXCEPTION(XDisplay::connect(std::string(":65000"), false), DisplayConnectError);
    TEST_EXCEPTION(XDisplay::connect(std::string(":65000"), true), DisplayConnectError);
}

static void connect_error_names_display()
{
    init_test_logger();
    try {
        XDisplay::connect(std::string(":65000"), false);
        TEST_CHECK_(false, "connect() should have thrown");
    } catch (const DisplayConnectError &e) {
        TEST_CHECK(std::string(e.what()).find(":65000") != std::string::npos);
        TEST_MSG("message: %s", e.what());
    }
}

TEST_LIST = {
    { "connect to missing server", connect_to_missing_server },
    { "connect error names display", connect_error_names_display },
    { 0 }
};
