#include <acutest.h>

#include "lib/check_lib.hpp"
#include <string>
#include <unistd.h>

static void passes_result_through()
{
    int fds[2];
    TEST_CHECK(CHECK(pipe(fds)) == 0);
    TEST_CHECK(CHECK(close(fds[0])) == 0);
    TEST_CHECK(CHECK(close(fds[1])) == 0);
}

static void failure_carries_errno()
{
    try {
        CHECK(close(-1));
        TEST_CHECK_(false, "CHECK should have thrown");
    } catch (const IOError &e) {
        std::string msg = e.what();
        TEST_CHECK(msg.find("close(-1)") != std::string::npos);
        TEST_CHECK(msg.find("errno `" + std::to_string(EBADF) + "`") != std::string::npos);
        TEST_MSG("message: %s", msg.c_str());
    }
}

TEST_LIST = {
    { "passes result through", passes_result_through },
    { "failure carries errno", failure_carries_errno },
    { 0 }
};
