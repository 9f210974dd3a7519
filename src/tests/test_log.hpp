#pragma once

#include "log.hpp"

/** acutest may run several tests in one process (--no-exec), initialize only once. */
inline void init_test_logger()
{
    if (!logger) {
        initialize_logger("[%n] [%l] %v", true, false);
    }
}
