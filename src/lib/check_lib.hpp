#pragma once

#include "lib/errors.hpp"
#include <cerrno>
#include <string>

/// Throw IOError with function name and stringified expr as
/// error message if expr evaluates to -1
#define CHECK(expr)                                                                                \
    ({                                                                                             \
        auto ret = (expr);                                                                         \
        if (ret == -1) {                                                                           \
            int err = errno;                                                                       \
            throw IOError(err, std::string(__PRETTY_FUNCTION__) + ": " #expr);                     \
        }                                                                                          \
        ret;                                                                                       \
    })
