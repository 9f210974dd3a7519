/**
 * Version of `assert` that throws runtime_error instead.
 *
 * An abort would kill xfreeze with the screen still covered by the frozen
 * frame; throwing unwinds the stack, which runs the FreezeGuard destructor.
 */
#pragma once
#include "log.hpp"
#include <stdexcept>

class assertion_error : public std::runtime_error
{
public:
    explicit assertion_error(const std::string &expression,
                             const std::string &src_file,
                             size_t src_line,
                             const std::string &fn_name)
        : std::runtime_error("Assertion failed: `" + expression + "`")
    {
        logger->critical("Assertion failed: `{}`", expression);
        logger->critical("    at {}:{} ({})", src_file, src_line, fn_name);
        logger->critical("Releasing the display and exiting...");
    }
};

#ifdef DEBUG
#define ASSERT(expr)                                                                               \
    (static_cast<bool>(expr)                                                                       \
       ? void(0)                                                                                   \
       : throw assertion_error(#expr, __FILE__, __LINE__, __PRETTY_FUNCTION__))
#define IF_DEBUG(yes, no) (yes)
#else
// type-check the assert expressions even in release mode, but don't run them
#define ASSERT(expr) void(true || ((void)(expr), false))
#define IF_DEBUG(yes, no) (no)
#endif
