#pragma once

#include "display.hpp"
#include "lib/errors.hpp"
#include <functional>
#include <string>
#include <vector>

/** DisplayConnection which only records what was requested from it. */
class FakeDisplay : public DisplayConnection
{
public:
    std::vector<std::string> calls{};
    bool frozen = false;
    bool fail_suspend = false;
    bool fail_resume = false;
    /** Invoked from suspend()/resume(), before they change `frozen`. */
    std::function<void()> on_suspend = nullptr;
    std::function<void()> on_resume = nullptr;

    void suspend() override
    {
        calls.emplace_back("suspend");
        if (on_suspend) on_suspend();
        if (fail_suspend) throw FreezeError("fake server refused to freeze");
        frozen = true;
    }

    void resume() override
    {
        calls.emplace_back("resume");
        if (on_resume) on_resume();
        if (fail_resume) throw ReleaseError("fake server refused to resume");
        frozen = false;
    }

    [[nodiscard]] long count(const std::string &call) const
    {
        long n = 0;
        for (const auto &c : calls) {
            if (c == call) n++;
        }
        return n;
    }
};

/** Forwards to a display owned by the test, for APIs that take ownership. */
class BorrowedDisplay : public DisplayConnection
{
public:
    explicit BorrowedDisplay(DisplayConnection &display)
        : display(display)
    {}

    void suspend() override { display.suspend(); }
    void resume() override { display.resume(); }

private:
    DisplayConnection &display;
};
