#include "xfreeze.hpp"
#include "exit_codes.hpp"
#include "lib/errors.hpp"
#include "log.hpp"
#include "orchestrator.hpp"
#include <ev++.h>

static void log_exception(const std::exception &e)
{
    logger->error("{}", e.what());
    try {
        std::rethrow_if_nested(e);
    } catch (const std::exception &e) {
        log_exception(e);
    } catch (...) {
        logger->critical("Unknown nested exception");
    }
}

int run_frozen(const DisplayOpener &open_display, const std::vector<std::string> &command)
{
    try {
        std::unique_ptr<DisplayConnection> display = open_display();

        ev::default_loop loop;
        Orchestrator orchestrator(loop, *display);
        return orchestrator.run(command);

    } catch (const DisplayConnectError &e) {
        log_exception(e);
        return EXIT_DISPLAY_CONNECT;
    } catch (const FreezeError &e) {
        log_exception(e);
        return EXIT_FREEZE;
    } catch (const SpawnError &e) {
        log_exception(e);
        return EXIT_SPAWN;
    } catch (const WaitError &e) {
        log_exception(e);
        return EXIT_WAIT;
    } catch (const std::exception &e) {
        log_exception(e);
        return EXIT_INTERNAL;
    }
}
