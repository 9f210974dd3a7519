#include "exit_codes.hpp"
#include "lib/assert.hpp"
#include "log.hpp"
#include "version.h"
#include "x11_display.hpp"
#include "xfreeze.hpp"
#include <iostream>
#include <optional>
#include <unistd.h>

using namespace std;

static void print_help()
{
    // clang-format off
    cout << "Usage: xfreeze [OPTIONS] [--] <COMMAND> [ARGS...]\n"
            "Freezes the screen, runs COMMAND and unfreezes the screen once COMMAND exits.\n"
            "  [-c]              show the mouse cursor in the frozen image (requires XFixes)\n"
            "  [-d <DISPLAY>]    X display to freeze, default is $DISPLAY\n"
            "  [-v]              verbose output\n"
            "  [-V]              print xfreeze version and exit\n"
            "  [-h]              print this message\n"
            "SIGINT, SIGTERM and SIGHUP are forwarded to COMMAND. SIGINT is not forwarded\n"
            "when xfreeze runs in the foreground of a terminal, as Ctrl-C already reaches COMMAND.\n"
            "Exit status is the exit status of COMMAND, 128+N if it was killed by signal N, or:\n"
            "  " << EXIT_USAGE << "    invalid arguments\n"
            "  " << EXIT_DISPLAY_CONNECT << "  cannot connect to the display\n"
            "  " << EXIT_FREEZE << "  cannot freeze the display\n"
            "  " << EXIT_WAIT << "  waiting for COMMAND failed\n"
            "  " << EXIT_INTERNAL << "  other xfreeze error\n"
            "  " << EXIT_SPAWN << "  COMMAND could not be executed\n"
            "To control logger output, use the following environment variables:\n"
            "  SPDLOG_LEVEL=<level> (see https://spdlog.docsforge.com/v1.x/api/spdlog/cfg/helpers/load_levels/)\n"
            "    2 loggers are defined: 'main' and 'process'\n"
            "  XFREEZE_PLAIN_LOG flag - if present, logs will not contain colors and time\n"
            "  XFREEZE_FORCE_COLOR_LOG flag - if present, logs are always colored\n";
    // clang-format on
}

int main(int argc, char *argv[])
{
    int opt;
    bool show_cursor = false;
    bool verbose = false;
    optional<string> display_name{};

    // '+' stops at the first non-option, options of COMMAND are not ours
    while ((opt = getopt(argc, argv, "+cd:vhV")) != -1) {
        switch (opt) {
            case 'c': // blend cursor into the frozen image
                show_cursor = true;
                break;
            case 'd': // X display name
                display_name = optarg;
                break;
            case 'v':
                verbose = true;
                break;
            case 'V':
                cout << "xfreeze version " << XFREEZE_VERSION << " ("
                     << IF_DEBUG("debug", "release") << ")" << endl;
                return 0;
            case 'h':
                print_help();
                return 0;
            default:
                print_help();
                return EXIT_USAGE;
        }
    }

    if (optind >= argc) {
        cerr << "xfreeze: missing COMMAND\n";
        print_help();
        return EXIT_USAGE;
    }
    vector<string> command(argv + optind, argv + argc);

    // logs go to stderr, stdout belongs to COMMAND
    initialize_logger(getenv("XFREEZE_PLAIN_LOG") ? "xfreeze: [%l] %v"
                                                  : "xfreeze: %H:%M:%S.%e [%^%l%$] %v",
                      true,
                      getenv("XFREEZE_FORCE_COLOR_LOG") != nullptr);
    if (verbose) {
        enable_verbose_logging();
    }

    return run_frozen([&] { return XDisplay::connect(display_name, show_cursor); }, command);
}
