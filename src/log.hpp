#pragma once

#pragma GCC diagnostic push
// this suppresses the GCC warning about unknown pragma below
#pragma GCC diagnostic ignored "-Wpragmas"
// this suppresses the warning about unknown warning in Clang below, but it's not known for GCC
#pragma GCC diagnostic ignored "-Wunknown-warning-option"
// this pragma is supported in GCC, but not Clang
#pragma GCC diagnostic ignored "-Wsuggest-attribute=const"
#pragma GCC diagnostic ignored "-Weffc++"
#include <spdlog/spdlog.h>
#pragma GCC diagnostic pop

/** Logger for messages about xfreeze itself (display, signals, exit status). */
extern std::shared_ptr<spdlog::logger> logger;
/** Logger for messages about the wrapped child process. */
extern std::shared_ptr<spdlog::logger> logger_process;

/**
 * Sets up the global spdlog loggers stored in `logger` and `logger_process`.
 * Both write to stderr, so they never mix with the child's stdout.
 *
 * @param pattern - logger format string
 * @param load_env_levels - if true, spdlog will load log level from SPDLOG_LEVEL env var
 * @param force_colors - if true, spdlog always uses color escape codes in logs
 */
void initialize_logger(std::string pattern, bool load_env_levels, bool force_colors);

/** Lowers both loggers to debug level; used for `-v`. */
void enable_verbose_logging();
