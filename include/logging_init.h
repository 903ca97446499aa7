// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <spdlog/spdlog.h>

#include <string>

/**
 * @file logging_init.h
 * @brief spdlog setup shared by the stepline-layout tool and LVGL hosts
 *
 * Components never create loggers of their own. They log through the spdlog
 * default logger with a "[Component]" prefix; this module decides where those
 * lines end up.
 */

namespace stepline {
namespace logging {

/// Where log lines go besides the console
enum class LogTarget {
    Auto,    ///< syslog on Linux, console elsewhere
    Journal, ///< Routed through syslog; journald collects it
    Syslog,
    File,    ///< Rotating file, 5 MB x 3
    Console  ///< No system sink
};

struct LogConfig {
    spdlog::level::level_enum level = spdlog::level::warn;
    bool enable_console = true; ///< Colored stderr sink
    LogTarget target = LogTarget::Auto;
    std::string file_path;      ///< File target path, empty = $XDG_DATA_HOME/stepline/stepline.log
};

/**
 * @brief Install a stderr logger at WARN so early failures are visible
 *
 * Call first thing in main(). Calling it twice throws spdlog_ex (the logger
 * name is registered).
 */
void init_early();

/**
 * @brief Replace the default logger with console + @p config.target sinks
 *
 * Also enables a 32 message backtrace, dumped with spdlog::dump_backtrace()
 * when a configuration is rejected.
 */
void init(const LogConfig& config);

// ============================================================================
// Parsing helpers
// ============================================================================

/// "auto", "journal", "syslog", "file" or "console"; anything else is Auto
LogTarget parse_log_target(const std::string& str);

const char* log_target_name(LogTarget target);

/**
 * @brief spdlog level from its name ("warning" is accepted for warn)
 * @return @p default_level for empty or unknown names
 */
spdlog::level::level_enum
parse_level(const std::string& str, spdlog::level::level_enum default_level = spdlog::level::warn);

/// -v count: 0 warn, 1 info, 2 debug, 3+ trace
spdlog::level::level_enum verbosity_to_level(int verbosity);

/**
 * @brief Pick the effective level
 *
 * A non-zero @p cli_verbosity wins, then @p config_level_str, then the default
 * (debug in test mode, warn otherwise).
 */
spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level_str,
                                            bool test_mode);

} // namespace logging
} // namespace stepline
