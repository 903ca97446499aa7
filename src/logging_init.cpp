// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "logging_init.h"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <filesystem>
#include <memory>
#include <vector>

#ifdef __linux__
#include <spdlog/sinks/syslog_sink.h>
#include <syslog.h>
#endif

namespace stepline {
namespace logging {

namespace {

struct TargetName {
    LogTarget target;
    const char* name;
};

constexpr TargetName TARGET_NAMES[] = {
    {LogTarget::Auto, "auto"},     {LogTarget::Journal, "journal"}, {LogTarget::Syslog, "syslog"},
    {LogTarget::File, "file"},     {LogTarget::Console, "console"},
};

/// Get XDG_DATA_HOME or default ~/.local/share
std::string get_xdg_data_home() {
    const char* xdg = std::getenv("XDG_DATA_HOME");
    if (xdg && xdg[0] != '\0') {
        return xdg;
    }

    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') {
        return std::string(home) + "/.local/share";
    }

    return "/tmp"; // Last resort fallback
}

std::string resolve_log_file_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    std::string user_dir = get_xdg_data_home() + "/stepline";
    std::error_code ec;
    std::filesystem::create_directories(user_dir, ec);

    return user_dir + "/stepline.log";
}

LogTarget detect_best_target() {
#ifdef __linux__
    return LogTarget::Syslog;
#else
    return LogTarget::Console;
#endif
}

void add_system_sink(std::vector<spdlog::sink_ptr>& sinks, LogTarget target,
                     const std::string& file_path) {
    switch (target) {
#ifdef __linux__
    case LogTarget::Journal:
    case LogTarget::Syslog:
        // No systemd sink in this build; the journal picks up syslog anyway
        sinks.push_back(
            std::make_shared<spdlog::sinks::syslog_sink_mt>("stepline", LOG_PID, LOG_USER, false));
        break;
#endif
    case LogTarget::File: {
        std::string path = resolve_log_file_path(file_path);
        // 5MB max size, 3 rotated files
        sinks.push_back(
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(path, 5 * 1024 * 1024, 3));
        break;
    }
    default:
        break;
    }
}

} // namespace

void init_early() {
    auto logger = spdlog::stderr_color_mt("stepline_early");
    logger->set_level(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

void init(const LogConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;

    // CLI output goes to stdout, so keep log lines on stderr
    if (config.enable_console) {
        sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    }

    LogTarget effective_target =
        (config.target == LogTarget::Auto) ? detect_best_target() : config.target;
    add_system_sink(sinks, effective_target, config.file_path);

    auto logger = std::make_shared<spdlog::logger>("stepline", sinks.begin(), sinks.end());
    logger->set_level(config.level);
    spdlog::set_default_logger(logger);

    // Recent messages are dumped on fatal configuration errors
    spdlog::enable_backtrace(32);

    spdlog::debug("[Logging] Initialized: target={}, console={}, backtrace=32 messages",
                  log_target_name(effective_target), config.enable_console ? "yes" : "no");
}

LogTarget parse_log_target(const std::string& str) {
    for (const auto& entry : TARGET_NAMES) {
        if (str == entry.name) {
            return entry.target;
        }
    }
    return LogTarget::Auto;
}

const char* log_target_name(LogTarget target) {
    for (const auto& entry : TARGET_NAMES) {
        if (entry.target == target) {
            return entry.name;
        }
    }
    return "unknown";
}

spdlog::level::level_enum parse_level(const std::string& str,
                                      spdlog::level::level_enum default_level) {
    if (str.empty()) {
        return default_level;
    }
    // from_str() maps unknown names to off, so only trust off when asked for
    auto level = spdlog::level::from_str(str);
    if (level == spdlog::level::off && str != "off") {
        return default_level;
    }
    return level;
}

spdlog::level::level_enum verbosity_to_level(int verbosity) {
    switch (verbosity) {
    case 0:
        return spdlog::level::warn;
    case 1:
        return spdlog::level::info;
    case 2:
        return spdlog::level::debug;
    default:
        return verbosity < 0 ? spdlog::level::warn : spdlog::level::trace;
    }
}

spdlog::level::level_enum resolve_log_level(int cli_verbosity, const std::string& config_level_str,
                                            bool test_mode) {
    if (cli_verbosity > 0) {
        return verbosity_to_level(cli_verbosity);
    }
    spdlog::level::level_enum fallback = test_mode ? spdlog::level::debug : spdlog::level::warn;
    return parse_level(config_level_str, fallback);
}

} // namespace logging
} // namespace stepline
