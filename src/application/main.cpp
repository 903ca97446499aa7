// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"
#include "indicator_json.h"
#include "logging_init.h"
#include "step_indicator.h"

#include <spdlog/spdlog.h>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdio>
#include <stdexcept>

using namespace stepline;

// Loads an indicator, optionally animates it, and prints sampled layouts as JSON
int main(int argc, char** argv) {
    logging::init_early();

    CliArgs args;
    if (!parse_cli_args(argc, argv, args)) {
        print_help(argv[0]);
        return args.show_help ? 0 : 1;
    }

    logging::LogConfig log_config;
    log_config.level = logging::resolve_log_level(args.verbosity, "", false);
    log_config.target = logging::parse_log_target(args.log_dest);
    logging::init(log_config);

    auto config = load_indicator_from_file(args.config_path);
    if (!config) {
        spdlog::dump_backtrace();
        fprintf(stderr, "Error: could not load %s\n", args.config_path.c_str());
        return 1;
    }

    if (args.from) {
        config->current_progress = *args.from;
    }

    LayoutExtent extent;
    extent.primary = args.length;
    extent.cross = args.cross;

    nlohmann::json frames = nlohmann::json::array();
    try {
        StepIndicator indicator(*config);
        if (args.progress) {
            indicator.set_progress(*args.progress);
        }

        uint32_t time_ms = 0;
        for (int frame = 0; frame < args.frames; ++frame) {
            if (frame > 0) {
                indicator.advance(static_cast<uint32_t>(args.frame_ms));
                time_ms += static_cast<uint32_t>(args.frame_ms);
            }
            nlohmann::json entry;
            entry["time_ms"] = time_ms;
            entry["animating"] = indicator.is_animating();
            entry["layout"] = layout_to_json(indicator.layout(extent));
            frames.push_back(entry);
        }
    } catch (const std::invalid_argument& e) {
        spdlog::error("[Main] Rejected configuration: {}", e.what());
        spdlog::dump_backtrace();
        return 1;
    }

    spdlog::info("[Main] Sampled {} frame(s) of {}", args.frames, args.config_path);
    printf("%s\n", frames.dump(2).c_str());
    return 0;
}
