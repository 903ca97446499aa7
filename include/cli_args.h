// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file cli_args.h
 * @brief Command-line argument parsing for stepline-layout
 */

#include <optional>
#include <string>

namespace stepline {

/**
 * @brief Parsed command-line arguments
 */
struct CliArgs {
    std::string config_path; ///< Indicator JSON (required)

    std::optional<float> progress;   ///< Target progress (default: current_step from the file)
    std::optional<float> from;       ///< Start of the transition (default: current_step)
    std::optional<float> length;     ///< Primary extent (unset = unbounded)
    std::optional<float> cross;      ///< Cross extent (unset = unbounded)

    int frames = 1;       ///< Number of frames to print
    int frame_ms = 16;    ///< Time between sampled frames

    int verbosity = 0;    ///< -v count
    std::string log_dest; ///< --log-dest value (empty = auto)

    bool show_help = false;
};

/**
 * @brief Parse command-line arguments
 *
 * Errors are printed to stderr.
 *
 * @param argc Argument count
 * @param argv Argument values
 * @param args Output: parsed arguments
 * @return true on success, false on error or when help was requested (args.show_help)
 */
bool parse_cli_args(int argc, char** argv, CliArgs& args);

void print_help(const char* program_name);

} // namespace stepline
