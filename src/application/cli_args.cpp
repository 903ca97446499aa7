// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <cstring>

namespace stepline {

// Helper to parse integer with validation
static bool parse_int(const char* str, long min_val, long max_val, int& out, const char* name) {
    char* endptr;
    long val = strtol(str, &endptr, 10);
    if (*str == '\0' || *endptr != '\0' || val < min_val || val > max_val) {
        fprintf(stderr, "Error: invalid %s (must be %ld-%ld): %s\n", name, min_val, max_val, str);
        return false;
    }
    out = static_cast<int>(val);
    return true;
}

// Helper to parse a finite float
static bool parse_float(const char* str, std::optional<float>& out, const char* name) {
    char* endptr;
    float val = strtof(str, &endptr);
    if (*str == '\0' || *endptr != '\0' || !std::isfinite(val)) {
        fprintf(stderr, "Error: %s requires a numeric value\n", name);
        return false;
    }
    out = val;
    return true;
}

static bool has_value(int i, int argc, const char* name) {
    if (i + 1 >= argc) {
        fprintf(stderr, "Error: %s requires an argument\n", name);
        return false;
    }
    return true;
}

void print_help(const char* program_name) {
    printf("Usage: %s -c <file> [options]\n", program_name);
    printf("Options:\n");
    printf("  -c, --config <file>  Indicator JSON configuration\n");
    printf("  -p, --progress <n>   Target progress (default: current_step from the file)\n");
    printf("  --from <n>           Start the transition from this value\n");
    printf("  -l, --length <px>    Primary extent (default: unbounded, uses fallback_length)\n");
    printf("  --cross <px>         Cross extent (default: unbounded, uses largest size)\n");
    printf("  -f, --frames <n>     Number of frames to sample (1-10000, default: 1)\n");
    printf("  --frame-ms <ms>      Time between frames (0-10000, default: 16)\n");
    printf("  -v, --verbose        Increase verbosity (-v=info, -vv=debug, -vvv=trace)\n");
    printf("  --log-dest <dest>    Log destination: auto, journal, syslog, file, console\n"
           "                       (default: auto)\n");
    printf("  -h, --help           Show this help message\n");
}

bool parse_cli_args(int argc, char** argv, CliArgs& args) {
    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "-c") == 0 || strcmp(argv[i], "--config") == 0) {
            if (!has_value(i, argc, "-c/--config"))
                return false;
            args.config_path = argv[++i];
        } else if (strcmp(argv[i], "-p") == 0 || strcmp(argv[i], "--progress") == 0) {
            if (!has_value(i, argc, "-p/--progress") ||
                !parse_float(argv[++i], args.progress, "--progress"))
                return false;
        } else if (strcmp(argv[i], "--from") == 0) {
            if (!has_value(i, argc, "--from") || !parse_float(argv[++i], args.from, "--from"))
                return false;
        } else if (strcmp(argv[i], "-l") == 0 || strcmp(argv[i], "--length") == 0) {
            if (!has_value(i, argc, "-l/--length") ||
                !parse_float(argv[++i], args.length, "--length"))
                return false;
        } else if (strcmp(argv[i], "--cross") == 0) {
            if (!has_value(i, argc, "--cross") || !parse_float(argv[++i], args.cross, "--cross"))
                return false;
        } else if (strcmp(argv[i], "-f") == 0 || strcmp(argv[i], "--frames") == 0) {
            if (!has_value(i, argc, "-f/--frames") ||
                !parse_int(argv[++i], 1, 10000, args.frames, "frame count"))
                return false;
        } else if (strcmp(argv[i], "--frame-ms") == 0) {
            if (!has_value(i, argc, "--frame-ms") ||
                !parse_int(argv[++i], 0, 10000, args.frame_ms, "frame interval"))
                return false;
        } else if (strcmp(argv[i], "--log-dest") == 0) {
            if (!has_value(i, argc, "--log-dest"))
                return false;
            args.log_dest = argv[++i];
        } else if (strcmp(argv[i], "-h") == 0 || strcmp(argv[i], "--help") == 0) {
            args.show_help = true;
            return false;
        } else if (strcmp(argv[i], "--verbose") == 0) {
            args.verbosity++;
        } else if (argv[i][0] == '-' && argv[i][1] == 'v') {
            // -v, -vv, -vvv
            const char* p = argv[i] + 1;
            while (*p == 'v') {
                args.verbosity++;
                p++;
            }
            if (*p != '\0') {
                fprintf(stderr, "Error: Unknown argument: %s\n", argv[i]);
                return false;
            }
        } else {
            fprintf(stderr, "Error: Unknown argument: %s\n", argv[i]);
            return false;
        }
    }

    if (args.config_path.empty()) {
        fprintf(stderr, "Error: -c/--config is required\n");
        return false;
    }
    return true;
}

} // namespace stepline
