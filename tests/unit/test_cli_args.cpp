// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "cli_args.h"

#include <string>
#include <vector>

#include <catch2/catch_all.hpp>

using namespace stepline;

namespace {

/// Owns argv storage for parse_cli_args
struct Argv {
    std::vector<std::string> storage;
    std::vector<char*> ptrs;

    Argv(std::initializer_list<const char*> args) {
        storage.emplace_back("stepline-layout");
        for (const char* a : args) {
            storage.emplace_back(a);
        }
        for (auto& s : storage) {
            ptrs.push_back(&s[0]);
        }
        ptrs.push_back(nullptr);
    }

    int argc() const {
        return static_cast<int>(storage.size());
    }
    char** argv() {
        return ptrs.data();
    }
};

} // namespace

TEST_CASE("CliArgs: config only uses defaults", "[cli_args]") {
    Argv a{"-c", "indicator.json"};
    CliArgs args;
    REQUIRE(parse_cli_args(a.argc(), a.argv(), args));
    CHECK(args.config_path == "indicator.json");
    CHECK_FALSE(args.progress.has_value());
    CHECK_FALSE(args.from.has_value());
    CHECK_FALSE(args.length.has_value());
    CHECK_FALSE(args.cross.has_value());
    CHECK(args.frames == 1);
    CHECK(args.frame_ms == 16);
    CHECK(args.verbosity == 0);
    CHECK(args.log_dest.empty());
}

TEST_CASE("CliArgs: all options", "[cli_args]") {
    Argv a{"--config", "x.json", "-p", "7.5", "--from", "2", "-l", "320", "--cross", "12",
           "-f", "20", "--frame-ms", "33", "-vv", "--log-dest", "file"};
    CliArgs args;
    REQUIRE(parse_cli_args(a.argc(), a.argv(), args));
    CHECK(args.config_path == "x.json");
    CHECK(args.progress == 7.5f);
    CHECK(args.from == 2.0f);
    CHECK(args.length == 320.0f);
    CHECK(args.cross == 12.0f);
    CHECK(args.frames == 20);
    CHECK(args.frame_ms == 33);
    CHECK(args.verbosity == 2);
    CHECK(args.log_dest == "file");
}

TEST_CASE("CliArgs: repeated -v accumulates", "[cli_args]") {
    Argv a{"-c", "x.json", "-v", "-v", "--verbose"};
    CliArgs args;
    REQUIRE(parse_cli_args(a.argc(), a.argv(), args));
    CHECK(args.verbosity == 3);
}

TEST_CASE("CliArgs: help", "[cli_args]") {
    Argv a{"-h"};
    CliArgs args;
    CHECK_FALSE(parse_cli_args(a.argc(), a.argv(), args));
    CHECK(args.show_help);
}

TEST_CASE("CliArgs: errors", "[cli_args]") {
    CliArgs args;

    SECTION("missing config") {
        Argv a{"-p", "3"};
        CHECK_FALSE(parse_cli_args(a.argc(), a.argv(), args));
    }
    SECTION("missing value") {
        Argv a{"-c"};
        CHECK_FALSE(parse_cli_args(a.argc(), a.argv(), args));
    }
    SECTION("non-numeric progress") {
        Argv a{"-c", "x.json", "-p", "half"};
        CHECK_FALSE(parse_cli_args(a.argc(), a.argv(), args));
    }
    SECTION("frames out of range") {
        Argv a{"-c", "x.json", "-f", "0"};
        CHECK_FALSE(parse_cli_args(a.argc(), a.argv(), args));
    }
    SECTION("unknown argument") {
        Argv a{"-c", "x.json", "--bogus"};
        CHECK_FALSE(parse_cli_args(a.argc(), a.argv(), args));
    }
    SECTION("bad verbosity flag") {
        Argv a{"-c", "x.json", "-vx"};
        CHECK_FALSE(parse_cli_args(a.argc(), a.argv(), args));
    }
    CHECK_FALSE(args.show_help);
}
