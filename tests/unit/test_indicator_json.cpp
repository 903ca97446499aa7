// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "indicator_json.h"
#include "step_indicator.h"

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>

#include <catch2/catch_all.hpp>

using namespace stepline;

// =============================================================================
// Parsing
// =============================================================================

TEST_CASE("IndicatorJson: full document", "[indicator_json]") {
    const char* doc = R"({
        "total_steps": 6,
        "current_step": 2.5,
        "axis": "vertical",
        "direction": "rtl",
        "cross_alignment": "end",
        "padding": 1.5,
        "size": 3,
        "selected_size": 8,
        "unselected_size": 2,
        "selected_color": "#ff0000",
        "unselected_color": "#00ff0080",
        "selected_gradient": { "colors": ["#000000", "#ffffff"], "stops": [0.0, 1.0] },
        "gradient": { "colors": ["#ff0000", "#00ff00", "#0000ff"] },
        "corner_radius": 4,
        "fallback_length": 240,
        "animation": { "duration_ms": 500, "curve": "bounce_out", "restart": "displayed_value" }
    })";

    auto config = parse_indicator_json(doc, "test");
    REQUIRE(config.has_value());
    CHECK(config->total_steps == 6);
    CHECK(config->current_progress == 2.5f);
    CHECK(config->axis == Axis::VERTICAL);
    CHECK(config->direction == TraversalDirection::REVERSE);
    CHECK(config->cross_alignment == CrossAlignment::END);
    CHECK(config->padding == 1.5f);
    CHECK(config->size == 3.0f);
    CHECK(config->selected_size == 8.0f);
    CHECK(config->unselected_size == 2.0f);
    CHECK(config->selected_color == Color(255, 0, 0));
    CHECK(config->unselected_color == Color(0, 255, 0, 0x80));
    REQUIRE(config->selected_gradient.has_value());
    CHECK(config->selected_gradient->last_color() == Color(255, 255, 255));
    REQUIRE(config->gradient.has_value());
    CHECK(config->gradient->stops().size() == 3);
    CHECK(config->corner_radius == 4.0f);
    CHECK(config->fallback_length == 240.0f);
    CHECK(config->animation_duration_ms == 500);
    CHECK(config->animation_curve == EasingCurve::BOUNCE_OUT);
    CHECK(config->restart_policy == RestartPolicy::FROM_DISPLAYED_VALUE);
}

TEST_CASE("IndicatorJson: missing keys keep defaults", "[indicator_json]") {
    auto config = parse_indicator_json(R"({"total_steps": 3})", "minimal");
    REQUIRE(config.has_value());
    CHECK(config->current_progress == 0.0f);
    CHECK(config->axis == Axis::HORIZONTAL);
    CHECK(config->direction == TraversalDirection::FORWARD);
    CHECK(config->padding == 2.0f);
    CHECK(config->size == 4.0f);
    CHECK(config->selected_color == colors::BLUE);
    CHECK(config->unselected_color == colors::GREY);
    CHECK_FALSE(config->corner_radius.has_value());
    CHECK_FALSE(config->has_any_gradient());
    CHECK(config->animation_duration_ms == 300);
    CHECK(config->animation_curve == EasingCurve::EASE_IN_OUT);
    CHECK(config->restart_policy == RestartPolicy::FROM_PREVIOUS_TARGET);
}

TEST_CASE("IndicatorJson: malformed colors fall back", "[indicator_json]") {
    auto config = parse_indicator_json(R"({"total_steps": 3, "selected_color": "blue"})", "t");
    REQUIRE(config.has_value());
    CHECK(config->selected_color == colors::BLUE);
}

TEST_CASE("IndicatorJson: invalid documents are rejected", "[indicator_json]") {
    CHECK_FALSE(parse_indicator_json("", "empty").has_value());
    CHECK_FALSE(parse_indicator_json("{ not json", "broken").has_value());
    CHECK_FALSE(parse_indicator_json(R"({"padding": 0})", "no steps").has_value());
    CHECK_FALSE(parse_indicator_json(R"({"total_steps": 0})", "zero").has_value());
    CHECK_FALSE(parse_indicator_json(R"({"total_steps": "four"})", "type").has_value());
    CHECK_FALSE(
        parse_indicator_json(R"({"total_steps": 2, "current_step": -1})", "negative").has_value());
    CHECK_FALSE(
        parse_indicator_json(R"({"total_steps": 2, "padding": -0.5})", "padding").has_value());

    SECTION("negative duration does not wrap") {
        CHECK_FALSE(parse_indicator_json(R"({"total_steps": 4, "animation": {"duration_ms": -5}})",
                                         "negative duration")
                        .has_value());
        CHECK_FALSE(parse_indicator_json(
                        R"({"total_steps": 4, "animation": {"duration_ms": 4294967296}})",
                        "huge duration")
                        .has_value());

        auto config = parse_indicator_json(
            R"({"total_steps": 4, "animation": {"duration_ms": 4294967295}})", "max duration");
        REQUIRE(config.has_value());
        CHECK(config->animation_duration_ms == UINT32_MAX);
    }

    SECTION("negative sizes") {
        CHECK_FALSE(
            parse_indicator_json(R"({"total_steps": 2, "size": -1})", "size").has_value());
        CHECK_FALSE(parse_indicator_json(R"({"total_steps": 2, "selected_size": -3})", "selected")
                        .has_value());
        CHECK_FALSE(
            parse_indicator_json(R"({"total_steps": 2, "unselected_size": -0.5})", "unselected")
                .has_value());
    }
}

TEST_CASE("IndicatorJson: malformed gradients are rejected", "[indicator_json]") {
    SECTION("single color") {
        CHECK_FALSE(parse_indicator_json(
                        R"({"total_steps": 2, "gradient": {"colors": ["#ff0000"]}})", "g")
                        .has_value());
    }
    SECTION("stops out of order") {
        CHECK_FALSE(parse_indicator_json(R"({"total_steps": 2, "gradient":
                        {"colors": ["#ff0000", "#00ff00", "#0000ff"], "stops": [0, 0.7, 0.3]}})",
                                         "g")
                        .has_value());
    }
    SECTION("stop count mismatch") {
        CHECK_FALSE(parse_indicator_json(R"({"total_steps": 2, "gradient":
                        {"colors": ["#ff0000", "#0000ff"], "stops": [0, 0.5, 1]}})",
                                         "g")
                        .has_value());
    }
    SECTION("bad color") {
        CHECK_FALSE(parse_indicator_json(
                        R"({"total_steps": 2, "gradient": {"colors": ["#ff0000", "nope"]}})", "g")
                        .has_value());
    }
}

// =============================================================================
// Files
// =============================================================================

TEST_CASE("IndicatorJson: save then load preserves the configuration", "[indicator_json]") {
    IndicatorConfig config;
    config.total_steps = 7;
    config.current_progress = 3.0f;
    config.direction = TraversalDirection::REVERSE;
    config.padding = 0.0f;
    config.selected_size = 6.0f;
    config.corner_radius = 2.0f;
    config.gradient = Gradient({{Color(255, 0, 0), 0.0f},
                                {Color(0, 255, 0), 0.25f},
                                {Color(0, 0, 255), 1.0f}});
    config.animation_curve = EasingCurve::OVERSHOOT;

    auto path = (std::filesystem::temp_directory_path() / "stepline_test_indicator.json").string();
    REQUIRE(save_indicator_to_file(config, path));

    auto loaded = load_indicator_from_file(path);
    std::remove(path.c_str());

    REQUIRE(loaded.has_value());
    CHECK(loaded->total_steps == 7);
    CHECK(loaded->current_progress == 3.0f);
    CHECK(loaded->direction == TraversalDirection::REVERSE);
    CHECK(loaded->padding == 0.0f);
    CHECK(loaded->selected_size == 6.0f);
    CHECK(loaded->corner_radius == 2.0f);
    REQUIRE(loaded->gradient.has_value());
    CHECK(*loaded->gradient == *config.gradient);
    CHECK(loaded->animation_curve == EasingCurve::OVERSHOOT);
}

TEST_CASE("IndicatorJson: missing file", "[indicator_json]") {
    CHECK_FALSE(load_indicator_from_file("/nonexistent/stepline/indicator.json").has_value());
}

// =============================================================================
// Layout export
// =============================================================================

TEST_CASE("IndicatorJson: layout_to_json", "[indicator_json]") {
    IndicatorConfig config;
    config.total_steps = 10;
    config.current_progress = 3.0f;
    config.padding = 0.0f;
    StepIndicator indicator(config);

    auto json = layout_to_json(indicator.layout(LayoutExtent{100.0f, std::nullopt}));
    CHECK(json["optimized"] == true);
    CHECK(json["total_length"] == 100.0f);
    REQUIRE(json["segments"].size() == 2);
    CHECK(json["segments"][0]["length_primary"].get<float>() == Catch::Approx(30.0f));
    CHECK(json["segments"][0]["color"] == "#2196f3");
    CHECK(json["segments"][1]["color"] == "#9e9e9e");
    CHECK(json["segments"][1]["activatable"] == false);
}
