// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "step_style.h"

#include <optional>

#include <catch2/catch_all.hpp>

using namespace stepline;

static const Color RED(255, 0, 0);
static const Color BLUE(0, 0, 255);
static const Color ORANGE(255, 128, 0);

// =============================================================================
// Only-step detection and corners
// =============================================================================

TEST_CASE("StepStyle: a single step is always the only step", "[step_style][corners]") {
    CHECK(is_only_step(1, 0.0f, 0.0f));
    CHECK(is_only_step(1, 8.0f, 0.7f));
    CHECK(is_only_step(1, 2.0f, 1.0f));
}

TEST_CASE("StepStyle: two gapless steps merge while progress rounds to 0",
          "[step_style][corners]") {
    CHECK(is_only_step(2, 0.0f, 0.0f));
    CHECK(is_only_step(2, 0.0f, 0.4f));
    CHECK_FALSE(is_only_step(2, 0.0f, 0.6f));
    CHECK_FALSE(is_only_step(2, 1.0f, 0.0f));
    CHECK_FALSE(is_only_step(3, 0.0f, 0.0f));
}

TEST_CASE("StepStyle: corner_mask_for", "[step_style][corners]") {
    CHECK(corner_mask_for(false, true, true, true) == CORNER_NONE);
    CHECK(corner_mask_for(true, false, false, true) == CORNER_ALL);
    CHECK(corner_mask_for(true, true, false, false) == CORNER_LEADING);
    CHECK(corner_mask_for(true, false, true, false) == CORNER_TRAILING);
    CHECK(corner_mask_for(true, false, false, false) == CORNER_NONE);
}

TEST_CASE("StepStyle: corner_radii per axis", "[step_style][corners]") {
    SECTION("horizontal leading is the left edge") {
        auto r = corner_radii(CORNER_LEADING, Axis::HORIZONTAL, 4.0f);
        CHECK(r.top_left == 4.0f);
        CHECK(r.bottom_left == 4.0f);
        CHECK(r.top_right == 0.0f);
        CHECK(r.bottom_right == 0.0f);
    }

    SECTION("vertical leading is the top edge") {
        auto r = corner_radii(CORNER_LEADING, Axis::VERTICAL, 4.0f);
        CHECK(r.top_left == 4.0f);
        CHECK(r.top_right == 4.0f);
        CHECK(r.bottom_left == 0.0f);
        CHECK(r.bottom_right == 0.0f);
    }

    SECTION("all corners") {
        auto r = corner_radii(CORNER_ALL, Axis::VERTICAL, 3.0f);
        CHECK(r.top_left == 3.0f);
        CHECK(r.top_right == 3.0f);
        CHECK(r.bottom_left == 3.0f);
        CHECK(r.bottom_right == 3.0f);
    }
}

// =============================================================================
// Sizes
// =============================================================================

TEST_CASE("StepStyle: size falls back from selected/unselected to base", "[step_style][size]") {
    IndicatorConfig config;
    config.size = 4.0f;
    CHECK(resolve_step_size(config, 0, true) == 4.0f);

    config.selected_size = 6.0f;
    CHECK(resolve_step_size(config, 0, true) == 6.0f);
    CHECK(resolve_step_size(config, 0, false) == 4.0f);
}

TEST_CASE("StepStyle: size resolver overrides the triplet", "[step_style][size]") {
    IndicatorConfig config;
    config.total_steps = 4;
    config.selected_size = 6.0f;
    config.unselected_size = 2.0f;
    config.size_resolver = [](int index, bool selected) -> std::optional<float> {
        if (index == 2)
            return selected ? 12.0f : 9.0f;
        return std::nullopt;
    };

    CHECK(resolve_step_size(config, 2, true) == 12.0f);
    CHECK(resolve_step_size(config, 2, false) == 9.0f);
    CHECK(resolve_step_size(config, 1, true) == 6.0f);
    CHECK(max_defined_size(config) == 12.0f);
}

TEST_CASE("StepStyle: max_defined_size without a resolver", "[step_style][size]") {
    IndicatorConfig config;
    config.size = 4.0f;
    CHECK(max_defined_size(config) == 4.0f);
    config.unselected_size = 7.0f;
    CHECK(max_defined_size(config) == 7.0f);
}

// =============================================================================
// Paint precedence
// =============================================================================

TEST_CASE("StepStyle: flat colors gated by selection", "[step_style][paint]") {
    IndicatorConfig config;
    CHECK(resolve_flat_color(config, 0, true) == colors::BLUE);
    CHECK(resolve_flat_color(config, 0, false) == colors::GREY);

    config.color_resolver = [](int index) -> std::optional<Color> {
        if (index == 1)
            return ORANGE;
        return std::nullopt;
    };
    CHECK(resolve_flat_color(config, 1, false) == ORANGE);
    CHECK(resolve_flat_color(config, 0, false) == colors::GREY);
}

TEST_CASE("StepStyle: gradients win over the color resolver", "[step_style][paint]") {
    IndicatorConfig config;
    config.color_resolver = [](int) -> std::optional<Color> { return ORANGE; };
    config.gradient = Gradient({{RED, 0.0f}, {BLUE, 1.0f}});

    PaintSpan span{0.0f, 0.5f, 0.0f, 1.0f};
    StepPaint paint = resolve_paint(config, 0, true, span);
    REQUIRE(paint.has_gradient());
    CHECK(paint.gradient->first_color() == RED);
    CHECK(paint.gradient->last_color() == config.gradient->sample_at(0.5f));
    CHECK(paint.color == paint.gradient->sample_at(0.5f));
}

TEST_CASE("StepStyle: bucket gradient beats the global gradient", "[step_style][paint]") {
    IndicatorConfig config;
    config.gradient = Gradient({{RED, 0.0f}, {BLUE, 1.0f}});
    config.selected_gradient = Gradient({{ORANGE, 0.0f}, {BLUE, 1.0f}});

    PaintSpan span{0.0f, 0.25f, 0.0f, 1.0f};

    StepPaint selected = resolve_paint(config, 0, true, span);
    REQUIRE(selected.has_gradient());
    CHECK(selected.gradient->first_color() == ORANGE);
    CHECK(selected.gradient->last_color() == BLUE);

    // No unselected gradient: the global one covers that bucket
    StepPaint unselected = resolve_paint(config, 0, false, span);
    REQUIRE(unselected.has_gradient());
    CHECK(unselected.gradient->first_color() == RED);
}

TEST_CASE("StepStyle: flat paint without gradients", "[step_style][paint]") {
    IndicatorConfig config;
    StepPaint paint = resolve_paint(config, 3, false, PaintSpan{});
    CHECK_FALSE(paint.has_gradient());
    CHECK(paint.color == colors::GREY);
}

TEST_CASE("StepStyle: bucket_span", "[step_style][paint]") {
    float start = -1.0f;
    float end = -1.0f;

    bucket_span(4.0f, 1.0f, 2.0f, TraversalDirection::FORWARD, start, end);
    CHECK(start == 0.25f);
    CHECK(end == 0.5f);

    bucket_span(4.0f, 1.0f, 2.0f, TraversalDirection::REVERSE, start, end);
    CHECK(start == 0.5f);
    CHECK(end == 0.25f);

    bucket_span(0.0f, 1.0f, 2.0f, TraversalDirection::FORWARD, start, end);
    CHECK(start == 0.0f);
    CHECK(end == 0.0f);

    bucket_span(2.0f, -1.0f, 3.0f, TraversalDirection::FORWARD, start, end);
    CHECK(start == 0.0f);
    CHECK(end == 1.0f);
}
