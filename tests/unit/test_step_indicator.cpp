// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "step_indicator.h"

#include <cmath>
#include <limits>
#include <stdexcept>
#include <vector>

#include <catch2/catch_all.hpp>

using namespace stepline;

static IndicatorConfig linear_config(int total_steps, uint32_t duration_ms = 100) {
    IndicatorConfig config;
    config.total_steps = total_steps;
    config.padding = 0.0f;
    config.animation_duration_ms = duration_ms;
    config.animation_curve = EasingCurve::LINEAR;
    return config;
}

// =============================================================================
// Construction and validation
// =============================================================================

TEST_CASE("StepIndicator: rejects invalid configurations", "[step_indicator]") {
    IndicatorConfig config;

    SECTION("total_steps") {
        config.total_steps = 0;
        CHECK_THROWS_AS(StepIndicator(config), std::invalid_argument);
    }
    SECTION("negative progress") {
        config.current_progress = -1.0f;
        CHECK_THROWS_AS(StepIndicator(config), std::invalid_argument);
    }
    SECTION("non-finite progress") {
        config.current_progress = std::numeric_limits<float>::quiet_NaN();
        CHECK_THROWS_AS(StepIndicator(config), std::invalid_argument);
    }
    SECTION("negative padding") {
        config.padding = -2.0f;
        CHECK_THROWS_AS(StepIndicator(config), std::invalid_argument);
    }
    SECTION("negative corner radius") {
        config.corner_radius = -1.0f;
        CHECK_THROWS_AS(StepIndicator(config), std::invalid_argument);
    }
    SECTION("negative size") {
        config.size = -4.0f;
        CHECK_THROWS_AS(StepIndicator(config), std::invalid_argument);
    }
    SECTION("negative selected_size") {
        config.selected_size = -1.0f;
        CHECK_THROWS_AS(StepIndicator(config), std::invalid_argument);
    }
    SECTION("negative unselected_size") {
        config.unselected_size = -1.0f;
        CHECK_THROWS_AS(StepIndicator(config), std::invalid_argument);
    }
    SECTION("zero sizes are allowed") {
        config.size = 0.0f;
        config.selected_size = 0.0f;
        CHECK_NOTHROW(StepIndicator(config));
    }
}

TEST_CASE("StepIndicator: starts at the configured progress", "[step_indicator]") {
    IndicatorConfig config = linear_config(5);
    config.current_progress = 2.0f;
    StepIndicator indicator(config);

    CHECK(indicator.animated_value() == 2.0f);
    CHECK_FALSE(indicator.is_animating());
    CHECK(indicator.is_optimized());
}

TEST_CASE("StepIndicator: rejected update leaves state untouched", "[step_indicator]") {
    StepIndicator indicator(linear_config(5));
    indicator.set_progress(4.0f);
    indicator.advance(50);
    REQUIRE(indicator.animated_value() == Catch::Approx(2.0f));

    IndicatorConfig bad = indicator.config();
    bad.total_steps = -3;
    CHECK_THROWS_AS(indicator.update_config(bad), std::invalid_argument);
    CHECK_THROWS_AS(indicator.set_progress(-1.0f), std::invalid_argument);

    CHECK(indicator.config().total_steps == 5);
    CHECK(indicator.target_value() == 4.0f);
    CHECK(indicator.is_animating());
    CHECK(indicator.animated_value() == Catch::Approx(2.0f));
}

// =============================================================================
// Animation
// =============================================================================

TEST_CASE("StepIndicator: progress changes animate", "[step_indicator][animation]") {
    StepIndicator indicator(linear_config(10));
    indicator.set_progress(10.0f);
    CHECK(indicator.is_animating());
    CHECK(indicator.animated_value() == 0.0f);

    CHECK(indicator.advance(30));
    CHECK(indicator.animated_value() == Catch::Approx(3.0f));

    auto layout = indicator.layout(LayoutExtent{100.0f, std::nullopt});
    CHECK(layout.animated_value == Catch::Approx(3.0f));
    CHECK(layout.segments[0].length_primary == Catch::Approx(30.0f));

    CHECK_FALSE(indicator.advance(70));
    CHECK(indicator.animated_value() == 10.0f);
}

TEST_CASE("StepIndicator: zero duration jumps", "[step_indicator][animation]") {
    StepIndicator indicator(linear_config(10, 0));
    indicator.set_progress(6.0f);
    CHECK_FALSE(indicator.is_animating());
    CHECK(indicator.animated_value() == 6.0f);
}

TEST_CASE("StepIndicator: restart policies", "[step_indicator][animation]") {
    IndicatorConfig config = linear_config(10);

    SECTION("previous target restarts from the old target") {
        StepIndicator indicator(config);
        indicator.set_progress(10.0f);
        indicator.advance(50);
        REQUIRE(indicator.animated_value() == Catch::Approx(5.0f));

        indicator.set_progress(2.0f);
        CHECK(indicator.animated_value() == 10.0f);
        indicator.advance(50);
        CHECK(indicator.animated_value() == Catch::Approx(6.0f));
    }

    SECTION("displayed value restarts from what is on screen") {
        config.restart_policy = RestartPolicy::FROM_DISPLAYED_VALUE;
        StepIndicator indicator(config);
        indicator.set_progress(10.0f);
        indicator.advance(50);

        indicator.set_progress(2.0f);
        CHECK(indicator.animated_value() == Catch::Approx(5.0f));
        indicator.advance(50);
        CHECK(indicator.animated_value() == Catch::Approx(3.5f));
    }
}

TEST_CASE("StepIndicator: duration change applies to the next transition",
          "[step_indicator][animation]") {
    StepIndicator indicator(linear_config(10, 100));
    indicator.set_progress(10.0f);

    IndicatorConfig slower = indicator.config();
    slower.animation_duration_ms = 1000;
    indicator.update_config(slower);

    // Same target: the running transition keeps its timing
    CHECK_FALSE(indicator.advance(100));
    CHECK(indicator.animated_value() == 10.0f);

    indicator.set_progress(0.0f);
    indicator.advance(100);
    CHECK(indicator.animated_value() == Catch::Approx(9.0f));
}

TEST_CASE("StepIndicator: finish_animation shows the target", "[step_indicator][animation]") {
    StepIndicator indicator(linear_config(4));
    indicator.set_progress(3.0f);
    indicator.finish_animation();
    CHECK_FALSE(indicator.is_animating());
    CHECK(indicator.animated_value() == 3.0f);
}

TEST_CASE("StepIndicator: planner follows the configuration", "[step_indicator]") {
    StepIndicator indicator(linear_config(4));
    CHECK(indicator.is_optimized());
    CHECK(indicator.layout(LayoutExtent::unbounded()).segments.size() == 2);

    IndicatorConfig padded = indicator.config();
    padded.padding = 1.0f;
    indicator.update_config(padded);
    CHECK_FALSE(indicator.is_optimized());
    CHECK(indicator.layout(LayoutExtent::unbounded()).segments.size() == 4);
}

// =============================================================================
// Hit testing
// =============================================================================

TEST_CASE("StepIndicator: step_at skips padding gaps", "[step_indicator][hit_test]") {
    IndicatorConfig config;
    config.total_steps = 4;
    config.padding = 5.0f;
    StepIndicator indicator(config);
    auto layout = indicator.layout(LayoutExtent{100.0f, std::nullopt});

    // Steps are 15 long: [5, 20), [30, 45), [55, 70), [80, 95)
    CHECK(StepIndicator::step_at(layout, 10.0f) == std::optional<size_t>(0));
    CHECK(StepIndicator::step_at(layout, 30.0f) == std::optional<size_t>(1));
    CHECK(StepIndicator::step_at(layout, 94.0f) == std::optional<size_t>(3));
    CHECK_FALSE(StepIndicator::step_at(layout, 2.0f));
    CHECK_FALSE(StepIndicator::step_at(layout, 20.0f));
    CHECK_FALSE(StepIndicator::step_at(layout, 25.0f));
    CHECK_FALSE(StepIndicator::step_at(layout, 100.0f));
    CHECK_FALSE(StepIndicator::step_at(layout, -4.0f));
}

TEST_CASE("StepIndicator: activate_at honors the tap target", "[step_indicator][hit_test]") {
    IndicatorConfig config;
    config.total_steps = 3;
    config.padding = 0.0f;

    std::vector<int> activated;
    config.activation_factory = [&activated](int index) {
        return StepActivation([&activated, index] { activated.push_back(index); });
    };

    SECTION("whole segment") {
        StepIndicator indicator(config);
        auto layout = indicator.layout(LayoutExtent{90.0f, std::nullopt});
        CHECK(StepIndicator::activate_at(layout, 45.0f));
        CHECK(StepIndicator::activate_at(layout, 89.0f));
        CHECK(activated == std::vector<int>{1, 2});
    }

    SECTION("content owns the tap target") {
        config.content_factory = [](int, const Color&, float) {
            return std::make_shared<StepContent>();
        };
        StepIndicator indicator(config);
        auto layout = indicator.layout(LayoutExtent{90.0f, std::nullopt});
        CHECK_FALSE(StepIndicator::activate_at(layout, 45.0f));
        CHECK(activated.empty());
    }

    SECTION("reverse traversal reports traversal indices") {
        config.direction = TraversalDirection::REVERSE;
        StepIndicator indicator(config);
        auto layout = indicator.layout(LayoutExtent{90.0f, std::nullopt});
        CHECK(StepIndicator::activate_at(layout, 10.0f));
        CHECK(activated == std::vector<int>{2});
    }

    SECTION("misses fire nothing") {
        StepIndicator indicator(config);
        auto layout = indicator.layout(LayoutExtent{90.0f, std::nullopt});
        CHECK_FALSE(StepIndicator::activate_at(layout, 120.0f));
        CHECK(activated.empty());
    }
}
