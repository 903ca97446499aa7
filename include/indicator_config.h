// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include "progress_animator.h"
#include "step_color.h"
#include "step_easing.h"
#include "step_fill.h"
#include "step_gradient.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

/**
 * @file indicator_config.h
 * @brief Caller-supplied configuration of a step progress indicator
 *
 * ## Per-step customization
 *
 * Four optional callbacks customize individual steps. All of them receive the
 * traversal index (0 = first step to fill), not the physical index:
 *
 * - `size_resolver(index, selected)` overrides size / selected_size / unselected_size
 * - `color_resolver(index)` overrides selected_color / unselected_color
 * - `content_factory(index, color, size)` supplies host content drawn in place of the step
 * - `activation_factory(index)` supplies the callback run when the step is tapped
 *
 * Configuring any of them (or a non-zero padding) disables the two-segment
 * fast path, see is_optimizable().
 */

namespace stepline {

enum class Axis {
    HORIZONTAL, ///< Steps laid out along x
    VERTICAL    ///< Steps laid out along y
};

/// Placement of a segment thinner than the cross extent
enum class CrossAlignment { START, CENTER, END };

/**
 * @brief Opaque host content attached to a step
 *
 * The core never inspects content. Hosts derive from this to carry whatever
 * their renderer needs, such as a widget builder or an image handle.
 */
class StepContent {
  public:
    virtual ~StepContent() = default;
};

using SizeResolver = std::function<std::optional<float>(int index, bool selected)>;
using ColorResolver = std::function<std::optional<Color>(int index)>;
using StepContentFactory =
    std::function<std::shared_ptr<StepContent>(int index, const Color& color, float size)>;
using StepActivation = std::function<void()>;
using ActivationFactory = std::function<StepActivation(int index)>;

struct IndicatorConfig {
    int total_steps = 1;
    float current_progress = 0.0f; ///< Filled steps counted from the traversal start

    Axis axis = Axis::HORIZONTAL;
    TraversalDirection direction = TraversalDirection::FORWARD;
    CrossAlignment cross_alignment = CrossAlignment::CENTER;

    float padding = 2.0f; ///< Gap on each side of a step, in primary-axis units

    float size = 4.0f; ///< Cross-axis thickness
    std::optional<float> selected_size;
    std::optional<float> unselected_size;

    Color selected_color = colors::BLUE;
    Color unselected_color = colors::GREY;

    std::optional<Gradient> gradient; ///< Spans the whole indicator
    std::optional<Gradient> selected_gradient;
    std::optional<Gradient> unselected_gradient;

    std::optional<float> corner_radius;

    float fallback_length = 100.0f; ///< Primary length when the container is unbounded

    uint32_t animation_duration_ms = 300;
    EasingCurve animation_curve = EasingCurve::EASE_IN_OUT;
    RestartPolicy restart_policy = RestartPolicy::FROM_PREVIOUS_TARGET;

    SizeResolver size_resolver;
    ColorResolver color_resolver;
    StepContentFactory content_factory;
    ActivationFactory activation_factory;

    /**
     * @brief Check construction-time invariants
     *
     * @throws std::invalid_argument naming the first offending field
     */
    void validate() const;

    /// Cross-axis size of a selected step when no size_resolver is set
    float selected_size_or_default() const {
        return selected_size.value_or(size);
    }
    /// Cross-axis size of an unselected step when no size_resolver is set
    float unselected_size_or_default() const {
        return unselected_size.value_or(size);
    }

    bool has_any_gradient() const {
        return gradient || selected_gradient || unselected_gradient;
    }
};

} // namespace stepline
