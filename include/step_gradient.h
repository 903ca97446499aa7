// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include "step_color.h"

#include <vector>

namespace stepline {

struct GradientStop {
    Color color;
    float position = 0.0f; ///< 0.0 - 1.0 along the gradient axis

    bool operator==(const GradientStop& o) const {
        return color == o.color && position == o.position;
    }
};

/**
 * @brief Ordered linear color ramp
 *
 * A Gradient always holds at least two stops, strictly increasing, starting at
 * 0.0 and ending at 1.0. The constructor enforces this, so sampling code never
 * has to handle a malformed ramp.
 *
 * Gradients are renderer-agnostic. Segment paints carry two-stop sub-gradients
 * produced by sub_gradient(), so any backend that can fill a rectangle with a
 * two-stop linear gradient can reproduce one continuous ramp across several
 * separately painted steps.
 */
class Gradient {
  public:
    /**
     * @brief Construct from explicit stops
     * @throws std::invalid_argument if the stop list is not well-formed
     */
    explicit Gradient(std::vector<GradientStop> stops);

    /**
     * @brief Construct from colors spread evenly over [0, 1]
     * @throws std::invalid_argument if fewer than two colors are given
     */
    static Gradient evenly_spaced(const std::vector<Color>& colors);

    /**
     * @brief Interpolated color at @p position
     *
     * Locates the bracketing stop pair and blends channel-wise. Positions
     * outside [0, 1] clamp to the end colors.
     */
    Color sample_at(float position) const;

    /**
     * @brief Two-stop gradient spanning [start, end] of this ramp
     *
     * Both bounds are clamped to [0, 1]. @p start may exceed @p end, which
     * yields a reversed slice (used when the traversal runs against the
     * physical axis).
     */
    Gradient sub_gradient(float start, float end) const;

    const std::vector<GradientStop>& stops() const {
        return stops_;
    }
    const Color& first_color() const {
        return stops_.front().color;
    }
    const Color& last_color() const {
        return stops_.back().color;
    }

    bool operator==(const Gradient& o) const {
        return stops_ == o.stops_;
    }
    bool operator!=(const Gradient& o) const {
        return !(*this == o);
    }

  private:
    std::vector<GradientStop> stops_;
};

} // namespace stepline
