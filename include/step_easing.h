// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

#include <string>

namespace stepline {

/**
 * @brief Easing curves available for progress transitions
 *
 * The cubic curves use the same control points as LVGL's lv_anim_path_* and
 * the CSS/Material easing tables. OVERSHOOT and ELASTIC_OUT leave [0, 1] in
 * the middle of the transition; consumers clamp where that matters.
 */
enum class EasingCurve {
    LINEAR,
    EASE_IN,
    EASE_OUT,
    EASE_IN_OUT,
    FAST_OUT_SLOW_IN,
    OVERSHOOT,
    ELASTIC_OUT,
    BOUNCE_OUT
};

/// Map normalized time t (clamped to [0, 1]) through @p curve.
/// Every curve satisfies f(0) == 0 and f(1) == 1.
float apply_easing(EasingCurve curve, float t);

/**
 * @brief Parse a curve name ("linear", "ease_in", "ease_out", "ease_in_out",
 *        "fast_out_slow_in", "overshoot", "elastic_out", "bounce_out")
 *
 * @param str Curve name (case-sensitive)
 * @param default_curve Returned when @p str is empty or unrecognized
 */
EasingCurve parse_easing_curve(const std::string& str,
                               EasingCurve default_curve = EasingCurve::EASE_IN_OUT);

const char* easing_curve_name(EasingCurve curve);

} // namespace stepline
