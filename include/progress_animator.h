// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later
#pragma once

/**
 * @file progress_animator.h
 * @brief Time-driven scalar transition for the indicator's progress value
 *
 * The animator owns no timer. The host delivers frame ticks through advance()
 * with the time elapsed since the previous tick (LVGL timer, vsync callback,
 * or a test loop), which keeps the animator deterministic under test.
 *
 * @code{.cpp}
 * ProgressAnimator anim(0.0f);
 * anim.start(0.0f, 3.0f, 300, EasingCurve::EASE_IN_OUT);
 * while (anim.advance(16)) {
 *     redraw(anim.value());
 * }
 * @endcode
 */

#include "step_easing.h"

#include <cstdint>

namespace stepline {

/**
 * @brief Where a new transition starts when the target changes mid-flight
 */
enum class RestartPolicy {
    FROM_PREVIOUS_TARGET, ///< Start from the old target value (may jump if interrupted)
    FROM_DISPLAYED_VALUE  ///< Start from the value currently on screen
};

class ProgressAnimator {
  public:
    explicit ProgressAnimator(float initial_value = 0.0f);

    /**
     * @brief Begin a transition, discarding any transition in flight
     *
     * A zero duration pins the value to @p to immediately and leaves the
     * animator idle.
     */
    void start(float from, float to, uint32_t duration_ms, EasingCurve curve);

    /**
     * @brief Advance the transition by @p delta_ms
     * @return true while the transition is still running after this tick
     */
    bool advance(uint32_t delta_ms);

    /// Stop and pin the value to @p value
    void jump_to(float value);

    /// Abandon the transition, keeping the value currently displayed
    void cancel();

    float value() const {
        return value_;
    }
    float from() const {
        return from_;
    }
    float target() const {
        return to_;
    }
    uint32_t elapsed_ms() const {
        return elapsed_ms_;
    }
    uint32_t duration_ms() const {
        return duration_ms_;
    }
    bool is_running() const {
        return running_;
    }

    /// from + (to - from) * curve(clamp(elapsed / duration, 0, 1))
    static float value_at(float from, float to, uint32_t elapsed_ms, uint32_t duration_ms,
                          EasingCurve curve);

  private:
    float from_ = 0.0f;
    float to_ = 0.0f;
    float value_ = 0.0f;
    uint32_t elapsed_ms_ = 0;
    uint32_t duration_ms_ = 0;
    EasingCurve curve_ = EasingCurve::LINEAR;
    bool running_ = false;
};

} // namespace stepline
