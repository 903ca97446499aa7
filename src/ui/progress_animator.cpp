// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#include "progress_animator.h"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace stepline {

ProgressAnimator::ProgressAnimator(float initial_value)
    : from_(initial_value), to_(initial_value), value_(initial_value) {}

float ProgressAnimator::value_at(float from, float to, uint32_t elapsed_ms, uint32_t duration_ms,
                                 EasingCurve curve) {
    if (duration_ms == 0 || elapsed_ms >= duration_ms) {
        return to;
    }
    float t = static_cast<float>(elapsed_ms) / static_cast<float>(duration_ms);
    return from + (to - from) * apply_easing(curve, t);
}

void ProgressAnimator::start(float from, float to, uint32_t duration_ms, EasingCurve curve) {
    if (running_) {
        spdlog::trace("[ProgressAnimator] Retarget {:.3f} -> {:.3f} after {}ms of {}ms", from_,
                      to, elapsed_ms_, duration_ms_);
    }

    from_ = from;
    to_ = to;
    curve_ = curve;
    duration_ms_ = duration_ms;
    elapsed_ms_ = 0;

    if (duration_ms == 0 || from == to) {
        value_ = to;
        running_ = false;
        return;
    }

    value_ = from;
    running_ = true;
    spdlog::trace("[ProgressAnimator] Start {:.3f} -> {:.3f} over {}ms ({})", from, to,
                  duration_ms, easing_curve_name(curve));
}

bool ProgressAnimator::advance(uint32_t delta_ms) {
    if (!running_) {
        return false;
    }

    // Saturate instead of wrapping on very long stalls
    elapsed_ms_ = (delta_ms > duration_ms_ - std::min(elapsed_ms_, duration_ms_))
                      ? duration_ms_
                      : elapsed_ms_ + delta_ms;
    value_ = value_at(from_, to_, elapsed_ms_, duration_ms_, curve_);

    if (elapsed_ms_ >= duration_ms_) {
        value_ = to_;
        running_ = false;
    }
    return running_;
}

void ProgressAnimator::jump_to(float value) {
    from_ = value;
    to_ = value;
    value_ = value;
    elapsed_ms_ = 0;
    running_ = false;
}

void ProgressAnimator::cancel() {
    if (running_) {
        spdlog::trace("[ProgressAnimator] Cancelled at {:.3f}", value_);
    }
    to_ = value_;
    running_ = false;
}

} // namespace stepline
